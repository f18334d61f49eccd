#include <gtest/gtest.h>

#include "hashsweep/error.hpp"
#include "hashsweep/hasher.hpp"
#include "test_support.hpp"

using namespace hashsweep;

TEST(HasherTest, Sha256KnownDigests) {
    auto hasher = make_hasher(HashSettings{});

    EXPECT_EQ(hasher->digest("bob"), SHA256_BOB);
    EXPECT_EQ(hasher->digest("abc"), SHA256_ABC);
    EXPECT_EQ(hasher->algorithm(), "SHA256");
}

TEST(HasherTest, Sha384AndSha512KnownDigests) {
    HashSettings settings;

    settings.algorithm = HashAlgorithm::SHA384;
    EXPECT_EQ(make_hasher(settings)->digest("abc"),
              "cb00753f45a35e8bb5a03d699ac65007272c32ab0eded1631a8b605a43ff5bed"
              "8086072ba1e7cc2358baeca134c825a7");

    settings.algorithm = HashAlgorithm::SHA512;
    EXPECT_EQ(make_hasher(settings)->digest("abc"),
              "ddaf35a193617abacc417349ae20413112e6fa4e89a97ea20a9eeee64b55d39a"
              "2192992a274fc1a836ba3c23a3feebbd454d4423643ce80e2a9ac94fa54ca49f");
}

TEST(HasherTest, Pbkdf2MatchesPublishedVector) {
    // PBKDF2-HMAC-SHA256, P="passwd", S="salt", c=1 (RFC 7914), first 32 bytes
    HashSettings settings;
    settings.algorithm = HashAlgorithm::PBKDF2;
    settings.iterations = 1;
    settings.salt_length = 4;
    settings.salt = from_hex("73616c74");

    auto hasher = make_hasher(settings);

    EXPECT_EQ(hasher->digest("passwd"), "55ac046e56e3089fec1691c22544b605f94185216dde0465e68b9d57c20dacbc");
    EXPECT_EQ(hasher->algorithm(), "PBKDF2");
}

TEST(HasherTest, Pbkdf2IsDeterministicWithDefaultSalt) {
    HashSettings settings;
    settings.algorithm = HashAlgorithm::PBKDF2;
    settings.iterations = 10;

    auto first = make_hasher(settings);
    auto second = make_hasher(settings);

    std::string digest = first->digest("carol");
    EXPECT_EQ(digest.size(), 64u);
    EXPECT_EQ(digest, second->digest("carol"));
    EXPECT_NE(digest, first->digest("alice"));
}

TEST(HasherTest, Pbkdf2RejectsBadSettings) {
    HashSettings settings;
    settings.algorithm = HashAlgorithm::PBKDF2;

    settings.iterations = 0;
    EXPECT_THROW(make_hasher(settings), ConfigError);

    settings.iterations = 1;
    settings.salt_length = 8;
    settings.salt = from_hex("0011");
    EXPECT_THROW(make_hasher(settings), ConfigError);
}

TEST(HasherTest, ParseAlgorithmIsCaseInsensitive) {
    EXPECT_EQ(parse_algorithm("sha256"), HashAlgorithm::SHA256);
    EXPECT_EQ(parse_algorithm("SHA-384"), HashAlgorithm::SHA384);
    EXPECT_EQ(parse_algorithm("Sha512"), HashAlgorithm::SHA512);
    EXPECT_EQ(parse_algorithm("pbkdf2"), HashAlgorithm::PBKDF2);
}

TEST(HasherTest, UnknownAlgorithmIsRejected) {
    try {
        parse_algorithm("MD5");
        FAIL() << "Expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_EQ(e.code(), ErrorCode::UNKNOWN_ALGORITHM);
    }
}

TEST(HasherTest, NormalizeDigestLowercasesAndTrims) {
    EXPECT_EQ(normalize_digest("  ABCDEF01\n"), "abcdef01");
    EXPECT_EQ(normalize_digest(""), "");
}

TEST(HasherTest, HexConversion) {
    const unsigned char bytes[] = {0x00, 0x7f, 0xff};

    EXPECT_EQ(to_hex(bytes, sizeof(bytes)), "007fff");
    EXPECT_EQ(from_hex("007FfF"), (std::vector<std::uint8_t>{0x00, 0x7f, 0xff}));
    EXPECT_THROW(from_hex("abc"), ConfigError);
    EXPECT_THROW(from_hex("zz"), ConfigError);
}

TEST(HasherTest, FactoryValidatesUpFront) {
    HashSettings settings;
    settings.algorithm = HashAlgorithm::PBKDF2;
    settings.iterations = 0;
    EXPECT_THROW(make_hasher_factory(settings), ConfigError);

    auto factory = make_hasher_factory(HashSettings{});
    auto a = factory();
    auto b = factory();
    EXPECT_NE(a.get(), b.get());
    EXPECT_EQ(a->digest("bob"), b->digest("bob"));
}
