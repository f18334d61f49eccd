/**
 * Digest algorithms backed by OpenSSL.
 *
 * SHA-2 family via the EVP digest API; PBKDF2 is PBKDF2-HMAC-SHA256 with a
 * fixed, configured salt so the same candidate always yields the same digest.
 */

#include "hashsweep/hasher.hpp"
#include "hashsweep/error.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>

namespace hashsweep {

namespace {

constexpr std::size_t PBKDF2_KEY_LENGTH = 32;

class Sha2Hasher : public Hasher {
public:
    explicit Sha2Hasher(HashAlgorithm algorithm) : algorithm_(algorithm) {
        switch (algorithm) {
            case HashAlgorithm::SHA256: md_ = EVP_sha256(); break;
            case HashAlgorithm::SHA384: md_ = EVP_sha384(); break;
            case HashAlgorithm::SHA512: md_ = EVP_sha512(); break;
            default:
                throw ConfigError("Not a SHA-2 algorithm", algorithm_name(algorithm),
                                  ErrorCode::UNKNOWN_ALGORITHM);
        }
    }

    std::string digest(const std::string& candidate) const override {
        std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
        if (!ctx) {
            throw HashError("EVP_MD_CTX_new failed");
        }

        unsigned char out[EVP_MAX_MD_SIZE];
        unsigned int out_len = 0;
        if (EVP_DigestInit_ex(ctx.get(), md_, nullptr) != 1 ||
            EVP_DigestUpdate(ctx.get(), candidate.data(), candidate.size()) != 1 ||
            EVP_DigestFinal_ex(ctx.get(), out, &out_len) != 1) {
            throw HashError("digest computation failed", algorithm());
        }
        return to_hex(out, out_len);
    }

    std::string algorithm() const override { return algorithm_name(algorithm_); }

private:
    HashAlgorithm algorithm_;
    const EVP_MD* md_ = nullptr;
};

class Pbkdf2Hasher : public Hasher {
public:
    Pbkdf2Hasher(std::uint32_t iterations, std::vector<std::uint8_t> salt)
        : iterations_(iterations), salt_(std::move(salt)) {}

    std::string digest(const std::string& candidate) const override {
        unsigned char out[PBKDF2_KEY_LENGTH];
        int ok = PKCS5_PBKDF2_HMAC(candidate.data(), static_cast<int>(candidate.size()),
                                   salt_.data(), static_cast<int>(salt_.size()),
                                   static_cast<int>(iterations_), EVP_sha256(),
                                   static_cast<int>(PBKDF2_KEY_LENGTH), out);
        if (ok != 1) {
            throw HashError("PBKDF2 derivation failed", "iterations=" + std::to_string(iterations_));
        }
        return to_hex(out, PBKDF2_KEY_LENGTH);
    }

    std::string algorithm() const override { return algorithm_name(HashAlgorithm::PBKDF2); }

private:
    std::uint32_t iterations_;
    std::vector<std::uint8_t> salt_;
};

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

HashAlgorithm parse_algorithm(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    upper.erase(std::remove(upper.begin(), upper.end(), '-'), upper.end());

    if (upper == "SHA256") return HashAlgorithm::SHA256;
    if (upper == "SHA384") return HashAlgorithm::SHA384;
    if (upper == "SHA512") return HashAlgorithm::SHA512;
    if (upper == "PBKDF2") return HashAlgorithm::PBKDF2;

    throw ConfigError("Invalid hash algorithm '" + name + "'",
                      "must be one of SHA256, SHA384, SHA512, PBKDF2",
                      ErrorCode::UNKNOWN_ALGORITHM);
}

std::string algorithm_name(HashAlgorithm algorithm) {
    switch (algorithm) {
        case HashAlgorithm::SHA256: return "SHA256";
        case HashAlgorithm::SHA384: return "SHA384";
        case HashAlgorithm::SHA512: return "SHA512";
        case HashAlgorithm::PBKDF2: return "PBKDF2";
    }
    return "UNKNOWN";
}

std::unique_ptr<Hasher> make_hasher(const HashSettings& settings) {
    if (settings.algorithm != HashAlgorithm::PBKDF2) {
        return std::make_unique<Sha2Hasher>(settings.algorithm);
    }

    if (settings.iterations == 0) {
        throw ConfigError("pbkdf2_iterations must be at least 1");
    }
    std::vector<std::uint8_t> salt = settings.salt;
    if (salt.empty()) {
        salt.assign(settings.salt_length, 0);
    } else if (salt.size() != settings.salt_length) {
        throw ConfigError("pbkdf2_salt length does not match pbkdf2_salt_length",
                          std::to_string(salt.size()) + " != " + std::to_string(settings.salt_length));
    }
    return std::make_unique<Pbkdf2Hasher>(settings.iterations, std::move(salt));
}

HasherFactory make_hasher_factory(const HashSettings& settings) {
    // Surface setup errors before any worker starts.
    make_hasher(settings);
    return [settings]() { return make_hasher(settings); };
}

std::string to_hex(const unsigned char* data, std::size_t length) {
    static const char digits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(length * 2);
    for (std::size_t i = 0; i < length; ++i) {
        hex.push_back(digits[data[i] >> 4]);
        hex.push_back(digits[data[i] & 0x0f]);
    }
    return hex;
}

std::vector<std::uint8_t> from_hex(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw ConfigError("Hex string has odd length", hex);
    }
    std::vector<std::uint8_t> bytes;
    bytes.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            throw ConfigError("Invalid hex digit", hex);
        }
        bytes.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return bytes;
}

std::string normalize_digest(const std::string& digest) {
    auto begin = std::find_if_not(digest.begin(), digest.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(digest.rbegin(), digest.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    std::string normalized = begin < end ? std::string(begin, end) : std::string();
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return normalized;
}

} // namespace hashsweep
