#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace hashsweep {

enum class HashAlgorithm {
    SHA256,
    SHA384,
    SHA512,
    PBKDF2
};

// Throws ConfigError(UNKNOWN_ALGORITHM) for anything outside the supported set.
HashAlgorithm parse_algorithm(const std::string& name);
std::string algorithm_name(HashAlgorithm algorithm);

struct HashSettings {
    HashAlgorithm algorithm = HashAlgorithm::SHA256;
    std::uint32_t iterations = 100000;          // PBKDF2 only
    std::size_t salt_length = 32;               // PBKDF2 only
    std::vector<std::uint8_t> salt;             // PBKDF2 only; empty means zero-filled
};

/**
 * Keyed digest of a single candidate, rendered as lowercase hex.
 * Implementations are not required to be thread-safe; every worker owns one.
 */
class Hasher {
public:
    virtual ~Hasher() = default;

    // Throws HashError when the digest cannot be computed.
    virtual std::string digest(const std::string& candidate) const = 0;

    virtual std::string algorithm() const = 0;
};

using HasherFactory = std::function<std::unique_ptr<Hasher>()>;

std::unique_ptr<Hasher> make_hasher(const HashSettings& settings);

// Factory bound to `settings`; validates them once up front.
HasherFactory make_hasher_factory(const HashSettings& settings);

std::string to_hex(const unsigned char* data, std::size_t length);
std::vector<std::uint8_t> from_hex(const std::string& hex);

// Lowercase with surrounding whitespace removed.
std::string normalize_digest(const std::string& digest);

} // namespace hashsweep
