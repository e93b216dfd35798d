#pragma once

#include "flowfile/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace flowfile::checksum {

/**
 * @brief Canonical registry name for @p algorithm, or "" when unsupported
 *
 * Lookup is case-insensitive and ignores surrounding whitespace:
 * MD5, SHA1 (alias SHA), SHA224, SHA256, SHA384, SHA512.
 */
std::string canonical_name(const std::string& algorithm);

inline bool is_supported(const std::string& algorithm) {
    return !canonical_name(algorithm).empty();
}

/**
 * @brief Incremental message digest over OpenSSL EVP
 *
 * hex_digest() does not finalize the running state, so it can be called at
 * any point and the hasher keeps accepting data afterwards.
 */
class Hasher {
public:
    /// UnknownChecksum when @p algorithm is not in the registry.
    static Result<std::unique_ptr<Hasher>> create(const std::string& algorithm);

    ~Hasher();

    Hasher(const Hasher&) = delete;
    Hasher& operator=(const Hasher&) = delete;

    /// UnknownChecksum when the digest backend rejects the call.
    Result<void> update(const std::uint8_t* data, std::size_t len);
    Result<void> reset();

    /// Lowercase hex of the digest of everything fed since the last reset.
    Result<std::string> hex_digest() const;

    const std::string& algorithm() const noexcept { return algorithm_; }

private:
    struct Impl;

    Hasher(std::string algorithm, std::unique_ptr<Impl> impl);

    std::string algorithm_;
    std::unique_ptr<Impl> impl_;
};

/// One-shot digest of a memory buffer.
Result<std::string> hash_bytes(const std::string& algorithm, const void* data, std::size_t len);

} // namespace flowfile::checksum
