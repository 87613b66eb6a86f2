// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

// Avoids pulling <openssl/evp.h> into every client
struct evp_md_ctx_st;

namespace nameuuid {

class DigestException : public std::runtime_error
{
public:
    explicit DigestException(const std::string& message)
        : std::runtime_error(message) {}
};

/// @brief MD5 / SHA-1 message digest, backed by OpenSSL's EVP API.
///
/// Feed data with update() any number of times, then call finish()
/// exactly once. Digesting several chunks yields the same result as
/// digesting their concatenation.
///
/// Instances are not shareable across threads, but any number of
/// instances may be used concurrently.
///
class Digest
{
public:
    enum class Algorithm
    {
        MD5,
        SHA1
    };

    static constexpr size_t MD5_SIZE = 16;
    static constexpr size_t SHA1_SIZE = 20;
    static constexpr size_t MAX_SIZE = SHA1_SIZE;

    explicit Digest(Algorithm algorithm);
    ~Digest() noexcept;

    Digest(const Digest&) = delete;
    Digest& operator=(const Digest&) = delete;

    Algorithm algorithm() const noexcept { return algorithm_; }

    void update(const void* data, size_t len);

    void update(std::string_view s)
    {
        update(s.data(), s.size());
    }

    /// @brief Completes the digest.
    /// @param out receives the digest (at least MAX_SIZE bytes)
    /// @return number of bytes written (16 for MD5, 20 for SHA-1)
    size_t finish(uint8_t* out);

    static size_t size(Algorithm algorithm) noexcept
    {
        return algorithm == Algorithm::MD5 ? MD5_SIZE : SHA1_SIZE;
    }

    /// @brief One-shot digest of a single buffer.
    static size_t compute(Algorithm algorithm,
        const void* data, size_t len, uint8_t* out);

private:
    [[noreturn]] static void fail(const char* operation);

    evp_md_ctx_st* ctx_;
    Algorithm algorithm_;
    bool finished_ = false;
};

} // namespace nameuuid
