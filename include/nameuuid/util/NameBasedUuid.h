// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once
#include <string>
#include <string_view>
#include <nameuuid/crypto/Digest.h>
#include <nameuuid/util/UUID.h>
#include <nameuuid/util/UuidException.h>

namespace nameuuid {

/// @brief Derives RFC 4122 name-based UUIDs (section 4.3): version 3
/// hashes the namespace and name with MD5, version 5 with SHA-1.
///
/// The digest input is the 16 namespace bytes (none if no namespace
/// is given) followed by the UTF-8 bytes of the name, with nothing in
/// between. All functions are stateless and may be called from any
/// number of threads.
///
/// Names are byte strings; pass them UTF-8 encoded.
///
class NameBasedUuid
{
public:
    static constexpr int MD5_VERSION = 3;
    static constexpr int SHA1_VERSION = 5;
    static constexpr int DEFAULT_VERSION = SHA1_VERSION;

    // RFC 4122, Appendix C
    static constexpr UUID NAMESPACE_DNS{UUID::Bytes{
        0x6b, 0xa7, 0xb8, 0x10, 0x9d, 0xad, 0x11, 0xd1,
        0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8 }};
    static constexpr UUID NAMESPACE_URL{UUID::Bytes{
        0x6b, 0xa7, 0xb8, 0x11, 0x9d, 0xad, 0x11, 0xd1,
        0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8 }};
    static constexpr UUID NAMESPACE_OID{UUID::Bytes{
        0x6b, 0xa7, 0xb8, 0x12, 0x9d, 0xad, 0x11, 0xd1,
        0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8 }};
    static constexpr UUID NAMESPACE_X500{UUID::Bytes{
        0x6b, 0xa7, 0xb8, 0x14, 0x9d, 0xad, 0x11, 0xd1,
        0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8 }};

    static bool isSupportedVersion(int version) noexcept
    {
        return version == MD5_VERSION || version == SHA1_VERSION;
    }

    static Digest::Algorithm algorithm(int version) noexcept
    {
        return version == MD5_VERSION ?
            Digest::Algorithm::MD5 : Digest::Algorithm::SHA1;
    }

    /// @brief Feeds the digest input (namespace bytes, then name bytes).
    /// @param ns the namespace, or nullptr for none
    static void compose(Digest& digest, const UUID* ns, std::string_view name);

    /// @brief Creates the UUID for `name` within namespace `ns`
    /// (nullptr for none).
    /// @throws UuidException (UNSUPPORTED_VERSION) if `version` is not 3 or 5
    static UUID create(const UUID* ns, std::string_view name,
        int version = DEFAULT_VERSION);

    static UUID create(const UUID& ns, std::string_view name,
        int version = DEFAULT_VERSION)
    {
        return create(&ns, name, version);
    }

    static UUID create(std::string_view name, int version = DEFAULT_VERSION)
    {
        return create(nullptr, name, version);
    }

    /// @brief Checks the arguments and creates the UUID, reporting
    /// invalid input through the return value instead of throwing.
    /// `result` is only assigned if UuidError::NONE is returned.
    ///
    /// @param target the name; must not be null (empty is fine)
    /// @param ns     canonical namespace UUID string, or nullptr
    static UuidError tryGenerate(UUID& result, const char* target,
        const char* ns = nullptr, int version = DEFAULT_VERSION);

    /// @brief Returns the canonical lowercase string of the UUID for
    /// `target` (no namespace).
    /// @throws UuidException if `target` is null or `version` is not 3 or 5
    static std::string generate(const char* target, int version = DEFAULT_VERSION)
    {
        return generate(target, nullptr, version);
    }

    /// @brief Returns the canonical lowercase string of the UUID for
    /// `target` within namespace `ns` (a canonical UUID string, or
    /// nullptr for none).
    /// @throws UuidException if `target` is null, `version` is not
    ///   3 or 5, or `ns` is not a valid UUID string
    static std::string generate(const char* target, const char* ns,
        int version = DEFAULT_VERSION);
};

} // namespace nameuuid
