// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once
#include <array>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>

namespace nameuuid {

/// @brief A UUID as its 16 raw bytes, in the order in which they
/// appear in the canonical string form (RFC 4122 network order).
///
class UUID
{
public:
    static constexpr size_t SIZE = 16;
    static constexpr size_t STRING_LENGTH = 36;

    using Bytes = std::array<uint8_t, SIZE>;

    constexpr UUID() : guid_{} {}

    constexpr explicit UUID(const Bytes& bytes) : guid_(bytes) {}

    explicit UUID(const uint8_t* bytes)    // NOLINT initialization in body
    {
        memcpy(guid_.data(), bytes, SIZE);
    }

    bool operator==(const UUID& other) const
    {
        return guid_ == other.guid_;
    }

    bool operator!=(const UUID& other) const
    {
        return !(*this == other);
    }

    const uint8_t* data() const { return guid_.data(); }
    const Bytes& bytes() const { return guid_; }

    /// @brief The version nibble (high nibble of byte 6).
    int version() const
    {
        return guid_[6] >> 4;
    }

    /// @brief The two variant bits (top bits of byte 8); 2 (binary 10)
    /// for RFC 4122 UUIDs.
    int variant() const
    {
        return guid_[8] >> 6;
    }

    /// @brief Builds a UUID from the first 16 bytes of a digest,
    /// stamping `version` into byte 6 and the RFC 4122 variant into
    /// byte 8. The digest itself is not modified; any bytes past
    /// the 16th (as with SHA-1) are ignored.
    static UUID fromDigest(const uint8_t* digest, int version);

    /// @brief Checks that `s` is a canonical 36-character UUID:
    /// hex groups of 8-4-4-4-12 (either case), a version nibble of
    /// 0 to 5 and a variant nibble of 8, 9, a or b.
    static bool isValid(std::string_view s) noexcept;

    /// @brief Parses a canonical UUID string.
    /// @return false if `s` fails isValid(); `result` is left untouched
    static bool tryParse(std::string_view s, UUID& result) noexcept;

    /// @brief Parses a canonical UUID string.
    /// @throws UuidException (INVALID_NAMESPACE) if `s` fails isValid()
    static UUID parse(std::string_view s);

    /// @brief Writes the 36-character lowercase form, followed by a
    /// null terminator (buf must hold at least 37 chars).
    /// @return pointer to the null terminator
    char* format(char* buf) const;

    template<typename Stream>
    void format(Stream& out) const
    {
        char buf[64];
        char* p = format(buf);
        out.write(buf, p - buf);
    }

    std::string toString() const;

private:
    Bytes guid_;
};

template<typename Stream>
Stream& operator<<(Stream& out, const UUID& uuid)
{
    char buf[64];
    char* p = uuid.format(buf);
    out.write(buf, p - buf);
    return out;
}

} // namespace nameuuid
