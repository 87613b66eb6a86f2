// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace nameuuid::Format {

inline constexpr char HEX_DIGITS_LOWER[] = "0123456789abcdef";

/// @brief Writes the two lowercase hex digits of a byte.
/// @return pointer past the last character written
inline char* hexByte(char* p, uint8_t b)
{
    *p++ = HEX_DIGITS_LOWER[b >> 4];
    *p++ = HEX_DIGITS_LOWER[b & 0x0f];
    return p;
}

/// @brief Writes `len` bytes as a run of lowercase hex digits
/// (2 * len characters, no separators, no null terminator).
/// @return pointer past the last character written
char* hex(char* p, const uint8_t* bytes, size_t len);

std::string hex(const uint8_t* bytes, size_t len);

} // namespace nameuuid::Format
