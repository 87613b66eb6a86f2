// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once

#include <array>
#include <concepts>
#include <cstdint>
#include <type_traits>

namespace nameuuid {
namespace Parsing {

namespace detail {

constexpr std::array<int8_t, 256> makeHexTable()
{
    std::array<int8_t, 256> table{};
    for (int i = 0; i < 256; i++) table[i] = -1;
    for (int i = 0; i < 10; i++) table['0' + i] = static_cast<int8_t>(i);
    for (int i = 0; i < 6; i++)
    {
        table['a' + i] = static_cast<int8_t>(10 + i);
        table['A' + i] = static_cast<int8_t>(10 + i);
    }
    return table;
}

inline constexpr std::array<int8_t, 256> HEX_VALUES = makeHexTable();

} // namespace detail

/// @brief Value of a hex digit (either case), or -1 if `ch` is not one.
template <typename Char>
requires std::is_integral_v<Char> && (sizeof(Char) <= 4)
constexpr int hexDigit(Char ch)
{
    auto u = static_cast<std::make_unsigned_t<Char>>(ch);
    return u < 256 ? detail::HEX_VALUES[u] : -1;
}

} // namespace Parsing
} // namespace nameuuid
