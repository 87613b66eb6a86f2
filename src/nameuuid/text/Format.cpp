// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#include <nameuuid/text/Format.h>

namespace nameuuid::Format {

char* hex(char* p, const uint8_t* bytes, size_t len)
{
    const uint8_t* end = bytes + len;
    while(bytes < end)
    {
        p = hexByte(p, *bytes++);
    }
    return p;
}

std::string hex(const uint8_t* bytes, size_t len)
{
    std::string s(len * 2, '\0');
    hex(s.data(), bytes, len);
    return s;
}

} // namespace nameuuid::Format
