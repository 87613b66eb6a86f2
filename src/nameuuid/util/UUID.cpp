// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#include <nameuuid/util/UUID.h>
#include <nameuuid/text/Format.h>
#include <nameuuid/text/Parsing.h>
#include <nameuuid/util/UuidException.h>


namespace nameuuid {

// Hyphen positions of the canonical 8-4-4-4-12 form
static constexpr size_t HYPHENS[] = { 8, 13, 18, 23 };

// Offsets of the version and variant nibbles
static constexpr size_t VERSION_POS = 14;
static constexpr size_t VARIANT_POS = 19;

UUID UUID::fromDigest(const uint8_t* digest, int version)
{
    UUID uuid(digest);
    uuid.guid_[6] = static_cast<uint8_t>((uuid.guid_[6] & 0x0F) | (version << 4));
    uuid.guid_[8] = static_cast<uint8_t>((uuid.guid_[8] & 0x3F) | 0x80);  // variant 1
    return uuid;
}


bool UUID::isValid(std::string_view s) noexcept
{
    if (s.size() != STRING_LENGTH) return false;
    size_t nextHyphen = 0;
    for (size_t i = 0; i < STRING_LENGTH; i++)
    {
        if (nextHyphen < 4 && i == HYPHENS[nextHyphen])
        {
            if (s[i] != '-') return false;
            nextHyphen++;
            continue;
        }
        if (Parsing::hexDigit(s[i]) < 0) return false;
    }
    if (Parsing::hexDigit(s[VERSION_POS]) > 5) return false;
    int variant = Parsing::hexDigit(s[VARIANT_POS]);
    return variant == 0 || (variant >= 8 && variant <= 11);
}


bool UUID::tryParse(std::string_view s, UUID& result) noexcept
{
    if (!isValid(s)) return false;

    size_t n = 0;
    for (size_t i = 0; i < STRING_LENGTH && n < SIZE; i++)
    {
        if (s[i] == '-') continue;
        int high = Parsing::hexDigit(s[i]);
        int low = Parsing::hexDigit(s[i+1]);
        result.guid_[n++] = static_cast<uint8_t>((high << 4) | low);
        i++;
    }
    return true;
}


UUID UUID::parse(std::string_view s)
{
    UUID uuid;
    if (!tryParse(s, uuid))
    {
        throw UuidException(UuidError::INVALID_NAMESPACE,
            "Invalid UUID: \"" + std::string(s) + "\"");
    }
    return uuid;
}


char* UUID::format(char* buf) const
{
    const uint8_t* b = guid_.data();
    char* p = Format::hex(buf, b, 4);
    *p++ = '-';
    p = Format::hex(p, b + 4, 2);
    *p++ = '-';
    p = Format::hex(p, b + 6, 2);
    *p++ = '-';
    p = Format::hex(p, b + 8, 2);
    *p++ = '-';
    p = Format::hex(p, b + 10, 6);
    *p = '\0';
    return p;
}


std::string UUID::toString() const
{
    char buf[STRING_LENGTH + 1];
    format(buf);
    return std::string(buf, STRING_LENGTH);
}

} // namespace nameuuid
