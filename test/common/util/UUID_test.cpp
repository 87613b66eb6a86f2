// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#include <catch2/catch_test_macros.hpp>
#include <cstring>
#include <sstream>
#include <string>
#include "nameuuid/util/UUID.h"
#include "nameuuid/util/UuidException.h"

using namespace nameuuid;

static const char* TEST_NAMESPACE = "9239107d-259f-4cf8-b62d-0964b680ab08";


TEST_CASE("UUID::isValid")
{
	REQUIRE(UUID::isValid(TEST_NAMESPACE));
	REQUIRE(UUID::isValid("9239107D-259F-4CF8-B62D-0964B680AB08"));
	REQUIRE(UUID::isValid("00000000-0000-0000-0000-000000000000"));
	REQUIRE(UUID::isValid("6ba7b810-9dad-11d1-80b4-00c04fd430c8"));
	REQUIRE(UUID::isValid("ffffffff-ffff-5fff-bfff-ffffffffffff"));

	REQUIRE_FALSE(UUID::isValid("Lorem ipsum"));
	REQUIRE_FALSE(UUID::isValid(""));
	REQUIRE_FALSE(UUID::isValid("not-a-uuid"));
	// wrong length
	REQUIRE_FALSE(UUID::isValid("9239107d-259f-4cf8-b62d-0964b680ab0"));
	REQUIRE_FALSE(UUID::isValid("9239107d-259f-4cf8-b62d-0964b680ab08a"));
	// no hyphens, or hyphens in the wrong place
	REQUIRE_FALSE(UUID::isValid("9239107d259f4cf8b62d0964b680ab08"));
	REQUIRE_FALSE(UUID::isValid("9239107-d259f-4cf8-b62d-0964b680ab08"));
	REQUIRE_FALSE(UUID::isValid("{239107d-259f-4cf8-b62d-0964b680ab0}"));
	// non-hex digit
	REQUIRE_FALSE(UUID::isValid("9239107g-259f-4cf8-b62d-0964b680ab08"));
	// version nibble above 5
	REQUIRE_FALSE(UUID::isValid("9239107d-259f-6cf8-b62d-0964b680ab08"));
	REQUIRE_FALSE(UUID::isValid("9239107d-259f-7cf8-b62d-0964b680ab08"));
	// variant nibble outside 0, 8-b
	REQUIRE_FALSE(UUID::isValid("9239107d-259f-4cf8-c62d-0964b680ab08"));
	REQUIRE_FALSE(UUID::isValid("9239107d-259f-4cf8-762d-0964b680ab08"));
	REQUIRE_FALSE(UUID::isValid("9239107d-259f-4cf8-162d-0964b680ab08"));
}

TEST_CASE("UUID::parse")
{
	UUID uuid = UUID::parse(TEST_NAMESPACE);
	const uint8_t expected[] =
	{
		0x92, 0x39, 0x10, 0x7d, 0x25, 0x9f, 0x4c, 0xf8,
		0xb6, 0x2d, 0x09, 0x64, 0xb6, 0x80, 0xab, 0x08
	};
	REQUIRE(uuid == UUID(expected));
	REQUIRE(uuid.version() == 4);
	REQUIRE(uuid.variant() == 2);
	REQUIRE(uuid.toString() == TEST_NAMESPACE);

	// case-insensitive input, lowercase output
	UUID upper = UUID::parse("9239107D-259F-4CF8-B62D-0964B680AB08");
	REQUIRE(upper == uuid);
	REQUIRE(upper.toString() == TEST_NAMESPACE);

	REQUIRE_THROWS_AS(UUID::parse("Lorem ipsum"), UuidException);
	try
	{
		UUID::parse("9239107d-259f-7cf8-b62d-0964b680ab08");
		FAIL("Expected UuidException");
	}
	catch (const UuidException& ex)
	{
		REQUIRE(ex.error() == UuidError::INVALID_NAMESPACE);
	}
}

TEST_CASE("UUID::tryParse")
{
	UUID uuid;
	REQUIRE(UUID::tryParse(TEST_NAMESPACE, uuid));
	REQUIRE(uuid.toString() == TEST_NAMESPACE);

	UUID untouched = uuid;
	REQUIRE_FALSE(UUID::tryParse("Lorem ipsum", untouched));
	REQUIRE(untouched == uuid);
}

TEST_CASE("UUID::fromDigest")
{
	uint8_t digest[20];
	for (int i = 0; i < 20; i++) digest[i] = 0xff;
	uint8_t original[20];
	memcpy(original, digest, sizeof(digest));

	UUID v5 = UUID::fromDigest(digest, 5);
	REQUIRE(v5.toString() == "ffffffff-ffff-5fff-bfff-ffffffffffff");
	REQUIRE(v5.version() == 5);
	REQUIRE(v5.variant() == 2);
	REQUIRE(memcmp(digest, original, sizeof(digest)) == 0);

	uint8_t zeroes[16] = {};
	UUID v3 = UUID::fromDigest(zeroes, 3);
	REQUIRE(v3.toString() == "00000000-0000-3000-8000-000000000000");
	REQUIRE(v3.version() == 3);
	REQUIRE(v3.variant() == 2);

	// low nibble of byte 6 and low six bits of byte 8 pass through
	const uint8_t mixed[16] =
	{
		0x01, 0x23, 0x45, 0x67, 0x89, 0xab, 0xcd, 0xef,
		0x7e, 0xdc, 0xba, 0x98, 0x76, 0x54, 0x32, 0x10
	};
	REQUIRE(UUID::fromDigest(mixed, 3).toString() ==
		"01234567-89ab-3def-bedc-ba9876543210");
	REQUIRE(UUID::fromDigest(mixed, 5).toString() ==
		"01234567-89ab-5def-bedc-ba9876543210");
}

TEST_CASE("UUID: parse and format round trip")
{
	const char* samples[] =
	{
		"00000000-0000-0000-0000-000000000000",
		"6ba7b810-9dad-11d1-80b4-00c04fd430c8",
		"d3486ae9-136e-5856-bc42-212385ea7970",
		"86fb269d-190d-3c85-b6e0-468ceca42a20",
	};
	for (const char* s : samples)
	{
		UUID uuid = UUID::parse(s);
		REQUIRE(uuid.toString() == s);
		REQUIRE(UUID::parse(uuid.toString()) == uuid);
	}

	// Re-encoding parsed bytes only touches the version/variant fields
	UUID ns = UUID::parse(TEST_NAMESPACE);
	UUID restamped = UUID::fromDigest(ns.data(), 5);
	for (size_t i = 0; i < UUID::SIZE; i++)
	{
		if (i == 6)
		{
			REQUIRE((restamped.data()[i] & 0x0f) == (ns.data()[i] & 0x0f));
		}
		else if (i == 8)
		{
			REQUIRE((restamped.data()[i] & 0x3f) == (ns.data()[i] & 0x3f));
		}
		else
		{
			REQUIRE(restamped.data()[i] == ns.data()[i]);
		}
	}
}

TEST_CASE("UUID::format")
{
	UUID uuid = UUID::parse(TEST_NAMESPACE);

	char buf[64];
	char* end = uuid.format(buf);
	REQUIRE(static_cast<size_t>(end - buf) == UUID::STRING_LENGTH);
	REQUIRE(*end == '\0');
	REQUIRE(std::string(buf) == TEST_NAMESPACE);

	std::ostringstream out;
	out << uuid;
	REQUIRE(out.str() == TEST_NAMESPACE);

	REQUIRE(UUID().toString() == "00000000-0000-0000-0000-000000000000");
}
