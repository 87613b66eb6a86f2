// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#include <nameuuid/util/UuidException.h>

namespace nameuuid {

const char* errorMessage(UuidError error) noexcept
{
    switch (error)
    {
    case UuidError::NONE:
        return "No error";
    case UuidError::MISSING_TARGET:
        return "Target string must not be null";
    case UuidError::UNSUPPORTED_VERSION:
        return "Version of UUID can be only 3 or 5";
    case UuidError::INVALID_NAMESPACE:
        return "Invalid UUID";
    }
    return "Unknown error";
}

} // namespace nameuuid
