// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once

#include <stdexcept>
#include <string>

namespace nameuuid {

/// @brief Reasons a name-based UUID cannot be produced. All of them
/// are caller-input mistakes; none is transient.
enum class UuidError
{
    NONE,
    MISSING_TARGET,
    UNSUPPORTED_VERSION,
    INVALID_NAMESPACE
};

const char* errorMessage(UuidError error) noexcept;

class UuidException : public std::invalid_argument
{
public:
    explicit UuidException(UuidError error)
        : std::invalid_argument(errorMessage(error)),
          error_(error) {}

    UuidException(UuidError error, const std::string& message)
        : std::invalid_argument(message),
          error_(error) {}

    UuidError error() const noexcept { return error_; }

private:
    UuidError error_;
};

} // namespace nameuuid
