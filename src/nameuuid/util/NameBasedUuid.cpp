// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#include <nameuuid/util/NameBasedUuid.h>

namespace nameuuid {

void NameBasedUuid::compose(Digest& digest, const UUID* ns, std::string_view name)
{
    if (ns) digest.update(ns->data(), UUID::SIZE);
    digest.update(name);
}


UUID NameBasedUuid::create(const UUID* ns, std::string_view name, int version)
{
    if (!isSupportedVersion(version))
    {
        throw UuidException(UuidError::UNSUPPORTED_VERSION);
    }

    Digest digest(algorithm(version));
    compose(digest, ns, name);
    uint8_t hash[Digest::MAX_SIZE];
    digest.finish(hash);

    // SHA-1 yields 20 bytes; RFC 4122 keeps only the first 16
    return UUID::fromDigest(hash, version);
}


UuidError NameBasedUuid::tryGenerate(UUID& result, const char* target,
    const char* ns, int version)
{
    if (!target) return UuidError::MISSING_TARGET;
    if (!isSupportedVersion(version)) return UuidError::UNSUPPORTED_VERSION;

    UUID nsUuid;
    if (ns && !UUID::tryParse(ns, nsUuid)) return UuidError::INVALID_NAMESPACE;

    result = create(ns ? &nsUuid : nullptr, target, version);
    return UuidError::NONE;
}


std::string NameBasedUuid::generate(const char* target, const char* ns, int version)
{
    UUID uuid;
    UuidError error = tryGenerate(uuid, target, ns, version);
    if (error == UuidError::INVALID_NAMESPACE)
    {
        throw UuidException(error,
            "Invalid namespace UUID: \"" + std::string(ns) + "\"");
    }
    if (error != UuidError::NONE) throw UuidException(error);
    return uuid.toString();
}

} // namespace nameuuid
