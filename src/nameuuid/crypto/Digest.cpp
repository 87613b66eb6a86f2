// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#include <nameuuid/crypto/Digest.h>
#include <nameuuid/util/log.h>
#include <cstring>
#include <openssl/err.h>
#include <openssl/evp.h>

namespace nameuuid {

static const EVP_MD* evpMethod(Digest::Algorithm algorithm) noexcept
{
    return algorithm == Digest::Algorithm::MD5 ? EVP_md5() : EVP_sha1();
}

void Digest::fail(const char* operation)
{
    char reason[256];
    unsigned long code = ERR_get_error();
    if (code)
    {
        ERR_error_string_n(code, reason, sizeof(reason));
    }
    else
    {
        strcpy(reason, "unknown error");
    }
    ERR_clear_error();
    LOG("%s failed: %s", operation, reason);
    throw DigestException(std::string(operation) + " failed: " + reason);
}

Digest::Digest(Algorithm algorithm) :
    ctx_(EVP_MD_CTX_new()),
    algorithm_(algorithm)
{
    if (!ctx_) fail("EVP_MD_CTX_new");
    if (EVP_DigestInit_ex(ctx_, evpMethod(algorithm), nullptr) != 1)
    {
        // The destructor won't run for a throwing constructor
        EVP_MD_CTX_free(ctx_);
        fail("EVP_DigestInit_ex");
    }
}

Digest::~Digest() noexcept
{
    EVP_MD_CTX_free(ctx_);
}

void Digest::update(const void* data, size_t len)
{
    if (finished_) throw DigestException("Digest already finished");
    if (len == 0) return;
    if (EVP_DigestUpdate(ctx_, data, len) != 1) fail("EVP_DigestUpdate");
}

size_t Digest::finish(uint8_t* out)
{
    if (finished_) throw DigestException("Digest already finished");
    finished_ = true;
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_, out, &len) != 1) fail("EVP_DigestFinal_ex");
    return len;
}

size_t Digest::compute(Algorithm algorithm,
    const void* data, size_t len, uint8_t* out)
{
    Digest digest(algorithm);
    digest.update(data, len);
    return digest.finish(out);
}

} // namespace nameuuid
