// CONCORD - Hashing Implementation
// Copyright (c) 2024 CONCORD Developers
// MIT License

#include <concord/core/hash.h>
#include <concord/core/random.h>

#include <openssl/evp.h>

#include <memory>
#include <stdexcept>

namespace concord {

std::string Sha256Hex(const std::string& data) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(
        EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digestLen) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    return BytesToHex(digest, digestLen);
}

} // namespace concord
