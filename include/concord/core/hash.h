// CONCORD - Hashing
// Copyright (c) 2024 CONCORD Developers
// MIT License

#ifndef CONCORD_CORE_HASH_H
#define CONCORD_CORE_HASH_H

#include <string>

namespace concord {

/// SHA-256 of `data` as 64 lowercase hex characters (OpenSSL libcrypto)
std::string Sha256Hex(const std::string& data);

} // namespace concord

#endif // CONCORD_CORE_HASH_H
