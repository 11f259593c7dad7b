// CONCORD - Random Identifiers
// Copyright (c) 2024 CONCORD Developers
// MIT License
//
// Cryptographically secure random bytes (OpenSSL RAND_bytes) and the
// identifiers built from them.

#ifndef CONCORD_CORE_RANDOM_H
#define CONCORD_CORE_RANDOM_H

#include <cstddef>
#include <cstdint>
#include <string>

namespace concord {

/// Fill buffer with random bytes. Throws std::runtime_error if the
/// OpenSSL generator is not seeded.
void GetRandBytes(uint8_t* buf, size_t len);

/// Lowercase hex of `nbytes` random bytes (string length is 2 * nbytes)
std::string GetRandHex(size_t nbytes);

/// New trace identifier ("tr-" + 16 hex chars)
std::string NewTraceId();

/// Lowercase hex encoding
std::string BytesToHex(const uint8_t* data, size_t len);

} // namespace concord

#endif // CONCORD_CORE_RANDOM_H
