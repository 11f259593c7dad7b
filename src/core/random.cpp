// CONCORD - Random Identifiers Implementation
// Copyright (c) 2024 CONCORD Developers
// MIT License

#include <concord/core/random.h>

#include <openssl/rand.h>

#include <stdexcept>
#include <vector>

namespace concord {

namespace {
    constexpr char HEX_CHARS[] = "0123456789abcdef";
}

void GetRandBytes(uint8_t* buf, size_t len) {
    if (len == 0) return;
    if (RAND_bytes(buf, static_cast<int>(len)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
}

std::string GetRandHex(size_t nbytes) {
    std::vector<uint8_t> buf(nbytes);
    GetRandBytes(buf.data(), buf.size());
    return BytesToHex(buf.data(), buf.size());
}

std::string NewTraceId() {
    return "tr-" + GetRandHex(8);
}

std::string BytesToHex(const uint8_t* data, size_t len) {
    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        result.push_back(HEX_CHARS[data[i] >> 4]);
        result.push_back(HEX_CHARS[data[i] & 0x0F]);
    }
    return result;
}

} // namespace concord
