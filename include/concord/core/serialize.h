// CONCORD - Serialization Header
// Copyright (c) 2024 CONCORD Developers
// MIT License
//
// Binary serialization primitives used for stored records.
// Integers are little-endian, strings and vectors are CompactSize-prefixed.
// Big-endian helpers are provided separately for building sortable keys.

#ifndef CONCORD_CORE_SERIALIZE_H
#define CONCORD_CORE_SERIALIZE_H

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <ios>
#include <map>
#include <string>
#include <vector>

namespace concord {

/// Maximum size for a single serialized string or vector
static constexpr uint64_t MAX_SIZE = 0x02000000;  // 32 MB

// ============================================================================
// DataStream - In-memory byte buffer for serialization
// ============================================================================

class DataStream {
public:
    using size_type = std::size_t;

private:
    std::vector<uint8_t> data_;
    size_type read_pos_ = 0;

public:
    DataStream() = default;

    DataStream(const uint8_t* data, size_type len) : data_(data, data + len) {}

    explicit DataStream(const std::string& bytes)
        : data_(bytes.begin(), bytes.end()) {}

    /// Unread bytes remaining
    size_type size() const noexcept { return data_.size() - read_pos_; }
    bool empty() const noexcept { return size() == 0; }

    const uint8_t* data() const noexcept { return data_.data() + read_pos_; }

    /// Unread bytes as a string (for database values)
    std::string str() const {
        return std::string(reinterpret_cast<const char*>(data()), size());
    }

    void Write(const uint8_t* src, size_type len) {
        data_.insert(data_.end(), src, src + len);
    }

    void Write(const char* src, size_type len) {
        Write(reinterpret_cast<const uint8_t*>(src), len);
    }

    void Read(uint8_t* dst, size_type len) {
        if (len > size()) {
            throw std::ios_base::failure("DataStream::Read(): end of data");
        }
        std::memcpy(dst, data_.data() + read_pos_, len);
        read_pos_ += len;
    }

    void Read(char* dst, size_type len) {
        Read(reinterpret_cast<uint8_t*>(dst), len);
    }

    template<typename T>
    DataStream& operator<<(const T& obj);

    template<typename T>
    DataStream& operator>>(T& obj);
};

// ============================================================================
// Low-Level Serialization Functions
// ============================================================================

template<typename Stream>
inline void ser_writedata8(Stream& s, uint8_t obj) {
    s.Write(&obj, 1);
}

template<typename Stream>
inline void ser_writedata32(Stream& s, uint32_t obj) {
    uint8_t buf[4];
    for (int i = 0; i < 4; ++i) buf[i] = static_cast<uint8_t>(obj >> (8 * i));
    s.Write(buf, 4);
}

template<typename Stream>
inline void ser_writedata64(Stream& s, uint64_t obj) {
    uint8_t buf[8];
    for (int i = 0; i < 8; ++i) buf[i] = static_cast<uint8_t>(obj >> (8 * i));
    s.Write(buf, 8);
}

template<typename Stream>
inline uint8_t ser_readdata8(Stream& s) {
    uint8_t obj;
    s.Read(&obj, 1);
    return obj;
}

template<typename Stream>
inline uint32_t ser_readdata32(Stream& s) {
    uint8_t buf[4];
    s.Read(buf, 4);
    uint32_t v = 0;
    for (int i = 3; i >= 0; --i) v = (v << 8) | buf[i];
    return v;
}

template<typename Stream>
inline uint64_t ser_readdata64(Stream& s) {
    uint8_t buf[8];
    s.Read(buf, 8);
    uint64_t v = 0;
    for (int i = 7; i >= 0; --i) v = (v << 8) | buf[i];
    return v;
}

// ============================================================================
// CompactSize Encoding
// ============================================================================
//   size <  253        -- 1 byte
//   size <= 0xFFFFFFFF -- 5 bytes (0xFE + 4 bytes little-endian)
//   otherwise          -- 9 bytes (0xFF + 8 bytes little-endian)

template<typename Stream>
void WriteCompactSize(Stream& s, uint64_t size) {
    if (size < 253) {
        ser_writedata8(s, static_cast<uint8_t>(size));
    } else if (size <= 0xFFFFFFFF) {
        ser_writedata8(s, 0xFE);
        ser_writedata32(s, static_cast<uint32_t>(size));
    } else {
        ser_writedata8(s, 0xFF);
        ser_writedata64(s, size);
    }
}

template<typename Stream>
uint64_t ReadCompactSize(Stream& s) {
    uint8_t marker = ser_readdata8(s);
    uint64_t size = 0;
    if (marker < 253) {
        size = marker;
    } else if (marker == 0xFE) {
        size = ser_readdata32(s);
    } else if (marker == 0xFF) {
        size = ser_readdata64(s);
    } else {
        throw std::ios_base::failure("ReadCompactSize(): bad marker");
    }
    if (size > MAX_SIZE) {
        throw std::ios_base::failure("ReadCompactSize(): size too large");
    }
    return size;
}

// ============================================================================
// Serialize/Unserialize for Basic Types
// ============================================================================

template<typename Stream>
inline void Serialize(Stream& s, uint32_t a) { ser_writedata32(s, a); }
template<typename Stream>
inline void Serialize(Stream& s, int32_t a) { ser_writedata32(s, static_cast<uint32_t>(a)); }
template<typename Stream>
inline void Unserialize(Stream& s, uint32_t& a) { a = ser_readdata32(s); }
template<typename Stream>
inline void Unserialize(Stream& s, int32_t& a) { a = static_cast<int32_t>(ser_readdata32(s)); }

template<typename Stream>
inline void Serialize(Stream& s, uint64_t a) { ser_writedata64(s, a); }
template<typename Stream>
inline void Serialize(Stream& s, int64_t a) { ser_writedata64(s, static_cast<uint64_t>(a)); }
template<typename Stream>
inline void Unserialize(Stream& s, uint64_t& a) { a = ser_readdata64(s); }
template<typename Stream>
inline void Unserialize(Stream& s, int64_t& a) { a = static_cast<int64_t>(ser_readdata64(s)); }

template<typename Stream>
inline void Serialize(Stream& s, bool a) { ser_writedata8(s, a ? 1 : 0); }
template<typename Stream>
inline void Unserialize(Stream& s, bool& a) { a = (ser_readdata8(s) != 0); }

template<typename Stream>
void Serialize(Stream& s, const std::string& str) {
    WriteCompactSize(s, str.size());
    if (!str.empty()) {
        s.Write(str.data(), str.size());
    }
}

template<typename Stream>
void Unserialize(Stream& s, std::string& str) {
    uint64_t size = ReadCompactSize(s);
    str.resize(size);
    if (size > 0) {
        s.Read(&str[0], size);
    }
}

template<typename Stream, typename T>
void Serialize(Stream& s, const std::vector<T>& v) {
    WriteCompactSize(s, v.size());
    for (const auto& item : v) {
        Serialize(s, item);
    }
}

template<typename Stream, typename T>
void Unserialize(Stream& s, std::vector<T>& v) {
    uint64_t size = ReadCompactSize(s);
    v.clear();
    for (uint64_t i = 0; i < size; ++i) {
        T item;
        Unserialize(s, item);
        v.push_back(std::move(item));
    }
}

template<typename Stream>
void Serialize(Stream& s, const std::map<std::string, std::string>& m) {
    WriteCompactSize(s, m.size());
    for (const auto& [key, value] : m) {
        Serialize(s, key);
        Serialize(s, value);
    }
}

template<typename Stream>
void Unserialize(Stream& s, std::map<std::string, std::string>& m) {
    uint64_t size = ReadCompactSize(s);
    m.clear();
    for (uint64_t i = 0; i < size; ++i) {
        std::string key;
        std::string value;
        Unserialize(s, key);
        Unserialize(s, value);
        m.emplace(std::move(key), std::move(value));
    }
}

template<typename T>
DataStream& DataStream::operator<<(const T& obj) {
    Serialize(*this, obj);
    return *this;
}

template<typename T>
DataStream& DataStream::operator>>(T& obj) {
    Unserialize(*this, obj);
    return *this;
}

// ============================================================================
// Big-Endian Key Components
// ============================================================================

/// Append a big-endian uint64 so that byte order matches numeric order
inline void AppendBE64(std::string& out, uint64_t v) {
    for (int i = 7; i >= 0; --i) {
        out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
    }
}

/// Read a big-endian uint64 from the first 8 bytes of `p`
inline uint64_t ReadBE64(const char* p) {
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) {
        v = (v << 8) | static_cast<uint8_t>(p[i]);
    }
    return v;
}

} // namespace concord

#endif // CONCORD_CORE_SERIALIZE_H
