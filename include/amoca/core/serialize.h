// AMOCA - Serialization Header
// Copyright (c) 2024 AMOCA Developers
// MIT License
//
// Binary encoding for ledger records, transactions and database values.
// Integers are little-endian fixed width; strings and vectors carry a
// compact-size length prefix.

#ifndef AMOCA_CORE_SERIALIZE_H
#define AMOCA_CORE_SERIALIZE_H

#include <amoca/core/types.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <ios>
#include <string>
#include <vector>

namespace amoca {

// ============================================================================
// Constants
// ============================================================================

/// Maximum length prefix accepted when decoding
static constexpr uint64_t MAX_SIZE = 0x02000000;  // 32 MB

// ============================================================================
// Endianness Helpers
// ============================================================================

namespace detail {

template<typename T>
inline T ToLittleEndian(T host) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    T swapped;
    const uint8_t* src = reinterpret_cast<const uint8_t*>(&host);
    uint8_t* dst = reinterpret_cast<uint8_t*>(&swapped);
    for (size_t i = 0; i < sizeof(T); ++i) {
        dst[i] = src[sizeof(T) - 1 - i];
    }
    return swapped;
#else
    return host;
#endif
}

} // namespace detail

// ============================================================================
// DataStream - In-memory byte buffer for serialization
// ============================================================================

class DataStream {
public:
    DataStream() = default;
    explicit DataStream(const std::vector<uint8_t>& data) : data_(data) {}
    explicit DataStream(std::vector<uint8_t>&& data) : data_(std::move(data)) {}
    DataStream(const uint8_t* data, size_t len) : data_(data, data + len) {}
    
    /// Unread bytes remaining
    size_t size() const noexcept { return data_.size() - readPos_; }
    bool empty() const noexcept { return size() == 0; }
    
    /// Pointer to unread data
    const uint8_t* data() const noexcept { return data_.data() + readPos_; }
    
    /// Unread data as a byte vector
    std::vector<uint8_t> GetBytes() const {
        return std::vector<uint8_t>(data_.begin() + readPos_, data_.end());
    }
    
    /// Unread data as a string (database values)
    std::string GetString() const {
        return std::string(reinterpret_cast<const char*>(data()), size());
    }
    
    void Write(const uint8_t* src, size_t len) {
        data_.insert(data_.end(), src, src + len);
    }
    
    void Write(const char* src, size_t len) {
        Write(reinterpret_cast<const uint8_t*>(src), len);
    }
    
    void Read(uint8_t* dst, size_t len) {
        if (len > size()) {
            throw std::ios_base::failure("DataStream::Read(): end of data");
        }
        std::memcpy(dst, data_.data() + readPos_, len);
        readPos_ += len;
    }
    
    void Read(char* dst, size_t len) {
        Read(reinterpret_cast<uint8_t*>(dst), len);
    }
    
    void clear() {
        data_.clear();
        readPos_ = 0;
    }
    
    std::string ToHex() const;
    
    template<typename T>
    DataStream& operator<<(const T& obj);
    
    template<typename T>
    DataStream& operator>>(T& obj);

private:
    std::vector<uint8_t> data_;
    size_t readPos_{0};
};

// ============================================================================
// Fixed-Width Integers
// ============================================================================

template<typename Stream, typename T>
inline void WriteLE(Stream& s, T value) {
    value = detail::ToLittleEndian(value);
    s.Write(reinterpret_cast<const uint8_t*>(&value), sizeof(T));
}

template<typename Stream, typename T>
inline T ReadLE(Stream& s) {
    T value;
    s.Read(reinterpret_cast<uint8_t*>(&value), sizeof(T));
    return detail::ToLittleEndian(value);
}

// ============================================================================
// CompactSize Encoding
// ============================================================================
//   size <  253        -- 1 byte
//   size <= 0xFFFF     -- 0xFD + 2 bytes
//   size <= 0xFFFFFFFF -- 0xFE + 4 bytes
//   otherwise          -- 0xFF + 8 bytes

template<typename Stream>
void WriteCompactSize(Stream& s, uint64_t size) {
    if (size < 253) {
        WriteLE<Stream, uint8_t>(s, static_cast<uint8_t>(size));
    } else if (size <= 0xFFFF) {
        WriteLE<Stream, uint8_t>(s, 0xFD);
        WriteLE<Stream, uint16_t>(s, static_cast<uint16_t>(size));
    } else if (size <= 0xFFFFFFFF) {
        WriteLE<Stream, uint8_t>(s, 0xFE);
        WriteLE<Stream, uint32_t>(s, static_cast<uint32_t>(size));
    } else {
        WriteLE<Stream, uint8_t>(s, 0xFF);
        WriteLE<Stream, uint64_t>(s, size);
    }
}

template<typename Stream>
uint64_t ReadCompactSize(Stream& s) {
    uint8_t marker = ReadLE<Stream, uint8_t>(s);
    uint64_t size = 0;
    
    if (marker < 253) {
        size = marker;
    } else if (marker == 253) {
        size = ReadLE<Stream, uint16_t>(s);
        if (size < 253) {
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
        }
    } else if (marker == 254) {
        size = ReadLE<Stream, uint32_t>(s);
        if (size < 0x10000) {
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
        }
    } else {
        size = ReadLE<Stream, uint64_t>(s);
        if (size < 0x100000000ULL) {
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
        }
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
inline void Serialize(Stream& s, uint8_t a) { WriteLE(s, a); }
template<typename Stream>
inline void Unserialize(Stream& s, uint8_t& a) { a = ReadLE<Stream, uint8_t>(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint32_t a) { WriteLE(s, a); }
template<typename Stream>
inline void Unserialize(Stream& s, uint32_t& a) { a = ReadLE<Stream, uint32_t>(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint64_t a) { WriteLE(s, a); }
template<typename Stream>
inline void Unserialize(Stream& s, uint64_t& a) { a = ReadLE<Stream, uint64_t>(s); }

template<typename Stream>
inline void Serialize(Stream& s, int64_t a) { WriteLE(s, static_cast<uint64_t>(a)); }
template<typename Stream>
inline void Unserialize(Stream& s, int64_t& a) {
    a = static_cast<int64_t>(ReadLE<Stream, uint64_t>(s));
}

template<typename Stream>
inline void Serialize(Stream& s, bool a) { WriteLE<Stream, uint8_t>(s, a ? 1 : 0); }
template<typename Stream>
inline void Unserialize(Stream& s, bool& a) { a = ReadLE<Stream, uint8_t>(s) != 0; }

// ============================================================================
// Strings and Byte Vectors
// ============================================================================

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

template<typename Stream>
void Serialize(Stream& s, const std::vector<uint8_t>& v) {
    WriteCompactSize(s, v.size());
    if (!v.empty()) {
        s.Write(v.data(), v.size());
    }
}

template<typename Stream>
void Unserialize(Stream& s, std::vector<uint8_t>& v) {
    uint64_t size = ReadCompactSize(s);
    v.resize(size);
    if (size > 0) {
        s.Read(v.data(), size);
    }
}

// ============================================================================
// Hash Types
// ============================================================================

template<typename Stream>
void Serialize(Stream& s, const Hash256& hash) {
    s.Write(hash.data(), Hash256::SIZE);
}

template<typename Stream>
void Unserialize(Stream& s, Hash256& hash) {
    s.Read(hash.data(), Hash256::SIZE);
}

template<typename Stream>
void Serialize(Stream& s, const Hash160& hash) {
    s.Write(hash.data(), Hash160::SIZE);
}

template<typename Stream>
void Unserialize(Stream& s, Hash160& hash) {
    s.Read(hash.data(), Hash160::SIZE);
}

// ============================================================================
// DataStream Stream Operators Implementation
// ============================================================================

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

} // namespace amoca

#endif // AMOCA_CORE_SERIALIZE_H
