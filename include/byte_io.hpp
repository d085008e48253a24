/*
 * AdaTP - big-endian byte readers and writers
 *
 * Every multi-byte integer on the wire is big-endian. ByteReader never reads
 * past the end of its input; each read reports whether enough bytes remained.
 */

#pragma once

#include <array>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace adatp {

inline void store_u16(uint8_t* out, uint16_t value) {
    out[0] = static_cast<uint8_t>(value >> 8);
    out[1] = static_cast<uint8_t>(value & 0xFF);
}

inline void store_u32(uint8_t* out, uint32_t value) {
    for (int i = 3; i >= 0; --i) {
        out[i] = static_cast<uint8_t>(value & 0xFF);
        value >>= 8;
    }
}

inline void store_u64(uint8_t* out, uint64_t value) {
    for (int i = 7; i >= 0; --i) {
        out[i] = static_cast<uint8_t>(value & 0xFF);
        value >>= 8;
    }
}

inline uint16_t load_u16(const uint8_t* in) {
    return static_cast<uint16_t>((in[0] << 8) | in[1]);
}

inline uint32_t load_u32(const uint8_t* in) {
    uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        value = (value << 8) | in[i];
    }
    return value;
}

inline uint64_t load_u64(const uint8_t* in) {
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value = (value << 8) | in[i];
    }
    return value;
}

class ByteWriter {
public:
    ByteWriter() = default;
    explicit ByteWriter(std::size_t reserve) { buffer_.reserve(reserve); }

    void put_u8(uint8_t value) { buffer_.push_back(value); }

    void put_u16(uint16_t value) {
        uint8_t tmp[2];
        store_u16(tmp, value);
        buffer_.insert(buffer_.end(), tmp, tmp + 2);
    }

    void put_u32(uint32_t value) {
        uint8_t tmp[4];
        store_u32(tmp, value);
        buffer_.insert(buffer_.end(), tmp, tmp + 4);
    }

    void put_u64(uint64_t value) {
        uint8_t tmp[8];
        store_u64(tmp, value);
        buffer_.insert(buffer_.end(), tmp, tmp + 8);
    }

    void put_bytes(const uint8_t* data, std::size_t len) {
        buffer_.insert(buffer_.end(), data, data + len);
    }

    void put_bytes(const std::vector<uint8_t>& data) { put_bytes(data.data(), data.size()); }

    template <std::size_t N>
    void put_array(const std::array<uint8_t, N>& data) {
        put_bytes(data.data(), N);
    }

    void put_string(const std::string& text) {
        buffer_.insert(buffer_.end(), text.begin(), text.end());
    }

    std::vector<uint8_t> take() { return std::move(buffer_); }

    std::size_t size() const { return buffer_.size(); }

private:
    std::vector<uint8_t> buffer_;
};

class ByteReader {
public:
    ByteReader(const uint8_t* data, std::size_t len) : data_(data), len_(len) {}
    explicit ByteReader(const std::vector<uint8_t>& data) : data_(data.data()), len_(data.size()) {}

    std::size_t remaining() const { return len_ - pos_; }
    std::size_t position() const { return pos_; }

    bool read_u8(uint8_t& out) {
        if (remaining() < 1) {
            return false;
        }
        out = data_[pos_++];
        return true;
    }

    bool read_u16(uint16_t& out) {
        if (remaining() < 2) {
            return false;
        }
        out = load_u16(data_ + pos_);
        pos_ += 2;
        return true;
    }

    bool read_u32(uint32_t& out) {
        if (remaining() < 4) {
            return false;
        }
        out = load_u32(data_ + pos_);
        pos_ += 4;
        return true;
    }

    bool read_u64(uint64_t& out) {
        if (remaining() < 8) {
            return false;
        }
        out = load_u64(data_ + pos_);
        pos_ += 8;
        return true;
    }

    template <std::size_t N>
    bool read_array(std::array<uint8_t, N>& out) {
        if (remaining() < N) {
            return false;
        }
        std::memcpy(out.data(), data_ + pos_, N);
        pos_ += N;
        return true;
    }

    bool read_string(std::size_t len, std::string& out) {
        if (remaining() < len) {
            return false;
        }
        out.assign(reinterpret_cast<const char*>(data_ + pos_), len);
        pos_ += len;
        return true;
    }

private:
    const uint8_t* data_;
    std::size_t len_;
    std::size_t pos_ = 0;
};

} // namespace adatp
