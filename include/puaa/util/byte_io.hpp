#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace puaa::util {

// =============================================================================
// Big-endian primitives (tables and sfnt containers are big-endian throughout)
// =============================================================================

inline uint16_t load_be16(const uint8_t* p) noexcept {
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

inline uint32_t load_be32(const uint8_t* p) noexcept {
    return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) | uint32_t(p[3]);
}

inline void store_be16(uint8_t* p, uint16_t v) noexcept {
    p[0] = static_cast<uint8_t>(v >> 8);
    p[1] = static_cast<uint8_t>(v);
}

inline void store_be32(uint8_t* p, uint32_t v) noexcept {
    p[0] = static_cast<uint8_t>(v >> 24);
    p[1] = static_cast<uint8_t>(v >> 16);
    p[2] = static_cast<uint8_t>(v >> 8);
    p[3] = static_cast<uint8_t>(v);
}

constexpr uint32_t make_tag(char a, char b, char c, char d) noexcept {
    return (uint32_t(uint8_t(a)) << 24) | (uint32_t(uint8_t(b)) << 16) |
           (uint32_t(uint8_t(c)) << 8) | uint32_t(uint8_t(d));
}

inline std::string tag_to_string(uint32_t tag) {
    std::string s(4, ' ');
    for (int i = 0; i < 4; ++i) {
        s[i] = static_cast<char>((tag >> (24 - 8 * i)) & 0xFF);
    }
    return s;
}

// =============================================================================
// Growable output buffer
// =============================================================================

class ByteWriter {
public:
    void put_u8(uint8_t v) { bytes_.push_back(v); }

    void put_u16(uint16_t v) {
        bytes_.push_back(static_cast<uint8_t>(v >> 8));
        bytes_.push_back(static_cast<uint8_t>(v));
    }

    void put_u32(uint32_t v) {
        uint8_t b[4];
        store_be32(b, v);
        bytes_.insert(bytes_.end(), b, b + 4);
    }

    void put_bytes(std::span<const uint8_t> data) {
        bytes_.insert(bytes_.end(), data.begin(), data.end());
    }

    // Overwrite a value reserved earlier
    void patch_u32(size_t pos, uint32_t v) noexcept { store_be32(bytes_.data() + pos, v); }

    size_t size() const noexcept { return bytes_.size(); }
    const std::vector<uint8_t>& bytes() const noexcept { return bytes_; }
    std::vector<uint8_t> take() { return std::move(bytes_); }

private:
    std::vector<uint8_t> bytes_;
};

// =============================================================================
// Bounds-checked input cursor
// =============================================================================

/**
 * Reads big-endian values from a byte span. Any read past the end throws
 * Error(message, context), so callers choose which failure a short buffer is
 * (a corrupt table, an unsupported container, ...).
 */
template<typename Error>
class ByteReader {
public:
    ByteReader(std::span<const uint8_t> data, std::string context, size_t pos = 0)
        : data_(data), context_(std::move(context)), pos_(pos) {}

    uint8_t u8() {
        require(1);
        return data_[pos_++];
    }

    uint16_t u16() {
        require(2);
        uint16_t v = load_be16(data_.data() + pos_);
        pos_ += 2;
        return v;
    }

    uint32_t u32() {
        require(4);
        uint32_t v = load_be32(data_.data() + pos_);
        pos_ += 4;
        return v;
    }

    void skip(size_t n) {
        require(n);
        pos_ += n;
    }

    void seek(size_t pos) {
        if (pos > data_.size()) {
            throw Error("offset " + std::to_string(pos) + " is past the end of the data", context_);
        }
        pos_ = pos;
    }

    size_t position() const noexcept { return pos_; }

private:
    void require(size_t n) const {
        if (n > data_.size() - pos_) {
            throw Error("read of " + std::to_string(n) + " bytes at offset " +
                        std::to_string(pos_) + " runs past the end of the data", context_);
        }
    }

    std::span<const uint8_t> data_;
    std::string context_;
    size_t pos_;
};

} // namespace puaa::util
