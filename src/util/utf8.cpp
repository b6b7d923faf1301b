#include "puaa/util/utf8.hpp"

namespace puaa::util {

namespace {

constexpr uint32_t REPLACEMENT = 0xFFFD;

// Decodes one sequence at p. Returns its length, or 0 if the sequence is invalid.
size_t decode_one(const uint8_t* p, const uint8_t* end, uint32_t& cp) {
    if (*p < 0x80) {
        // ASCII fast path
        cp = *p;
        return 1;
    }

    size_t len;
    uint32_t min;
    if ((*p & 0xE0) == 0xC0) {
        len = 2; min = 0x80; cp = *p & 0x1F;
    } else if ((*p & 0xF0) == 0xE0) {
        len = 3; min = 0x800; cp = *p & 0x0F;
    } else if ((*p & 0xF8) == 0xF0) {
        len = 4; min = 0x10000; cp = *p & 0x07;
    } else {
        return 0;   // continuation or invalid start byte
    }

    if (static_cast<size_t>(end - p) < len) {
        return 0;
    }
    for (size_t i = 1; i < len; ++i) {
        if ((p[i] & 0xC0) != 0x80) {
            return 0;
        }
        cp = (cp << 6) | (p[i] & 0x3F);
    }

    // Overlong, surrogate, out of range
    if (cp < min || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
        return 0;
    }
    return len;
}

} // namespace

size_t bom_length(std::string_view data) {
    if (data.size() >= 3 &&
        static_cast<uint8_t>(data[0]) == 0xEF &&
        static_cast<uint8_t>(data[1]) == 0xBB &&
        static_cast<uint8_t>(data[2]) == 0xBF) {
        return 3;
    }
    return 0;
}

std::optional<size_t> find_invalid_utf8(std::string_view data) {
    const uint8_t* begin = reinterpret_cast<const uint8_t*>(data.data());
    const uint8_t* p = begin;
    const uint8_t* end = begin + data.size();

    while (p < end) {
        uint32_t cp;
        size_t len = decode_one(p, end, cp);
        if (len == 0) {
            return static_cast<size_t>(p - begin);
        }
        p += len;
    }
    return std::nullopt;
}

std::vector<uint32_t> decode_utf8(std::string_view data) {
    std::vector<uint32_t> codepoints;
    codepoints.reserve(data.size());

    const uint8_t* p = reinterpret_cast<const uint8_t*>(data.data()) + bom_length(data);
    const uint8_t* end = reinterpret_cast<const uint8_t*>(data.data()) + data.size();

    while (p < end) {
        uint32_t cp;
        size_t len = decode_one(p, end, cp);
        if (len == 0) {
            // Skip one byte and resync on the next
            codepoints.push_back(REPLACEMENT);
            ++p;
        } else {
            codepoints.push_back(cp);
            p += len;
        }
    }

    return codepoints;
}

std::string encode_utf8(uint32_t cp) {
    std::string result;
    if (cp < 0x80) {
        result.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        result.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        result.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        result.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        result.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        result.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        result.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    return result;
}

} // namespace puaa::util
