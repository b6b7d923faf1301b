// =============================================================================
// UTF-8 Utility Tests
// =============================================================================

#include <gtest/gtest.h>
#include "puaa/util/utf8.hpp"

using namespace puaa::util;

class Utf8Test : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(Utf8Test, EncodeEachLength) {
    EXPECT_EQ(encode_utf8(0x41), "A");
    EXPECT_EQ(encode_utf8(0xE9), "\xC3\xA9");
    EXPECT_EQ(encode_utf8(0x4E00), "\xE4\xB8\x80");
    EXPECT_EQ(encode_utf8(0x1F600), "\xF0\x9F\x98\x80");
    EXPECT_EQ(encode_utf8(0x10FFFF), "\xF4\x8F\xBF\xBF");
}

TEST_F(Utf8Test, DecodeMixedText) {
    std::vector<uint32_t> cps = decode_utf8("A\xC3\xA9\xE4\xB8\x80\xF0\x9F\x98\x80");
    EXPECT_EQ(cps, (std::vector<uint32_t>{0x41, 0xE9, 0x4E00, 0x1F600}));
}

TEST_F(Utf8Test, DecodeSkipsByteOrderMark) {
    EXPECT_EQ(decode_utf8("\xEF\xBB\xBFZ"), (std::vector<uint32_t>{0x5A}));
    EXPECT_EQ(bom_length("\xEF\xBB\xBFZ"), 3u);
    EXPECT_EQ(bom_length("Z"), 0u);
    EXPECT_EQ(bom_length("\xEF\xBB"), 0u);
}

TEST_F(Utf8Test, DecodeReplacesInvalidBytes) {
    // Lone continuation byte, then a valid letter
    EXPECT_EQ(decode_utf8("\x80" "B"), (std::vector<uint32_t>{0xFFFD, 0x42}));
    // Truncated three-byte sequence resyncs byte by byte
    EXPECT_EQ(decode_utf8("\xE4\xB8"), (std::vector<uint32_t>{0xFFFD, 0xFFFD}));
}

TEST_F(Utf8Test, FindInvalidReportsOffset) {
    EXPECT_FALSE(find_invalid_utf8("plain ascii; 0041").has_value());
    EXPECT_FALSE(find_invalid_utf8("\xE4\xB8\x80 ok").has_value());
    EXPECT_EQ(find_invalid_utf8("abc\xFF"), 3u);
}

TEST_F(Utf8Test, RejectsOverlongSurrogatesAndOutOfRange) {
    EXPECT_EQ(find_invalid_utf8("\xC0\xAF"), 0u);           // overlong '/'
    EXPECT_EQ(find_invalid_utf8("\xE0\x80\xAF"), 0u);       // overlong '/'
    EXPECT_EQ(find_invalid_utf8("x\xED\xA0\x80"), 1u);      // U+D800
    EXPECT_EQ(find_invalid_utf8("\xF4\x90\x80\x80"), 0u);   // U+110000
}

TEST_F(Utf8Test, RoundTripAcrossPlanes) {
    for (uint32_t cp : {0x7Fu, 0x80u, 0x7FFu, 0x800u, 0xFFFFu, 0x10000u, 0xFAB00u}) {
        std::string bytes = encode_utf8(cp);
        EXPECT_FALSE(find_invalid_utf8(bytes).has_value()) << std::hex << cp;
        EXPECT_EQ(decode_utf8(bytes), (std::vector<uint32_t>{cp})) << std::hex << cp;
    }
}
