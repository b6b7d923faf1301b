// =============================================================================
// UCD Text Parser Tests
// =============================================================================

#include <gtest/gtest.h>
#include "puaa/error.hpp"
#include "puaa/ucd/parser.hpp"
#include "test_support.hpp"

using namespace puaa;
using namespace puaa::ucd;

class ParserTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}

    static SourceFile parse(const std::string& text, FileKind kind, const std::string& path = "test.txt") {
        return parse_text(text, path, kind);
    }

    // Line number reported by a MalformedSourceError, or 0 if nothing was thrown
    static size_t error_line(const std::string& text, FileKind kind) {
        try {
            parse(text, kind);
        } catch (const MalformedSourceError& e) {
            return e.line();
        }
        return 0;
    }
};

// =============================================================================
// Codepoints and ranges
// =============================================================================

TEST_F(ParserTest, ParseCodepoint) {
    EXPECT_EQ(parse_codepoint("0041"), 0x41u);
    EXPECT_EQ(parse_codepoint("fab00"), 0xFAB00u);
    EXPECT_EQ(parse_codepoint("10FFFF"), 0x10FFFFu);

    EXPECT_FALSE(parse_codepoint(""));
    EXPECT_FALSE(parse_codepoint("110000"));
    EXPECT_FALSE(parse_codepoint("12G4"));
    EXPECT_FALSE(parse_codepoint("000000041"));   // more than 8 digits
}

TEST_F(ParserTest, ParseRange) {
    auto single = parse_range("0041");
    ASSERT_TRUE(single);
    EXPECT_EQ(*single, CodepointRange::single(0x41));

    auto range = parse_range("4E00..9FFF");
    ASSERT_TRUE(range);
    EXPECT_EQ(range->start, 0x4E00u);
    EXPECT_EQ(range->end, 0x9FFFu);

    EXPECT_FALSE(parse_range("9FFF..4E00"));
    EXPECT_FALSE(parse_range("4E00.."));
    EXPECT_FALSE(parse_range("..9FFF"));
}

// =============================================================================
// Blocks.txt
// =============================================================================

TEST_F(ParserTest, BlocksWithCommentsAndBlankLines) {
    SourceFile file = parse(test::SAMPLE_BLOCKS, FileKind::Blocks);

    ASSERT_EQ(file.blocks.size(), 2u);
    EXPECT_EQ(file.blocks[0].range, (CodepointRange{0x0000, 0x007F}));
    EXPECT_EQ(file.blocks[0].name, "Basic Latin");
    EXPECT_EQ(file.blocks[1].name, "CJK Unified Ideographs");
    EXPECT_EQ(file.blocks[1].origin.line, 3u);
    EXPECT_EQ(file.blocks[1].origin.file, "test.txt");
}

TEST_F(ParserTest, BlocksSkipByteOrderMark) {
    SourceFile file = parse("\xEF\xBB\xBF" "FAB00..FAB3F; Applebanana\n", FileKind::Blocks);
    ASSERT_EQ(file.blocks.size(), 1u);
    EXPECT_EQ(file.blocks[0].range.start, 0xFAB00u);
}

TEST_F(ParserTest, BlocksRejectBadLines) {
    EXPECT_EQ(error_line("0000..007F; Basic Latin\n0080..00FF\n", FileKind::Blocks), 2u);
    EXPECT_EQ(error_line("0000..007F;\n", FileKind::Blocks), 1u);
    EXPECT_EQ(error_line("007F..0000; Backwards\n", FileKind::Blocks), 1u);
}

TEST_F(ParserTest, InvalidUtf8ReportsLine) {
    EXPECT_EQ(error_line("0000..007F; Basic Latin\n0080..00FF; Bad \xFF name\n", FileKind::Blocks), 2u);
}

// =============================================================================
// UnicodeData.txt
// =============================================================================

TEST_F(ParserTest, UnicodeDataFields) {
    SourceFile file = parse(test::SAMPLE_UNICODE_DATA, FileKind::UnicodeData);
    ASSERT_EQ(file.characters.size(), 7u);

    const CharacterRecord& null = file.characters[0];
    EXPECT_EQ(null.name, "<control>");
    EXPECT_EQ(null.general_category, GeneralCategory::Cc);
    EXPECT_EQ(null.bidi_class, BidiClass::BN);
    EXPECT_EQ(null.unicode1_name, std::optional<std::string>("NULL"));

    const CharacterRecord& zero = file.characters[1];
    ASSERT_TRUE(zero.numeric_values);
    EXPECT_EQ(zero.numeric_values->decimal, "0");
    EXPECT_EQ(zero.numeric_values->numeric, "0");

    const CharacterRecord& upper_a = file.characters[2];
    EXPECT_EQ(upper_a.general_category, GeneralCategory::Lu);
    EXPECT_EQ(upper_a.simple_lowercase, std::optional<uint32_t>(0x61));
    EXPECT_FALSE(upper_a.simple_uppercase);
    EXPECT_FALSE(upper_a.decomposition);
    EXPECT_FALSE(upper_a.numeric_values);

    const CharacterRecord& lower_a = file.characters[3];
    EXPECT_EQ(lower_a.simple_uppercase, std::optional<uint32_t>(0x41));
    EXPECT_EQ(lower_a.simple_titlecase, std::optional<uint32_t>(0x41));

    const CharacterRecord& half = file.characters[4];
    ASSERT_TRUE(half.decomposition);
    EXPECT_EQ(half.decomposition->tag, "<fraction>");
    EXPECT_EQ(half.decomposition->mapping, (std::vector<uint32_t>{0x31, 0x2044, 0x32}));
    ASSERT_TRUE(half.numeric_values);
    EXPECT_EQ(half.numeric_values->decimal, "");
    EXPECT_EQ(half.numeric_values->numeric, "1/2");

    const CharacterRecord& paren = file.characters[5];
    EXPECT_TRUE(paren.bidi_mirrored);
    EXPECT_FALSE(upper_a.bidi_mirrored);
}

TEST_F(ParserTest, CanonicalDecompositionHasNoTag) {
    SourceFile file = parse("00C5;LATIN CAPITAL LETTER A WITH RING ABOVE;Lu;0;L;0041 030A;;;;N;;;;00E5;\n",
                            FileKind::UnicodeData);
    ASSERT_EQ(file.characters.size(), 1u);
    ASSERT_TRUE(file.characters[0].decomposition);
    EXPECT_EQ(file.characters[0].decomposition->tag, "");
    EXPECT_EQ(file.characters[0].decomposition->mapping, (std::vector<uint32_t>{0x41, 0x30A}));
}

TEST_F(ParserTest, FirstLastPairFoldsIntoRange) {
    SourceFile file = parse(test::SAMPLE_UNICODE_DATA, FileKind::UnicodeData);

    const CharacterRecord& cjk = file.characters.back();
    EXPECT_EQ(cjk.codepoints, (CodepointRange{0x4E00, 0x9FFF}));
    EXPECT_EQ(cjk.name, "<CJK Ideograph>");
    EXPECT_EQ(cjk.general_category, GeneralCategory::Lo);
}

TEST_F(ParserTest, FirstWithoutLastIsRejected) {
    const std::string text =
        "0041;LATIN CAPITAL LETTER A;Lu;0;L;;;;;N;;;;0061;\n"
        "AC00;<Hangul Syllable, First>;Lo;0;L;;;;;N;;;;;\n";
    EXPECT_EQ(error_line(text, FileKind::UnicodeData), 2u);
}

TEST_F(ParserTest, FirstFollowedByOrdinaryLineIsRejected) {
    const std::string text =
        "AC00;<Hangul Syllable, First>;Lo;0;L;;;;;N;;;;;\n"
        "AC01;HANGUL SYLLABLE GAG;Lo;0;L;;;;;N;;;;;\n";
    EXPECT_EQ(error_line(text, FileKind::UnicodeData), 2u);
}

TEST_F(ParserTest, LastWithoutFirstIsRejected) {
    EXPECT_EQ(error_line("D7A3;<Hangul Syllable, Last>;Lo;0;L;;;;;N;;;;;\n", FileKind::UnicodeData), 1u);
}

TEST_F(ParserTest, MismatchedRangeLabelsAreRejected) {
    const std::string text =
        "AC00;<Hangul Syllable, First>;Lo;0;L;;;;;N;;;;;\n"
        "D7A3;<Hangul Syllables, Last>;Lo;0;L;;;;;N;;;;;\n";
    EXPECT_EQ(error_line(text, FileKind::UnicodeData), 2u);
}

TEST_F(ParserTest, RangeEndpointsMustAgree) {
    const std::string text =
        "AC00;<Hangul Syllable, First>;Lo;0;L;;;;;N;;;;;\n"
        "D7A3;<Hangul Syllable, Last>;Lm;0;L;;;;;N;;;;;\n";
    EXPECT_EQ(error_line(text, FileKind::UnicodeData), 2u);
}

TEST_F(ParserTest, UnicodeDataRejectsBadFields) {
    // 14 fields
    EXPECT_EQ(error_line("0041;LATIN CAPITAL LETTER A;Lu;0;L;;;;;N;;;;0061\n", FileKind::UnicodeData), 1u);
    // Unknown general category
    EXPECT_EQ(error_line("0041;A;Xx;0;L;;;;;N;;;;;\n", FileKind::UnicodeData), 1u);
    // Unknown bidi class
    EXPECT_EQ(error_line("0041;A;Lu;0;QQ;;;;;N;;;;;\n", FileKind::UnicodeData), 1u);
    // Combining class out of range
    EXPECT_EQ(error_line("0041;A;Lu;256;L;;;;;N;;;;;\n", FileKind::UnicodeData), 1u);
    // Mirrored must be Y or N
    EXPECT_EQ(error_line("0041;A;Lu;0;L;;;;;X;;;;;\n", FileKind::UnicodeData), 1u);
    // Bad case mapping
    EXPECT_EQ(error_line("0041;A;Lu;0;L;;;;;N;;;;ZZZZ;\n", FileKind::UnicodeData), 1u);
}

TEST_F(ParserTest, ErrorContextNamesFileAndLine) {
    try {
        parse_text("0041;A;Lu;0;L;;;;;N;;;;;\n\n0042;B;Qq;0;L;;;;;N;;;;;\n", "ucd/UnicodeData.txt",
                   FileKind::UnicodeData);
        FAIL() << "expected MalformedSourceError";
    } catch (const MalformedSourceError& e) {
        EXPECT_EQ(e.file(), "ucd/UnicodeData.txt");
        EXPECT_EQ(e.line(), 3u);
        EXPECT_EQ(e.context(), "ucd/UnicodeData.txt:3");
        EXPECT_EQ(e.code(), ErrorCode::MALFORMED_SOURCE);
    }
}

// =============================================================================
// NameAliases.txt
// =============================================================================

TEST_F(ParserTest, NameAliases) {
    SourceFile file = parse(test::SAMPLE_NAME_ALIASES, FileKind::NameAliases);
    ASSERT_EQ(file.aliases.size(), 3u);
    EXPECT_EQ(file.aliases[0].codepoint, 0u);
    EXPECT_EQ(file.aliases[0].alias, "NULL");
    EXPECT_EQ(file.aliases[0].type, AliasType::Control);
    EXPECT_EQ(file.aliases[1].type, AliasType::Abbreviation);
    EXPECT_EQ(file.aliases[2].type, AliasType::Figment);
}

TEST_F(ParserTest, NameAliasesRejectUnknownType) {
    EXPECT_EQ(error_line("0000;NULL;nickname\n", FileKind::NameAliases), 1u);
    EXPECT_EQ(error_line("0000;NULL\n", FileKind::NameAliases), 1u);
}

// =============================================================================
// Generic property files
// =============================================================================

TEST_F(ParserTest, PropertyFileKeepsFields) {
    SourceFile file = parse_text(test::SAMPLE_PROPERTY, "ucd/Scripts.txt", FileKind::Property);
    ASSERT_TRUE(file.section);
    EXPECT_EQ(file.section->name, "Scripts.txt");
    ASSERT_EQ(file.section->records.size(), 4u);
    EXPECT_EQ(file.section->records[0].range, (CodepointRange{0x0000, 0x0040}));
    EXPECT_EQ(file.section->records[0].fields, (std::vector<std::string>{"Common"}));
    EXPECT_EQ(file.section->records[3].fields, (std::vector<std::string>{"Han"}));
}

TEST_F(ParserTest, PropertyFileMultipleFields) {
    SourceFile file = parse("00C0..00C5; NFD_QC; N\n", FileKind::Property);
    ASSERT_EQ(file.section->records.size(), 1u);
    EXPECT_EQ(file.section->records[0].fields, (std::vector<std::string>{"NFD_QC", "N"}));
}

TEST_F(ParserTest, UnihanLines) {
    SourceFile file = parse("U+4E00\tkDefinition\tone; a, an; alone\nU+4E01\tkMandarin\tdīng\n",
                            FileKind::Property, "Unihan_Readings.txt");
    ASSERT_EQ(file.section->records.size(), 2u);
    EXPECT_EQ(file.section->records[0].range, CodepointRange::single(0x4E00));
    EXPECT_EQ(file.section->records[0].fields,
              (std::vector<std::string>{"kDefinition", "one; a, an; alone"}));
    EXPECT_EQ(file.section->records[1].fields[1], "dīng");
}

TEST_F(ParserTest, PropertyFileRejectsNonCodepointKeys) {
    EXPECT_EQ(error_line("# Header\nNames: something\n", FileKind::Property), 2u);
    EXPECT_EQ(error_line("0041\n", FileKind::Property), 1u);
}

// =============================================================================
// Annotated files
// =============================================================================

TEST_F(ParserTest, AnnotatedFileSwitchesGrammars) {
    const std::string text =
        "# Private use: Klingon\n"
        "@flag conscript\n"
        "@substring klingon\n"
        "@file Blocks.txt\n"
        "F8D0..F8FF; Klingon\n"
        "@file UnicodeData.txt\n"
        "F8D0;KLINGON LETTER A;Lo;0;L;;;;;N;;;;;\n"
        "F8D1;KLINGON LETTER B;Lo;0;L;;;;;N;;;;;\n"
        "@file NameAliases.txt\n"
        "F8D0;KLINGON A;alternate\n"
        "@file Blocks.txt\n"
        "F8E0..F8EF; More Klingon\n";

    SourceFile file = parse(text, FileKind::Annotated);
    EXPECT_EQ(file.flags, (std::vector<std::string>{"conscript"}));
    EXPECT_EQ(file.substrings, (std::vector<std::string>{"klingon"}));
    ASSERT_EQ(file.blocks.size(), 2u);
    EXPECT_EQ(file.blocks[1].name, "More Klingon");
    ASSERT_EQ(file.characters.size(), 2u);
    EXPECT_EQ(file.characters[1].name, "KLINGON LETTER B");
    ASSERT_EQ(file.aliases.size(), 1u);
    EXPECT_EQ(file.aliases[0].type, AliasType::Alternate);
    EXPECT_FALSE(file.section);
}

TEST_F(ParserTest, AnnotatedDataBeforeFileDirective) {
    EXPECT_EQ(error_line("@flag x\nF8D0..F8FF; Klingon\n", FileKind::Annotated), 2u);
}

TEST_F(ParserTest, AnnotatedDirectiveErrors) {
    EXPECT_EQ(error_line("@file Scripts.txt\n", FileKind::Annotated), 1u);
    EXPECT_EQ(error_line("@include other.txt\n", FileKind::Annotated), 1u);
    EXPECT_EQ(error_line("@flag\n", FileKind::Annotated), 1u);
    EXPECT_EQ(error_line("@flag a b\n", FileKind::Annotated), 1u);
}

TEST_F(ParserTest, AnnotatedRangeMustCloseBeforeNextFile) {
    const std::string text =
        "@file UnicodeData.txt\n"
        "F0000;<Plane 15 Private Use, First>;Co;0;L;;;;;N;;;;;\n"
        "@file Blocks.txt\n";
    EXPECT_EQ(error_line(text, FileKind::Annotated), 2u);
}

// =============================================================================
// Files on disk
// =============================================================================

TEST_F(ParserTest, ParseFileInfersKind) {
    test::TempDir dir;
    test::write_text(dir / "Blocks.txt", test::APPLEBANANA_BLOCKS);

    SourceFile file = parse_file(dir / "Blocks.txt");
    EXPECT_EQ(file.kind, FileKind::Blocks);
    ASSERT_EQ(file.blocks.size(), 1u);
    EXPECT_EQ(file.blocks[0].name, "Applebanana");
}

TEST_F(ParserTest, MissingFileIsIOError) {
    test::TempDir dir;
    EXPECT_THROW(parse_file(dir / "Blocks.txt"), IOError);
}
