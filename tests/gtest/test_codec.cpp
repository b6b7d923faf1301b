// =============================================================================
// Table Encoder / Decoder Tests
// =============================================================================

#include <gtest/gtest.h>
#include "puaa/codec/decoder.hpp"
#include "puaa/codec/encoder.hpp"
#include "puaa/error.hpp"
#include "puaa/merger.hpp"
#include "puaa/ucd/parser.hpp"
#include "test_support.hpp"

#include <set>

using namespace puaa;
using namespace puaa::codec;

class CodecTest : public ::testing::Test {
protected:
    void SetUp() override {
        Merger merger(Profile::Full);
        merger.add(ucd::parse_text(test::SAMPLE_BLOCKS, "Blocks.txt", FileKind::Blocks));
        merger.add(ucd::parse_text(test::SAMPLE_UNICODE_DATA, "UnicodeData.txt", FileKind::UnicodeData));
        merger.add(ucd::parse_text(test::SAMPLE_NAME_ALIASES, "NameAliases.txt", FileKind::NameAliases));
        merger.add(ucd::parse_text(test::SAMPLE_PROPERTY, "Scripts.txt", FileKind::Property));
        merger.add(ucd::parse_text("0041; NFD_QC; N\n0061..0062; NFD_QC; M\n", "Normalization.txt",
                                   FileKind::Property));
        table_ = merger.finish();
    }

    void TearDown() override {}

    // Codepoints around every boundary in the table
    std::set<uint32_t> boundary_points() const {
        std::set<uint32_t> points = {0, 0x10FFFF, 0xFAB00};
        auto add = [&](const CodepointRange& r) {
            for (uint32_t cp : {r.start, r.end}) {
                points.insert(cp);
                if (cp > 0) points.insert(cp - 1);
                if (cp < MAX_CODEPOINT) points.insert(cp + 1);
            }
        };
        for (const auto& b : table_.blocks) add(b.range);
        for (const auto& c : table_.characters) add(c.codepoints);
        for (const auto& a : table_.aliases) add(CodepointRange::single(a.codepoint));
        for (const auto& s : table_.properties) {
            for (const auto& r : s.records) add(r.range);
        }
        return points;
    }

    static void expect_same_lookup(const LookupResult& expected, const LookupResult& actual, uint32_t cp) {
        SCOPED_TRACE("U+" + format_codepoint(cp));
        EXPECT_EQ(expected.block, actual.block);
        EXPECT_EQ(expected.character, actual.character);
        EXPECT_EQ(expected.aliases, actual.aliases);
        ASSERT_EQ(expected.properties.size(), actual.properties.size());
        for (size_t i = 0; i < expected.properties.size(); ++i) {
            EXPECT_EQ(expected.properties[i].section, actual.properties[i].section);
            EXPECT_EQ(expected.properties[i].range, actual.properties[i].range);
            EXPECT_EQ(expected.properties[i].fields, actual.properties[i].fields);
        }
    }

    CompiledTable table_;
};

TEST_F(CodecTest, HeaderFields) {
    std::vector<uint8_t> bytes = encode(table_);
    ASSERT_GE(bytes.size(), HEADER_SIZE);
    EXPECT_EQ(util::load_be32(bytes.data()), TABLE_MAGIC);
    EXPECT_EQ(util::load_be16(bytes.data() + HEADER_VERSION_OFFSET), FORMAT_VERSION);
    EXPECT_EQ(bytes[HEADER_PROFILE_OFFSET], static_cast<uint8_t>(Profile::Full));
    EXPECT_EQ(util::load_be32(bytes.data() + HEADER_LENGTH_OFFSET), bytes.size());
}

TEST_F(CodecTest, LookupMatchesInMemoryResolution) {
    TableReader reader(encode(table_));
    EXPECT_EQ(reader.profile(), Profile::Full);
    EXPECT_EQ(reader.version(), FORMAT_VERSION);

    for (uint32_t cp : boundary_points()) {
        expect_same_lookup(resolve(table_, cp), reader.lookup(cp), cp);
    }
}

TEST_F(CodecTest, LookupInsideFoldedRange) {
    TableReader reader(encode(table_));

    LookupResult result = reader.lookup(0x6C34);
    ASSERT_TRUE(result.block);
    EXPECT_EQ(result.block->name, "CJK Unified Ideographs");
    ASSERT_TRUE(result.character);
    EXPECT_EQ(result.character->name, "<CJK Ideograph>");
    EXPECT_EQ(result.character->codepoints, (CodepointRange{0x4E00, 0x9FFF}));
    ASSERT_EQ(result.properties.size(), 1u);
    EXPECT_EQ(result.properties[0].section, "Scripts.txt");
    EXPECT_EQ(result.properties[0].fields, (std::vector<std::string>{"Han"}));
}

TEST_F(CodecTest, LookupOutsideEverythingIsEmpty) {
    TableReader reader(encode(table_));
    EXPECT_TRUE(reader.lookup(0xE000).empty());
    EXPECT_TRUE(reader.lookup(0x10FFFF).empty());
}

TEST_F(CodecTest, AliasesComeBackInSourceOrder) {
    TableReader reader(encode(table_));
    LookupResult result = reader.lookup(0);
    ASSERT_EQ(result.aliases.size(), 2u);
    EXPECT_EQ(result.aliases[0].alias, "NULL");
    EXPECT_EQ(result.aliases[0].type, AliasType::Control);
    EXPECT_EQ(result.aliases[1].alias, "NUL");
    EXPECT_EQ(result.aliases[1].type, AliasType::Abbreviation);
}

TEST_F(CodecTest, RoundTripThroughLazyIteration) {
    TableReader reader(encode(table_));
    CompiledTable decoded = reader.to_table();

    EXPECT_EQ(decoded.profile, table_.profile);
    EXPECT_EQ(decoded.blocks, table_.blocks);
    EXPECT_EQ(decoded.characters, table_.characters);
    EXPECT_EQ(decoded.aliases, table_.aliases);
    ASSERT_EQ(decoded.properties.size(), table_.properties.size());
    for (size_t i = 0; i < decoded.properties.size(); ++i) {
        EXPECT_EQ(decoded.properties[i].name, table_.properties[i].name);
        EXPECT_EQ(decoded.properties[i].records, table_.properties[i].records);
    }
}

TEST_F(CodecTest, LazyRangesAreRestartable) {
    TableReader reader(encode(table_));
    auto blocks = reader.blocks();
    ASSERT_EQ(blocks.size(), 2u);

    std::vector<std::string> first, second;
    for (const Block& b : blocks) first.push_back(b.name);
    for (const Block& b : blocks) second.push_back(b.name);
    EXPECT_EQ(first, second);
    EXPECT_EQ(blocks[1].name, "CJK Unified Ideographs");

    auto aliases = reader.aliases();
    ASSERT_EQ(aliases.size(), 2u);
    EXPECT_EQ(aliases[0].codepoint, 0u);
    EXPECT_EQ(aliases[1].codepoint, 0x41u);
}

TEST_F(CodecTest, EncodingIsDeterministic) {
    EXPECT_EQ(encode(table_), encode(table_));

    // Same sources merged again give the same bytes
    Merger merger(Profile::Full);
    merger.add(ucd::parse_text(test::SAMPLE_BLOCKS, "elsewhere/Blocks.txt", FileKind::Blocks));
    merger.add(ucd::parse_text(test::SAMPLE_UNICODE_DATA, "elsewhere/UnicodeData.txt", FileKind::UnicodeData));
    merger.add(ucd::parse_text(test::SAMPLE_NAME_ALIASES, "elsewhere/NameAliases.txt", FileKind::NameAliases));
    merger.add(ucd::parse_text(test::SAMPLE_PROPERTY, "Scripts.txt", FileKind::Property));
    merger.add(ucd::parse_text("0041; NFD_QC; N\n0061..0062; NFD_QC; M\n", "Normalization.txt",
                               FileKind::Property));
    EXPECT_EQ(encode(merger.finish()), encode(table_));
}

TEST_F(CodecTest, RepeatedStringsAreStoredOnce) {
    CompiledTable one;
    one.profile = Profile::Min;
    one.blocks.push_back(Block{{0x0000, 0x007F}, "Same Name Repeated Here", {}});

    CompiledTable two = one;
    two.blocks.push_back(Block{{0x0080, 0x00FF}, "Same Name Repeated Here", {}});

    // The second block costs one index entry and one string ref, not another copy
    EXPECT_EQ(encode(two).size(), encode(one).size() + INDEX_ENTRY_SIZE + STRING_REF_SIZE);
}

TEST_F(CodecTest, EmptyTable) {
    CompiledTable empty;
    empty.profile = Profile::Names;
    std::vector<uint8_t> bytes = encode(empty);
    EXPECT_EQ(bytes.size(), HEADER_SIZE);

    TableReader reader(bytes);
    EXPECT_EQ(reader.profile(), Profile::Names);
    EXPECT_TRUE(reader.lookup(0x41).empty());
    EXPECT_NO_THROW(reader.validate());
}

TEST_F(CodecTest, ValidateAcceptsEncodedTable) {
    TableReader reader(encode(table_));
    EXPECT_NO_THROW(reader.validate());
    EXPECT_EQ(reader.section_count(), 2u);
    EXPECT_EQ(reader.section_name(0), "Normalization.txt");
    EXPECT_EQ(reader.section_name(1), "Scripts.txt");
}

TEST_F(CodecTest, EncoderRejectsUnsortedInput) {
    CompiledTable bad;
    bad.blocks.push_back(Block{{0x0080, 0x00FF}, "B", {}});
    bad.blocks.push_back(Block{{0x0000, 0x007F}, "A", {}});
    EXPECT_THROW(encode(bad), InvalidArgumentError);

    CompiledTable overlapping;
    overlapping.blocks.push_back(Block{{0x0000, 0x00FF}, "A", {}});
    overlapping.blocks.push_back(Block{{0x0080, 0x017F}, "B", {}});
    EXPECT_THROW(encode(overlapping), InvalidArgumentError);
}

TEST_F(CodecTest, EncoderRejectsOversizedStrings) {
    CompiledTable bad;
    bad.blocks.push_back(Block{{0x0000, 0x007F}, std::string(MAX_STRING_LENGTH + 1, 'x'), {}});
    EXPECT_THROW(encode(bad), InvalidArgumentError);
}

// =============================================================================
// Property segments
// =============================================================================

TEST_F(CodecTest, SegmentsPartitionOverlappingRecords) {
    std::vector<PropertyRecord> records = {
        {{0x00, 0xFF}, {"A"}, {}},
        {{0x41, 0x5A}, {"B"}, {}},
        {{0x41, 0x41}, {"C"}, {}},
    };

    std::vector<Segment> segments = build_segments(records);
    ASSERT_EQ(segments.size(), 4u);
    EXPECT_EQ(segments[0].range, (CodepointRange{0x00, 0x40}));
    EXPECT_EQ(segments[0].rows, (std::vector<std::vector<std::string>>{{"A"}}));
    EXPECT_EQ(segments[1].range, (CodepointRange{0x41, 0x41}));
    EXPECT_EQ(segments[1].rows, (std::vector<std::vector<std::string>>{{"A"}, {"B"}, {"C"}}));
    EXPECT_EQ(segments[2].range, (CodepointRange{0x42, 0x5A}));
    EXPECT_EQ(segments[2].rows, (std::vector<std::vector<std::string>>{{"A"}, {"B"}}));
    EXPECT_EQ(segments[3].range, (CodepointRange{0x5B, 0xFF}));
}

TEST_F(CodecTest, SegmentsLeaveGapsUncovered) {
    std::vector<PropertyRecord> records = {
        {{0x10, 0x1F}, {"X"}, {}},
        {{0x30, 0x3F}, {"Y"}, {}},
    };
    std::vector<Segment> segments = build_segments(records);
    ASSERT_EQ(segments.size(), 2u);
    EXPECT_EQ(segments[0].range, (CodepointRange{0x10, 0x1F}));
    EXPECT_EQ(segments[1].range, (CodepointRange{0x30, 0x3F}));
    EXPECT_EQ(segments_to_records(segments), records);
}

TEST_F(CodecTest, SegmentsReachTopOfCodespace) {
    std::vector<PropertyRecord> records = {{{0x100000, 0x10FFFF}, {"Plane 16"}, {}}};
    std::vector<Segment> segments = build_segments(records);
    ASSERT_EQ(segments.size(), 1u);
    EXPECT_EQ(segments[0].range, (CodepointRange{0x100000, 0x10FFFF}));
}

TEST_F(CodecTest, OverlappingPropertiesResolveThroughTable) {
    CompiledTable table;
    table.properties.push_back(PropertySection{"Overlap.txt", {
        {{0x00, 0xFF}, {"A"}, {}},
        {{0x41, 0x5A}, {"B"}, {}},
    }});
    TableReader reader(encode(table));

    LookupResult at_a = reader.lookup(0x41);
    ASSERT_EQ(at_a.properties.size(), 2u);
    EXPECT_EQ(at_a.properties[0].fields[0], "A");
    EXPECT_EQ(at_a.properties[1].fields[0], "B");
    EXPECT_EQ(at_a.properties[0].range, (CodepointRange{0x41, 0x5A}));

    for (uint32_t cp : {0x00u, 0x40u, 0x41u, 0x5Au, 0x5Bu, 0xFFu, 0x100u}) {
        expect_same_lookup(resolve(table, cp), reader.lookup(cp), cp);
    }
}

// =============================================================================
// Selecting property sections by name
// =============================================================================

TEST_F(CodecTest, SectionNamesInTableOrder) {
    TableReader reader(encode(table_));
    EXPECT_EQ(reader.section_names(), (std::vector<std::string>{"Normalization.txt", "Scripts.txt"}));
}

TEST_F(CodecTest, SectionMatchesIgnoresCaseAndExtension) {
    EXPECT_TRUE(section_matches("Scripts.txt", "Scripts.txt"));
    EXPECT_TRUE(section_matches("Scripts.txt", "scripts"));
    EXPECT_TRUE(section_matches("Scripts.txt", "SCRIPTS.TXT"));
    EXPECT_FALSE(section_matches("Scripts.txt", "script"));
    EXPECT_FALSE(section_matches("Scripts.txt", "ScriptExtensions"));
    EXPECT_FALSE(section_matches("Scripts.txt", ""));
}

TEST_F(CodecTest, FindSectionsSelectsNamedProperties) {
    TableReader reader(encode(table_));

    std::vector<size_t> found = reader.find_sections({"scripts"});
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(reader.section_name(found[0]), "Scripts.txt");

    // Table order, whatever order the names were given in
    EXPECT_EQ(reader.find_sections({"Scripts", "normalization"}), (std::vector<size_t>{0, 1}));
    EXPECT_TRUE(reader.find_sections({"Age"}).empty());
    EXPECT_TRUE(reader.find_sections({}).empty());
}
