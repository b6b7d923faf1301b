// =============================================================================
// Exporter (decompile) Tests
// =============================================================================

#include <gtest/gtest.h>
#include "puaa/codec/decoder.hpp"
#include "puaa/codec/encoder.hpp"
#include "puaa/compiler.hpp"
#include "puaa/error.hpp"
#include "puaa/exporter.hpp"
#include "test_support.hpp"

#include <memory>

using namespace puaa;
using ucd::SourceSpec;

namespace fs = std::filesystem;

class ExporterTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::make_unique<test::TempDir>();
        release_ = dir_->path() / "release";
        test::write_sample_release(release_);
        test::write_text(release_ / "extracted" / "DerivedAge.txt",
                         "0000..007F; 1.1\n4E00..9FA5; 1.1\n9FA6..9FBB; 4.1\n");
    }

    void TearDown() override {
        dir_.reset();
    }

    // Compile a directory, decompile it, compile the result again
    void round_trip(Profile profile) {
        std::vector<uint8_t> original = codec::encode(Compiler::build(profile, {SourceSpec::directory(release_)}));
        codec::TableReader reader(original);

        const fs::path out = dir_->path() / ("export-" + std::string(profile_name(profile)));
        Exporter::decompile(reader, out);

        std::vector<uint8_t> again = codec::encode(Compiler::build(profile, {SourceSpec::directory(out)}));
        EXPECT_EQ(again, original) << "profile " << profile_name(profile);
    }

    std::unique_ptr<test::TempDir> dir_;
    fs::path release_;
};

TEST_F(ExporterTest, FullRoundTrip) {
    round_trip(Profile::Full);
}

TEST_F(ExporterTest, NamesRoundTrip) {
    round_trip(Profile::Names);
}

TEST_F(ExporterTest, MinRoundTrip) {
    round_trip(Profile::Min);
}

TEST_F(ExporterTest, WritesOnlyWhatTheProfileCarries) {
    std::vector<uint8_t> bytes = codec::encode(Compiler::build(Profile::Min, {SourceSpec::directory(release_)}));
    codec::TableReader reader(bytes);

    const fs::path out = dir_->path() / "min";
    std::vector<fs::path> written = Exporter::decompile(reader, out);
    EXPECT_EQ(written, (std::vector<fs::path>{out / "Blocks.txt", out / "UnicodeData.txt"}));
}

TEST_F(ExporterTest, SectionsAreWrittenByFileName) {
    std::vector<uint8_t> bytes = codec::encode(Compiler::build(Profile::Full, {SourceSpec::directory(release_)}));
    codec::TableReader reader(bytes);

    const fs::path out = dir_->path() / "full";
    std::vector<fs::path> written = Exporter::decompile(reader, out);
    ASSERT_EQ(written.size(), 5u);
    EXPECT_EQ(written[3], out / "DerivedAge.txt");
    EXPECT_EQ(written[4], out / "Scripts.txt");
    EXPECT_FALSE(fs::exists(out / "extracted"));
}

TEST_F(ExporterTest, RangesAreWrittenAsFirstLastPairs) {
    std::vector<uint8_t> bytes = codec::encode(Compiler::build(Profile::Min, {SourceSpec::directory(release_)}));
    codec::TableReader reader(bytes);

    const fs::path out = dir_->path() / "min";
    Exporter::decompile(reader, out);

    std::vector<uint8_t> data = test::read_bytes(out / "UnicodeData.txt");
    std::string text(data.begin(), data.end());
    EXPECT_NE(text.find("4E00;<CJK Ideograph, First>;Lo;0;L;;;;;N;;;;;\n"), std::string::npos);
    EXPECT_NE(text.find("9FFF;<CJK Ideograph, Last>;Lo;0;L;;;;;N;;;;;\n"), std::string::npos);
    EXPECT_NE(text.find("00BD;VULGAR FRACTION ONE HALF;No;0;ON;<fraction> 0031 2044 0032;;;1/2;N;FRACTION ONE HALF;;;;\n"),
              std::string::npos);
}

TEST_F(ExporterTest, UnihanValuesWithSeparatorsUseTabForm) {
    CompiledTable table;
    table.profile = Profile::Full;
    PropertySection section;
    section.name = "Unihan_Readings.txt";
    section.records.push_back({CodepointRange::single(0x4E00), {"kDefinition", "one; a, an; alone"}, {}});
    table.properties.push_back(section);

    std::vector<uint8_t> bytes = codec::encode(table);
    codec::TableReader reader(bytes);

    const fs::path out = dir_->path() / "unihan";
    Exporter::decompile(reader, out);

    std::vector<uint8_t> data = test::read_bytes(out / "Unihan_Readings.txt");
    std::string text(data.begin(), data.end());
    EXPECT_NE(text.find("U+4E00\tkDefinition\tone; a, an; alone\n"), std::string::npos);
}

TEST_F(ExporterTest, SeparatorInOrdinaryFieldIsRefused) {
    CompiledTable table;
    table.profile = Profile::Full;
    PropertySection section;
    section.name = "Odd.txt";
    section.records.push_back({CodepointRange{0x41, 0x42}, {"a;b"}, {}});
    table.properties.push_back(section);

    std::vector<uint8_t> bytes = codec::encode(table);
    codec::TableReader reader(bytes);
    EXPECT_THROW(Exporter::decompile(reader, dir_->path() / "odd"), InvalidArgumentError);
}

TEST_F(ExporterTest, SectionNamesCannotEscapeOutputDirectory) {
    CompiledTable table;
    table.profile = Profile::Full;
    PropertySection section;
    section.name = "../escape.txt";
    section.records.push_back({CodepointRange::single(0x41), {"x"}, {}});
    table.properties.push_back(section);

    std::vector<uint8_t> bytes = codec::encode(table);
    codec::TableReader reader(bytes);
    EXPECT_THROW(Exporter::decompile(reader, dir_->path() / "out"), InvalidArgumentError);
    EXPECT_FALSE(fs::exists(dir_->path() / "escape.txt"));
}
