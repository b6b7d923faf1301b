#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "puaa/unicode_properties.hpp"

namespace puaa {

// =============================================================================
// Codepoint ranges
// =============================================================================

struct CodepointRange {
    uint32_t start = 0;
    uint32_t end = 0;   // inclusive

    static CodepointRange single(uint32_t cp) { return {cp, cp}; }

    bool contains(uint32_t cp) const noexcept { return start <= cp && cp <= end; }
    bool overlaps(const CodepointRange& o) const noexcept { return start <= o.end && o.start <= end; }
    uint32_t size() const noexcept { return end - start + 1; }

    bool operator==(const CodepointRange& o) const noexcept { return start == o.start && end == o.end; }
    bool operator!=(const CodepointRange& o) const noexcept { return !(*this == o); }
    bool operator<(const CodepointRange& o) const noexcept {
        return start != o.start ? start < o.start : end < o.end;
    }
};

// "0041" or "4E00..9FFF"
std::string format_range(const CodepointRange& range);
std::string format_codepoint(uint32_t cp);

// Where a record came from. Line 0 means "whole file".
struct SourceLocation {
    std::string file;
    size_t line = 0;

    std::string to_string() const {
        return line ? file + ":" + std::to_string(line) : file;
    }
};

// =============================================================================
// Records
// =============================================================================

struct Block {
    CodepointRange range;
    std::string name;
    SourceLocation origin;

    bool operator==(const Block& o) const { return range == o.range && name == o.name; }
    bool operator!=(const Block& o) const { return !(*this == o); }
};

struct Decomposition {
    std::string tag;                 // e.g. "<compat>", empty for canonical
    std::vector<uint32_t> mapping;

    bool operator==(const Decomposition& o) const { return tag == o.tag && mapping == o.mapping; }
};

// Fields 6..8 of UnicodeData.txt, kept verbatim.
struct NumericValues {
    std::string decimal;
    std::string digit;
    std::string numeric;

    bool operator==(const NumericValues& o) const {
        return decimal == o.decimal && digit == o.digit && numeric == o.numeric;
    }
};

struct CharacterRecord {
    CodepointRange codepoints;
    std::string name;
    GeneralCategory general_category = GeneralCategory::Cn;
    uint8_t canonical_combining_class = 0;
    BidiClass bidi_class = BidiClass::L;
    std::optional<Decomposition> decomposition;
    std::optional<NumericValues> numeric_values;
    bool bidi_mirrored = false;
    std::optional<std::string> unicode1_name;
    std::optional<std::string> iso_comment;
    std::optional<uint32_t> simple_uppercase;
    std::optional<uint32_t> simple_lowercase;
    std::optional<uint32_t> simple_titlecase;
    SourceLocation origin;

    // Compares every property field; the origin is not part of the value.
    bool same_fields(const CharacterRecord& o) const;

    bool operator==(const CharacterRecord& o) const { return codepoints == o.codepoints && same_fields(o); }
    bool operator!=(const CharacterRecord& o) const { return !(*this == o); }
};

struct NameAlias {
    uint32_t codepoint = 0;
    std::string alias;
    AliasType type = AliasType::Correction;
    SourceLocation origin;

    bool operator==(const NameAlias& o) const {
        return codepoint == o.codepoint && alias == o.alias && type == o.type;
    }
    bool operator!=(const NameAlias& o) const { return !(*this == o); }
};

// One line of an arbitrary codepoint-keyed property file.
struct PropertyRecord {
    CodepointRange range;
    std::vector<std::string> fields;
    SourceLocation origin;

    bool operator==(const PropertyRecord& o) const { return range == o.range && fields == o.fields; }
};

// An opaque property file carried through the Full profile, keyed by file name.
struct PropertySection {
    std::string name;
    std::vector<PropertyRecord> records;
};

// =============================================================================
// Source files and compiled tables
// =============================================================================

enum class FileKind {
    Blocks,
    UnicodeData,
    NameAliases,
    Annotated,
    Property
};

const char* file_kind_name(FileKind kind) noexcept;

// Infer the kind from a file name (case-insensitive). Unknown names are Property files.
FileKind file_kind_for_name(const std::string& file_name);

// Records parsed from one physical file. An annotated file may fill several lists.
struct SourceFile {
    std::string path;
    FileKind kind = FileKind::Property;
    std::vector<Block> blocks;
    std::vector<CharacterRecord> characters;
    std::vector<NameAlias> aliases;
    std::optional<PropertySection> section;

    // Selection directives of annotated files
    std::vector<std::string> flags;
    std::vector<std::string> substrings;
};

// The files contributed by one source spec (a directory or explicit files).
struct SourceGroup {
    std::string label;
    std::vector<SourceFile> files;
};

enum class Profile : uint8_t {
    Full = 0,
    Min = 1,
    Names = 2
};

const char* profile_name(Profile profile) noexcept;
std::optional<Profile> parse_profile(const std::string& name);

// Which record kinds a profile consumes.
bool profile_includes_aliases(Profile profile) noexcept;
bool profile_includes_properties(Profile profile) noexcept;

struct CompiledTable {
    Profile profile = Profile::Full;
    std::vector<Block> blocks;
    std::vector<CharacterRecord> characters;
    std::vector<NameAlias> aliases;
    std::vector<PropertySection> properties;
};

// =============================================================================
// Lookup results
// =============================================================================

struct PropertyMatch {
    std::string section;
    CodepointRange range;           // the segment that covers the codepoint
    std::vector<std::string> fields;

    bool operator==(const PropertyMatch& o) const { return section == o.section && fields == o.fields; }
};

struct LookupResult {
    std::optional<Block> block;
    std::optional<CharacterRecord> character;
    std::vector<NameAlias> aliases;
    std::vector<PropertyMatch> properties;

    bool empty() const {
        return !block && !character && aliases.empty() && properties.empty();
    }
};

// Linear resolution over an in-memory table. The reference the binary
// reader is checked against, and the lookup used before a table is encoded.
LookupResult resolve(const CompiledTable& table, uint32_t cp);

} // namespace puaa
