#include "puaa/types.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace puaa {

std::string format_codepoint(uint32_t cp) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04X", cp);
    return buf;
}

std::string format_range(const CodepointRange& range) {
    if (range.start == range.end) {
        return format_codepoint(range.start);
    }
    return format_codepoint(range.start) + ".." + format_codepoint(range.end);
}

bool CharacterRecord::same_fields(const CharacterRecord& o) const {
    return name == o.name
        && general_category == o.general_category
        && canonical_combining_class == o.canonical_combining_class
        && bidi_class == o.bidi_class
        && decomposition == o.decomposition
        && numeric_values == o.numeric_values
        && bidi_mirrored == o.bidi_mirrored
        && unicode1_name == o.unicode1_name
        && iso_comment == o.iso_comment
        && simple_uppercase == o.simple_uppercase
        && simple_lowercase == o.simple_lowercase
        && simple_titlecase == o.simple_titlecase;
}

const char* file_kind_name(FileKind kind) noexcept {
    switch (kind) {
        case FileKind::Blocks:      return "Blocks";
        case FileKind::UnicodeData: return "UnicodeData";
        case FileKind::NameAliases: return "NameAliases";
        case FileKind::Annotated:   return "Annotated";
        case FileKind::Property:    return "Property";
    }
    return "Unknown";
}

FileKind file_kind_for_name(const std::string& file_name) {
    std::string lower = file_name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "blocks.txt") return FileKind::Blocks;
    if (lower == "unicodedata.txt") return FileKind::UnicodeData;
    if (lower == "namealiases.txt") return FileKind::NameAliases;
    return FileKind::Property;
}

const char* profile_name(Profile profile) noexcept {
    switch (profile) {
        case Profile::Full:  return "full";
        case Profile::Min:   return "min";
        case Profile::Names: return "names";
    }
    return "unknown";
}

std::optional<Profile> parse_profile(const std::string& name) {
    if (name == "full") return Profile::Full;
    if (name == "min") return Profile::Min;
    if (name == "names") return Profile::Names;
    return std::nullopt;
}

bool profile_includes_aliases(Profile profile) noexcept {
    return profile == Profile::Full || profile == Profile::Names;
}

bool profile_includes_properties(Profile profile) noexcept {
    return profile == Profile::Full;
}

// =============================================================================
// In-memory resolution
// =============================================================================

namespace {

// Last element whose range starts at or before cp, if it also ends at or after cp.
template<typename T, typename RangeOf>
const T* find_covering(const std::vector<T>& items, uint32_t cp, RangeOf range_of) {
    auto it = std::upper_bound(items.begin(), items.end(), cp,
                               [&](uint32_t value, const T& item) { return value < range_of(item).start; });
    if (it == items.begin()) {
        return nullptr;
    }
    --it;
    return range_of(*it).contains(cp) ? &*it : nullptr;
}

} // namespace

LookupResult resolve(const CompiledTable& table, uint32_t cp) {
    LookupResult result;

    if (const Block* b = find_covering(table.blocks, cp, [](const Block& x) { return x.range; })) {
        result.block = *b;
    }

    if (const CharacterRecord* c = find_covering(table.characters, cp,
                                                 [](const CharacterRecord& x) { return x.codepoints; })) {
        result.character = *c;
    }

    for (const auto& alias : table.aliases) {
        if (alias.codepoint == cp) {
            result.aliases.push_back(alias);
        }
    }

    // Records may overlap inside a section; every covering row is reported in
    // (start, end) order, which is the order the encoder lists segment rows in.
    for (const auto& section : table.properties) {
        std::vector<std::string> fields;
        bool covered = false;
        CodepointRange segment{0, MAX_CODEPOINT};
        for (const auto& record : section.records) {
            if (record.range.contains(cp)) {
                covered = true;
                segment.start = std::max(segment.start, record.range.start);
                segment.end = std::min(segment.end, record.range.end);
            } else if (record.range.start > cp) {
                segment.end = std::min(segment.end, record.range.start - 1);
            } else if (record.range.end < cp) {
                segment.start = std::max(segment.start, record.range.end + 1);
            }
        }
        if (!covered) {
            continue;
        }
        for (const auto& record : section.records) {
            if (record.range.contains(cp)) {
                PropertyMatch match;
                match.section = section.name;
                match.range = segment;
                match.fields = record.fields;
                result.properties.push_back(std::move(match));
            }
        }
    }

    return result;
}

} // namespace puaa
