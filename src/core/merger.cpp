#include "puaa/merger.hpp"

#include <algorithm>
#include <iterator>

#include "puaa/error.hpp"
#include "puaa/logging.hpp"

namespace puaa {

namespace {

const CodepointRange& range_of(const Block& b) { return b.range; }
const CodepointRange& range_of(const CharacterRecord& c) { return c.codepoints; }

// Insert into a map of disjoint ranges keyed by start.
template<typename Record>
void insert_disjoint(std::map<uint32_t, Record>& records, const Record& record, const char* what) {
    const CodepointRange& range = range_of(record);

    // Existing records are disjoint, so the overlapping ones form one run
    // beginning at the last record that starts at or before range.start.
    auto it = records.upper_bound(range.start);
    if (it != records.begin()) {
        auto prev = std::prev(it);
        if (range_of(prev->second).end >= range.start) {
            it = prev;
        }
    }

    if (it != records.end() && range_of(it->second).start <= range.end) {
        const Record& existing = it->second;
        if (range_of(existing) == range) {
            LOG_DEBUG("Overriding ", what, " ", format_range(range), " from ",
                      existing.origin.to_string(), " with ", record.origin.to_string());
            it->second = record;
            return;
        }
        throw ConflictingRangeError(
            std::string(what) + " " + format_range(range) + " partially overlaps " +
                format_range(range_of(existing)),
            existing.origin.to_string(), record.origin.to_string());
    }

    records.emplace(range.start, record);
}

template<typename Record>
std::vector<Record> drain(std::map<uint32_t, Record>& records) {
    std::vector<Record> out;
    out.reserve(records.size());
    for (auto& [start, record] : records) {
        out.push_back(std::move(record));
    }
    records.clear();
    return out;
}

} // namespace

void Merger::add_block(const Block& block) {
    insert_disjoint(blocks_, block, "block");
}

void Merger::add_character(const CharacterRecord& record) {
    insert_disjoint(characters_, record, "character range");
}

void Merger::add_alias(const NameAlias& alias) {
    if (seen_aliases_.emplace(alias.codepoint, alias.alias, alias.type).second) {
        aliases_.push_back(alias);
    }
}

void Merger::add_section(const PropertySection& section) {
    auto it = sections_.find(section.name);
    if (it != sections_.end()) {
        LOG_DEBUG("Replacing property section ", section.name);
        it->second = section;
    } else {
        sections_.emplace(section.name, section);
    }
}

void Merger::add(const SourceFile& file) {
    for (const auto& block : file.blocks) {
        add_block(block);
    }
    for (const auto& record : file.characters) {
        add_character(record);
    }
    if (profile_includes_aliases(profile_)) {
        for (const auto& alias : file.aliases) {
            add_alias(alias);
        }
    }
    if (profile_includes_properties(profile_) && file.section) {
        add_section(*file.section);
    }
}

void Merger::add(const SourceGroup& group) {
    for (const auto& file : group.files) {
        add(file);
    }
}

CompiledTable Merger::finish() {
    CompiledTable table;
    table.profile = profile_;
    table.blocks = drain(blocks_);
    table.characters = drain(characters_);

    table.aliases = std::move(aliases_);
    aliases_.clear();
    seen_aliases_.clear();
    std::stable_sort(table.aliases.begin(), table.aliases.end(),
                     [](const NameAlias& a, const NameAlias& b) { return a.codepoint < b.codepoint; });

    // std::map already orders sections by name
    for (auto& [name, section] : sections_) {
        std::stable_sort(section.records.begin(), section.records.end(),
                         [](const PropertyRecord& a, const PropertyRecord& b) { return a.range < b.range; });
        table.properties.push_back(std::move(section));
    }
    sections_.clear();

    LOG_INFO("Merged ", profile_name(profile_), " table: ", table.blocks.size(), " blocks, ",
             table.characters.size(), " character ranges, ", table.aliases.size(), " aliases, ",
             table.properties.size(), " property sections");
    return table;
}

CompiledTable Merger::merge(const std::vector<SourceGroup>& groups, Profile profile) {
    Merger merger(profile);
    for (const auto& group : groups) {
        merger.add(group);
    }
    return merger.finish();
}

} // namespace puaa
