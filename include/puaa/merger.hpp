#pragma once

#include <map>
#include <set>
#include <string>
#include <tuple>
#include <vector>

#include "puaa/types.hpp"

namespace puaa {

/**
 * Combines records from ordered sources into one CompiledTable.
 *
 * Blocks and characters: a record whose range equals an existing one replaces
 * it (last writer wins); a partial overlap throws ConflictingRangeError naming
 * both origins. This holds across sources and inside one source.
 * Aliases accumulate in source order with exact duplicates dropped.
 * Property sections are replaced whole by a later section of the same name.
 * Only the record kinds of the requested profile are taken.
 */
class Merger {
public:
    explicit Merger(Profile profile) : profile_(profile) {}

    void add(const SourceFile& file);
    void add(const SourceGroup& group);

    // Sorted, disjoint result. The merger is left empty.
    CompiledTable finish();

    Profile profile() const noexcept { return profile_; }

    static CompiledTable merge(const std::vector<SourceGroup>& groups, Profile profile);

private:
    void add_block(const Block& block);
    void add_character(const CharacterRecord& record);
    void add_alias(const NameAlias& alias);
    void add_section(const PropertySection& section);

    Profile profile_;
    std::map<uint32_t, Block> blocks_;                 // keyed by range start
    std::map<uint32_t, CharacterRecord> characters_;
    std::vector<NameAlias> aliases_;
    std::set<std::tuple<uint32_t, std::string, AliasType>> seen_aliases_;
    std::map<std::string, PropertySection> sections_;
};

} // namespace puaa
