#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <iterator>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "puaa/codec/format.hpp"
#include "puaa/error.hpp"
#include "puaa/types.hpp"

namespace puaa::codec {

/**
 * Restartable lazy range. Element i is decoded when the iterator is
 * dereferenced; nothing is cached. Valid while the producing TableReader
 * lives at the same address.
 */
template<typename Value>
class LazyRange {
public:
    using Decode = std::function<Value(size_t)>;

    class iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = Value;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = Value;

        iterator() = default;
        iterator(const LazyRange* range, size_t index) : range_(range), index_(index) {}

        Value operator*() const { return range_->decode_(index_); }

        iterator& operator++() {
            ++index_;
            return *this;
        }

        iterator operator++(int) {
            iterator tmp = *this;
            ++index_;
            return tmp;
        }

        bool operator==(const iterator& o) const { return index_ == o.index_; }
        bool operator!=(const iterator& o) const { return index_ != o.index_; }

    private:
        const LazyRange* range_ = nullptr;
        size_t index_ = 0;
    };

    LazyRange(size_t count, Decode decode) : count_(count), decode_(std::move(decode)) {}

    iterator begin() const { return iterator(this, 0); }
    iterator end() const { return iterator(this, count_); }
    size_t size() const noexcept { return count_; }
    bool empty() const noexcept { return count_ == 0; }

    Value operator[](size_t i) const { return decode_(i); }

private:
    size_t count_;
    Decode decode_;
};

// All aliases of one codepoint
struct AliasEntry {
    uint32_t codepoint = 0;
    std::vector<NameAlias> aliases;
};

/**
 * Read-only view of a compiled table.
 *
 * The constructor validates the header and the range indexes: bad magic,
 * sections outside the buffer, malformed index lengths, index entries that
 * are unsorted, overlapping or out of range, or a wrong total length throw
 * CorruptTableError; a newer format version or an unknown profile throws
 * UnsupportedVersionError. Payloads are decoded on demand, and any
 * reference outside its section throws CorruptTableError.
 */
// True if name selects the property section called section
bool section_matches(std::string_view section, std::string_view name);

class TableReader {
public:
    explicit TableReader(std::vector<uint8_t> bytes);

    /**
     * Open a raw compiled table, or an sfnt container that carries one
     * under table_tag (default from sfnt.table_tag).
     */
    static TableReader open(const std::filesystem::path& path);
    static TableReader open(const std::filesystem::path& path, uint32_t table_tag);

    TableReader(TableReader&&) = default;
    TableReader& operator=(TableReader&&) = default;
    TableReader(const TableReader&) = delete;
    TableReader& operator=(const TableReader&) = delete;

    Profile profile() const noexcept { return profile_; }
    uint16_t version() const noexcept { return version_; }
    size_t size() const noexcept { return bytes_.size(); }
    std::span<const uint8_t> bytes() const noexcept { return bytes_; }

    // O(log n) per index
    LookupResult lookup(uint32_t cp) const;

    // Full consistency walk; throws CorruptTableError on the first problem
    void validate() const;

    LazyRange<Block> blocks() const;
    LazyRange<CharacterRecord> characters() const;
    LazyRange<AliasEntry> aliases() const;

    size_t section_count() const noexcept { return property_sections_.size(); }
    std::string section_name(size_t section) const;
    std::vector<std::string> section_names() const;
    LazyRange<Segment> segments(size_t section) const;

    /**
     * Indexes of the property sections selected by name, in table order.
     * A name selects a section case-insensitively, with or without its
     * extension, so "scripts" selects "Scripts.txt".
     */
    std::vector<size_t> find_sections(const std::vector<std::string>& names) const;

    // Materialize everything. Property sections come back in segment form.
    CompiledTable to_table() const;

private:
    struct PropertySectionInfo {
        size_t name_ref = 0;        // absolute offset of the name ref
        size_t index_offset = 0;    // absolute
        size_t index_count = 0;
        size_t payload_offset = 0;  // absolute
        size_t payload_length = 0;
    };

    using Reader = util::ByteReader<CorruptTableError>;

    std::span<const uint8_t> section(Section s) const;
    std::span<const uint8_t> property_index(const PropertySectionInfo& info) const;
    std::string read_string(Reader& r) const;

    Block decode_block(size_t i) const;
    CharacterRecord decode_character(size_t i) const;
    AliasEntry decode_alias(size_t i) const;
    Segment decode_segment(size_t section, size_t i) const;

    void read_property_directory();

    std::vector<uint8_t> bytes_;
    uint16_t version_ = 0;
    Profile profile_ = Profile::Full;
    SectionDescriptor sections_[SECTION_COUNT];
    std::vector<PropertySectionInfo> property_sections_;
};

} // namespace puaa::codec
