#include "puaa/codec/decoder.hpp"

#include <cctype>

#include "puaa/config.hpp"
#include "puaa/logging.hpp"
#include "puaa/sfnt/sfnt_file.hpp"
#include "puaa/util/file_io.hpp"

namespace puaa::codec {

using util::load_be16;
using util::load_be32;

namespace {

// =============================================================================
// Range index helpers (12-byte entries: start, end, payload offset)
// =============================================================================

size_t index_count(std::span<const uint8_t> index) {
    return index.size() / INDEX_ENTRY_SIZE;
}

CodepointRange index_range(std::span<const uint8_t> index, size_t i) {
    const uint8_t* p = index.data() + i * INDEX_ENTRY_SIZE;
    return {load_be32(p), load_be32(p + 4)};
}

uint32_t index_payload(std::span<const uint8_t> index, size_t i) {
    return load_be32(index.data() + i * INDEX_ENTRY_SIZE + 8);
}

// Last entry with start <= cp, if its end covers cp
std::optional<size_t> find_in_index(std::span<const uint8_t> index, uint32_t cp) {
    size_t lo = 0;
    size_t hi = index_count(index);
    while (lo < hi) {
        size_t mid = lo + (hi - lo) / 2;
        if (load_be32(index.data() + mid * INDEX_ENTRY_SIZE) <= cp) {
            lo = mid + 1;
        } else {
            hi = mid;
        }
    }
    if (lo == 0) {
        return std::nullopt;
    }
    const size_t i = lo - 1;
    if (index_range(index, i).end < cp) {
        return std::nullopt;
    }
    return i;
}

// Entries ascending, each start <= end <= U+10FFFF, no overlap
void check_index(std::span<const uint8_t> index, const std::string& what) {
    const size_t n = index_count(index);
    for (size_t i = 0; i < n; ++i) {
        CodepointRange r = index_range(index, i);
        if (r.start > r.end || r.end > MAX_CODEPOINT) {
            throw CorruptTableError(what + " entry " + std::to_string(i) + " has an invalid range",
                                    format_range(r));
        }
        if (i > 0 && r.start <= index_range(index, i - 1).end) {
            throw CorruptTableError(what + " entries are not sorted and disjoint",
                                    format_range(index_range(index, i - 1)) + " then " + format_range(r));
        }
    }
}

bool equals_ignoring_case(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

uint32_t configured_table_tag() {
    std::string tag = Config::getInstance().get<std::string>("sfnt.table_tag", "PUAA");
    if (tag.size() != 4) {
        throw InvalidArgumentError("sfnt.table_tag must be four characters", tag);
    }
    return util::make_tag(tag[0], tag[1], tag[2], tag[3]);
}

} // namespace

bool section_matches(std::string_view section, std::string_view name) {
    if (equals_ignoring_case(section, name)) {
        return true;
    }
    const size_t dot = section.rfind('.');
    return dot != std::string_view::npos && equals_ignoring_case(section.substr(0, dot), name);
}

// =============================================================================
// Construction
// =============================================================================

TableReader::TableReader(std::vector<uint8_t> bytes) : bytes_(std::move(bytes)) {
    if (bytes_.size() < HEADER_SIZE) {
        throw CorruptTableError("table of " + std::to_string(bytes_.size()) + " bytes is shorter than its header");
    }
    if (load_be32(bytes_.data()) != TABLE_MAGIC) {
        throw CorruptTableError("bad magic '" + util::tag_to_string(load_be32(bytes_.data())) + "'");
    }

    version_ = load_be16(bytes_.data() + HEADER_VERSION_OFFSET);
    if (version_ == 0 || version_ > FORMAT_VERSION) {
        throw UnsupportedVersionError("format version " + std::to_string(version_) +
                                      " is not supported (this reader handles version " +
                                      std::to_string(FORMAT_VERSION) + ")");
    }

    const uint8_t profile = bytes_[HEADER_PROFILE_OFFSET];
    if (profile > static_cast<uint8_t>(Profile::Names)) {
        throw UnsupportedVersionError("unknown profile tag " + std::to_string(profile));
    }
    profile_ = static_cast<Profile>(profile);

    const uint32_t total = load_be32(bytes_.data() + HEADER_LENGTH_OFFSET);
    if (total != bytes_.size()) {
        throw CorruptTableError("header records " + std::to_string(total) + " bytes but the table has " +
                                std::to_string(bytes_.size()));
    }

    for (size_t i = 0; i < SECTION_COUNT; ++i) {
        const uint8_t* p = bytes_.data() + HEADER_SECTIONS_OFFSET + i * 8;
        sections_[i] = {load_be32(p), load_be32(p + 4)};
        const char* name = codec::section_name(static_cast<Section>(i));
        if (sections_[i].length > 0 &&
            (sections_[i].offset < HEADER_SIZE ||
             uint64_t(sections_[i].offset) + sections_[i].length > bytes_.size())) {
            throw CorruptTableError(std::string(name) + " lies outside the table",
                                    "offset " + std::to_string(sections_[i].offset) +
                                    ", length " + std::to_string(sections_[i].length));
        }
    }

    for (Section s : {Section::BlockIndex, Section::CharacterIndex, Section::AliasIndex}) {
        if (section(s).size() % INDEX_ENTRY_SIZE != 0) {
            throw CorruptTableError(std::string(codec::section_name(s)) + " length is not a multiple of 12",
                                    std::to_string(section(s).size()));
        }
    }

    // Lookups binary-search the indexes, so their order is checked up front
    check_index(section(Section::BlockIndex), "block index");
    check_index(section(Section::CharacterIndex), "character index");
    check_index(section(Section::AliasIndex), "alias index");

    read_property_directory();
}

void TableReader::read_property_directory() {
    std::span<const uint8_t> dir = section(Section::PropertyDirectory);
    if (dir.empty()) {
        return;
    }
    if (dir.size() < 4) {
        throw CorruptTableError("property directory is truncated");
    }

    const uint32_t count = load_be32(dir.data());
    if (uint64_t(count) * DIRECTORY_ENTRY_SIZE + 4 != dir.size()) {
        throw CorruptTableError("property directory length does not match its " + std::to_string(count) +
                                " entries");
    }

    const size_t data_base = sections_[static_cast<size_t>(Section::PropertyData)].offset;
    const size_t data_size = section(Section::PropertyData).size();
    const size_t dir_base = sections_[static_cast<size_t>(Section::PropertyDirectory)].offset;

    property_sections_.reserve(count);
    for (size_t j = 0; j < count; ++j) {
        const size_t pos = 4 + j * DIRECTORY_ENTRY_SIZE;
        const uint8_t* p = dir.data() + pos;
        const uint32_t index_offset = load_be32(p + 8);
        const uint32_t index_entries = load_be32(p + 12);
        const uint32_t payload_offset = load_be32(p + 16);
        const uint32_t payload_length = load_be32(p + 20);

        if (uint64_t(index_offset) + uint64_t(index_entries) * INDEX_ENTRY_SIZE > data_size ||
            uint64_t(payload_offset) + payload_length > data_size) {
            throw CorruptTableError("property section " + std::to_string(j) + " lies outside the property data");
        }

        PropertySectionInfo info;
        info.name_ref = dir_base + pos;
        info.index_offset = data_base + index_offset;
        info.index_count = index_entries;
        info.payload_offset = data_base + payload_offset;
        info.payload_length = payload_length;
        check_index(property_index(info), "property section " + std::to_string(j) + " index");
        property_sections_.push_back(info);
    }
}

TableReader TableReader::open(const std::filesystem::path& path) {
    return open(path, configured_table_tag());
}

TableReader TableReader::open(const std::filesystem::path& path, uint32_t table_tag) {
    std::vector<uint8_t> bytes = util::read_binary_file(path);

    // A raw table also starts with 'PUAA'; a standalone container is told
    // apart by its consistent sfnt search fields.
    if (bytes.size() >= 4 && load_be32(bytes.data()) == TABLE_MAGIC && !sfnt::has_sfnt_directory(bytes)) {
        LOG_DEBUG("Opening raw table ", path.string());
        return TableReader(std::move(bytes));
    }

    sfnt::SfntFile font = sfnt::SfntFile::parse(bytes, path.string());
    const sfnt::Table* table = font.find(table_tag);
    if (!table) {
        throw UnsupportedContainerError("container has no '" + util::tag_to_string(table_tag) + "' table",
                                        path.string());
    }
    LOG_DEBUG("Opening '", util::tag_to_string(table_tag), "' table embedded in ", path.string());
    return TableReader(table->data);
}

// =============================================================================
// Raw access
// =============================================================================

std::span<const uint8_t> TableReader::section(Section s) const {
    const SectionDescriptor& d = sections_[static_cast<size_t>(s)];
    if (d.length == 0) {
        return {};
    }
    return std::span<const uint8_t>(bytes_).subspan(d.offset, d.length);
}

std::span<const uint8_t> TableReader::property_index(const PropertySectionInfo& info) const {
    return std::span<const uint8_t>(bytes_).subspan(info.index_offset, info.index_count * INDEX_ENTRY_SIZE);
}

std::string TableReader::read_string(Reader& r) const {
    const uint32_t offset = r.u32();
    const uint16_t length = r.u16();
    std::span<const uint8_t> pool = section(Section::StringPool);
    if (uint64_t(offset) + length > pool.size()) {
        throw CorruptTableError("string reference outside the string pool",
                                "offset " + std::to_string(offset) + ", length " + std::to_string(length));
    }
    return std::string(reinterpret_cast<const char*>(pool.data()) + offset, length);
}

// =============================================================================
// Payload decoding
// =============================================================================

Block TableReader::decode_block(size_t i) const {
    std::span<const uint8_t> index = section(Section::BlockIndex);
    Block block;
    block.range = index_range(index, i);

    Reader r(section(Section::BlockPayload), "block payload");
    r.seek(index_payload(index, i));
    block.name = read_string(r);
    return block;
}

CharacterRecord TableReader::decode_character(size_t i) const {
    std::span<const uint8_t> index = section(Section::CharacterIndex);
    CharacterRecord c;
    c.codepoints = index_range(index, i);
    const std::string context = "character payload for " + format_range(c.codepoints);

    Reader r(section(Section::CharacterPayload), context);
    r.seek(index_payload(index, i));

    const uint16_t flags = r.u16();
    if (flags & ~CharFlags::ALL) {
        throw CorruptTableError("unknown character flags", context);
    }
    c.name = read_string(r);

    const uint8_t gc = r.u8();
    c.canonical_combining_class = r.u8();
    const uint8_t bidi = r.u8();
    r.skip(1);
    c.general_category = static_cast<GeneralCategory>(gc);
    c.bidi_class = static_cast<BidiClass>(bidi);
    if (!UnicodeProperties::is_valid(c.general_category) || !UnicodeProperties::is_valid(c.bidi_class)) {
        throw CorruptTableError("invalid general category or bidi class", context);
    }

    if (flags & CharFlags::DECOMPOSITION) {
        Decomposition d;
        d.tag = read_string(r);
        const uint16_t count = r.u16();
        d.mapping.reserve(count);
        for (uint16_t k = 0; k < count; ++k) {
            d.mapping.push_back(r.u32());
        }
        c.decomposition = std::move(d);
    }
    if (flags & CharFlags::NUMERIC) {
        NumericValues n;
        n.decimal = read_string(r);
        n.digit = read_string(r);
        n.numeric = read_string(r);
        c.numeric_values = std::move(n);
    }
    if (flags & CharFlags::UNICODE1_NAME) c.unicode1_name = read_string(r);
    if (flags & CharFlags::ISO_COMMENT) c.iso_comment = read_string(r);
    if (flags & CharFlags::UPPERCASE) c.simple_uppercase = r.u32();
    if (flags & CharFlags::LOWERCASE) c.simple_lowercase = r.u32();
    if (flags & CharFlags::TITLECASE) c.simple_titlecase = r.u32();
    c.bidi_mirrored = (flags & CharFlags::BIDI_MIRRORED) != 0;

    return c;
}

AliasEntry TableReader::decode_alias(size_t i) const {
    std::span<const uint8_t> index = section(Section::AliasIndex);
    AliasEntry entry;
    entry.codepoint = index_range(index, i).start;
    const std::string context = "alias payload for " + format_codepoint(entry.codepoint);

    Reader r(section(Section::AliasPayload), context);
    r.seek(index_payload(index, i));

    const uint16_t count = r.u16();
    entry.aliases.reserve(count);
    for (uint16_t k = 0; k < count; ++k) {
        NameAlias alias;
        alias.codepoint = entry.codepoint;
        alias.alias = read_string(r);
        alias.type = static_cast<AliasType>(r.u8());
        if (!UnicodeProperties::is_valid(alias.type)) {
            throw CorruptTableError("invalid alias type", context);
        }
        entry.aliases.push_back(std::move(alias));
    }
    return entry;
}

Segment TableReader::decode_segment(size_t s, size_t i) const {
    const PropertySectionInfo& info = property_sections_.at(s);
    std::span<const uint8_t> index = property_index(info);

    Segment segment;
    segment.range = index_range(index, i);
    const std::string context = "property segment " + format_range(segment.range);

    Reader r(std::span<const uint8_t>(bytes_).subspan(info.payload_offset, info.payload_length), context);
    r.seek(index_payload(index, i));

    const uint16_t rows = r.u16();
    segment.rows.reserve(rows);
    for (uint16_t k = 0; k < rows; ++k) {
        const uint16_t fields = r.u16();
        std::vector<std::string> row;
        row.reserve(fields);
        for (uint16_t f = 0; f < fields; ++f) {
            row.push_back(read_string(r));
        }
        segment.rows.push_back(std::move(row));
    }
    return segment;
}

std::string TableReader::section_name(size_t s) const {
    const PropertySectionInfo& info = property_sections_.at(s);
    Reader r(bytes_, "property directory", info.name_ref);
    return read_string(r);
}

std::vector<std::string> TableReader::section_names() const {
    std::vector<std::string> names;
    names.reserve(property_sections_.size());
    for (size_t s = 0; s < property_sections_.size(); ++s) {
        names.push_back(section_name(s));
    }
    return names;
}

std::vector<size_t> TableReader::find_sections(const std::vector<std::string>& names) const {
    std::vector<size_t> found;
    for (size_t s = 0; s < property_sections_.size(); ++s) {
        const std::string section = section_name(s);
        for (const auto& name : names) {
            if (section_matches(section, name)) {
                found.push_back(s);
                break;
            }
        }
    }
    return found;
}

// =============================================================================
// Queries
// =============================================================================

LookupResult TableReader::lookup(uint32_t cp) const {
    LookupResult result;

    if (auto i = find_in_index(section(Section::BlockIndex), cp)) {
        result.block = decode_block(*i);
    }
    if (auto i = find_in_index(section(Section::CharacterIndex), cp)) {
        result.character = decode_character(*i);
    }
    if (auto i = find_in_index(section(Section::AliasIndex), cp)) {
        result.aliases = decode_alias(*i).aliases;
    }

    for (size_t s = 0; s < property_sections_.size(); ++s) {
        auto i = find_in_index(property_index(property_sections_[s]), cp);
        if (!i) continue;

        Segment segment = decode_segment(s, *i);
        const std::string name = section_name(s);
        for (auto& row : segment.rows) {
            PropertyMatch match;
            match.section = name;
            match.range = segment.range;
            match.fields = std::move(row);
            result.properties.push_back(std::move(match));
        }
    }

    return result;
}

LazyRange<Block> TableReader::blocks() const {
    return LazyRange<Block>(index_count(section(Section::BlockIndex)),
                            [this](size_t i) { return decode_block(i); });
}

LazyRange<CharacterRecord> TableReader::characters() const {
    return LazyRange<CharacterRecord>(index_count(section(Section::CharacterIndex)),
                                      [this](size_t i) { return decode_character(i); });
}

LazyRange<AliasEntry> TableReader::aliases() const {
    return LazyRange<AliasEntry>(index_count(section(Section::AliasIndex)),
                                 [this](size_t i) { return decode_alias(i); });
}

LazyRange<Segment> TableReader::segments(size_t s) const {
    const size_t count = property_sections_.at(s).index_count;
    return LazyRange<Segment>(count, [this, s](size_t i) { return decode_segment(s, i); });
}

void TableReader::validate() const {
    for (const Block& block : blocks()) {
        (void)block;
    }
    for (const CharacterRecord& c : characters()) {
        (void)c;
    }

    std::span<const uint8_t> alias_index = section(Section::AliasIndex);
    for (size_t i = 0; i < index_count(alias_index); ++i) {
        CodepointRange r = index_range(alias_index, i);
        if (r.start != r.end) {
            throw CorruptTableError("alias index entry spans a range", format_range(r));
        }
        if (decode_alias(i).aliases.empty()) {
            throw CorruptTableError("alias entry without aliases", format_codepoint(r.start));
        }
    }

    std::string prev_name;
    for (size_t s = 0; s < property_sections_.size(); ++s) {
        const std::string name = section_name(s);
        if (s > 0 && !(prev_name < name)) {
            throw CorruptTableError("property sections are not ordered by name", prev_name + " then " + name);
        }
        for (const Segment& segment : segments(s)) {
            if (segment.rows.empty()) {
                throw CorruptTableError("property segment without rows",
                                        name + " " + format_range(segment.range));
            }
        }
        prev_name = name;
    }

    LOG_DEBUG("Validated table: ", index_count(section(Section::BlockIndex)), " blocks, ",
              index_count(section(Section::CharacterIndex)), " character ranges, ",
              index_count(alias_index), " alias entries, ", property_sections_.size(), " property sections");
}

CompiledTable TableReader::to_table() const {
    CompiledTable table;
    table.profile = profile_;

    for (Block block : blocks()) {
        table.blocks.push_back(std::move(block));
    }
    for (CharacterRecord c : characters()) {
        table.characters.push_back(std::move(c));
    }
    for (AliasEntry entry : aliases()) {
        for (auto& alias : entry.aliases) {
            table.aliases.push_back(std::move(alias));
        }
    }
    for (size_t s = 0; s < property_sections_.size(); ++s) {
        std::vector<Segment> segs;
        for (Segment segment : segments(s)) {
            segs.push_back(std::move(segment));
        }
        table.properties.push_back(PropertySection{section_name(s), segments_to_records(segs)});
    }

    return table;
}

} // namespace puaa::codec
