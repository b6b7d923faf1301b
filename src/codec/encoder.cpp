#include "puaa/codec/encoder.hpp"

#include <array>
#include <map>
#include <span>
#include <unordered_map>

#include "puaa/codec/format.hpp"
#include "puaa/error.hpp"
#include "puaa/logging.hpp"

namespace puaa::codec {

using util::ByteWriter;

namespace {

constexpr uint64_t MAX_OFFSET = 0xFFFFFFFFull;

std::span<const uint8_t> as_bytes(const std::string& s) {
    return {reinterpret_cast<const uint8_t*>(s.data()), s.size()};
}

// Each distinct string is stored once, in first-insertion order
class StringPool {
public:
    void put_ref(ByteWriter& w, const std::string& s) {
        if (s.size() > MAX_STRING_LENGTH) {
            throw InvalidArgumentError("string of " + std::to_string(s.size()) +
                                       " bytes exceeds the 65535-byte limit",
                                       s.substr(0, 40) + "...");
        }

        uint32_t offset;
        auto it = offsets_.find(s);
        if (it != offsets_.end()) {
            offset = it->second;
        } else {
            if (pool_.size() + s.size() > MAX_OFFSET) {
                throw InvalidArgumentError("string pool exceeds 32-bit offsets");
            }
            offset = static_cast<uint32_t>(pool_.size());
            pool_.put_bytes(as_bytes(s));
            offsets_.emplace(s, offset);
        }

        w.put_u32(offset);
        w.put_u16(static_cast<uint16_t>(s.size()));
    }

    ByteWriter& bytes() { return pool_; }
    size_t count() const { return offsets_.size(); }

private:
    ByteWriter pool_;
    std::unordered_map<std::string, uint32_t> offsets_;
};

void put_count(ByteWriter& w, size_t n, const std::string& what, const std::string& context) {
    if (n > MAX_LIST_LENGTH) {
        throw InvalidArgumentError(what + " has " + std::to_string(n) + " entries, the limit is 65535", context);
    }
    w.put_u16(static_cast<uint16_t>(n));
}

uint32_t checked_offset(size_t offset, const char* what) {
    if (offset > MAX_OFFSET) {
        throw InvalidArgumentError(std::string(what) + " exceeds 32-bit offsets");
    }
    return static_cast<uint32_t>(offset);
}

void put_index_entry(ByteWriter& index, const CodepointRange& range, size_t payload_offset, const char* what) {
    index.put_u32(range.start);
    index.put_u32(range.end);
    index.put_u32(checked_offset(payload_offset, what));
}

// Sorted by start, start <= end <= U+10FFFF, no overlap
template<typename T, typename RangeOf>
void check_ordered(const std::vector<T>& items, RangeOf range_of, const char* what) {
    const CodepointRange* prev = nullptr;
    for (const auto& item : items) {
        const CodepointRange& r = range_of(item);
        if (r.start > r.end || r.end > MAX_CODEPOINT) {
            throw InvalidArgumentError(std::string("invalid ") + what + " range", format_range(r));
        }
        if (prev && r.start <= prev->end) {
            throw InvalidArgumentError(std::string(what) + " ranges are not sorted and disjoint",
                                       format_range(*prev) + " then " + format_range(r));
        }
        prev = &r;
    }
}

class Encoder {
public:
    explicit Encoder(const CompiledTable& table) : table_(table) {}

    std::vector<uint8_t> run() {
        encode_blocks();
        encode_characters();
        encode_aliases();
        encode_properties();
        return assemble();
    }

private:
    ByteWriter& section(Section s) { return sections_[static_cast<size_t>(s)]; }

    void encode_blocks() {
        check_ordered(table_.blocks, [](const Block& b) -> const CodepointRange& { return b.range; }, "block");

        ByteWriter& index = section(Section::BlockIndex);
        ByteWriter& payload = section(Section::BlockPayload);
        for (const auto& block : table_.blocks) {
            put_index_entry(index, block.range, payload.size(), "block payload");
            strings_.put_ref(payload, block.name);
        }
    }

    void encode_characters() {
        check_ordered(table_.characters,
                      [](const CharacterRecord& c) -> const CodepointRange& { return c.codepoints; },
                      "character");

        ByteWriter& index = section(Section::CharacterIndex);
        ByteWriter& payload = section(Section::CharacterPayload);

        // Ranges with identical properties share one payload
        std::map<std::vector<uint8_t>, size_t> shared;

        for (const auto& record : table_.characters) {
            ByteWriter one;
            character_payload(one, record);
            auto [it, inserted] = shared.emplace(one.bytes(), payload.size());
            if (inserted) {
                payload.put_bytes(one.bytes());
            }
            put_index_entry(index, record.codepoints, it->second, "character payload");
        }
    }

    void character_payload(ByteWriter& w, const CharacterRecord& c) {
        const std::string context = format_range(c.codepoints);
        if (!UnicodeProperties::is_valid(c.general_category) || !UnicodeProperties::is_valid(c.bidi_class)) {
            throw InvalidArgumentError("character has an invalid general category or bidi class", context);
        }

        uint16_t flags = 0;
        if (c.decomposition) flags |= CharFlags::DECOMPOSITION;
        if (c.numeric_values) flags |= CharFlags::NUMERIC;
        if (c.unicode1_name) flags |= CharFlags::UNICODE1_NAME;
        if (c.iso_comment) flags |= CharFlags::ISO_COMMENT;
        if (c.simple_uppercase) flags |= CharFlags::UPPERCASE;
        if (c.simple_lowercase) flags |= CharFlags::LOWERCASE;
        if (c.simple_titlecase) flags |= CharFlags::TITLECASE;
        if (c.bidi_mirrored) flags |= CharFlags::BIDI_MIRRORED;

        w.put_u16(flags);
        strings_.put_ref(w, c.name);
        w.put_u8(static_cast<uint8_t>(c.general_category));
        w.put_u8(c.canonical_combining_class);
        w.put_u8(static_cast<uint8_t>(c.bidi_class));
        w.put_u8(0);

        if (c.decomposition) {
            strings_.put_ref(w, c.decomposition->tag);
            put_count(w, c.decomposition->mapping.size(), "decomposition", context);
            for (uint32_t cp : c.decomposition->mapping) {
                w.put_u32(cp);
            }
        }
        if (c.numeric_values) {
            strings_.put_ref(w, c.numeric_values->decimal);
            strings_.put_ref(w, c.numeric_values->digit);
            strings_.put_ref(w, c.numeric_values->numeric);
        }
        if (c.unicode1_name) strings_.put_ref(w, *c.unicode1_name);
        if (c.iso_comment) strings_.put_ref(w, *c.iso_comment);
        if (c.simple_uppercase) w.put_u32(*c.simple_uppercase);
        if (c.simple_lowercase) w.put_u32(*c.simple_lowercase);
        if (c.simple_titlecase) w.put_u32(*c.simple_titlecase);
    }

    void encode_aliases() {
        ByteWriter& index = section(Section::AliasIndex);
        ByteWriter& payload = section(Section::AliasPayload);

        const auto& aliases = table_.aliases;
        size_t i = 0;
        while (i < aliases.size()) {
            const uint32_t cp = aliases[i].codepoint;
            if (cp > MAX_CODEPOINT) {
                throw InvalidArgumentError("alias codepoint out of range", format_codepoint(cp));
            }
            size_t j = i;
            while (j < aliases.size() && aliases[j].codepoint == cp) ++j;
            if (j < aliases.size() && aliases[j].codepoint < cp) {
                throw InvalidArgumentError("aliases are not ordered by codepoint",
                                           format_codepoint(cp) + " then " + format_codepoint(aliases[j].codepoint));
            }

            put_index_entry(index, CodepointRange::single(cp), payload.size(), "alias payload");
            put_count(payload, j - i, "alias list", format_codepoint(cp));
            for (size_t k = i; k < j; ++k) {
                if (!UnicodeProperties::is_valid(aliases[k].type)) {
                    throw InvalidArgumentError("invalid alias type", format_codepoint(cp));
                }
                strings_.put_ref(payload, aliases[k].alias);
                payload.put_u8(static_cast<uint8_t>(aliases[k].type));
            }
            i = j;
        }
    }

    void encode_properties() {
        ByteWriter& directory = section(Section::PropertyDirectory);
        ByteWriter& data = section(Section::PropertyData);

        if (table_.properties.empty()) {
            return;
        }
        directory.put_u32(static_cast<uint32_t>(table_.properties.size()));

        const std::string* prev_name = nullptr;
        for (const auto& prop : table_.properties) {
            if (prev_name && !(*prev_name < prop.name)) {
                throw InvalidArgumentError("property sections are not ordered by name", prop.name);
            }
            prev_name = &prop.name;

            std::vector<Segment> segments = build_segments(prop.records);

            ByteWriter index;
            ByteWriter payload;
            for (const auto& segment : segments) {
                put_index_entry(index, segment.range, payload.size(), "property payload");
                const std::string context = prop.name + " " + format_range(segment.range);
                put_count(payload, segment.rows.size(), "property segment", context);
                for (const auto& row : segment.rows) {
                    put_count(payload, row.size(), "property row", context);
                    for (const auto& field : row) {
                        strings_.put_ref(payload, field);
                    }
                }
            }

            strings_.put_ref(directory, prop.name);
            directory.put_u16(0);
            directory.put_u32(checked_offset(data.size(), "property data"));
            directory.put_u32(static_cast<uint32_t>(segments.size()));
            data.put_bytes(index.bytes());
            directory.put_u32(checked_offset(data.size(), "property data"));
            directory.put_u32(checked_offset(payload.size(), "property payload"));
            data.put_bytes(payload.bytes());
        }
    }

    std::vector<uint8_t> assemble() {
        sections_[static_cast<size_t>(Section::StringPool)] = std::move(strings_.bytes());

        ByteWriter out;
        out.put_u32(TABLE_MAGIC);
        out.put_u16(FORMAT_VERSION);
        out.put_u8(static_cast<uint8_t>(table_.profile));
        out.put_u8(0);
        out.put_u32(0);     // total length, patched below

        uint64_t offset = HEADER_SIZE;
        for (const auto& s : sections_) {
            out.put_u32(static_cast<uint32_t>(offset));
            out.put_u32(static_cast<uint32_t>(s.size()));
            offset += s.size();
            if (offset > MAX_OFFSET) {
                throw InvalidArgumentError("compiled table exceeds 32-bit offsets");
            }
        }
        out.patch_u32(HEADER_LENGTH_OFFSET, static_cast<uint32_t>(offset));

        for (const auto& s : sections_) {
            out.put_bytes(s.bytes());
        }

        LOG_DEBUG("Encoded ", profile_name(table_.profile), " table: ", out.size(), " bytes, ",
                  strings_.count(), " distinct strings");
        return out.take();
    }

    const CompiledTable& table_;
    std::array<ByteWriter, SECTION_COUNT> sections_;
    StringPool strings_;
};

} // namespace

std::vector<uint8_t> encode(const CompiledTable& table) {
    Encoder encoder(table);
    return encoder.run();
}

} // namespace puaa::codec
