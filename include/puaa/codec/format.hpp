#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "puaa/types.hpp"
#include "puaa/util/byte_io.hpp"

namespace puaa::codec {

// =============================================================================
// Compiled table layout (all integers big-endian)
//
//   header               84 bytes
//   block index          12-byte entries: start, end, payload offset
//   block payload        name ref
//   character index
//   character payload    flags u16, name ref, gc u8, ccc u8, bidi u8, 0 u8,
//                        optional parts in flag order
//   alias index          one entry per codepoint (start == end)
//   alias payload        count u16, count x (alias ref, type u8)
//   property directory   count u32, count x 24-byte section entries
//   property data        per section: range index + segment payloads
//   string pool          UTF-8, each distinct string stored once
//
// Payload offsets are relative to their payload section. A string ref is
// offset u32 + length u16 into the string pool.
// =============================================================================

constexpr uint32_t TABLE_MAGIC = util::make_tag('P', 'U', 'A', 'A');
constexpr uint16_t FORMAT_VERSION = 1;

constexpr size_t SECTION_COUNT = 9;
constexpr size_t HEADER_SIZE = 12 + SECTION_COUNT * 8;
constexpr size_t INDEX_ENTRY_SIZE = 12;
constexpr size_t STRING_REF_SIZE = 6;
constexpr size_t DIRECTORY_ENTRY_SIZE = 24;

constexpr size_t MAX_STRING_LENGTH = 0xFFFF;
constexpr size_t MAX_LIST_LENGTH = 0xFFFF;

// Header field offsets
constexpr size_t HEADER_VERSION_OFFSET = 4;
constexpr size_t HEADER_PROFILE_OFFSET = 6;
constexpr size_t HEADER_LENGTH_OFFSET = 8;
constexpr size_t HEADER_SECTIONS_OFFSET = 12;

enum class Section : size_t {
    BlockIndex = 0,
    BlockPayload,
    CharacterIndex,
    CharacterPayload,
    AliasIndex,
    AliasPayload,
    PropertyDirectory,
    PropertyData,
    StringPool
};

const char* section_name(Section section) noexcept;

// Character payload flags
namespace CharFlags {
    constexpr uint16_t DECOMPOSITION = 1 << 0;
    constexpr uint16_t NUMERIC       = 1 << 1;
    constexpr uint16_t UNICODE1_NAME = 1 << 2;
    constexpr uint16_t ISO_COMMENT   = 1 << 3;
    constexpr uint16_t UPPERCASE     = 1 << 4;
    constexpr uint16_t LOWERCASE     = 1 << 5;
    constexpr uint16_t TITLECASE     = 1 << 6;
    constexpr uint16_t BIDI_MIRRORED = 1 << 7;

    constexpr uint16_t ALL = 0xFF;
}

struct SectionDescriptor {
    uint32_t offset = 0;
    uint32_t length = 0;
};

// =============================================================================
// Property segments
// =============================================================================

/**
 * A maximal span of a property section over which the same rows apply.
 * Rows keep the order of the section's records.
 */
struct Segment {
    CodepointRange range;
    std::vector<std::vector<std::string>> rows;

    bool operator==(const Segment& o) const { return range == o.range && rows == o.rows; }
};

// Partition (possibly overlapping) records into disjoint segments, ascending.
// Codepoints no record covers get no segment.
std::vector<Segment> build_segments(const std::vector<PropertyRecord>& records);

// One record per (segment, row). Equal to the input for sections whose records are disjoint.
std::vector<PropertyRecord> segments_to_records(const std::vector<Segment>& segments);

} // namespace puaa::codec
