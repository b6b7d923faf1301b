#include "puaa/codec/format.hpp"

#include <algorithm>
#include <numeric>

namespace puaa::codec {

const char* section_name(Section section) noexcept {
    switch (section) {
        case Section::BlockIndex:        return "block index";
        case Section::BlockPayload:      return "block payload";
        case Section::CharacterIndex:    return "character index";
        case Section::CharacterPayload:  return "character payload";
        case Section::AliasIndex:        return "alias index";
        case Section::AliasPayload:      return "alias payload";
        case Section::PropertyDirectory: return "property directory";
        case Section::PropertyData:      return "property data";
        case Section::StringPool:        return "string pool";
    }
    return "unknown";
}

std::vector<Segment> build_segments(const std::vector<PropertyRecord>& records) {
    std::vector<size_t> order(records.size());
    std::iota(order.begin(), order.end(), size_t(0));
    std::stable_sort(order.begin(), order.end(),
                     [&](size_t a, size_t b) { return records[a].range < records[b].range; });

    // Coverage only changes at a record start or one past a record end
    std::vector<uint32_t> bounds;
    bounds.reserve(records.size() * 2);
    for (const auto& r : records) {
        bounds.push_back(r.range.start);
        bounds.push_back(r.range.end + 1);
    }
    std::sort(bounds.begin(), bounds.end());
    bounds.erase(std::unique(bounds.begin(), bounds.end()), bounds.end());

    std::vector<Segment> segments;
    std::vector<size_t> active;     // positions in order, ascending
    size_t next = 0;

    for (size_t b = 0; b + 1 < bounds.size(); ++b) {
        const uint32_t lo = bounds[b];
        const uint32_t hi = bounds[b + 1] - 1;

        while (next < order.size() && records[order[next]].range.start == lo) {
            active.push_back(next++);
        }
        active.erase(std::remove_if(active.begin(), active.end(),
                                    [&](size_t p) { return records[order[p]].range.end < lo; }),
                     active.end());
        if (active.empty()) continue;

        Segment segment;
        segment.range = {lo, hi};
        segment.rows.reserve(active.size());
        for (size_t p : active) {
            segment.rows.push_back(records[order[p]].fields);
        }
        segments.push_back(std::move(segment));
    }

    return segments;
}

std::vector<PropertyRecord> segments_to_records(const std::vector<Segment>& segments) {
    std::vector<PropertyRecord> records;
    for (const auto& segment : segments) {
        for (const auto& row : segment.rows) {
            PropertyRecord record;
            record.range = segment.range;
            record.fields = row;
            records.push_back(std::move(record));
        }
    }
    return records;
}

} // namespace puaa::codec
