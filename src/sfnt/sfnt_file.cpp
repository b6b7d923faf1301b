#include "puaa/sfnt/sfnt_file.hpp"

#include <algorithm>
#include <cstdio>
#include <numeric>

#include "puaa/error.hpp"
#include "puaa/logging.hpp"
#include "puaa/util/file_io.hpp"

namespace puaa::sfnt {

using util::load_be16;
using util::load_be32;
using util::store_be16;
using util::store_be32;
using util::tag_to_string;

namespace {

constexpr uint64_t MAX_OFFSET = 0xFFFFFFFFull;

struct SearchFields {
    uint16_t search_range = 0;
    uint16_t entry_selector = 0;
    uint16_t range_shift = 0;
};

SearchFields search_fields(size_t num_tables) {
    SearchFields f;
    if (num_tables == 0) {
        return f;
    }
    while ((size_t(2) << f.entry_selector) <= num_tables) {
        ++f.entry_selector;
    }
    f.search_range = static_cast<uint16_t>((1u << f.entry_selector) * TABLE_RECORD_SIZE);
    f.range_shift = static_cast<uint16_t>(num_tables * TABLE_RECORD_SIZE - f.search_range);
    return f;
}

// Checksum of a table; for head, with checkSumAdjustment treated as zero
uint32_t table_checksum(uint32_t tag, std::span<const uint8_t> data) {
    uint32_t sum = compute_checksum(data);
    if (tag == TAG_HEAD && data.size() >= CHECKSUM_ADJUSTMENT_OFFSET + 4) {
        sum -= load_be32(data.data() + CHECKSUM_ADJUSTMENT_OFFSET);
    }
    return sum;
}

std::string hex32(uint32_t v) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "0x%08X", v);
    return buf;
}

} // namespace

bool is_supported_version(uint32_t version) noexcept {
    return version == VERSION_TRUETYPE || version == VERSION_CFF || version == VERSION_APPLE ||
           version == VERSION_TYPE1 || version == VERSION_PUAA;
}

uint32_t compute_checksum(std::span<const uint8_t> data) noexcept {
    uint32_t sum = 0;
    size_t aligned = data.size() & ~size_t(3);
    for (size_t i = 0; i < aligned; i += 4) {
        sum += load_be32(data.data() + i);
    }
    // Tail bytes shifted into the high end of a final word
    uint32_t tail = 0;
    for (size_t i = aligned; i < data.size(); ++i) {
        tail |= uint32_t(data[i]) << (24 - 8 * (i - aligned));
    }
    return sum + tail;
}

bool has_sfnt_directory(std::span<const uint8_t> data) noexcept {
    if (data.size() < OFFSET_TABLE_SIZE || !is_supported_version(load_be32(data.data()))) {
        return false;
    }
    size_t n = load_be16(data.data() + 4);
    if (OFFSET_TABLE_SIZE + n * TABLE_RECORD_SIZE > data.size()) {
        return false;
    }
    SearchFields expected = search_fields(n);
    return load_be16(data.data() + 6) == expected.search_range &&
           load_be16(data.data() + 8) == expected.entry_selector &&
           load_be16(data.data() + 10) == expected.range_shift;
}

SfntFile SfntFile::parse(std::span<const uint8_t> data, const std::string& context) {
    if (data.size() < OFFSET_TABLE_SIZE) {
        throw UnsupportedContainerError("file is too short for an sfnt offset table", context);
    }

    SfntFile font;
    font.version_ = load_be32(data.data());
    if (!is_supported_version(font.version_)) {
        throw UnsupportedContainerError("unsupported sfnt version " + hex32(font.version_), context);
    }

    const size_t num_tables = load_be16(data.data() + 4);
    if (OFFSET_TABLE_SIZE + num_tables * TABLE_RECORD_SIZE > data.size()) {
        throw UnsupportedContainerError("table directory of " + std::to_string(num_tables) +
                                        " entries is truncated", context);
    }

    struct Record {
        uint32_t tag, checksum, offset, length;
    };
    std::vector<Record> records;
    records.reserve(num_tables);
    for (size_t i = 0; i < num_tables; ++i) {
        const uint8_t* p = data.data() + OFFSET_TABLE_SIZE + i * TABLE_RECORD_SIZE;
        Record rec{load_be32(p), load_be32(p + 4), load_be32(p + 8), load_be32(p + 12)};
        if (uint64_t(rec.offset) + rec.length > data.size()) {
            throw UnsupportedContainerError("table '" + tag_to_string(rec.tag) + "' extends past the end of the file",
                                            context);
        }
        for (const auto& other : records) {
            if (other.tag == rec.tag) {
                throw UnsupportedContainerError("duplicate table '" + tag_to_string(rec.tag) + "'", context);
            }
        }
        records.push_back(rec);
    }

    // Keep the original data order so rewriting disturbs as little as possible
    std::stable_sort(records.begin(), records.end(),
                     [](const Record& a, const Record& b) { return a.offset < b.offset; });

    const Record* head = nullptr;
    for (const auto& rec : records) {
        std::span<const uint8_t> bytes = data.subspan(rec.offset, rec.length);
        if (rec.tag == TAG_HEAD) {
            if (rec.length < CHECKSUM_ADJUSTMENT_OFFSET + 4) {
                throw UnsupportedContainerError("'head' table is too short", context);
            }
            head = &rec;
        }
        uint32_t sum = table_checksum(rec.tag, bytes);
        if (sum != rec.checksum) {
            throw ChecksumMismatchError("checksum of table '" + tag_to_string(rec.tag) + "' is " + hex32(sum) +
                                        ", directory says " + hex32(rec.checksum), context);
        }
        font.tables_.push_back(Table{rec.tag, rec.checksum, std::vector<uint8_t>(bytes.begin(), bytes.end())});
    }

    if (head) {
        const size_t pos = head->offset + CHECKSUM_ADJUSTMENT_OFFSET;
        const uint32_t adjustment = load_be32(data.data() + pos);
        std::vector<uint8_t> copy(data.begin(), data.end());
        store_be32(copy.data() + pos, 0);
        const uint32_t expected = CHECKSUM_MAGIC - compute_checksum(copy);
        if (adjustment != expected) {
            throw ChecksumMismatchError("head.checkSumAdjustment is " + hex32(adjustment) + ", expected " +
                                        hex32(expected), context);
        }
    }

    LOG_DEBUG("Read sfnt ", hex32(font.version_), " with ", font.tables_.size(), " tables from ", context);
    return font;
}

SfntFile SfntFile::read(const std::filesystem::path& path) {
    std::vector<uint8_t> data = util::read_binary_file(path);
    return parse(data, path.string());
}

const Table* SfntFile::find(uint32_t tag) const noexcept {
    for (const auto& table : tables_) {
        if (table.tag == tag) {
            return &table;
        }
    }
    return nullptr;
}

void SfntFile::set_table(uint32_t tag, std::vector<uint8_t> data) {
    for (auto& table : tables_) {
        if (table.tag == tag) {
            table.data = std::move(data);
            table.checksum = table_checksum(tag, table.data);
            return;
        }
    }
    uint32_t checksum = table_checksum(tag, data);
    tables_.push_back(Table{tag, checksum, std::move(data)});
}

bool SfntFile::remove_table(uint32_t tag) {
    auto it = std::find_if(tables_.begin(), tables_.end(), [tag](const Table& t) { return t.tag == tag; });
    if (it == tables_.end()) {
        return false;
    }
    tables_.erase(it);
    return true;
}

std::vector<uint8_t> SfntFile::serialize() const {
    const size_t n = tables_.size();
    if (n > 0xFFFF) {
        throw TableTooLargeError("too many tables for an sfnt directory", std::to_string(n));
    }

    // Layout in current order, each table 4-byte aligned
    std::vector<uint64_t> offsets(n);
    uint64_t offset = OFFSET_TABLE_SIZE + n * TABLE_RECORD_SIZE;
    for (size_t i = 0; i < n; ++i) {
        offsets[i] = offset;
        offset += tables_[i].data.size();
        if (offset > MAX_OFFSET) {
            throw TableTooLargeError("table '" + tag_to_string(tables_[i].tag) +
                                     "' does not fit within 32-bit file offsets",
                                     std::to_string(tables_[i].data.size()) + " bytes");
        }
        offset = (offset + 3) & ~uint64_t(3);
    }

    std::vector<uint8_t> out(static_cast<size_t>(offset), 0);
    SearchFields search = search_fields(n);
    store_be32(out.data(), version_);
    store_be16(out.data() + 4, static_cast<uint16_t>(n));
    store_be16(out.data() + 6, search.search_range);
    store_be16(out.data() + 8, search.entry_selector);
    store_be16(out.data() + 10, search.range_shift);

    size_t head_adjustment = 0;
    std::vector<uint32_t> checksums(n);
    for (size_t i = 0; i < n; ++i) {
        const Table& table = tables_[i];
        uint8_t* dst = out.data() + offsets[i];
        std::copy(table.data.begin(), table.data.end(), dst);
        if (table.tag == TAG_HEAD) {
            if (table.data.size() < CHECKSUM_ADJUSTMENT_OFFSET + 4) {
                throw UnsupportedContainerError("'head' table is too short");
            }
            head_adjustment = offsets[i] + CHECKSUM_ADJUSTMENT_OFFSET;
            store_be32(out.data() + head_adjustment, 0);
        }
        checksums[i] = compute_checksum({dst, table.data.size()});
    }

    // Directory sorted by tag
    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), size_t(0));
    std::sort(order.begin(), order.end(),
              [this](size_t a, size_t b) { return tables_[a].tag < tables_[b].tag; });
    for (size_t k = 0; k < n; ++k) {
        const size_t i = order[k];
        uint8_t* p = out.data() + OFFSET_TABLE_SIZE + k * TABLE_RECORD_SIZE;
        store_be32(p, tables_[i].tag);
        store_be32(p + 4, checksums[i]);
        store_be32(p + 8, static_cast<uint32_t>(offsets[i]));
        store_be32(p + 12, static_cast<uint32_t>(tables_[i].data.size()));
    }

    if (head_adjustment) {
        store_be32(out.data() + head_adjustment, CHECKSUM_MAGIC - compute_checksum(out));
    }
    return out;
}

} // namespace puaa::sfnt
