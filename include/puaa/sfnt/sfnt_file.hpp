#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

#include "puaa/util/byte_io.hpp"

namespace puaa::sfnt {

constexpr uint32_t VERSION_TRUETYPE = 0x00010000;
constexpr uint32_t VERSION_CFF      = util::make_tag('O', 'T', 'T', 'O');
constexpr uint32_t VERSION_APPLE    = util::make_tag('t', 'r', 'u', 'e');
constexpr uint32_t VERSION_TYPE1    = util::make_tag('t', 'y', 'p', '1');
constexpr uint32_t VERSION_PUAA     = util::make_tag('P', 'U', 'A', 'A');   // standalone property container

constexpr uint32_t TAG_HEAD = util::make_tag('h', 'e', 'a', 'd');
constexpr uint32_t TAG_PUAA = util::make_tag('P', 'U', 'A', 'A');

constexpr uint32_t CHECKSUM_MAGIC = 0xB1B0AFBA;
constexpr size_t CHECKSUM_ADJUSTMENT_OFFSET = 8;   // within 'head'

constexpr size_t OFFSET_TABLE_SIZE = 12;
constexpr size_t TABLE_RECORD_SIZE = 16;

bool is_supported_version(uint32_t version) noexcept;

// Sum of big-endian 32-bit words, a short tail padded with zeros
uint32_t compute_checksum(std::span<const uint8_t> data) noexcept;

// Whether data starts with a supported offset table whose search fields
// match its table count and whose directory fits in the data
bool has_sfnt_directory(std::span<const uint8_t> data) noexcept;

struct Table {
    uint32_t tag = 0;
    uint32_t checksum = 0;
    std::vector<uint8_t> data;
};

/**
 * An sfnt-family container (TrueType, OpenType/CFF, Apple, Type 1 wrapped,
 * or a standalone PUAA container) held in memory.
 *
 * Tables keep their original file order; serialize() lays them out in that
 * order, each 4-byte aligned, writes the directory sorted by tag, and
 * recomputes every checksum including head.checkSumAdjustment.
 */
class SfntFile {
public:
    /**
     * Parse and verify. Unsupported versions and truncated directories or
     * tables throw UnsupportedContainerError; a table checksum or the
     * whole-font adjustment that does not verify throws ChecksumMismatchError.
     */
    static SfntFile parse(std::span<const uint8_t> data, const std::string& context);
    static SfntFile read(const std::filesystem::path& path);

    uint32_t version() const noexcept { return version_; }
    const std::vector<Table>& tables() const noexcept { return tables_; }

    const Table* find(uint32_t tag) const noexcept;

    // Replace in place, or append as the last table
    void set_table(uint32_t tag, std::vector<uint8_t> data);

    // Returns false if no such table exists
    bool remove_table(uint32_t tag);

    // Throws TableTooLargeError if the layout does not fit 32-bit offsets
    std::vector<uint8_t> serialize() const;

private:
    uint32_t version_ = VERSION_TRUETYPE;
    std::vector<Table> tables_;
};

} // namespace puaa::sfnt
