#pragma once

#include <filesystem>
#include <vector>

#include "puaa/codec/decoder.hpp"

namespace puaa {

/**
 * Write a compiled table back out as UCD text files under out_dir:
 * Blocks.txt, UnicodeData.txt (range records re-expanded into First/Last
 * line pairs), NameAliases.txt and one file per property section, named
 * after the section. Only the kinds the table's profile carries are
 * written. Scanning out_dir with the same profile yields an equal table.
 *
 * Returns the files written, in that order.
 */
class Exporter {
public:
    static std::vector<std::filesystem::path> decompile(const codec::TableReader& reader,
                                                        const std::filesystem::path& out_dir);
};

} // namespace puaa
