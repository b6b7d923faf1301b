#pragma once

#include <cstdint>
#include <filesystem>

#include "puaa/sfnt/sfnt_file.hpp"

namespace puaa::sfnt {

struct EmbedOptions {
    uint32_t table_tag = TAG_PUAA;
    uint64_t max_table_length = 0xFFFFFFFFull;

    // Tag from sfnt.table_tag
    static EmbedOptions from_config();
};

/**
 * Insert or replace the compiled table in a font and write the result to
 * font_out (which may equal font_in). The table file must be a valid
 * compiled table. The font's checksums must verify on read and are all
 * recomputed on write.
 *
 * Throws TableTooLargeError when the table exceeds max_table_length or the
 * font no longer fits 32-bit offsets. On any failure neither path changes.
 */
void embed(const std::filesystem::path& font_in,
           const std::filesystem::path& table_path,
           const std::filesystem::path& font_out,
           const EmbedOptions& options = {});

/**
 * Copy the compiled table carried by source_font (a font, or a raw table)
 * into font_in, writing the result to font_out. Both fonts are read under
 * options.table_tag. Throws UnsupportedContainerError if the source carries
 * no such table; otherwise behaves like embed().
 */
void copy(const std::filesystem::path& source_font,
          const std::filesystem::path& font_in,
          const std::filesystem::path& font_out,
          const EmbedOptions& options = {});

/**
 * Remove the compiled table from a font, writing the result to font_out.
 * Returns false if the font carried no such table (font_out is still written).
 */
bool strip(const std::filesystem::path& font_in,
           const std::filesystem::path& font_out,
           const EmbedOptions& options = {});

} // namespace puaa::sfnt
