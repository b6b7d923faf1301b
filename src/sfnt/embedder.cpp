#include "puaa/sfnt/embedder.hpp"

#include "puaa/codec/decoder.hpp"
#include "puaa/config.hpp"
#include "puaa/error.hpp"
#include "puaa/logging.hpp"
#include "puaa/util/file_io.hpp"

namespace puaa::sfnt {

EmbedOptions EmbedOptions::from_config() {
    EmbedOptions options;
    std::string tag = Config::getInstance().get<std::string>("sfnt.table_tag", "PUAA");
    if (tag.size() != 4) {
        throw InvalidArgumentError("sfnt.table_tag must be four characters", tag);
    }
    options.table_tag = util::make_tag(tag[0], tag[1], tag[2], tag[3]);
    return options;
}

namespace {

// table_origin names where the bytes came from in errors and logs
void embed_table(const std::filesystem::path& font_in,
                 std::vector<uint8_t> table,
                 const std::string& table_origin,
                 const std::filesystem::path& font_out,
                 const EmbedOptions& options) {
    SfntFile font = SfntFile::read(font_in);

    if (table.size() > options.max_table_length) {
        throw TableTooLargeError("table of " + std::to_string(table.size()) + " bytes exceeds the limit of " +
                                 std::to_string(options.max_table_length) + " bytes",
                                 table_origin);
    }

    // Refuse to embed anything that is not a readable table
    codec::TableReader reader(table);
    reader.validate();

    const bool replacing = font.find(options.table_tag) != nullptr;
    font.set_table(options.table_tag, std::move(table));

    std::vector<uint8_t> out = font.serialize();
    util::write_file_atomic(font_out, out);

    LOG_INFO(replacing ? "Replaced '" : "Embedded '", util::tag_to_string(options.table_tag), "' table (",
             profile_name(reader.profile()), ", ", reader.size(), " bytes) from ", table_origin, " into ",
             font_out.string());
}

} // namespace

void embed(const std::filesystem::path& font_in,
           const std::filesystem::path& table_path,
           const std::filesystem::path& font_out,
           const EmbedOptions& options) {
    embed_table(font_in, util::read_binary_file(table_path), table_path.string(), font_out, options);
}

void copy(const std::filesystem::path& source_font,
          const std::filesystem::path& font_in,
          const std::filesystem::path& font_out,
          const EmbedOptions& options) {
    codec::TableReader source = codec::TableReader::open(source_font, options.table_tag);
    std::span<const uint8_t> bytes = source.bytes();
    embed_table(font_in, std::vector<uint8_t>(bytes.begin(), bytes.end()), source_font.string(), font_out,
                options);
}

bool strip(const std::filesystem::path& font_in,
           const std::filesystem::path& font_out,
           const EmbedOptions& options) {
    SfntFile font = SfntFile::read(font_in);

    const bool removed = font.remove_table(options.table_tag);
    std::vector<uint8_t> out = font.serialize();
    util::write_file_atomic(font_out, out);

    if (removed) {
        LOG_INFO("Removed '", util::tag_to_string(options.table_tag), "' table, wrote ", font_out.string());
    } else {
        LOG_WARN("No '", util::tag_to_string(options.table_tag), "' table in ", font_in.string());
    }
    return removed;
}

} // namespace puaa::sfnt
