#include "puaa/exporter.hpp"

#include <sstream>

#include "puaa/error.hpp"
#include "puaa/logging.hpp"
#include "puaa/util/file_io.hpp"

namespace fs = std::filesystem;

namespace puaa {

namespace {

std::string hex(uint32_t cp) {
    return format_codepoint(cp);
}

std::string optional_hex(const std::optional<uint32_t>& cp) {
    return cp ? hex(*cp) : std::string();
}

// The 14 fields after the codepoint, with the given name
std::string character_fields(const CharacterRecord& c, const std::string& name) {
    std::ostringstream out;
    out << name << ';'
        << UnicodeProperties::name(c.general_category) << ';'
        << static_cast<unsigned>(c.canonical_combining_class) << ';'
        << UnicodeProperties::name(c.bidi_class) << ';';

    if (c.decomposition) {
        out << c.decomposition->tag;
        for (size_t i = 0; i < c.decomposition->mapping.size(); ++i) {
            if (i > 0 || !c.decomposition->tag.empty()) out << ' ';
            out << hex(c.decomposition->mapping[i]);
        }
    }
    out << ';';

    if (c.numeric_values) {
        out << c.numeric_values->decimal << ';' << c.numeric_values->digit << ';' << c.numeric_values->numeric << ';';
    } else {
        out << ";;;";
    }

    out << (c.bidi_mirrored ? 'Y' : 'N') << ';'
        << c.unicode1_name.value_or("") << ';'
        << c.iso_comment.value_or("") << ';'
        << optional_hex(c.simple_uppercase) << ';'
        << optional_hex(c.simple_lowercase) << ';'
        << optional_hex(c.simple_titlecase);
    return out.str();
}

std::string range_label(const std::string& name) {
    if (name.size() >= 2 && name.front() == '<' && name.back() == '>') {
        return name.substr(1, name.size() - 2);
    }
    return name;
}

std::string export_blocks(const codec::TableReader& reader) {
    std::ostringstream out;
    out << "# Blocks.txt\n\n";
    for (const Block& block : reader.blocks()) {
        out << format_range(block.range) << "; " << block.name << '\n';
    }
    return out.str();
}

std::string export_characters(const codec::TableReader& reader) {
    std::ostringstream out;
    for (const CharacterRecord& c : reader.characters()) {
        if (c.codepoints.size() == 1) {
            out << hex(c.codepoints.start) << ';' << character_fields(c, c.name) << '\n';
            continue;
        }
        const std::string label = range_label(c.name);
        out << hex(c.codepoints.start) << ';' << character_fields(c, "<" + label + ", First>") << '\n';
        out << hex(c.codepoints.end) << ';' << character_fields(c, "<" + label + ", Last>") << '\n';
    }
    return out.str();
}

std::string export_aliases(const codec::TableReader& reader) {
    std::ostringstream out;
    out << "# NameAliases.txt\n\n";
    for (const codec::AliasEntry& entry : reader.aliases()) {
        for (const NameAlias& alias : entry.aliases) {
            out << hex(alias.codepoint) << ';' << alias.alias << ';' << UnicodeProperties::name(alias.type) << '\n';
        }
    }
    return out.str();
}

bool contains_separator(const std::vector<std::string>& fields) {
    for (const auto& f : fields) {
        if (f.find(';') != std::string::npos) return true;
    }
    return false;
}

std::string export_section(const codec::TableReader& reader, size_t section) {
    std::ostringstream out;
    out << "# " << reader.section_name(section) << "\n\n";
    for (const codec::Segment& segment : reader.segments(section)) {
        for (const auto& row : segment.rows) {
            // Unihan rows may carry ';' in their value; keep them in tab form
            if (row.size() == 2 && segment.range.size() == 1 && contains_separator(row)) {
                out << "U+" << hex(segment.range.start) << '\t' << row[0] << '\t' << row[1] << '\n';
                continue;
            }
            if (contains_separator(row)) {
                throw InvalidArgumentError("property field contains ';' and cannot be written as text",
                                           reader.section_name(section) + ":" + format_range(segment.range));
            }
            out << format_range(segment.range);
            for (const auto& field : row) {
                out << "; " << field;
            }
            out << '\n';
        }
    }
    return out.str();
}

// Section names are relative paths; refuse anything that escapes out_dir
fs::path section_path(const fs::path& out_dir, const std::string& name) {
    fs::path rel = fs::path(name).lexically_normal();
    if (name.empty() || rel.is_absolute() || rel.has_root_name() ||
        (!rel.empty() && *rel.begin() == "..")) {
        throw InvalidArgumentError("property section name is not a relative path", name);
    }
    return out_dir / rel;
}

fs::path write_text(const fs::path& path, const std::string& text) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        throw IOError("Cannot create directory: " + ec.message(), path.parent_path().string(), ErrorCode::WRITE_FAILED);
    }
    util::write_file_atomic(path, std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(text.data()), text.size()));
    LOG_DEBUG("Wrote ", path.string(), " (", text.size(), " bytes)");
    return path;
}

} // namespace

std::vector<fs::path> Exporter::decompile(const codec::TableReader& reader, const fs::path& out_dir) {
    std::vector<fs::path> written;

    written.push_back(write_text(out_dir / "Blocks.txt", export_blocks(reader)));
    written.push_back(write_text(out_dir / "UnicodeData.txt", export_characters(reader)));

    if (profile_includes_aliases(reader.profile())) {
        written.push_back(write_text(out_dir / "NameAliases.txt", export_aliases(reader)));
    }

    if (profile_includes_properties(reader.profile())) {
        for (size_t s = 0; s < reader.section_count(); ++s) {
            const std::string name = reader.section_name(s);
            written.push_back(write_text(section_path(out_dir, name), export_section(reader, s)));
        }
    }

    LOG_INFO("Decompiled ", profile_name(reader.profile()), " table into ", written.size(),
             " files under ", out_dir.string());
    return written;
}

} // namespace puaa
