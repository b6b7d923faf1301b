#include "puaa/ucd/source_loader.hpp"

#include <algorithm>

#include "puaa/error.hpp"
#include "puaa/logging.hpp"
#include "puaa/ucd/parser.hpp"

namespace fs = std::filesystem;

namespace puaa::ucd {

namespace {

void scan_into(const fs::path& dir, std::vector<fs::path>& out) {
    std::vector<fs::directory_entry> entries;
    for (const auto& entry : fs::directory_iterator(dir)) {
        std::string name = entry.path().filename().string();
        if (name.empty() || name[0] == '.') continue;
        entries.push_back(entry);
    }
    std::sort(entries.begin(), entries.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) {
                  return a.path().filename() < b.path().filename();
              });

    for (const auto& entry : entries) {
        if (entry.is_directory()) {
            scan_into(entry.path(), out);
        } else if (entry.is_regular_file() && entry.path().extension() == ".txt") {
            out.push_back(entry.path());
        }
    }
}

void require_exists(const fs::path& path, bool directory) {
    std::error_code ec;
    bool ok = directory ? fs::is_directory(path, ec) : fs::exists(path, ec);
    if (!ok) {
        throw IOError(directory ? "source directory not found" : "source file not found", path.string());
    }
}

void load_directory(const SourceSpec& spec, Profile profile, SourceGroup& group) {
    require_exists(spec.path, true);

    for (const fs::path& path : scan_directory(spec.path)) {
        FileKind kind = file_kind_for_name(path.filename().string());
        if (!profile_reads(profile, kind)) {
            continue;
        }

        if (kind != FileKind::Property) {
            group.files.push_back(parse_file(path, kind));
            continue;
        }

        // Opaque files are recognised by content; the section is named by the file name
        // so an explicit file of the same name replaces it
        try {
            SourceFile file = parse_file(path, kind);
            group.files.push_back(std::move(file));
        } catch (const MalformedSourceError& e) {
            LOG_WARN("Skipping ", path.string(), ": not a codepoint property file (", e.context(), ": ",
                     e.message(), ")");
        }
    }
}

void load_annotated(const SourceSpec& spec, SourceGroup& group) {
    std::error_code ec;
    if (!fs::is_directory(spec.path, ec)) {
        require_exists(spec.path, false);
        group.files.push_back(parse_file(spec.path, FileKind::Annotated));
        return;
    }

    for (const fs::path& path : scan_directory(spec.path)) {
        SourceFile file = parse_file(path, FileKind::Annotated);
        if (annotated_matches(file, spec.flags, spec.substrings)) {
            LOG_DEBUG("Selected annotated file ", path.string());
            group.files.push_back(std::move(file));
        }
    }
}

} // namespace

bool profile_reads(Profile profile, FileKind kind) noexcept {
    switch (kind) {
        case FileKind::Blocks:
        case FileKind::UnicodeData:
        case FileKind::Annotated:
            return true;
        case FileKind::NameAliases:
            return profile_includes_aliases(profile);
        case FileKind::Property:
            return profile_includes_properties(profile);
    }
    return false;
}

bool annotated_matches(const SourceFile& file,
                       const std::vector<std::string>& flags,
                       const std::vector<std::string>& substrings) {
    for (const auto& flag : file.flags) {
        if (std::find(flags.begin(), flags.end(), flag) != flags.end()) {
            return true;
        }
    }

    std::string selection;
    for (const auto& s : substrings) {
        selection += s;
    }
    for (const auto& sub : file.substrings) {
        if (selection.find(sub) != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::vector<fs::path> scan_directory(const fs::path& dir) {
    std::vector<fs::path> out;
    scan_into(dir, out);
    return out;
}

SourceGroup load_source(const SourceSpec& spec, Profile profile) {
    SourceGroup group;
    group.label = spec.path.string();

    switch (spec.type) {
        case SourceSpec::Type::Directory:
            load_directory(spec, profile, group);
            break;

        case SourceSpec::Type::File: {
            require_exists(spec.path, false);
            FileKind kind = file_kind_for_name(spec.path.filename().string());
            if (!profile_reads(profile, kind)) {
                LOG_INFO("Ignoring ", spec.path.string(), ": ", file_kind_name(kind),
                         " files are not part of the ", profile_name(profile), " profile");
                break;
            }
            group.files.push_back(parse_file(spec.path, kind));
            break;
        }

        case SourceSpec::Type::Annotated:
            load_annotated(spec, group);
            break;
    }

    LOG_DEBUG("Loaded ", group.files.size(), " files from ", group.label);
    return group;
}

} // namespace puaa::ucd
