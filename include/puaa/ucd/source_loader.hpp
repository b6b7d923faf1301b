#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "puaa/types.hpp"

namespace puaa::ucd {

// One input of a compile invocation
struct SourceSpec {
    enum class Type {
        Directory,   // a UCD release directory, scanned recursively
        File,        // one explicit file, kind inferred from its name
        Annotated    // a directive-annotated file, or a directory of them
    };

    Type type = Type::Directory;
    std::filesystem::path path;
    std::vector<std::string> flags;        // selection for annotated directories
    std::vector<std::string> substrings;

    static SourceSpec directory(std::filesystem::path p) {
        return {Type::Directory, std::move(p), {}, {}};
    }
    static SourceSpec file(std::filesystem::path p) {
        return {Type::File, std::move(p), {}, {}};
    }
    static SourceSpec annotated(std::filesystem::path p,
                                std::vector<std::string> flags = {},
                                std::vector<std::string> substrings = {}) {
        return {Type::Annotated, std::move(p), std::move(flags), std::move(substrings)};
    }
};

// Whether a compile of this profile reads files of this kind at all
bool profile_reads(Profile profile, FileKind kind) noexcept;

/**
 * True if one of the file's @flag values is among the selected flags, or one
 * of its @substring values occurs in the concatenated selection substrings.
 */
bool annotated_matches(const SourceFile& file,
                       const std::vector<std::string>& flags,
                       const std::vector<std::string>& substrings);

// Non-hidden .txt files below dir, recursively, in sorted path order
std::vector<std::filesystem::path> scan_directory(const std::filesystem::path& dir);

/**
 * Parse everything one spec contributes to a compile of the given profile.
 *
 * Directory scans skip, with a warning, property files that do not match the
 * generic schema; every other parse failure propagates. Annotated directories
 * contribute only matching files; an explicitly named annotated file always
 * contributes.
 */
SourceGroup load_source(const SourceSpec& spec, Profile profile);

} // namespace puaa::ucd
