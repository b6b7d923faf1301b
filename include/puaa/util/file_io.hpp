#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace puaa::util {

// Whole-file reads. Missing or unreadable files throw IOError(FILE_NOT_FOUND).
std::string read_text_file(const std::filesystem::path& path);
std::vector<uint8_t> read_binary_file(const std::filesystem::path& path);

/**
 * Write data to "<path>.tmp-XXXXXX" in the destination directory, then
 * rename it over path. An existing file keeps its permission bits; a new
 * one is created 0644. On any failure the temp file is removed, path is
 * left as it was, and IOError(WRITE_FAILED) is thrown.
 */
void write_file_atomic(const std::filesystem::path& path, std::span<const uint8_t> data);

} // namespace puaa::util
