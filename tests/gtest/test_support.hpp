// =============================================================================
// Shared fixtures for the puaa test suites
// =============================================================================

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include <unistd.h>

namespace puaa::test {

// Unique directory under the system temp dir, removed on destruction
class TempDir {
public:
    TempDir() {
        static std::atomic<unsigned> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                ("puaa-test-" + std::to_string(::getpid()) + "-" + std::to_string(stamp) + "-" +
                 std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

inline void write_text(const std::filesystem::path& path, const std::string& text) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << text;
}

inline std::vector<uint8_t> read_bytes(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

inline void write_bytes(const std::filesystem::path& path, const std::vector<uint8_t>& bytes) {
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

// Names of everything directly inside dir
inline std::vector<std::string> list_dir(const std::filesystem::path& dir) {
    std::vector<std::string> names;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        names.push_back(entry.path().filename().string());
    }
    return names;
}

// A small UCD release: two blocks, a handful of characters (including a
// First/Last range), aliases and one property file.
constexpr const char* SAMPLE_BLOCKS =
    "# Blocks-15.1.0.txt\n"
    "0000..007F; Basic Latin\n"
    "4E00..9FFF; CJK Unified Ideographs\n";

constexpr const char* SAMPLE_UNICODE_DATA =
    "0000;<control>;Cc;0;BN;;;;;N;NULL;;;;\n"
    "0030;DIGIT ZERO;Nd;0;EN;;0;0;0;N;;;;;\n"
    "0041;LATIN CAPITAL LETTER A;Lu;0;L;;;;;N;;;;0061;\n"
    "0061;LATIN SMALL LETTER A;Ll;0;L;;;;;N;;;0041;;0041\n"
    "00BD;VULGAR FRACTION ONE HALF;No;0;ON;<fraction> 0031 2044 0032;;;1/2;N;FRACTION ONE HALF;;;;\n"
    "0028;LEFT PARENTHESIS;Ps;0;ON;;;;;Y;OPENING PARENTHESIS;;;;\n"
    "4E00;<CJK Ideograph, First>;Lo;0;L;;;;;N;;;;;\n"
    "9FFF;<CJK Ideograph, Last>;Lo;0;L;;;;;N;;;;;\n";

constexpr const char* SAMPLE_NAME_ALIASES =
    "0000;NULL;control\n"
    "0000;NUL;abbreviation\n"
    "0041;LETTER A;figment\n";

constexpr const char* SAMPLE_PROPERTY =
    "# Scripts-15.1.0.txt\n"
    "0000..0040 ; Common # Cc\n"
    "0041       ; Latin\n"
    "0061       ; Latin\n"
    "4E00..9FFF ; Han\n";

// The Applebanana letter pair in a private block
constexpr const char* APPLEBANANA_BLOCKS = "FAB00..FAB3F; Applebanana\n";

constexpr const char* APPLEBANANA_UNICODE_DATA =
    "FAB00;LATIN CAPITAL LETTER APPLEBANANA;Lu;0;L;;;;;N;;;;FAB20;\n"
    "FAB20;LATIN SMALL LETTER APPLEBANANA;Ll;0;L;;;;;N;;;FAB00;;FAB00\n";

inline void write_sample_release(const std::filesystem::path& dir) {
    write_text(dir / "Blocks.txt", SAMPLE_BLOCKS);
    write_text(dir / "UnicodeData.txt", SAMPLE_UNICODE_DATA);
    write_text(dir / "NameAliases.txt", SAMPLE_NAME_ALIASES);
    write_text(dir / "Scripts.txt", SAMPLE_PROPERTY);
}

} // namespace puaa::test
