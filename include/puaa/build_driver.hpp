#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "puaa/types.hpp"
#include "puaa/ucd/source_loader.hpp"

namespace puaa {

struct BuildTarget {
    std::string version;
    Profile profile = Profile::Full;
    std::filesystem::path output;
    std::vector<ucd::SourceSpec> sources;
};

struct BuildReport {
    std::vector<std::filesystem::path> built;
    std::vector<std::filesystem::path> skipped;
    std::vector<std::pair<std::filesystem::path, std::string>> failed;
    std::optional<std::string> latest_version;

    bool ok() const { return failed.empty(); }
};

/**
 * Compiles every per-version directory V under a UCD root into
 *   full-V.ucd   the whole directory
 *   min-V.ucd    Blocks.txt + UnicodeData.txt
 *   names-V.ucd  Blocks.txt + UnicodeData.txt + NameAliases.txt
 * next to the version directories. Targets whose output already exists
 * are skipped. The rest compile in parallel; a failing target is reported
 * and the others still run.
 */
class BuildDriver {
public:
    // threads == 0 means hardware concurrency
    explicit BuildDriver(size_t threads = 0) : threads_(threads) {}

    // Thread count from build.threads
    static BuildDriver from_config();

    // Version directory names in natural order ("9.0.0" before "10.0.0")
    static std::vector<std::string> versions(const std::filesystem::path& root);

    static std::vector<BuildTarget> plan(const std::filesystem::path& root);

    /**
     * Build all missing targets. If latest_copy is set, the newest version's
     * names table is copied there afterwards.
     */
    BuildReport run(const std::filesystem::path& root,
                    const std::optional<std::filesystem::path>& latest_copy = std::nullopt) const;

private:
    size_t threads_;
};

// "a2" < "a10"
bool natural_less(const std::string& a, const std::string& b);

} // namespace puaa
