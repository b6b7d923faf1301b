#include "puaa/build_driver.hpp"

#include <algorithm>
#include <cctype>
#include <future>
#include <thread>

#include "puaa/compiler.hpp"
#include "puaa/config.hpp"
#include "puaa/error.hpp"
#include "puaa/logging.hpp"
#include "puaa/thread_pool.hpp"
#include "puaa/util/file_io.hpp"

namespace fs = std::filesystem;

namespace puaa {

bool natural_less(const std::string& a, const std::string& b) {
    size_t i = 0, j = 0;
    while (i < a.size() && j < b.size()) {
        const bool da = std::isdigit(static_cast<unsigned char>(a[i]));
        const bool db = std::isdigit(static_cast<unsigned char>(b[j]));
        if (da && db) {
            size_t ei = i, ej = j;
            while (ei < a.size() && std::isdigit(static_cast<unsigned char>(a[ei]))) ++ei;
            while (ej < b.size() && std::isdigit(static_cast<unsigned char>(b[ej]))) ++ej;
            // Compare digit runs by value: strip leading zeros, then length, then text
            size_t si = i, sj = j;
            while (si + 1 < ei && a[si] == '0') ++si;
            while (sj + 1 < ej && b[sj] == '0') ++sj;
            if (ei - si != ej - sj) return ei - si < ej - sj;
            int cmp = a.compare(si, ei - si, b, sj, ej - sj);
            if (cmp != 0) return cmp < 0;
            i = ei;
            j = ej;
        } else {
            if (a[i] != b[j]) return a[i] < b[j];
            ++i;
            ++j;
        }
    }
    return a.size() - i < b.size() - j;
}

BuildDriver BuildDriver::from_config() {
    return BuildDriver(Config::getInstance().get<size_t>("build.threads", 0));
}

std::vector<std::string> BuildDriver::versions(const fs::path& root) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        throw IOError("UCD root directory not found", root.string());
    }

    std::vector<std::string> names;
    for (const auto& entry : fs::directory_iterator(root)) {
        std::string name = entry.path().filename().string();
        if (entry.is_directory() && !name.empty() && name[0] != '.') {
            names.push_back(std::move(name));
        }
    }
    std::sort(names.begin(), names.end(), natural_less);
    return names;
}

std::vector<BuildTarget> BuildDriver::plan(const fs::path& root) {
    std::vector<BuildTarget> targets;

    for (const std::string& version : versions(root)) {
        const fs::path dir = root / version;

        BuildTarget full;
        full.version = version;
        full.profile = Profile::Full;
        full.output = root / ("full-" + version + ".ucd");
        full.sources.push_back(ucd::SourceSpec::directory(dir));
        targets.push_back(std::move(full));

        // Explicit file lists; absent files are left out
        std::vector<ucd::SourceSpec> files;
        for (const char* name : {"Blocks.txt", "UnicodeData.txt", "NameAliases.txt"}) {
            if (fs::exists(dir / name)) {
                files.push_back(ucd::SourceSpec::file(dir / name));
            }
        }

        std::vector<ucd::SourceSpec> min_files;
        for (const auto& spec : files) {
            if (spec.path.filename() != "NameAliases.txt") {
                min_files.push_back(spec);
            }
        }

        if (min_files.empty()) {
            LOG_WARN("Version ", version, " has neither Blocks.txt nor UnicodeData.txt; only the full table is built");
            continue;
        }

        BuildTarget min;
        min.version = version;
        min.profile = Profile::Min;
        min.output = root / ("min-" + version + ".ucd");
        min.sources = std::move(min_files);
        targets.push_back(std::move(min));

        BuildTarget names;
        names.version = version;
        names.profile = Profile::Names;
        names.output = root / ("names-" + version + ".ucd");
        names.sources = std::move(files);
        targets.push_back(std::move(names));
    }

    return targets;
}

BuildReport BuildDriver::run(const fs::path& root, const std::optional<fs::path>& latest_copy) const {
    BuildReport report;
    std::vector<BuildTarget> targets = plan(root);

    std::vector<const BuildTarget*> pending;
    for (const auto& target : targets) {
        if (fs::exists(target.output)) {
            LOG_DEBUG("Skipping ", target.output.string(), ": already exists");
            report.skipped.push_back(target.output);
        } else {
            pending.push_back(&target);
        }
    }

    if (!pending.empty()) {
        size_t threads = threads_ ? threads_ : static_cast<size_t>(std::thread::hardware_concurrency());
        ThreadPool pool(std::max<size_t>(1, std::min(threads, pending.size())));
        LOG_INFO("Building ", pending.size(), " tables on ", pool.num_threads(), " threads (",
                 report.skipped.size(), " up to date)");

        // Each task reports its own failure; an empty string means success
        std::vector<std::future<std::string>> results;
        results.reserve(pending.size());
        for (const BuildTarget* target : pending) {
            results.push_back(pool.submit([target]() -> std::string {
                ScopedLogContext context(target->output.filename().string());
                try {
                    Compiler::compile(target->output, target->profile, target->sources);
                    return {};
                } catch (const PuaaException& e) {
                    LOG_ERROR("Failed to build ", target->output.string(), ": ", e.what());
                    return e.what();
                } catch (const std::exception& e) {
                    LOG_ERROR("Failed to build ", target->output.string(), ": ", e.what());
                    return e.what();
                }
            }));
        }

        for (size_t i = 0; i < pending.size(); ++i) {
            std::string error = results[i].get();
            if (error.empty()) {
                report.built.push_back(pending[i]->output);
            } else {
                report.failed.emplace_back(pending[i]->output, std::move(error));
            }
        }
    }

    std::vector<std::string> all_versions = versions(root);
    if (!all_versions.empty()) {
        report.latest_version = all_versions.back();
    }

    if (latest_copy) {
        if (!report.latest_version) {
            report.failed.emplace_back(*latest_copy, "no version directories under " + root.string());
        } else {
            const fs::path source = root / ("names-" + *report.latest_version + ".ucd");
            if (!fs::exists(source)) {
                report.failed.emplace_back(*latest_copy, source.string() + " was not built");
            } else {
                util::write_file_atomic(*latest_copy, util::read_binary_file(source));
                LOG_INFO("Copied ", source.string(), " to ", latest_copy->string());
            }
        }
    }

    LOG_INFO("Build finished: ", report.built.size(), " built, ", report.skipped.size(), " skipped, ",
             report.failed.size(), " failed");
    return report;
}

} // namespace puaa
