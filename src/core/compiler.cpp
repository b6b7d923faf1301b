#include "puaa/compiler.hpp"

#include <chrono>

#include "puaa/codec/encoder.hpp"
#include "puaa/error.hpp"
#include "puaa/logging.hpp"
#include "puaa/merger.hpp"
#include "puaa/util/file_io.hpp"

namespace puaa {

CompiledTable Compiler::build(Profile profile, const std::vector<ucd::SourceSpec>& sources) {
    PUAA_CHECK_ARGUMENT(!sources.empty(), "at least one source is required",
                        std::string(profile_name(profile)) + " profile");

    Merger merger(profile);
    for (const auto& spec : sources) {
        merger.add(ucd::load_source(spec, profile));
    }
    return merger.finish();
}

CompileResult Compiler::compile(const std::filesystem::path& output,
                                Profile profile,
                                const std::vector<ucd::SourceSpec>& sources) {
    auto start = std::chrono::steady_clock::now();
    LOG_INFO("Compiling ", output.string(), " (", profile_name(profile), ", ", sources.size(), " sources)");

    CompiledTable table = build(profile, sources);
    std::vector<uint8_t> bytes = codec::encode(table);
    util::write_file_atomic(output, bytes);

    CompileResult result;
    result.blocks = table.blocks.size();
    result.characters = table.characters.size();
    result.aliases = table.aliases.size();
    result.sections = table.properties.size();
    result.bytes = bytes.size();

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    LOG_INFO("Wrote ", output.string(), ": ", result.bytes, " bytes in ", ms, " ms");
    return result;
}

} // namespace puaa
