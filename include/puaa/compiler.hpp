#pragma once

#include <cstddef>
#include <filesystem>
#include <vector>

#include "puaa/types.hpp"
#include "puaa/ucd/source_loader.hpp"

namespace puaa {

struct CompileResult {
    size_t blocks = 0;
    size_t characters = 0;
    size_t aliases = 0;
    size_t sections = 0;
    size_t bytes = 0;
};

class Compiler {
public:
    // Load and merge, without encoding
    static CompiledTable build(Profile profile, const std::vector<ucd::SourceSpec>& sources);

    /**
     * Load, merge, encode and write output atomically. Later sources
     * override earlier ones. On failure output is left untouched.
     */
    static CompileResult compile(const std::filesystem::path& output,
                                 Profile profile,
                                 const std::vector<ucd::SourceSpec>& sources);
};

} // namespace puaa
