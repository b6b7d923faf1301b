#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "puaa/types.hpp"

namespace puaa::ucd {

/**
 * UAX#44 text table parser.
 *
 * Grammars by FileKind:
 *   Blocks       START..END; Name
 *   UnicodeData  15 semicolon-separated fields, <Label, First>/<Label, Last>
 *                line pairs folded into one range record named <Label>
 *   NameAliases  CODEPOINT; Alias; Type
 *   Annotated    @flag / @substring / @file directives switching between the
 *                three grammars above
 *   Property     KEY; field; ...   or   U+XXXX<TAB>kProperty<TAB>value
 *
 * '#' starts a comment everywhere. The text must be valid UTF-8 (a leading
 * BOM is skipped). The first bad line throws MalformedSourceError naming the
 * file and line; nothing is recovered.
 */

// Hex codepoint without prefix, at most U+10FFFF
std::optional<uint32_t> parse_codepoint(std::string_view hex);

// "XXXX" or "XXXX..YYYY" with start <= end
std::optional<CodepointRange> parse_range(std::string_view text);

SourceFile parse_text(std::string_view text, const std::string& path, FileKind kind);

SourceFile parse_file(const std::filesystem::path& path, FileKind kind);

// Kind inferred from the file name
SourceFile parse_file(const std::filesystem::path& path);

} // namespace puaa::ucd
