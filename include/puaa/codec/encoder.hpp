#pragma once

#include <cstdint>
#include <vector>

#include "puaa/types.hpp"

namespace puaa::codec {

/**
 * Serialize a merged table into the compiled binary form.
 *
 * Blocks and characters must be sorted and disjoint, aliases ordered by
 * codepoint and property sections ordered by name, as Merger::finish()
 * leaves them. The same table always yields the same bytes.
 *
 * Throws InvalidArgumentError for unordered input, a string longer than
 * 65535 bytes, more than 65535 items in one payload list, or a table whose
 * offsets do not fit in 32 bits.
 */
std::vector<uint8_t> encode(const CompiledTable& table);

} // namespace puaa::codec
