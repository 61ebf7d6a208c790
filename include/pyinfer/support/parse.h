/***
 * Name: pyinfer::support (parse)
 * Purpose: Non-throwing text parsing helpers used by option handling.
 * Inputs: Text views; optional error out
 * Outputs: Parsed values via out parameters; return true on success
 * Theory of Operation: Validates characters and range; ignores surrounding whitespace.
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace pyinfer {
namespace support {

/*** ParseCountStrict: Parse a non-negative base-10 count; fail on signs, junk or overflow. */
bool ParseCountStrict(std::string_view text, std::size_t& out_val, std::string* err = nullptr);

/*** SplitList: Split `text` on `sep`, dropping empty items. */
std::vector<std::string> SplitList(std::string_view text, char sep);

}  // namespace support
}  // namespace pyinfer
