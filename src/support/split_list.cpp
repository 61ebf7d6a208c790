/***
 * Name: pyinfer::support::SplitList
 * Purpose: Split a separator-delimited list into its non-empty items.
 * Inputs:
 *   - text: list text such as "units,modules"
 *   - sep: separator character
 * Outputs: Items in input order
 */
#include "pyinfer/support/parse.h"

namespace pyinfer::support {

std::vector<std::string> SplitList(std::string_view text, char sep) {
  std::vector<std::string> items;
  std::size_t start = 0;
  while (start <= text.size()) {
    const std::size_t end = text.find(sep, start);
    const std::string_view item = text.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
    if (!item.empty()) {
      items.emplace_back(item);
    }
    if (end == std::string_view::npos) {
      break;
    }
    start = end + 1;
  }
  return items;
}

}  // namespace pyinfer::support
