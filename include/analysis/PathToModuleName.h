/***
 * Name: pyinfer::analysis::pathToModuleName
 * Purpose: Convert a source file path to a dotted module name.
 * Theory of Operation:
 *   "<dir>/__init__.py" names the package <dir>; any other file is named by its stem. Each
 *   ancestor directory that contains an "__init__.py" marker prefixes its name; the walk
 *   stops at the first ancestor without one. The existence check is injectable so the
 *   algorithm can be exercised without a file system.
 */
#pragma once

#include <functional>
#include <string>

namespace pyinfer::analysis {

    using FileExists = std::function<bool(const std::string& path)>;

    std::string pathToModuleName(const std::string& path, const FileExists& exists);
    // Uses std::filesystem::exists.
    std::string pathToModuleName(const std::string& path);

} // namespace pyinfer::analysis
