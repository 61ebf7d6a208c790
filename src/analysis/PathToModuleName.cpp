/***
 * Name: pyinfer::analysis::pathToModuleName
 * Purpose: Derive a dotted module name from a source file path.
 * Inputs:
 *   - path: file path; "__init__.py" names its directory
 *   - exists: file existence predicate
 * Outputs: Dotted module name
 * Theory of Operation: Prefix each ancestor directory that holds an "__init__.py" marker,
 *   stopping at the first ancestor without one or at the filesystem root.
 */
#include "analysis/PathToModuleName.h"

#include <filesystem>

namespace pyinfer::analysis {

    std::string pathToModuleName(const std::string& path, const FileExists& exists) {
        namespace fs = std::filesystem;
        if (path.empty()) { return {}; }
        const fs::path file(path);
        fs::path dir = file.parent_path();
        std::string name;
        if (file.filename() == "__init__.py") {
            name = dir.filename().string();
            dir = dir.parent_path();
        } else {
            name = file.stem().string();
        }

        while (!dir.empty() && dir.has_filename() && exists((dir / "__init__.py").string())) {
            name = dir.filename().string() + "." + name;
            const fs::path parent = dir.parent_path();
            if (parent == dir) { break; }
            dir = parent;
        }
        return name;
    }

    std::string pathToModuleName(const std::string& path) {
        return pathToModuleName(path, [](const std::string& candidate) {
            std::error_code ec;
            return std::filesystem::exists(candidate, ec);
        });
    }

} // namespace pyinfer::analysis
