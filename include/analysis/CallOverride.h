/***
 * Name: pyinfer::analysis::CallOverride
 * Purpose: Signature of a hand-written replacement for the abstract call semantics of a function.
 * Theory of Operation:
 *   Receives the call node, the calling unit, one value set per argument and one name per
 *   argument (empty for positional arguments). Returning nullopt means "no opinion": the
 *   generic result is used when the function is also analyzed, otherwise the call yields
 *   nothing.
 */
#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "analysis/NamespaceSet.h"

namespace pyinfer::ast {
    struct Node;
}

namespace pyinfer::analysis {

    class AnalysisUnit;

    using CallOverride = std::function<std::optional<NamespaceSet>(const ast::Node& node, AnalysisUnit& unit,
                                                                   const std::vector<NamespaceSet>& args,
                                                                   const std::vector<std::string>& argNames)>;

    struct SpecializationEntry {
        CallOverride fn;
        bool analyze{true};
    };

} // namespace pyinfer::analysis
