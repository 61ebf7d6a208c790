/***
 * Name: pyinfer::analysis::MemberResult / ExportedMemberInfo
 * Purpose: Results of module and member queries.
 */
#pragma once

#include <string>

#include "analysis/Namespace.h"

namespace pyinfer::analysis {

    struct MemberResult {
        std::string name;
        std::string completion;
        NamespaceSet values;
        MemberType memberType{MemberType::Unknown};
    };

    struct ExportedMemberInfo {
        // Fully qualified name.
        std::string name;
        // false when the name is only present syntactically (speculative).
        bool isDefinedInModule{false};
    };

} // namespace pyinfer::analysis
