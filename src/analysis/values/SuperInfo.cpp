/***
 * Name: SuperInfo::getMember
 * Purpose: Look a member up on the bases of the class and bind functions to the instances.
 */
#include "analysis/values/SuperInfo.h"

#include "analysis/AnalysisSession.h"
#include "analysis/values/ClassInfo.h"
#include "analysis/values/FunctionInfo.h"

namespace pyinfer::analysis {

    NamespaceSet SuperInfo::getMember(const ast::Node& node, AnalysisUnit& unit, const std::string& name) {
        class_.bases().addDependency(unit);
        NamespaceSet out;
        for (Namespace* base : class_.bases().types()) {
            for (Namespace* value : base->getMember(node, unit, name)) {
                if (!bindsToInstance(*value)) {
                    out = out.add(value);
                    continue;
                }
                for (Namespace* self : instances_) { out = out.add(session_.boundMethod(*value, *self)); }
            }
        }
        return out;
    }

} // namespace pyinfer::analysis
