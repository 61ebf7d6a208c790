/***
 * Name: pyinfer::analysis::installBuiltinSpecializations
 * Purpose: Register the session's standard overrides for builtin and library functions whose
 *   generic inference is useless or explosive (range, getattr, super, copy.deepcopy, ...).
 */
#pragma once

namespace pyinfer::analysis {

    class AnalysisSession;

    void installBuiltinSpecializations(AnalysisSession& session);

} // namespace pyinfer::analysis
