/***
 * Name: pyinfer::ast::HasBody
 * Purpose: Statement list of a module, function or class; walked as one analysis unit.
 */
#pragma once

#include <memory>
#include <vector>

namespace pyinfer::ast {

template <typename StmtT>
struct HasBody {
    std::vector<std::unique_ptr<StmtT>> body;
};

} // namespace pyinfer::ast
