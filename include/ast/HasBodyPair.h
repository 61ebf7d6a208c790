/***
 * Name: pyinfer::ast::HasBodyPair
 * Purpose: Branch and loop bodies. For loops `elseBody` holds the `else:` clause.
 *   Analysis is flow-insensitive, so both lists are always walked.
 */
#pragma once

#include <memory>
#include <vector>

namespace pyinfer::ast {

template <typename StmtT>
struct HasBodyPair {
    std::vector<std::unique_ptr<StmtT>> thenBody;
    std::vector<std::unique_ptr<StmtT>> elseBody;
};

} // namespace pyinfer::ast
