/**
 * @file
 * @brief Name bound in the enclosing scope by a `def` or `class` statement.
 */
#pragma once

#include <string>

namespace pyinfer::ast {

struct HasName {
    std::string name;
};

} // namespace pyinfer::ast
