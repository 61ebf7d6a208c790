/**
 * @file
 * @brief Umbrella include for all AST node declarations.
 */
#pragma once

#include "ast/AssignStmt.h"
#include "ast/Attribute.h"
#include "ast/Call.h"
#include "ast/ExprStmt.h"
#include "ast/FunctionDef.h"
#include "ast/IfStmt.h"
#include "ast/Import.h"
#include "ast/ListLiteral.h"
#include "ast/Literal.h"
#include "ast/Module.h"
#include "ast/Name.h"
#include "ast/ReturnStmt.h"
#include "ast/Subscript.h"
