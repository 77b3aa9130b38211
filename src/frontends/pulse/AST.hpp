//===----------------------------------------------------------------------===//
//
// Part of the Pulse project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/pulse/AST.hpp
// Purpose: Umbrella header for the Pulse AST node families.
// Key invariants: Node kinds are closed sets; every node owns its children.
// Ownership/Lifetime: The Program owns the whole tree.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/pulse/AST_Decl.hpp"
#include "frontends/pulse/AST_Expr.hpp"
#include "frontends/pulse/AST_Stmt.hpp"
