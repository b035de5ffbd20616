#ifndef ARBOR_CORE_HPP
#define ARBOR_CORE_HPP

// The `core` folder contains the term kernel used by the proof engine:

#include "core/builder.hpp" // Builder (typed constructors, owns all terms)
#include "core/expr.hpp"    // Expr, ExprHash, InvalidExpr
#include "core/ident.hpp"   // Ident

#endif // ARBOR_CORE_HPP
