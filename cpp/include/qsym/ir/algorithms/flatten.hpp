// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <qsym/ir/data/expression.hpp>

namespace qsym::ir::algorithms {

/**
 * @brief Removes nested associativity from an expression tree.
 *
 * Every Sum whose term (after flattening) is itself a Sum has that term
 * replaced by its terms, in place and in order; Products are treated the
 * same way. A Sum nested in a Product, or a Product nested in a Sum, is kept
 * as a single child. Terms are never sorted, merged or simplified, so an
 * empty nested Sum simply disappears from its parent Sum.
 *
 * Leaves, and subtrees that are already flat, are returned as the same shared
 * handle. The traversal uses an explicit stack and is safe on arbitrarily
 * deep trees.
 *
 * Examples:
 * - `a + (b + c)` becomes `a + b + c`
 * - `a * (b * c)` becomes `a * b * c`
 * - `a * (b + c)` is unchanged
 *
 * @param expr The expression to flatten
 * @return The flattened expression; flatten(flatten(e)) == flatten(e)
 * @throws std::invalid_argument if expr is null
 */
data::ExpressionPtr flatten(const data::ExpressionPtr& expr);

}  // namespace qsym::ir::algorithms
