// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <spdlog/spdlog.h>

#include <qsym/ir/algorithms/canonicalizer.hpp>
#include <stdexcept>
#include <utility>

#include "native/structural_canonicalizer.hpp"

namespace qsym::ir::algorithms {

namespace detail {

// Leaves are shown in full; composites only by kind and size, so the
// message stays short for arbitrarily deep terms.
std::string describe_term(const data::Expression& term) {
  if (term.is_leaf()) {
    return "'" + term.to_string() + "'";
  }
  return std::string("a ") + data::to_string(term.kind()) + " of " +
         std::to_string(term.children().size()) + " children (depth " +
         std::to_string(term.depth()) + ")";
}

}  // namespace detail

IncomparableExpressionError::IncomparableExpressionError(
    data::ExpressionPtr lhs, data::ExpressionPtr rhs)
    : std::runtime_error("Cannot order sum terms " +
                         detail::describe_term(*lhs) + " and " +
                         detail::describe_term(*rhs) +
                         ": the comparison involves NaN"),
      lhs_(std::move(lhs)),
      rhs_(std::move(rhs)) {}

data::Canonicalized<data::Expression> Canonicalizer::_run_impl(
    data::ExpressionPtr expr) const {
  if (!expr) {
    throw std::invalid_argument("Canonicalizer: expression is null");
  }

  const auto options = native::parse_structural_options(*_settings);
  auto canonical = native::structural_canonical_form(expr, options);
  if (options.log_level <= spdlog::level::debug) {
    spdlog::debug("{} canonicalizer: {} nodes in, {} nodes out (depth {})",
                  name(), expr->num_nodes(), canonical->num_nodes(),
                  canonical->depth());
  }
  return data::Canonicalized<data::Expression>(std::move(canonical));
}

void CanonicalizerFactory::register_default_instances(Registry& registry) {
  add_instance(registry,
               []() -> std::unique_ptr<Canonicalizer> {
                 return std::make_unique<native::StructuralCanonicalizer>();
               });
}

data::Canonicalized<data::Expression> canonicalize(
    const data::ExpressionPtr& expr) {
  const native::StructuralCanonicalizer canonicalizer;
  return canonicalizer.run(expr);
}

}  // namespace qsym::ir::algorithms
