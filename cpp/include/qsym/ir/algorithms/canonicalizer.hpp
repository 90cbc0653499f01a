// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <memory>
#include <qsym/ir/algorithms/algorithm.hpp>
#include <qsym/ir/data/canonicalized.hpp>
#include <qsym/ir/data/expression.hpp>
#include <qsym/ir/data/settings.hpp>
#include <stdexcept>
#include <string>

namespace qsym::ir::algorithms {

/**
 * @brief Exception thrown when two sum terms cannot be ordered and the
 * canonicalizer is configured to reject such input.
 *
 * Only raised when the "incomparable_policy" setting is "throw". The message
 * shows leaves in full and summarizes composite terms by kind and size; the
 * offending terms are kept as shared handles.
 */
class IncomparableExpressionError : public std::runtime_error {
 public:
  IncomparableExpressionError(data::ExpressionPtr lhs, data::ExpressionPtr rhs);

  const data::ExpressionPtr& lhs() const { return lhs_; }
  const data::ExpressionPtr& rhs() const { return rhs_; }

 private:
  data::ExpressionPtr lhs_;
  data::ExpressionPtr rhs_;
};

/**
 * @class CanonicalizerSettings
 * @brief Settings shared by all canonicalizers
 *
 * Default settings:
 * - incomparable_policy: "equivalent" - How to order two sum terms that the
 *   structural order cannot rank (a NaN scalar or bound value is involved).
 *   "equivalent" keeps their relative input order and logs a warning,
 *   "throw" raises IncomparableExpressionError.
 * - log_level: "warn" - Lowest level of the messages the canonicalizer
 *   emits. Messages go to the default spdlog logger, whose own level is
 *   left untouched.
 */
class CanonicalizerSettings : public data::Settings {
 public:
  CanonicalizerSettings() {
    set_default("incomparable_policy", "equivalent",
                "Treatment of sum terms the structural order cannot rank",
                {"equivalent", "throw"});
    set_default("log_level", "warn", "Lowest level of emitted messages",
                {"trace", "debug", "info", "warn", "error", "critical",
                 "off"});
  }
};

/**
 * @brief Base class for canonicalizers
 *
 * Every canonicalizer applies the same procedure: the expression is
 * flattened and the terms of every Sum are sorted with
 * data::compare_structure, while Product factors keep their order. The
 * result is wrapped in data::Canonicalized, which no other code can
 * construct. Implementations differ only in their name and in the settings
 * they start from; they cannot change the procedure.
 *
 * run() locks the settings, so a configured canonicalizer may be shared
 * between threads.
 *
 * Example usage:
 * @code
 * auto canonicalizer = CanonicalizerFactory::create();
 * canonicalizer->settings().set("incomparable_policy", "throw");
 * auto canonical = canonicalizer->run(expr);
 * std::cout << canonical.get().to_string() << std::endl;
 * @endcode
 */
class Canonicalizer
    : public Algorithm<data::Canonicalized<data::Expression>,
                       data::ExpressionPtr> {
 public:
  Canonicalizer() { _settings = std::make_unique<CanonicalizerSettings>(); }

  std::string type_name() const override { return "canonicalizer"; }

 protected:
  /**
   * @brief Canonicalizes the expression and wraps the result
   * @throws std::invalid_argument if expr is null
   * @throws IncomparableExpressionError under the "throw" policy
   */
  data::Canonicalized<data::Expression> _run_impl(
      data::ExpressionPtr expr) const final;
};

/**
 * @brief Factory for canonicalizer implementations.
 *
 * The default implementation is "structural".
 */
struct CanonicalizerFactory
    : public AlgorithmFactory<Canonicalizer, CanonicalizerFactory> {
  static std::string algorithm_type_name() { return "canonicalizer"; }
  static void register_default_instances(Registry& registry);
  static std::string default_algorithm_name() { return "structural"; }
};

/**
 * @brief Canonicalizes an expression with default settings.
 *
 * The canonical form is obtained by flattening the expression, canonicalizing
 * every child and sorting the terms of every Sum with data::compare_structure.
 * Product factors keep their order. Structurally equal inputs give equal
 * results, and canonicalizing a canonical tree returns an equal tree.
 * Touches no shared state, so it may be called from any number of threads.
 *
 * @throws std::invalid_argument if expr is null
 */
data::Canonicalized<data::Expression> canonicalize(
    const data::ExpressionPtr& expr);

}  // namespace qsym::ir::algorithms
