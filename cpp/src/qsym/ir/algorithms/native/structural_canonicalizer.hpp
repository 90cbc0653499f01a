// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <spdlog/spdlog.h>

#include <qsym/ir/algorithms/canonicalizer.hpp>
#include <qsym/ir/data/settings.hpp>
#include <string>

namespace qsym::ir::algorithms::native {

enum class IncomparablePolicy { Equivalent, Throw };

/**
 * @brief Parsed form of CanonicalizerSettings
 */
struct StructuralOptions {
  IncomparablePolicy incomparable_policy = IncomparablePolicy::Equivalent;
  /// Messages below this level are not emitted
  spdlog::level::level_enum log_level = spdlog::level::warn;
};

/**
 * @throws SettingNotFound if a canonicalizer key is missing
 * @throws std::invalid_argument if a value cannot be parsed
 */
StructuralOptions parse_structural_options(const data::Settings& settings);

/**
 * @brief The canonicalization procedure
 *
 * The input is flattened once, then every composite node is visited in
 * post-order. The terms of each Sum are stable-sorted with
 * data::compare_structure; Product factors are left in place. Nodes whose
 * children come out unchanged are reused, so canonicalizing a canonical tree
 * returns the very same handle.
 *
 * @param expr A non-null expression
 * @throws IncomparableExpressionError under IncomparablePolicy::Throw
 */
data::ExpressionPtr structural_canonical_form(
    const data::ExpressionPtr& expr, const StructuralOptions& options);

/**
 * @class StructuralCanonicalizer
 * @brief The default canonicalizer, registered as "structural"
 */
class StructuralCanonicalizer final : public algorithms::Canonicalizer {
 public:
  std::string name() const override { return "structural"; }
};

}  // namespace qsym::ir::algorithms::native
