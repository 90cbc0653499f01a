// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include "structural_canonicalizer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <qsym/ir/algorithms/flatten.hpp>
#include <stdexcept>
#include <utility>
#include <vector>

namespace qsym::ir::algorithms::native {

namespace detail {

// Strict less-than over sum terms for std::stable_sort. Copies share the
// incomparable counter of the caller.
class TermLess {
 public:
  TermLess(IncomparablePolicy policy, std::size_t& num_incomparable)
      : policy_(policy), num_incomparable_(&num_incomparable) {}

  bool operator()(const data::ExpressionPtr& lhs,
                  const data::ExpressionPtr& rhs) const {
    switch (data::compare_structure(*lhs, *rhs)) {
      case data::StructuralOrder::Less:
        return true;
      case data::StructuralOrder::Unordered:
        if (policy_ == IncomparablePolicy::Throw) {
          throw IncomparableExpressionError(lhs, rhs);
        }
        ++*num_incomparable_;
        return false;
      default:
        return false;
    }
  }

 private:
  IncomparablePolicy policy_;
  std::size_t* num_incomparable_;
};

struct CanonicalFrame {
  data::ExpressionPtr node;
  std::size_t next_child = 0;
  data::ExpressionList children;
};

}  // namespace detail

StructuralOptions parse_structural_options(const data::Settings& settings) {
  StructuralOptions options;
  const auto& policy = settings.get("incomparable_policy");
  if (policy == "equivalent") {
    options.incomparable_policy = IncomparablePolicy::Equivalent;
  } else if (policy == "throw") {
    options.incomparable_policy = IncomparablePolicy::Throw;
  } else {
    throw std::invalid_argument("Unknown incomparable_policy: " + policy);
  }

  const auto& level = settings.get("log_level");
  options.log_level = spdlog::level::from_str(level);
  if (options.log_level == spdlog::level::off && level != "off") {
    throw std::invalid_argument("Unknown log_level: " + level);
  }
  return options;
}

data::ExpressionPtr structural_canonical_form(
    const data::ExpressionPtr& expr, const StructuralOptions& options) {
  auto flat = flatten(expr);
  if (flat->is_leaf()) {
    return flat;
  }

  std::size_t num_incomparable = 0;
  const detail::TermLess term_less(options.incomparable_policy,
                                   num_incomparable);

  // Post-order over composite nodes; flattening never has to be repeated
  // since sorting keeps every child's kind.
  std::vector<detail::CanonicalFrame> stack;
  stack.push_back({flat});
  data::ExpressionPtr result;

  while (!stack.empty()) {
    auto& frame = stack.back();
    const auto& original = frame.node->children();

    if (frame.next_child < original.size()) {
      const auto& child = original[frame.next_child++];
      if (child->is_leaf()) {
        frame.children.push_back(child);
      } else {
        // Invalidates `frame`
        stack.push_back({child});
      }
      continue;
    }

    if (frame.node->is_sum()) {
      std::stable_sort(frame.children.begin(), frame.children.end(),
                       term_less);
    }

    data::ExpressionPtr canonical;
    if (std::equal(frame.children.begin(), frame.children.end(),
                   original.begin(), original.end())) {
      canonical = frame.node;
    } else if (frame.node->is_sum()) {
      canonical = data::sum(std::move(frame.children));
    } else {
      canonical = data::product(std::move(frame.children));
    }

    stack.pop_back();
    if (stack.empty()) {
      result = std::move(canonical);
    } else {
      stack.back().children.push_back(std::move(canonical));
    }
  }

  if (num_incomparable > 0 && options.log_level <= spdlog::level::warn) {
    spdlog::warn(
        "Canonicalization met {} sum term comparison(s) involving NaN; the "
        "terms were kept in their input order",
        num_incomparable);
  }
  return result;
}

}  // namespace qsym::ir::algorithms::native
