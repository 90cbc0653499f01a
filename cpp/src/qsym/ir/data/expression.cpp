// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <qsym/ir/data/expression.hpp>
#include <qsym/ir/utils/hash.hpp>
#include <ostream>
#include <stdexcept>
#include <utility>

namespace qsym::ir::data {

namespace detail {

void require_non_null(const ExpressionList& children, const char* owner) {
  for (std::size_t i = 0; i < children.size(); ++i) {
    if (!children[i]) {
      throw std::invalid_argument(std::string(owner) + ": child " +
                                  std::to_string(i) + " is null");
    }
  }
}

// Validates the children before hashing them. The node count and depth
// helpers below may run before this, so they skip null children.
std::size_t composite_hash(ExpressionKind kind, const ExpressionList& children,
                           const char* owner) {
  require_non_null(children, owner);
  std::size_t seed = utils::hash_combine(std::size_t{0},
                                         static_cast<std::uint8_t>(kind),
                                         children.size());
  for (const auto& child : children) {
    seed = utils::hash_combine(seed, child->hash());
  }
  return seed;
}

std::size_t count_nodes(const ExpressionList& children) {
  std::size_t count = 1;
  for (const auto& child : children) {
    if (child) count += child->num_nodes();
  }
  return count;
}

std::size_t composite_depth(const ExpressionList& children) {
  std::size_t depth = 0;
  for (const auto& child : children) {
    if (child) depth = std::max(depth, child->depth());
  }
  return depth + 1;
}

std::size_t leaf_hash(ExpressionKind kind, std::size_t value_hash) {
  return utils::hash_combine(std::size_t{0}, static_cast<std::uint8_t>(kind),
                             value_hash);
}

// Composite children are parenthesized when their own separator would
// otherwise be ambiguous with the parent's.
std::string join_children(const ExpressionList& children,
                          const std::string& separator,
                          ExpressionKind parent_kind) {
  std::string result;
  for (std::size_t i = 0; i < children.size(); ++i) {
    if (i > 0) result += separator;
    const auto& child = children[i];
    if (child->is_sum() || child->kind() == parent_kind) {
      result += "(" + child->to_string() + ")";
    } else {
      result += child->to_string();
    }
  }
  return result;
}

StructuralOrder compare_pauli(const PauliString& lhs, const PauliString& rhs) {
  if (lhs < rhs) return StructuralOrder::Less;
  if (rhs < lhs) return StructuralOrder::Greater;

  // Same index sequence: rank by operator codes
  const auto& a = lhs.get_operators();
  const auto& b = rhs.get_operators();
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (a[i].second != b[i].second) {
      return a[i].second < b[i].second ? StructuralOrder::Less
                                       : StructuralOrder::Greater;
    }
  }
  return StructuralOrder::Equivalent;
}

}  // namespace detail

const char* to_string(ExpressionKind kind) {
  switch (kind) {
    case ExpressionKind::Scalar:
      return "scalar";
    case ExpressionKind::Symbol:
      return "symbol";
    case ExpressionKind::Pauli:
      return "pauli";
    case ExpressionKind::Sum:
      return "sum";
    case ExpressionKind::Product:
      return "product";
  }
  throw std::runtime_error("Invalid expression kind");
}

// ---------------------------------------------------------------------------
// Expression
// ---------------------------------------------------------------------------

const ExpressionList& Expression::children() const {
  static const ExpressionList no_children;
  return no_children;
}

const ScalarExpression* Expression::as_scalar() const {
  return dynamic_cast<const ScalarExpression*>(this);
}

const SymbolExpression* Expression::as_symbol() const {
  return dynamic_cast<const SymbolExpression*>(this);
}

const PauliExpression* Expression::as_pauli() const {
  return dynamic_cast<const PauliExpression*>(this);
}

const SumExpression* Expression::as_sum() const {
  return dynamic_cast<const SumExpression*>(this);
}

const ProductExpression* Expression::as_product() const {
  return dynamic_cast<const ProductExpression*>(this);
}

bool Expression::operator==(const Expression& other) const {
  std::vector<std::pair<const Expression*, const Expression*>> pending;
  pending.emplace_back(this, &other);

  while (!pending.empty()) {
    auto [lhs, rhs] = pending.back();
    pending.pop_back();

    if (lhs->kind() != rhs->kind() || lhs->hash() != rhs->hash()) {
      return false;
    }

    switch (lhs->kind()) {
      case ExpressionKind::Scalar:
        if (!(lhs->as_scalar()->get_value() ==
              rhs->as_scalar()->get_value())) {
          return false;
        }
        break;
      case ExpressionKind::Symbol:
        if (!(lhs->as_symbol()->get_symbol() ==
              rhs->as_symbol()->get_symbol())) {
          return false;
        }
        break;
      case ExpressionKind::Pauli:
        if (!(lhs->as_pauli()->get_pauli_string() ==
              rhs->as_pauli()->get_pauli_string())) {
          return false;
        }
        break;
      case ExpressionKind::Sum:
      case ExpressionKind::Product: {
        const auto& a = lhs->children();
        const auto& b = rhs->children();
        if (a.size() != b.size()) {
          return false;
        }
        for (std::size_t i = 0; i < a.size(); ++i) {
          pending.emplace_back(a[i].get(), b[i].get());
        }
        break;
      }
    }
  }
  return true;
}

// ---------------------------------------------------------------------------
// Leaves
// ---------------------------------------------------------------------------

ScalarExpression::ScalarExpression(double value)
    : Expression(detail::leaf_hash(ExpressionKind::Scalar,
                                   utils::hash_double(value)),
                 1, 1),
      value_(value) {}

// Shortest representation that reads back to the same double
std::string ScalarExpression::to_string() const {
  return fmt::format("{}", value_);
}

SymbolExpression::SymbolExpression(Symbol symbol)
    : Expression(detail::leaf_hash(ExpressionKind::Symbol, symbol.hash()), 1,
                 1),
      symbol_(std::move(symbol)) {}

std::string SymbolExpression::to_string() const { return symbol_.to_string(); }

PauliExpression::PauliExpression(PauliString pauli_string)
    : Expression(
          detail::leaf_hash(ExpressionKind::Pauli, pauli_string.hash()), 1, 1),
      pauli_string_(std::move(pauli_string)) {}

std::string PauliExpression::to_string() const {
  return pauli_string_.to_string();
}

// ---------------------------------------------------------------------------
// Composites
// ---------------------------------------------------------------------------

// Nodes are allocated non-const by the constructors below, and a child is
// only emptied once this list holds its last reference.
void Expression::release_children(ExpressionList& children) noexcept {
  ExpressionList pending = std::move(children);
  children.clear();
  while (!pending.empty()) {
    ExpressionPtr node = std::move(pending.back());
    pending.pop_back();
    if (node.use_count() != 1) continue;
    auto* grandchildren = const_cast<Expression&>(*node).owned_children();
    if (grandchildren == nullptr) continue;
    for (auto& grandchild : *grandchildren) {
      pending.push_back(std::move(grandchild));
    }
    grandchildren->clear();
  }
}

SumExpression::SumExpression(ExpressionList terms)
    : Expression(
          detail::composite_hash(ExpressionKind::Sum, terms, "SumExpression"),
          detail::count_nodes(terms), detail::composite_depth(terms)),
      terms_(std::move(terms)) {}

SumExpression::~SumExpression() { release_children(terms_); }

std::string SumExpression::to_string() const {
  if (terms_.empty()) return "0";
  return detail::join_children(terms_, " + ", ExpressionKind::Sum);
}

ProductExpression::ProductExpression(ExpressionList factors)
    : Expression(
          detail::composite_hash(ExpressionKind::Product, factors,
                                 "ProductExpression"),
          detail::count_nodes(factors), detail::composite_depth(factors)),
      factors_(std::move(factors)) {}

ProductExpression::~ProductExpression() { release_children(factors_); }

std::string ProductExpression::to_string() const {
  if (factors_.empty()) return "1";
  return detail::join_children(factors_, " * ", ExpressionKind::Product);
}

// ---------------------------------------------------------------------------
// Constructors
// ---------------------------------------------------------------------------

ExpressionPtr scalar(double value) {
  return std::make_shared<ScalarExpression>(value);
}

ExpressionPtr symbol(Symbol symbol) {
  return std::make_shared<SymbolExpression>(std::move(symbol));
}

ExpressionPtr pauli(PauliString pauli_string) {
  return std::make_shared<PauliExpression>(std::move(pauli_string));
}

ExpressionPtr sum(ExpressionList terms) {
  return std::make_shared<SumExpression>(std::move(terms));
}

ExpressionPtr product(ExpressionList factors) {
  return std::make_shared<ProductExpression>(std::move(factors));
}

// ---------------------------------------------------------------------------
// Structural order
// ---------------------------------------------------------------------------

StructuralOrder compare_structure(const Expression& lhs,
                                  const Expression& rhs) {
  // A work item either compares two nodes, or (when `lhs` is null) compares
  // the child counts of a composite pair once all shared-length children
  // turned out equivalent.
  struct WorkItem {
    const Expression* lhs;
    const Expression* rhs;
    std::size_t lhs_size;
    std::size_t rhs_size;
  };

  std::vector<WorkItem> pending;
  pending.push_back({&lhs, &rhs, 0, 0});

  while (!pending.empty()) {
    WorkItem item = pending.back();
    pending.pop_back();

    if (item.lhs == nullptr) {
      if (item.lhs_size != item.rhs_size) {
        return item.lhs_size < item.rhs_size ? StructuralOrder::Less
                                             : StructuralOrder::Greater;
      }
      continue;
    }

    const auto lhs_kind = item.lhs->kind();
    const auto rhs_kind = item.rhs->kind();
    if (lhs_kind != rhs_kind) {
      return lhs_kind < rhs_kind ? StructuralOrder::Less
                                 : StructuralOrder::Greater;
    }

    StructuralOrder order = StructuralOrder::Equivalent;
    switch (lhs_kind) {
      case ExpressionKind::Scalar:
        order = compare_values(item.lhs->as_scalar()->get_value(),
                               item.rhs->as_scalar()->get_value());
        break;
      case ExpressionKind::Symbol:
        order = item.lhs->as_symbol()->get_symbol().compare(
            item.rhs->as_symbol()->get_symbol());
        break;
      case ExpressionKind::Pauli:
        order = detail::compare_pauli(item.lhs->as_pauli()->get_pauli_string(),
                                      item.rhs->as_pauli()->get_pauli_string());
        break;
      case ExpressionKind::Sum:
      case ExpressionKind::Product: {
        const auto& a = item.lhs->children();
        const auto& b = item.rhs->children();
        // The length check runs after every shared-length child pair
        pending.push_back({nullptr, nullptr, a.size(), b.size()});
        const std::size_t shared = std::min(a.size(), b.size());
        for (std::size_t i = shared; i-- > 0;) {
          pending.push_back({a[i].get(), b[i].get(), 0, 0});
        }
        break;
      }
    }

    if (order != StructuralOrder::Equivalent) {
      return order;
    }
  }
  return StructuralOrder::Equivalent;
}

std::ostream& operator<<(std::ostream& os, const Expression& expr) {
  return os << expr.to_string();
}

}  // namespace qsym::ir::data
