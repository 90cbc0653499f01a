// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <ostream>
#include <qsym/ir/data/pauli_string.hpp>
#include <qsym/ir/data/symbol.hpp>
#include <string>
#include <vector>

namespace qsym::ir::data {

/**
 * @brief The kinds of node in an expression tree.
 *
 * The numeric values form the rank table of the structural order: when two
 * expressions of different kinds are compared, the one with the smaller kind
 * value is ordered first. The table is fixed and must not be reordered, since
 * it determines the canonical order of sum terms.
 *
 * | Kind    | Rank |
 * |---------|------|
 * | Scalar  | 0    |
 * | Symbol  | 1    |
 * | Pauli   | 2    |
 * | Sum     | 3    |
 * | Product | 4    |
 */
enum class ExpressionKind : std::uint8_t {
  Scalar = 0,
  Symbol = 1,
  Pauli = 2,
  Sum = 3,
  Product = 4
};

/**
 * @brief Returns the lower-case name of an expression kind, e.g. "sum".
 */
const char* to_string(ExpressionKind kind);

// Forward declarations
class Expression;
class ScalarExpression;
class SymbolExpression;
class PauliExpression;
class SumExpression;
class ProductExpression;

/**
 * @brief Shared handle to an immutable expression node.
 *
 * Nodes are never modified after construction, so a node may be referenced
 * from any number of parents and shared between threads.
 */
using ExpressionPtr = std::shared_ptr<const Expression>;

/**
 * @brief Ordered list of child expressions.
 */
using ExpressionList = std::vector<ExpressionPtr>;

/**
 * @brief Base interface for operator expression trees.
 *
 * An expression is one of five kinds: a real scalar, a Symbol, a PauliString,
 * a Sum of terms or a Product of factors. Sum terms commute; Product factors
 * do not, and no transform in this library reorders them.
 *
 * Equality is purely structural: two trees are equal iff they have identical
 * shape and identical leaf values in identical positions. No algebraic
 * identity is applied, so `a + b` and `b + a` are different trees until they
 * are canonicalized.
 */
class Expression {
 public:
  virtual ~Expression() = default;

  Expression(const Expression&) = delete;
  Expression& operator=(const Expression&) = delete;

  /**
   * @brief Returns the kind of this node.
   */
  virtual ExpressionKind kind() const = 0;

  /**
   * @brief Returns a human-readable representation of this tree.
   *
   * Nested sums, and products nested directly in products, are
   * parenthesized so the tree structure remains visible, e.g.
   * "a + (b + c)" or "(a + b) * X0".
   */
  virtual std::string to_string() const = 0;

  /**
   * @brief Returns the child expressions (empty for leaves).
   */
  virtual const ExpressionList& children() const;

  /**
   * @brief Returns the structural hash of this tree.
   *
   * Computed once on construction from the hashes of the children.
   */
  std::size_t hash() const { return hash_; }

  /**
   * @brief Returns the number of nodes in this tree, counting every
   * reference to a shared subtree separately.
   */
  std::size_t num_nodes() const { return num_nodes_; }

  /**
   * @brief Returns the depth of this tree; a leaf has depth 1.
   */
  std::size_t depth() const { return depth_; }

  /**
   * @brief Returns whether this node is a Scalar, Symbol or Pauli leaf.
   */
  bool is_leaf() const {
    return kind() != ExpressionKind::Sum && kind() != ExpressionKind::Product;
  }

  inline bool is_scalar() const { return kind() == ExpressionKind::Scalar; }
  inline bool is_symbol() const { return kind() == ExpressionKind::Symbol; }
  inline bool is_pauli() const { return kind() == ExpressionKind::Pauli; }
  inline bool is_sum() const { return kind() == ExpressionKind::Sum; }
  inline bool is_product() const { return kind() == ExpressionKind::Product; }

  /**
   * @brief Attempts to cast this expression to a ScalarExpression.
   * @return Pointer to ScalarExpression if successful, nullptr otherwise.
   */
  const ScalarExpression* as_scalar() const;

  /**
   * @brief Attempts to cast this expression to a SymbolExpression.
   * @return Pointer to SymbolExpression if successful, nullptr otherwise.
   */
  const SymbolExpression* as_symbol() const;

  /**
   * @brief Attempts to cast this expression to a PauliExpression.
   * @return Pointer to PauliExpression if successful, nullptr otherwise.
   */
  const PauliExpression* as_pauli() const;

  /**
   * @brief Attempts to cast this expression to a SumExpression.
   * @return Pointer to SumExpression if successful, nullptr otherwise.
   */
  const SumExpression* as_sum() const;

  /**
   * @brief Attempts to cast this expression to a ProductExpression.
   * @return Pointer to ProductExpression if successful, nullptr otherwise.
   */
  const ProductExpression* as_product() const;

  /**
   * @brief Structural equality over the whole tree.
   *
   * Scalars follow double semantics: a NaN scalar is not equal to anything,
   * including itself.
   */
  bool operator==(const Expression& other) const;

 protected:
  Expression(std::size_t hash, std::size_t num_nodes, std::size_t depth)
      : hash_(hash), num_nodes_(num_nodes), depth_(depth) {}

  /**
   * @brief Mutable access to the children of a composite node, nullptr for
   * leaves. Only used while the node is being torn down.
   */
  virtual ExpressionList* owned_children() noexcept { return nullptr; }

  /**
   * @brief Releases a list of children without recursing into subtrees that
   * are owned solely by it, so arbitrarily deep trees can be destroyed.
   */
  static void release_children(ExpressionList& children) noexcept;

 private:
  std::size_t hash_;
  std::size_t num_nodes_;
  std::size_t depth_;
};

/**
 * @brief Concept to check if a type is derived from Expression.
 */
template <typename T>
concept IsExpression = std::derived_from<T, Expression>;

/**
 * @brief A real scalar leaf.
 */
class ScalarExpression : public Expression {
 public:
  explicit ScalarExpression(double value);

  ExpressionKind kind() const override { return ExpressionKind::Scalar; }
  std::string to_string() const override;

  double get_value() const { return value_; }

 private:
  double value_;
};

/**
 * @brief A symbolic parameter leaf.
 */
class SymbolExpression : public Expression {
 public:
  explicit SymbolExpression(Symbol symbol);

  ExpressionKind kind() const override { return ExpressionKind::Symbol; }
  std::string to_string() const override;

  const Symbol& get_symbol() const { return symbol_; }

 private:
  Symbol symbol_;
};

/**
 * @brief A Pauli string leaf.
 */
class PauliExpression : public Expression {
 public:
  explicit PauliExpression(PauliString pauli_string);

  ExpressionKind kind() const override { return ExpressionKind::Pauli; }
  std::string to_string() const override;

  const PauliString& get_pauli_string() const { return pauli_string_; }

 private:
  PauliString pauli_string_;
};

/**
 * @brief A sum of zero or more terms. The order of the terms carries no
 * meaning, but is kept as given until the expression is canonicalized.
 */
class SumExpression : public Expression {
 public:
  /**
   * @brief Constructs a sum over the given terms without copying them.
   * @throws std::invalid_argument if any term is null.
   */
  explicit SumExpression(ExpressionList terms);
  ~SumExpression() override;

  ExpressionKind kind() const override { return ExpressionKind::Sum; }
  std::string to_string() const override;
  const ExpressionList& children() const override { return terms_; }

  const ExpressionList& get_terms() const { return terms_; }

 protected:
  ExpressionList* owned_children() noexcept override { return &terms_; }

 private:
  ExpressionList terms_;
};

/**
 * @brief An ordered product of zero or more factors. Factors do not commute.
 */
class ProductExpression : public Expression {
 public:
  /**
   * @brief Constructs a product over the given factors without copying them.
   * @throws std::invalid_argument if any factor is null.
   */
  explicit ProductExpression(ExpressionList factors);
  ~ProductExpression() override;

  ExpressionKind kind() const override { return ExpressionKind::Product; }
  std::string to_string() const override;
  const ExpressionList& children() const override { return factors_; }

  const ExpressionList& get_factors() const { return factors_; }

 protected:
  ExpressionList* owned_children() noexcept override { return &factors_; }

 private:
  ExpressionList factors_;
};

/**
 * @name Expression constructors
 * Leaf and combinator constructors. None of them flattens, sorts or
 * simplifies; children are shared, never copied.
 */
///@{
ExpressionPtr scalar(double value);
ExpressionPtr symbol(Symbol symbol);
ExpressionPtr pauli(PauliString pauli_string);
ExpressionPtr sum(ExpressionList terms);
ExpressionPtr product(ExpressionList factors);
///@}

/**
 * @brief Structural three-way comparison of two expression trees.
 *
 * This is the total order used to sort sum terms:
 * 1. different kinds are ranked by ExpressionKind;
 * 2. Scalars compare numerically;
 * 3. Symbols compare with Symbol::compare();
 * 4. Pauli strings compare by their index sequence and, on a tie, by their
 *    operator codes;
 * 5. Sums and Products compare child by child, the first non-equivalent pair
 *    deciding; if one child list is a prefix of the other, the shorter one is
 *    ordered first.
 *
 * The comparison returns `Unordered` as soon as an undecidable leaf pair (a
 * NaN) is reached before any decision. The traversal uses an explicit stack
 * and is safe on arbitrarily deep trees.
 */
StructuralOrder compare_structure(const Expression& lhs,
                                  const Expression& rhs);

/**
 * @brief Hash functor for ExpressionPtr keyed containers.
 */
struct ExpressionHash {
  std::size_t operator()(const ExpressionPtr& expr) const noexcept {
    return expr ? expr->hash() : 0;
  }
};

/**
 * @brief Structural equality functor for ExpressionPtr keyed containers.
 */
struct ExpressionEqual {
  bool operator()(const ExpressionPtr& lhs, const ExpressionPtr& rhs) const {
    if (!lhs || !rhs) return lhs == rhs;
    return *lhs == *rhs;
  }
};

std::ostream& operator<<(std::ostream& os, const Expression& expr);

}  // namespace qsym::ir::data
