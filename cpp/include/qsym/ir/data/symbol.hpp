// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <cstddef>
#include <optional>
#include <ostream>
#include <string>

namespace qsym::ir::data {

/**
 * @brief Result of a structural comparison between two IR values.
 *
 * Unlike a boolean less-than, a structural comparison may be undecidable, for
 * example when a NaN participates. Such pairs are reported as `Unordered` and
 * it is up to the caller to decide how to treat them.
 */
enum class StructuralOrder { Less, Equivalent, Greater, Unordered };

/**
 * @brief Compares two doubles, reporting NaN participation as `Unordered`.
 */
StructuralOrder compare_values(double lhs, double rhs);

/**
 * @brief A symbolic parameter appearing in an operator expression.
 *
 * A Symbol is either *named* (a free parameter such as `theta`) or *bound*
 * (a parameter that has been assigned a numeric value). Binding does not imply
 * evaluation: a bound symbol keeps its symbolic identity and is never equal to
 * the named symbol it was created from.
 *
 * Symbols are immutable value types.
 */
class Symbol {
 public:
  /**
   * @brief Creates a named (unbound) symbol.
   * @param name The name of the parameter.
   */
  static Symbol named(std::string name);

  /**
   * @brief Creates a symbol bound to a numeric value.
   * @param name The name of the parameter.
   * @param value The value the parameter is bound to.
   */
  static Symbol bound(std::string name, double value);

  /**
   * @brief Returns the name of the symbol, ignoring any bound value.
   */
  const std::string& name() const { return name_; }

  /**
   * @brief Returns whether this symbol carries a bound value.
   */
  bool is_bound() const { return value_.has_value(); }

  /**
   * @brief Returns the bound value, or std::nullopt for a named symbol.
   */
  std::optional<double> value() const { return value_; }

  /**
   * @brief Returns "name" for a named symbol and "name=value" for a bound
   * one.
   */
  std::string to_string() const;

  /**
   * @brief Structural three-way comparison.
   *
   * Named symbols rank before bound symbols. Within the same variant, names
   * are compared lexicographically and then bound values numerically. Two
   * bound symbols with the same name and a NaN value are `Unordered`.
   */
  StructuralOrder compare(const Symbol& other) const;

  /**
   * @brief Structural equality: same variant, same name, same value.
   */
  bool operator==(const Symbol& other) const;

  /**
   * @brief Strict ordering derived from compare(); unordered pairs are not
   * less than each other.
   */
  bool operator<(const Symbol& other) const;

  /**
   * @brief Hash consistent with operator==.
   */
  std::size_t hash() const;

 private:
  Symbol(std::string name, std::optional<double> value);

  std::string name_;
  std::optional<double> value_;
};

std::ostream& operator<<(std::ostream& os, const Symbol& symbol);

}  // namespace qsym::ir::data
