// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <spdlog/fmt/fmt.h>

#include <cmath>
#include <qsym/ir/data/symbol.hpp>
#include <qsym/ir/utils/hash.hpp>
#include <ostream>
#include <utility>

namespace qsym::ir::data {

StructuralOrder compare_values(double lhs, double rhs) {
  if (std::isnan(lhs) || std::isnan(rhs)) {
    return StructuralOrder::Unordered;
  }
  if (lhs < rhs) return StructuralOrder::Less;
  if (rhs < lhs) return StructuralOrder::Greater;
  return StructuralOrder::Equivalent;
}

Symbol::Symbol(std::string name, std::optional<double> value)
    : name_(std::move(name)), value_(value) {}

Symbol Symbol::named(std::string name) {
  return Symbol(std::move(name), std::nullopt);
}

Symbol Symbol::bound(std::string name, double value) {
  return Symbol(std::move(name), value);
}

std::string Symbol::to_string() const {
  if (!value_) {
    return name_;
  }
  return fmt::format("{}={}", name_, *value_);
}

StructuralOrder Symbol::compare(const Symbol& other) const {
  // Named (0) ranks before Bound (1)
  const int rank = is_bound() ? 1 : 0;
  const int other_rank = other.is_bound() ? 1 : 0;
  if (rank != other_rank) {
    return rank < other_rank ? StructuralOrder::Less : StructuralOrder::Greater;
  }

  const int name_cmp = name_.compare(other.name_);
  if (name_cmp != 0) {
    return name_cmp < 0 ? StructuralOrder::Less : StructuralOrder::Greater;
  }

  if (!is_bound()) {
    return StructuralOrder::Equivalent;
  }
  return compare_values(*value_, *other.value_);
}

bool Symbol::operator==(const Symbol& other) const {
  // std::optional<double> equality follows double equality, so a NaN bound
  // value is never equal to anything.
  return name_ == other.name_ && value_ == other.value_;
}

bool Symbol::operator<(const Symbol& other) const {
  return compare(other) == StructuralOrder::Less;
}

std::size_t Symbol::hash() const {
  std::size_t seed = utils::hash_combine(std::size_t{0}, name_, is_bound());
  if (value_) {
    seed = utils::hash_combine(seed, utils::hash_double(*value_));
  }
  return seed;
}

std::ostream& operator<<(std::ostream& os, const Symbol& symbol) {
  return os << symbol.to_string();
}

}  // namespace qsym::ir::data
