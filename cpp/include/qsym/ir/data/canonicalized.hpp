// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <cstddef>
#include <memory>
#include <ostream>
#include <qsym/ir/data/expression.hpp>
#include <string>
#include <utility>

namespace qsym::ir::algorithms {
class Canonicalizer;
}  // namespace qsym::ir::algorithms

namespace qsym::ir::data {

/**
 * @brief A value known to be in canonical form.
 *
 * Instances can only be produced by algorithms::Canonicalizer, so holding a
 * Canonicalized<T> is proof that the wrapped tree went through the
 * canonicalization procedure. Consumers that need canonical input (caches,
 * deduplication, equality of physically equivalent operators written in a
 * different term order) should accept this type rather than a bare
 * ExpressionPtr.
 *
 * The wrapper is immutable and cheap to copy; copies share the same tree.
 *
 * @tparam T The wrapped expression type
 */
template <IsExpression T>
class Canonicalized {
 public:
  Canonicalized(const Canonicalized&) = default;
  Canonicalized(Canonicalized&&) noexcept = default;
  Canonicalized& operator=(const Canonicalized&) = default;
  Canonicalized& operator=(Canonicalized&&) noexcept = default;

  /**
   * @brief Read-only access to the canonical tree.
   */
  const T& get() const { return *value_; }

  const T* operator->() const { return value_.get(); }

  /**
   * @brief Returns the shared handle to the canonical tree, e.g. to embed it
   * in a larger expression.
   */
  const std::shared_ptr<const T>& ptr() const { return value_; }

  /**
   * @brief Structural equality of the wrapped trees. For canonical trees this
   * coincides with equality up to reordering of sum terms.
   */
  bool operator==(const Canonicalized& other) const {
    return *value_ == *other.value_;
  }

  std::string to_string() const { return value_->to_string(); }

  std::size_t hash() const { return value_->hash(); }

 private:
  friend class algorithms::Canonicalizer;

  explicit Canonicalized(std::shared_ptr<const T> value)
      : value_(std::move(value)) {}

  std::shared_ptr<const T> value_;
};

/**
 * @brief Hash functor for Canonicalized keyed containers.
 */
template <IsExpression T>
struct CanonicalizedHash {
  std::size_t operator()(const Canonicalized<T>& value) const noexcept {
    return value.hash();
  }
};

template <IsExpression T>
std::ostream& operator<<(std::ostream& os, const Canonicalized<T>& value) {
  return os << value.to_string();
}

}  // namespace qsym::ir::data
