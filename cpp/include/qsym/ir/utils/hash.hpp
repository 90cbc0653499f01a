// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <cmath>
#include <cstddef>
#include <functional>
#include <utility>

namespace qsym::ir::utils {

/**
 * @brief Combines a hash value with the hash of another value.
 *
 * Boost-style hash_combine using the golden ratio constant. Expression hashes
 * are built by folding the hashes of children into the hash of their parent
 * with this function, so the order of the calls matters.
 *
 * @tparam T The type of value to hash.
 * @tparam Hasher The hash function type (defaults to std::hash<T>).
 * @param seed The existing hash value to combine with.
 * @param v The value to hash and combine.
 * @return The combined hash value.
 */
template <typename T, typename Hasher = std::hash<T>>
inline std::size_t hash_combine(std::size_t seed, const T& v) {
  Hasher h;
  return seed ^ (h(v) + 0x9e3779b9 + (seed << 6) + (seed >> 2));
}

/**
 * @brief Variadic overload that combines a hash seed with multiple values.
 *
 * Values are folded in left-to-right.
 *
 * Example:
 * @code
 *   std::size_t h = hash_combine(0, kind, name, value);
 * @endcode
 */
template <typename T, typename... Args>
inline std::size_t hash_combine(std::size_t seed, const T& v, Args&&... args) {
  return hash_combine(hash_combine(seed, v), std::forward<Args>(args)...);
}

/**
 * @brief Hash of a double that agrees with operator== on doubles.
 *
 * std::hash<double> distinguishes +0.0 and -0.0, which compare equal. Both
 * zeros are mapped to the same value here. NaN never compares equal to
 * anything, so its hash is irrelevant for lookups.
 */
inline std::size_t hash_double(double v) {
  if (v == 0.0) {
    v = 0.0;
  }
  return std::hash<double>{}(v);
}

}  // namespace qsym::ir::utils
