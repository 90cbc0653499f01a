// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace qsym::ir::data {

/**
 * @brief Single-qubit Pauli operators.
 *
 * The numeric codes (0=I, 1=X, 2=Y, 3=Z) are part of the canonical order:
 * Pauli strings with the same qubit indices are ranked by these codes when
 * they appear as sum terms.
 */
enum class PauliOperator : std::uint8_t { I = 0, X = 1, Y = 2, Z = 3 };

/**
 * @brief Exception thrown when text contains a character that is not a
 * Pauli operator symbol.
 */
class InvalidPauliCharacter : public std::invalid_argument {
 public:
  InvalidPauliCharacter(char character, std::size_t position);

  /// The offending character
  char character() const { return character_; }

  /// Zero-based position of the offending character in the parsed text
  std::size_t position() const { return position_; }

 private:
  char character_;
  std::size_t position_;
};

/**
 * @brief Parses a single Pauli operator symbol.
 * @param c One of 'I', 'X', 'Y', 'Z'.
 * @param position Position reported in the exception if parsing fails.
 * @throws InvalidPauliCharacter if c is not a Pauli operator symbol.
 */
PauliOperator pauli_operator_from_char(char c, std::size_t position = 0);

/**
 * @brief Returns the symbol ('I', 'X', 'Y' or 'Z') of a Pauli operator.
 */
char to_char(PauliOperator op);

/**
 * @brief Sparse (qubit_index, operator) list.
 *
 * Example: X(0) * Z(2) * Y(5) is [(0, X), (2, Z), (5, Y)].
 */
using PauliWord = std::vector<std::pair<std::uint64_t, PauliOperator>>;

/**
 * @brief A tensor product of Pauli operators acting on specific qubits.
 *
 * The stored operators are normalized on construction:
 * - identity operators are removed, so the identity string is empty;
 * - entries are sorted by ascending qubit index.
 *
 * Duplicate qubit indices are accepted and kept in their input order. No
 * qubit-wise multiplication is carried out; use has_duplicate_indices() to
 * detect such strings.
 *
 * Equality compares the full (index, operator) sequence, whereas operator<
 * compares the index sequences only. Two strings acting on the same qubits
 * with different operators are therefore neither less than each other nor
 * equal.
 */
class PauliString {
 public:
  /**
   * @brief Constructs the identity string.
   */
  PauliString() = default;

  /**
   * @brief Constructs a normalized PauliString from an unordered list.
   * @param operators (qubit_index, operator) pairs in any order, possibly
   *        containing identities.
   */
  explicit PauliString(PauliWord operators);

  /**
   * @brief Parses a dense Pauli string.
   *
   * The character at position i is the operator acting on qubit i, e.g.
   * "XIZ" is X(0) * Z(2).
   *
   * @param text Characters from {I, X, Y, Z}.
   * @return The normalized PauliString.
   * @throws InvalidPauliCharacter on the first character outside the set.
   */
  static PauliString from_text(std::string_view text);

  /**
   * @brief Returns the normalized (qubit_index, operator) pairs.
   */
  const PauliWord& get_operators() const { return operators_; }

  /**
   * @brief Returns the number of non-identity operators.
   */
  std::size_t size() const { return operators_.size(); }

  /**
   * @brief Returns whether this is the identity string.
   */
  bool is_identity() const { return operators_.empty(); }

  /**
   * @brief Returns whether any qubit index occurs more than once.
   */
  bool has_duplicate_indices() const;

  /**
   * @brief Returns the smallest qubit index acted on.
   * @throws std::logic_error If this is the identity string.
   */
  std::uint64_t min_qubit_index() const;

  /**
   * @brief Returns the largest qubit index acted on.
   * @throws std::logic_error If this is the identity string.
   */
  std::uint64_t max_qubit_index() const;

  /**
   * @brief Returns "I" for the identity, otherwise space separated
   * "<operator><index>" tokens, e.g. "X0 Z2".
   */
  std::string to_string() const;

  /**
   * @brief Returns the dense little-endian representation over num_qubits
   * qubits, with 'I' on every qubit not acted on.
   *
   * For example X(0) * Z(2) on 4 qubits is "XIZI". Operators on qubits beyond
   * num_qubits are omitted; for a duplicated index the last operator wins.
   */
  std::string to_canonical_string(std::uint64_t num_qubits) const;

  /**
   * @brief Structural equality over indices and operators.
   */
  bool operator==(const PauliString& other) const;

  /**
   * @brief Lexicographic comparison of the qubit index sequences only.
   *
   * Operators are not consulted. See the class description.
   */
  bool operator<(const PauliString& other) const;

  /**
   * @brief Hash consistent with operator==.
   */
  std::size_t hash() const;

 private:
  PauliWord operators_;
};

std::ostream& operator<<(std::ostream& os, const PauliString& pauli_string);

}  // namespace qsym::ir::data
