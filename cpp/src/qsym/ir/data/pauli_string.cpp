// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <spdlog/spdlog.h>

#include <algorithm>
#include <qsym/ir/data/pauli_string.hpp>
#include <qsym/ir/utils/hash.hpp>

namespace qsym::ir::data {

InvalidPauliCharacter::InvalidPauliCharacter(char character,
                                             std::size_t position)
    : std::invalid_argument("Invalid Pauli operator character '" +
                            std::string(1, character) + "' at position " +
                            std::to_string(position) +
                            ". Expected one of I, X, Y, Z."),
      character_(character),
      position_(position) {}

PauliOperator pauli_operator_from_char(char c, std::size_t position) {
  switch (c) {
    case 'I':
      return PauliOperator::I;
    case 'X':
      return PauliOperator::X;
    case 'Y':
      return PauliOperator::Y;
    case 'Z':
      return PauliOperator::Z;
    default:
      throw InvalidPauliCharacter(c, position);
  }
}

char to_char(PauliOperator op) {
  switch (op) {
    case PauliOperator::I:
      return 'I';
    case PauliOperator::X:
      return 'X';
    case PauliOperator::Y:
      return 'Y';
    case PauliOperator::Z:
      return 'Z';
  }
  throw std::runtime_error("Invalid Pauli operator type");
}

PauliString::PauliString(PauliWord operators)
    : operators_(std::move(operators)) {
  std::erase_if(operators_, [](const auto& entry) {
    return entry.second == PauliOperator::I;
  });
  // Stable so that duplicated indices keep their input order
  std::ranges::stable_sort(operators_, [](const auto& a, const auto& b) {
    return a.first < b.first;
  });

  if (has_duplicate_indices()) {
    spdlog::debug("PauliString {} acts more than once on the same qubit",
                  to_string());
  }
}

PauliString PauliString::from_text(std::string_view text) {
  PauliWord operators;
  operators.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    operators.emplace_back(i, pauli_operator_from_char(text[i], i));
  }
  return PauliString(std::move(operators));
}

bool PauliString::has_duplicate_indices() const {
  // Entries are sorted, so duplicates are adjacent
  return std::adjacent_find(operators_.begin(), operators_.end(),
                            [](const auto& a, const auto& b) {
                              return a.first == b.first;
                            }) != operators_.end();
}

std::uint64_t PauliString::min_qubit_index() const {
  if (operators_.empty()) {
    throw std::logic_error("min_qubit_index() called on identity PauliString");
  }
  return operators_.front().first;
}

std::uint64_t PauliString::max_qubit_index() const {
  if (operators_.empty()) {
    throw std::logic_error("max_qubit_index() called on identity PauliString");
  }
  return operators_.back().first;
}

std::string PauliString::to_string() const {
  if (operators_.empty()) {
    return "I";
  }

  std::string result;
  for (std::size_t i = 0; i < operators_.size(); ++i) {
    if (i > 0) result += " ";
    result += to_char(operators_[i].second);
    result += std::to_string(operators_[i].first);
  }
  return result;
}

std::string PauliString::to_canonical_string(std::uint64_t num_qubits) const {
  std::string result(num_qubits, 'I');
  for (const auto& [qubit, op] : operators_) {
    if (qubit < num_qubits) {
      result[qubit] = to_char(op);
    }
  }
  return result;
}

bool PauliString::operator==(const PauliString& other) const {
  return operators_ == other.operators_;
}

bool PauliString::operator<(const PauliString& other) const {
  return std::lexicographical_compare(
      operators_.begin(), operators_.end(), other.operators_.begin(),
      other.operators_.end(),
      [](const auto& a, const auto& b) { return a.first < b.first; });
}

std::size_t PauliString::hash() const {
  std::size_t seed = 0;
  for (const auto& [qubit, op] : operators_) {
    seed = utils::hash_combine(seed, qubit, static_cast<std::uint8_t>(op));
  }
  return seed;
}

std::ostream& operator<<(std::ostream& os, const PauliString& pauli_string) {
  return os << pauli_string.to_string();
}

}  // namespace qsym::ir::data
