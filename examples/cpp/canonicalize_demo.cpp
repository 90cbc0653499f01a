// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

/**
 * @file canonicalize_demo.cpp
 * @brief Builds a Pauli sum from the command line and prints its canonical
 * form
 *
 * Every argument is a dense Pauli string, where character i acts on qubit i.
 * The strings are added in the order given, wrapped in a product with a
 * coupling symbol, and canonicalized with the default canonicalizer.
 *
 * Usage:
 *   ./canonicalize_demo ZZ XI IX          # J * (ZZ + XI + IX)
 *   ./canonicalize_demo IX ZZ XI --throw  # Reject NaN comparisons
 *
 * The program outputs the input tree, its canonical form and whether the
 * canonical form matches the one of the reversed input.
 */

// QSym IR Header Files
// One can also include <qsym/ir.hpp> to get all QSym IR components
#include <qsym/ir/algorithms/canonicalizer.hpp>
#include <qsym/ir/data/expression.hpp>

// Third Party Header Files
#include <spdlog/spdlog.h>

// Standard Library Header Files
#include <algorithm>  // for std::reverse
#include <exception>  // for std::exception
#include <iostream>   // for std::cout, std::endl
#include <string>
#include <vector>

namespace data = qsym::ir::data;
namespace algorithms = qsym::ir::algorithms;

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cout << "Usage: " << argv[0] << " <pauli> [<pauli> ...] [--throw]"
              << std::endl;
    std::cout << "Example: " << argv[0] << " ZZ XI IX" << std::endl;
    return 1;
  }

  std::vector<std::string> words;
  std::string policy = "equivalent";
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--throw") {
      policy = "throw";
    } else {
      words.push_back(arg);
    }
  }

  try {
    data::ExpressionList terms;
    for (const auto& word : words) {
      terms.push_back(data::pauli(data::PauliString::from_text(word)));
    }
    spdlog::info("Parsed {} Pauli terms", terms.size());

    auto coupling = data::symbol(data::Symbol::named("J"));
    auto expr = data::product({coupling, data::sum(terms)});

    auto canonicalizer = algorithms::CanonicalizerFactory::create();
    canonicalizer->settings().set("incomparable_policy", policy);
    canonicalizer->settings().set("log_level", "info");
    std::cout << canonicalizer->settings().as_table() << std::endl;

    auto canonical = canonicalizer->run(expr);
    std::cout << "Input:     " << *expr << std::endl;
    std::cout << "Canonical: " << canonical << std::endl;

    std::reverse(terms.begin(), terms.end());
    auto reversed = algorithms::canonicalize(
        data::product({coupling, data::sum(std::move(terms))}));
    std::cout << "Reversed input has the same canonical form: "
              << (reversed == canonical ? "yes" : "no") << std::endl;
  } catch (const data::InvalidPauliCharacter& e) {
    spdlog::error("Invalid Pauli string: {}", e.what());
    return 2;
  } catch (const std::exception& e) {
    spdlog::error("Canonicalization failed: {}", e.what());
    return 3;
  }

  return 0;
}
