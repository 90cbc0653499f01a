// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <qsym/ir/algorithms/flatten.hpp>
#include <stdexcept>
#include <utility>
#include <vector>

namespace qsym::ir::algorithms {

namespace detail {

struct FlattenFrame {
  data::ExpressionPtr node;
  std::size_t next_child = 0;
  data::ExpressionList children;
  bool changed = false;
};

data::ExpressionPtr rebuild(const FlattenFrame& frame,
                            data::ExpressionList children) {
  if (frame.node->is_sum()) {
    return data::sum(std::move(children));
  }
  return data::product(std::move(children));
}

}  // namespace detail

data::ExpressionPtr flatten(const data::ExpressionPtr& expr) {
  if (!expr) {
    throw std::invalid_argument("flatten: expression is null");
  }
  if (expr->is_leaf()) {
    return expr;
  }

  std::vector<detail::FlattenFrame> stack;
  stack.push_back({expr});

  while (true) {
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

    data::ExpressionPtr flat =
        frame.changed ? detail::rebuild(frame, std::move(frame.children))
                      : frame.node;
    stack.pop_back();
    if (stack.empty()) {
      return flat;
    }

    auto& parent = stack.back();
    const auto& source = parent.node->children()[parent.next_child - 1];
    if (flat->kind() == parent.node->kind()) {
      const auto& spliced = flat->children();
      parent.children.insert(parent.children.end(), spliced.begin(),
                             spliced.end());
      parent.changed = true;
    } else {
      parent.changed = parent.changed || flat != source;
      parent.children.push_back(std::move(flat));
    }
  }
}

}  // namespace qsym::ir::algorithms
