// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <qsym/ir/algorithms/flatten.hpp>
#include <stdexcept>

#include "ut_common.hpp"

using namespace qsym::ir::data;
using qsym::ir::algorithms::flatten;
using testing::dense_pauli;
using testing::named;

class FlattenTest : public ::testing::Test {
 protected:
  ExpressionPtr a = named("a");
  ExpressionPtr b = named("b");
  ExpressionPtr c = named("c");
  ExpressionPtr d = named("d");
};

TEST_F(FlattenTest, SplicesNestedSums) {
  auto flat = flatten(sum({a, sum({b, c})}));
  EXPECT_EQ(*flat, *sum({a, b, c}));

  flat = flatten(sum({sum({a, b}), sum({c, sum({d})})}));
  EXPECT_EQ(*flat, *sum({a, b, c, d}));
}

TEST_F(FlattenTest, SplicesNestedProductsInOrder) {
  auto flat = flatten(product({product({a, b}), c, product({d, a})}));
  EXPECT_EQ(*flat, *product({a, b, c, d, a}));
}

TEST_F(FlattenTest, KeepsMixedNesting) {
  auto mixed = product({a, sum({b, c})});
  EXPECT_EQ(flatten(mixed), mixed);

  auto inner = flatten(sum({product({a, product({b, c})}), d}));
  EXPECT_EQ(*inner, *sum({product({a, b, c}), d}));
}

TEST_F(FlattenTest, SplicesThroughMixedLayers) {
  // The product is flattened below the sum, and the inner sum below it
  auto expr =
      sum({a, product({b, product({sum({c, sum({d})})})}), sum({a})});
  auto expected = sum({a, product({b, sum({c, d})}), a});
  EXPECT_EQ(*flatten(expr), *expected);
}

TEST_F(FlattenTest, EmptyNestedSumDisappears) {
  EXPECT_EQ(*flatten(sum({a, sum({}), b})), *sum({a, b}));
  EXPECT_EQ(*flatten(product({product({}), a})), *product({a}));
  EXPECT_EQ(*flatten(sum({sum({})})), *sum({}));
}

TEST_F(FlattenTest, DoesNotSimplify) {
  auto expr = sum({a, a, scalar(0.0), product({scalar(1.0), b})});
  EXPECT_EQ(flatten(expr), expr);
}

TEST_F(FlattenTest, LeavesAndFlatTreesAreReturnedUnchanged) {
  EXPECT_EQ(flatten(a), a);
  auto p = dense_pauli("XZ");
  EXPECT_EQ(flatten(p), p);

  auto flat = sum({a, product({b, c})});
  EXPECT_EQ(flatten(flat), flat);
}

TEST_F(FlattenTest, UnchangedSubtreesAreShared) {
  auto untouched = product({b, c});
  auto flat = flatten(sum({sum({a}), untouched}));
  ASSERT_EQ(flat->children().size(), 2);
  EXPECT_EQ(flat->children()[1], untouched);
}

TEST_F(FlattenTest, Idempotent) {
  auto expr = product(
      {sum({a, sum({b, product({c, product({d})})})}), product({a, b})});
  auto once = flatten(expr);
  auto twice = flatten(once);
  EXPECT_EQ(*once, *twice);
  EXPECT_EQ(once, twice);
}

TEST_F(FlattenTest, DeepSumChain) {
  ExpressionPtr expr = a;
  for (int i = 0; i < 5000; ++i) {
    expr = sum({b, expr});
  }
  auto flat = flatten(expr);
  EXPECT_EQ(flat->depth(), 2);
  EXPECT_EQ(flat->children().size(), 5001);
  EXPECT_EQ(flat->children().back(), a);
}

TEST_F(FlattenTest, DeepAlternatingTreeDoesNotRecurse) {
  ExpressionPtr expr = a;
  for (int i = 0; i < 100000; ++i) {
    expr = (i % 2 == 0) ? sum({expr}) : product({expr});
  }
  auto flat = flatten(expr);
  EXPECT_EQ(flat, expr);
  EXPECT_EQ(flat->depth(), 100001);
}

TEST_F(FlattenTest, NullThrows) {
  EXPECT_THROW(flatten(nullptr), std::invalid_argument);
}
