// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <qsym/ir/data/expression.hpp>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

#include "ut_common.hpp"

using namespace qsym::ir::data;
using testing::dense_pauli;
using testing::named;

TEST(ExpressionTest, LeafConstruction) {
  auto s = scalar(2.5);
  ASSERT_TRUE(s->is_scalar());
  EXPECT_TRUE(s->is_leaf());
  EXPECT_EQ(s->kind(), ExpressionKind::Scalar);
  EXPECT_DOUBLE_EQ(s->as_scalar()->get_value(), 2.5);
  EXPECT_EQ(s->as_sum(), nullptr);

  auto a = named("a");
  ASSERT_TRUE(a->is_symbol());
  EXPECT_EQ(a->as_symbol()->get_symbol(), Symbol::named("a"));

  auto p = dense_pauli("XZ");
  ASSERT_TRUE(p->is_pauli());
  EXPECT_EQ(p->as_pauli()->get_pauli_string(), PauliString::from_text("XZ"));
  EXPECT_TRUE(p->children().empty());
}

TEST(ExpressionTest, CompositeConstructionSharesChildren) {
  auto a = named("a");
  auto b = named("b");
  auto s = sum({a, b, a});

  ASSERT_TRUE(s->is_sum());
  EXPECT_FALSE(s->is_leaf());
  const auto& terms = s->as_sum()->get_terms();
  ASSERT_EQ(terms.size(), 3);
  EXPECT_EQ(terms[0], a);
  EXPECT_EQ(terms[1], b);
  EXPECT_EQ(terms[2], a);

  auto p = product({s, b});
  ASSERT_TRUE(p->is_product());
  EXPECT_EQ(p->as_product()->get_factors()[0], s);
  EXPECT_EQ(p->as_sum(), nullptr);
}

TEST(ExpressionTest, ConstructorsDoNotNormalize) {
  auto a = named("a");
  auto b = named("b");
  auto c = named("c");
  auto nested = sum({a, sum({b, c})});
  EXPECT_EQ(nested->children().size(), 2);
  EXPECT_TRUE(nested->children()[1]->is_sum());

  // a + a is not collapsed
  EXPECT_EQ(sum({a, a})->children().size(), 2);
}

TEST(ExpressionTest, NullChildrenAreRejected) {
  EXPECT_THROW(sum({named("a"), nullptr}), std::invalid_argument);
  EXPECT_THROW(product({nullptr}), std::invalid_argument);
}

TEST(ExpressionTest, EmptyComposites) {
  EXPECT_EQ(sum({})->to_string(), "0");
  EXPECT_EQ(product({})->to_string(), "1");
  EXPECT_FALSE(*sum({}) == *product({}));
  EXPECT_EQ(*sum({}), *sum({}));
}

TEST(ExpressionTest, StructuralEquality) {
  auto lhs = product({sum({named("a"), scalar(2.0)}), dense_pauli("XI")});
  auto rhs = product({sum({named("a"), scalar(2.0)}), dense_pauli("X")});
  EXPECT_EQ(*lhs, *rhs);

  // Term order matters for raw equality
  auto swapped = product({sum({scalar(2.0), named("a")}), dense_pauli("X")});
  EXPECT_FALSE(*lhs == *swapped);

  // Shape matters
  EXPECT_FALSE(*sum({named("a")}) == *named("a"));
  EXPECT_FALSE(*sum({named("a")}) == *product({named("a")}));
}

TEST(ExpressionTest, NaNScalarIsNeverEqual) {
  auto n = scalar(testing::nan_value);
  EXPECT_FALSE(*n == *n);
  EXPECT_FALSE(*sum({n}) == *sum({n}));
}

TEST(ExpressionTest, SignedZerosAreEqualAndHashAlike) {
  EXPECT_EQ(*scalar(0.0), *scalar(-0.0));
  EXPECT_EQ(scalar(0.0)->hash(), scalar(-0.0)->hash());
}

TEST(ExpressionTest, HashAndEqualityFunctors) {
  std::unordered_set<ExpressionPtr, ExpressionHash, ExpressionEqual> seen;
  seen.insert(sum({named("a"), dense_pauli("X")}));
  seen.insert(sum({named("a"), dense_pauli("X")}));
  seen.insert(sum({dense_pauli("X"), named("a")}));
  EXPECT_EQ(seen.size(), 2);
}

TEST(ExpressionTest, ToString) {
  auto a = named("a");
  auto b = named("b");
  auto x0 = dense_pauli("X");
  EXPECT_EQ(scalar(0.5)->to_string(), "0.5");
  EXPECT_EQ(symbol(Symbol::bound("t", 2.0))->to_string(), "t=2");
  EXPECT_EQ(dense_pauli("III")->to_string(), "I");
  EXPECT_EQ(sum({a, b})->to_string(), "a + b");
  EXPECT_EQ(product({sum({a, b}), x0})->to_string(), "(a + b) * X0");
  EXPECT_EQ(sum({a, sum({b, x0})})->to_string(), "a + (b + X0)");
  EXPECT_EQ(sum({product({a, x0}), b})->to_string(), "a * X0 + b");
  EXPECT_EQ(product({a, product({b, x0})})->to_string(), "a * (b * X0)");

  std::ostringstream oss;
  oss << *sum({a, b});
  EXPECT_EQ(oss.str(), "a + b");
}

TEST(ExpressionTest, ScalarsPrintWithoutRounding) {
  EXPECT_EQ(scalar(0.1234567)->to_string(), "0.1234567");
  EXPECT_NE(scalar(0.1234567)->to_string(), scalar(0.1234568)->to_string());
  EXPECT_EQ(scalar(1e20)->to_string(), "1e+20");
  EXPECT_EQ(scalar(-0.25)->to_string(), "-0.25");
}

TEST(ExpressionTest, SizeMetrics) {
  auto a = named("a");
  EXPECT_EQ(a->num_nodes(), 1);
  EXPECT_EQ(a->depth(), 1);

  auto e = product({sum({a, a}), a});
  EXPECT_EQ(e->num_nodes(), 5);
  EXPECT_EQ(e->depth(), 3);
  EXPECT_EQ(sum({})->depth(), 1);
}

TEST(ExpressionTest, KindNames) {
  EXPECT_STREQ(to_string(ExpressionKind::Scalar), "scalar");
  EXPECT_STREQ(to_string(ExpressionKind::Product), "product");
}

TEST(StructuralOrderTest, RankTable) {
  const ExpressionList by_rank = {scalar(100.0), named("a"), dense_pauli("X"),
                                  sum({}), product({})};
  for (size_t i = 0; i < by_rank.size(); ++i) {
    for (size_t j = 0; j < by_rank.size(); ++j) {
      auto expected = i < j    ? StructuralOrder::Less
                      : i == j ? StructuralOrder::Equivalent
                               : StructuralOrder::Greater;
      EXPECT_EQ(compare_structure(*by_rank[i], *by_rank[j]), expected)
          << "i=" << i << " j=" << j;
    }
  }
}

TEST(StructuralOrderTest, Leaves) {
  EXPECT_EQ(compare_structure(*scalar(-1.0), *scalar(1.0)),
            StructuralOrder::Less);
  EXPECT_EQ(compare_structure(*named("b"), *named("a")),
            StructuralOrder::Greater);
  EXPECT_EQ(compare_structure(*named("a"),
                              *symbol(Symbol::bound("a", 0.0))),
            StructuralOrder::Less);
  EXPECT_EQ(compare_structure(*scalar(testing::nan_value), *scalar(1.0)),
            StructuralOrder::Unordered);
}

TEST(StructuralOrderTest, PauliTieBreakByOperatorCode) {
  // Index sequence decides first
  EXPECT_EQ(compare_structure(*dense_pauli("IZ"), *dense_pauli("XX")),
            StructuralOrder::Greater);
  EXPECT_EQ(compare_structure(*dense_pauli("Z"), *dense_pauli("IX")),
            StructuralOrder::Less);
  // Same indices: X < Y < Z
  EXPECT_EQ(compare_structure(*dense_pauli("X"), *dense_pauli("Y")),
            StructuralOrder::Less);
  EXPECT_EQ(compare_structure(*dense_pauli("ZX"), *dense_pauli("ZY")),
            StructuralOrder::Less);
  EXPECT_EQ(compare_structure(*dense_pauli("Z"), *dense_pauli("Y")),
            StructuralOrder::Greater);
  EXPECT_EQ(compare_structure(*dense_pauli("XY"), *dense_pauli("XY")),
            StructuralOrder::Equivalent);
}

TEST(StructuralOrderTest, CompositesAreLexicographic) {
  auto a = named("a");
  auto b = named("b");
  EXPECT_EQ(compare_structure(*sum({a, b}), *sum({b, a})),
            StructuralOrder::Less);
  // A prefix orders first
  EXPECT_EQ(compare_structure(*sum({a}), *sum({a, a})), StructuralOrder::Less);
  EXPECT_EQ(compare_structure(*product({a, b}), *product({a})),
            StructuralOrder::Greater);
  // The first differing child decides before lengths are consulted
  EXPECT_EQ(compare_structure(*sum({b}), *sum({a, a})),
            StructuralOrder::Greater);
  // Children are compared in depth
  EXPECT_EQ(compare_structure(*product({sum({a, b}), a}),
                              *product({sum({a, a}), b})),
            StructuralOrder::Greater);
}

TEST(StructuralOrderTest, NaNStopsComparisonOnlyIfReachedFirst) {
  auto n = scalar(testing::nan_value);
  EXPECT_EQ(compare_structure(*sum({scalar(1.0), n}), *sum({scalar(2.0), n})),
            StructuralOrder::Less);
  EXPECT_EQ(compare_structure(*sum({n, scalar(1.0)}), *sum({n, scalar(2.0)})),
            StructuralOrder::Unordered);
}

TEST(StructuralOrderTest, DeepTreesDoNotRecurse) {
  ExpressionPtr lhs = named("a");
  ExpressionPtr rhs = named("b");
  for (int i = 0; i < 200000; ++i) {
    lhs = product({lhs});
    rhs = product({rhs});
  }
  EXPECT_EQ(compare_structure(*lhs, *rhs), StructuralOrder::Less);
  EXPECT_FALSE(*lhs == *rhs);
  EXPECT_EQ(lhs->depth(), 200001);
}
