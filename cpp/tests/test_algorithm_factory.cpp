// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <qsym/ir/algorithms/canonicalizer.hpp>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#include "ut_common.hpp"

using namespace qsym::ir;
using namespace qsym::ir::data;
using algorithms::Canonicalizer;
using algorithms::CanonicalizerFactory;
using testing::named;

namespace {

// Starts from the "throw" policy
class StrictCanonicalizer : public Canonicalizer {
 public:
  StrictCanonicalizer() { settings().set("incomparable_policy", "throw"); }
  std::string name() const override { return "_test_strict"; }
};

class WrongFamily : public Canonicalizer {
 public:
  std::string name() const override { return "_test_wrong_family"; }
  std::string type_name() const override { return "simplifier"; }
};

// Claims the name of the default implementation
class Shadow : public Canonicalizer {
 public:
  Shadow() { settings().set("incomparable_policy", "throw"); }
  std::string name() const override { return "structural"; }
};

std::unique_ptr<Canonicalizer> make_strict() {
  return std::make_unique<StrictCanonicalizer>();
}

}  // namespace

// Only the canonicalizer can produce a canonical value
static_assert(!std::is_constructible_v<Canonicalized<Expression>,
                                       std::shared_ptr<const Expression>>);
static_assert(!std::is_default_constructible_v<Canonicalized<Expression>>);

class CanonicalizerFactoryTest : public ::testing::Test {
 protected:
  void TearDown() override {
    CanonicalizerFactory::unregister_instance("_test_strict");
  }
};

TEST_F(CanonicalizerFactoryTest, DefaultIsStructural) {
  auto canonicalizer = CanonicalizerFactory::create();
  ASSERT_NE(canonicalizer, nullptr);
  EXPECT_EQ(canonicalizer->name(), "structural");
  EXPECT_EQ(canonicalizer->type_name(), "canonicalizer");
  EXPECT_EQ(CanonicalizerFactory::create("structural")->name(), "structural");
  EXPECT_TRUE(CanonicalizerFactory::has("structural"));
}

TEST_F(CanonicalizerFactoryTest, EachCreateReturnsFreshSettings) {
  auto first = CanonicalizerFactory::create();
  first->settings().set("incomparable_policy", "throw");
  auto second = CanonicalizerFactory::create();
  EXPECT_EQ(second->settings().get("incomparable_policy"),
            "equivalent");
}

TEST_F(CanonicalizerFactoryTest, UnknownNameThrows) {
  try {
    CanonicalizerFactory::create("does_not_exist");
    FAIL() << "Expected std::runtime_error";
  } catch (const std::runtime_error& e) {
    const std::string message = e.what();
    EXPECT_NE(message.find("does_not_exist"), std::string::npos);
    EXPECT_NE(message.find("structural"), std::string::npos);
  }
}

TEST_F(CanonicalizerFactoryTest, RegisterCustomImplementation) {
  CanonicalizerFactory::register_instance(&make_strict);
  EXPECT_TRUE(CanonicalizerFactory::has("_test_strict"));

  auto available = CanonicalizerFactory::available();
  EXPECT_TRUE(std::is_sorted(available.begin(), available.end()));
  EXPECT_NE(std::find(available.begin(), available.end(), "structural"),
            available.end());

  auto strict = CanonicalizerFactory::create("_test_strict");
  EXPECT_EQ(strict->settings().get("incomparable_policy"), "throw");
  auto expr = sum({product({named("b"), named("a")}), named("c")});
  EXPECT_EQ(strict->run(expr), algorithms::canonicalize(expr));
  EXPECT_TRUE(strict->settings().is_locked());
  EXPECT_THROW(strict->run(sum({scalar(1.0), scalar(testing::nan_value)})),
               algorithms::IncomparableExpressionError);
}

TEST_F(CanonicalizerFactoryTest, DuplicateRegistrationThrows) {
  CanonicalizerFactory::register_instance(&make_strict);
  EXPECT_THROW(CanonicalizerFactory::register_instance(&make_strict),
               std::runtime_error);
  EXPECT_THROW(CanonicalizerFactory::register_instance(
                   []() { return std::make_unique<Shadow>(); }),
               std::runtime_error);
  EXPECT_EQ(CanonicalizerFactory::create()->settings().get(
                "incomparable_policy"),
            "equivalent");
}

TEST_F(CanonicalizerFactoryTest, WrongTypeNameThrows) {
  EXPECT_THROW(CanonicalizerFactory::register_instance(
                   []() { return std::make_unique<WrongFamily>(); }),
               std::runtime_error);
  EXPECT_FALSE(CanonicalizerFactory::has("_test_wrong_family"));
}

TEST_F(CanonicalizerFactoryTest, Unregister) {
  CanonicalizerFactory::register_instance(&make_strict);
  EXPECT_TRUE(CanonicalizerFactory::unregister_instance("_test_strict"));
  EXPECT_FALSE(CanonicalizerFactory::unregister_instance("_test_strict"));
  EXPECT_FALSE(CanonicalizerFactory::has("_test_strict"));
  EXPECT_TRUE(CanonicalizerFactory::has("structural"));
}
