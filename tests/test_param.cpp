#include "qdag_test_utils.hpp"

#include <cmath>
#include <limits>

using namespace qdag;
using qdag::testing::Duration;

TEST(RelativeEq, WithinTolerance) {
    EXPECT_TRUE(relative_eq(0.1, 0.1 + 1e-12));
    EXPECT_TRUE(relative_eq(0.5, 0.5000000000001));
    EXPECT_TRUE(relative_eq(1e6, 1e6 + 1e-5));
}

TEST(RelativeEq, OutsideTolerance) {
    EXPECT_FALSE(relative_eq(0.1, 0.1001));
    EXPECT_FALSE(relative_eq(1.0, 1.0 + 1e-8));
    EXPECT_FALSE(relative_eq(1.0, -1.0));
}

TEST(RelativeEq, NearZeroUsesEpsilon) {
    EXPECT_TRUE(relative_eq(0.0, 1e-17));
    EXPECT_TRUE(relative_eq(0.0, -0.0));
    EXPECT_FALSE(relative_eq(0.0, 1e-9));
}

TEST(RelativeEq, NonFiniteValues) {
    double inf = std::numeric_limits<double>::infinity();
    double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_TRUE(relative_eq(inf, inf));
    EXPECT_FALSE(relative_eq(inf, -inf));
    EXPECT_FALSE(relative_eq(inf, 1e308));
    EXPECT_FALSE(relative_eq(nan, nan));
}

TEST(ParamEq, MixedKindsAreUnequal) {
    Param f = 0.5;
    Param e = make_symbol("theta");
    Param o = ObjectRef(std::make_shared<Duration>(0.5, "ns"));

    EXPECT_FALSE(param_eq_tolerant(f, e));
    EXPECT_FALSE(param_eq_tolerant(e, o));
    EXPECT_FALSE(param_eq_tolerant(f, o));
}

TEST(ParamEq, ExpressionsUseTheirOwnEquality) {
    Param a = make_symbol("theta");
    Param b = make_symbol("theta");
    Param c = make_symbol("phi");
    EXPECT_TRUE(param_eq_tolerant(a, b));
    EXPECT_FALSE(param_eq_tolerant(a, c));

    Param lin1 = ExpressionRef(std::make_shared<LinearExpression>(
        1.0, std::map<std::string, double>{{"theta", 2.0}}));
    Param lin2 = ExpressionRef(std::make_shared<LinearExpression>(
        1.0, std::map<std::string, double>{{"theta", 2.0}, {"phi", 0.0}}));
    EXPECT_TRUE(param_eq_tolerant(lin1, lin2));
    EXPECT_FALSE(param_eq_tolerant(lin1, a));
}

TEST(ParamEq, ObjectsUseTheirOwnEquality) {
    Param a = ObjectRef(std::make_shared<Duration>(10.0, "dt"));
    Param b = ObjectRef(std::make_shared<Duration>(10.0, "dt"));
    Param c = ObjectRef(std::make_shared<Duration>(10.0, "ns"));
    EXPECT_TRUE(param_eq_tolerant(a, b));
    EXPECT_FALSE(param_eq_tolerant(a, c));
}

TEST(ParamEq, ListsMustHaveSameLength) {
    EXPECT_TRUE(params_eq_tolerant({0.1, 0.2}, {0.1, 0.2 + 1e-13}));
    EXPECT_FALSE(params_eq_tolerant({0.1}, {0.1, 0.2}));
    EXPECT_TRUE(params_eq_tolerant({}, {}));
}

TEST(ParamEq, ExactComparison) {
    EXPECT_FALSE(params_eq_exact({0.1}, {0.1 + 1e-12}));
    EXPECT_TRUE(params_eq_exact({0.1}, {0.1}));
}

TEST(Param, IsParameterized) {
    EXPECT_FALSE(is_parameterized({0.1, 0.2}));
    EXPECT_TRUE(is_parameterized({0.1, make_symbol("a")}));
    EXPECT_FALSE(
        is_parameterized({ObjectRef(std::make_shared<Duration>(1, "s"))}));
}

TEST(Param, DeepCopyBreaksObjectSharing) {
    auto original = std::make_shared<Duration>(5.0, "ns");
    ParamList params = {0.25, make_symbol("x"), ObjectRef(original)};

    auto copy = deep_copy_params(params);
    ASSERT_EQ(copy.size(), 3u);
    EXPECT_EQ(std::get<double>(copy[0]), 0.25);
    // Expressions are immutable and stay shared
    EXPECT_EQ(std::get<ExpressionRef>(copy[1]),
              std::get<ExpressionRef>(params[1]));

    auto copied = std::dynamic_pointer_cast<Duration>(
        std::get<ObjectRef>(copy[2]));
    ASSERT_NE(copied, nullptr);
    EXPECT_NE(copied.get(), original.get());
    copied->set_value(99.0);
    EXPECT_EQ(original->value(), 5.0);
}

TEST(Param, Repr) {
    EXPECT_EQ(params_repr({make_symbol("theta")}), "[theta]");
    LinearExpression lin(0.5, {{"a", 2.0}, {"b", 1.0}});
    EXPECT_EQ(lin.to_string(), "2*a + b + 0.5");
}
