#include <cmath>
#include <cstdint>
#include <limits>
#include <type_traits>

#include <gtest/gtest.h>

#include "checked.ops.hpp"

namespace {

constexpr int32_t kIntMax = std::numeric_limits<int32_t>::max();
constexpr int32_t kIntMin = std::numeric_limits<int32_t>::min();

} // namespace

TEST(CheckedCompare, NegativeSignedAgainstUnsignedIsFlagged) {
    bool error{false};

    EXPECT_EQ(checked_cmp(int32_t{-1}, uint32_t{0}, error), -1);
    EXPECT_TRUE(error);

    EXPECT_EQ(checked_cmp(int8_t{-1}, std::numeric_limits<uint64_t>::max(), error), -1);
    EXPECT_TRUE(error);

    EXPECT_EQ(checked_cmp(uint16_t{3}, int64_t{-5}, error), 1);
    EXPECT_TRUE(error);

    EXPECT_FALSE(checked_equals(int32_t{-1}, std::numeric_limits<uint32_t>::max(), error));
    EXPECT_TRUE(error);
}

TEST(CheckedCompare, NonNegativeMixedComparisonsAreExact) {
    bool error{true};

    EXPECT_TRUE(checked_equals(int32_t{5}, uint32_t{5}, error));
    EXPECT_FALSE(error);

    EXPECT_EQ(checked_cmp(int64_t{7}, uint8_t{9}, error), -1);
    EXPECT_FALSE(error);

    EXPECT_EQ(checked_cmp(std::numeric_limits<uint64_t>::max(), int64_t{1}, error), 1);
    EXPECT_FALSE(error);

    EXPECT_EQ(checked_cmp(int32_t{-3}, int64_t{-3}, error), 0);
    EXPECT_FALSE(error);
}

TEST(CheckedCompare, FloatingPoint) {
    bool error{false};
    const double nan = std::numeric_limits<double>::quiet_NaN();

    EXPECT_EQ(checked_cmp(0.5, 1, error), -1);
    EXPECT_FALSE(error);

    EXPECT_FALSE(checked_equals(nan, nan, error));
    EXPECT_FALSE(error);

    checked_cmp(nan, 1.0, error);
    EXPECT_TRUE(error);
}

TEST(CheckedCompare, IntegerAgainstRealIsExact) {
    bool error{false};
    // 2^53 + 1 has no double representation, converting it would compare equal to 2^53
    const int64_t above = int64_t{9007199254740993};

    EXPECT_FALSE(checked_equals(above, 9007199254740992.0, error));
    EXPECT_FALSE(error);
    EXPECT_EQ(checked_cmp(above, 9007199254740992.0, error), 1);
    EXPECT_EQ(checked_cmp(9007199254740992.0, above, error), -1);
    EXPECT_FALSE(error);

    EXPECT_FALSE(checked_equals(std::numeric_limits<uint64_t>::max(), 18446744073709551616.0, error));
    EXPECT_EQ(checked_cmp(std::numeric_limits<uint64_t>::max(), 18446744073709551616.0, error), -1);
    EXPECT_EQ(checked_cmp(int64_t{std::numeric_limits<int64_t>::min()}, -9223372036854775808.0, error), 0);

    EXPECT_EQ(checked_cmp(-3, -2.5, error), -1);
    EXPECT_EQ(checked_cmp(2, 2.5, error), -1);
    EXPECT_EQ(checked_cmp(-2, -2.5, error), 1);
    EXPECT_TRUE(checked_equals(7, 7.0, error));
    EXPECT_FALSE(error);

    EXPECT_FALSE(checked_equals(0, std::numeric_limits<double>::quiet_NaN(), error));
    EXPECT_FALSE(error);
}

TEST(CheckedOps, AddSubMulOverflow) {
    bool overflow{false};

    EXPECT_EQ(op_checked<ArithOp::Add>(kIntMax, 1, overflow), kIntMin);
    EXPECT_TRUE(overflow);

    EXPECT_EQ(op_checked<ArithOp::Add>(kIntMax - 1, 1, overflow), kIntMax);
    EXPECT_FALSE(overflow);

    EXPECT_EQ(op_checked<ArithOp::Sub>(1u, 2u, overflow), std::numeric_limits<uint32_t>::max());
    EXPECT_TRUE(overflow);

    op_checked<ArithOp::Mul>(int64_t{1} << 40, int64_t{1} << 30, overflow);
    EXPECT_TRUE(overflow);

    // 5u + -10 is computed as unsigned, the true result -5 does not fit
    op_checked<ArithOp::Add>(5u, -10, overflow);
    EXPECT_TRUE(overflow);

    EXPECT_EQ(op_checked<ArithOp::Add>(20u, -10, overflow), 10u);
    EXPECT_FALSE(overflow);
}

TEST(CheckedOps, PromotedResultType) {
    bool overflow{false};

    const auto r = op_checked<ArithOp::Add>(int8_t{100}, int8_t{100}, overflow);
    static_assert(std::is_same_v<std::remove_const_t<decltype(r)>, int>);
    EXPECT_EQ(r, 200);
    EXPECT_FALSE(overflow);
}

TEST(CheckedOps, Division) {
    bool overflow{false};

    EXPECT_EQ(op_checked<ArithOp::Div>(7, 0, overflow), 0);
    EXPECT_TRUE(overflow);

    EXPECT_EQ(op_checked<ArithOp::Mod>(7, 0, overflow), 0);
    EXPECT_TRUE(overflow);

    EXPECT_EQ(op_checked<ArithOp::Div>(kIntMin, -1, overflow), kIntMin);
    EXPECT_TRUE(overflow);

    EXPECT_EQ(op_checked<ArithOp::Mod>(kIntMin, -1, overflow), 0);
    EXPECT_FALSE(overflow);

    EXPECT_EQ(op_checked<ArithOp::Div>(-7, 2, overflow), -3);
    EXPECT_FALSE(overflow);

    op_checked<ArithOp::Div>(5u, -1, overflow);
    EXPECT_TRUE(overflow);

    EXPECT_EQ(op_checked<ArithOp::Div>(3u, -5, overflow), 0u);
    EXPECT_FALSE(overflow);

    op_checked<ArithOp::Mod>(-7, 3u, overflow);
    EXPECT_TRUE(overflow);

    EXPECT_EQ(op_checked<ArithOp::Mod>(7u, -3, overflow), 1u);
    EXPECT_FALSE(overflow);
}

TEST(CheckedOps, Negate) {
    bool overflow{false};

    EXPECT_EQ(op_checked<ArithOp::Negate>(kIntMin, overflow), kIntMin);
    EXPECT_TRUE(overflow);

    op_checked<ArithOp::Negate>(3u, overflow);
    EXPECT_TRUE(overflow);

    EXPECT_EQ(op_checked<ArithOp::Negate>(0u, overflow), 0u);
    EXPECT_FALSE(overflow);

    EXPECT_EQ(op_checked<ArithOp::Negate>(uint16_t{3}, overflow), -3);
    EXPECT_FALSE(overflow);
}

TEST(CheckedOps, FloatingPointOverflow) {
    bool overflow{false};

    op_checked<ArithOp::Mul>(1e308, 10.0, overflow);
    EXPECT_TRUE(overflow);

    op_checked<ArithOp::Div>(1.0, 0.0, overflow);
    EXPECT_TRUE(overflow);

    EXPECT_DOUBLE_EQ(op_checked<ArithOp::Mod>(7.5, 2, overflow), 1.5);
    EXPECT_FALSE(overflow);

    op_checked<ArithOp::Add>(std::numeric_limits<double>::infinity(), 1.0, overflow);
    EXPECT_FALSE(overflow);
}

TEST(CheckedCast, PreservesValue) {
    EXPECT_TRUE(cast_preserves_value<uint8_t>(int64_t{255}));
    EXPECT_FALSE(cast_preserves_value<uint8_t>(int64_t{300}));
    EXPECT_FALSE(cast_preserves_value<uint32_t>(-1));
    EXPECT_TRUE(cast_preserves_value<int16_t>(uint64_t{32767}));

    EXPECT_TRUE(cast_preserves_value<int32_t>(2.0));
    EXPECT_FALSE(cast_preserves_value<int32_t>(2.5));
    EXPECT_FALSE(cast_preserves_value<int32_t>(std::numeric_limits<double>::quiet_NaN()));
    EXPECT_TRUE(cast_preserves_value<uint32_t>(4294967295.0));
    EXPECT_FALSE(cast_preserves_value<uint32_t>(4294967296.0));
    EXPECT_FALSE(cast_preserves_value<uint32_t>(-1.0));
    EXPECT_TRUE(cast_preserves_value<int64_t>(-9223372036854775808.0));

    EXPECT_TRUE(cast_preserves_value<double>(int64_t{1} << 60));
    EXPECT_FALSE(cast_preserves_value<double>((int64_t{1} << 53) + 1));
    EXPECT_TRUE(cast_preserves_value<float>(-16777216));
    EXPECT_FALSE(cast_preserves_value<float>(16777217));

    EXPECT_TRUE(cast_preserves_value<float>(0.5));
    EXPECT_FALSE(cast_preserves_value<float>(0.1));
    EXPECT_FALSE(cast_preserves_value<float>(1e40));
    EXPECT_TRUE(cast_preserves_value<double>(0.1f));
}

TEST(CheckedCast, SaturatingAndWrapping) {
    EXPECT_EQ(saturating_cast<uint8_t>(300), 255);
    EXPECT_EQ(saturating_cast<uint8_t>(-5), 0);
    EXPECT_EQ(saturating_cast<int32_t>(1e20), kIntMax);
    EXPECT_EQ(saturating_cast<int32_t>(-1e20), kIntMin);
    EXPECT_EQ(saturating_cast<int32_t>(std::numeric_limits<double>::quiet_NaN()), 0);
    EXPECT_EQ(saturating_cast<float>(1e300), std::numeric_limits<float>::max());

    EXPECT_EQ(wrapping_cast<uint8_t>(300), 44);
    EXPECT_EQ(wrapping_cast<uint32_t>(-1), std::numeric_limits<uint32_t>::max());
    EXPECT_EQ(wrapping_cast<int32_t>(2.75), 2);
    EXPECT_TRUE(std::isinf(wrapping_cast<float>(1e300)));
}

TEST(CheckedOps, SaturatedResult) {
    EXPECT_EQ(saturated_result<ArithOp::Add>(kIntMax, 1), kIntMax);
    EXPECT_EQ(saturated_result<ArithOp::Add>(kIntMin, -1), kIntMin);
    EXPECT_EQ(saturated_result<ArithOp::Sub>(1u, 2u), 0u);
    EXPECT_EQ(saturated_result<ArithOp::Sub>(kIntMax, -1), kIntMax);
    EXPECT_EQ(saturated_result<ArithOp::Mul>(-(1 << 20), 1 << 20), kIntMin);
    EXPECT_EQ(saturated_result<ArithOp::Mul>(-(1 << 20), -(1 << 20)), kIntMax);
    EXPECT_EQ(saturated_result<ArithOp::Div>(5, 0), kIntMax);
    EXPECT_EQ(saturated_result<ArithOp::Div>(-5, 0), kIntMin);
    EXPECT_EQ(saturated_result<ArithOp::Div>(0, 0), 0);
    EXPECT_EQ(saturated_result<ArithOp::Div>(kIntMin, -1), kIntMax);
    EXPECT_EQ(saturated_result<ArithOp::Mod>(5, 0), 0);
    EXPECT_EQ(saturated_result<ArithOp::Negate>(kIntMin), kIntMax);
    EXPECT_EQ(saturated_result<ArithOp::Negate>(4u), 0u);
}

TEST(CheckedOps, Names) {
    EXPECT_EQ(arith_op_symbol(ArithOp::Mul), "*");
    EXPECT_EQ(arith_op_symbol(ArithOp::Negate), "-");
    EXPECT_EQ(numeric_type_name<int8_t>(), "i8");
    EXPECT_EQ(numeric_type_name<uint64_t>(), "u64");
    EXPECT_EQ(numeric_type_name<double>(), "f64");
}
