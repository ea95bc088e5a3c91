#include <compare>
#include <cstdint>
#include <limits>

#include <gtest/gtest.h>

#include "checked.value.hpp"

namespace {

constexpr int32_t kIntMax = std::numeric_limits<int32_t>::max();
constexpr int32_t kIntMin = std::numeric_limits<int32_t>::min();

const BoundedDomain<int32_t> kPercent{0, 100};

using WarnI32 = CheckedValue<int32_t, WarnPolicy>;
using WarnU8 = CheckedValue<uint8_t, WarnPolicy>;
using SatI32 = CheckedValue<int32_t, SaturatePolicy>;
using SatI8 = CheckedValue<int8_t, SaturatePolicy>;
using SatU8 = CheckedValue<uint8_t, SaturatePolicy>;
using SatF64 = CheckedValue<double, SaturatePolicy>;
using WarnF64 = CheckedValue<double, WarnPolicy>;

// Saturates like SaturatePolicy and counts the binary overflows it was handed.
struct CountingPolicy : SaturatePolicy {
    static inline int overflows = 0;

    using SaturatePolicy::on_overflow;

    template <ArithOp op, typename Lhs, typename Rhs>
    static ArithResult<Lhs, Rhs> on_overflow(const Lhs lhs, const Rhs rhs) {
        ++overflows;
        return saturated_result<op>(lhs, rhs);
    }
};

struct NoHooks {};

} // namespace

static_assert(CheckedPolicy<CountingPolicy>);
static_assert(!CheckedPolicy<NoHooks>);

TEST(WarnPolicy, ContinuesWithWrappedValues) {
    EXPECT_EQ((WarnI32{kIntMax} + 1).get(), kIntMin);
    EXPECT_EQ((WarnI32{kIntMin} - 1).get(), kIntMax);
    EXPECT_EQ((-WarnI32{kIntMin}).get(), kIntMin);
    EXPECT_EQ((WarnI32{7} / 0).get(), 0);
    EXPECT_EQ(WarnU8{300}.get(), 44);
    EXPECT_EQ(WarnU8{-1}.get(), 255);
}

TEST(WarnPolicy, KeepsOutOfDomainValues) {
    const WarnI32 over{150, kPercent};
    EXPECT_EQ(over.get(), 150);

    WarnI32 v{50, kPercent};
    v -= 60;
    EXPECT_EQ(v.get(), -10);
}

TEST(WarnPolicy, ComparisonsAnswerExactly) {
    EXPECT_TRUE(WarnI32{-1} < 0u);
    EXPECT_FALSE(WarnI32{-1} == std::numeric_limits<uint32_t>::max());
    EXPECT_TRUE(WarnI32{5} == 5u);
}

TEST(SaturatePolicy, Casts) {
    EXPECT_EQ(SatU8{300}.get(), 255);
    EXPECT_EQ(SatU8{-4}.get(), 0);
    EXPECT_EQ(SatI32{1e12}.get(), kIntMax);
    EXPECT_EQ(SatI32{2.75}.get(), 2);

    SatI8 small{100};
    small += 100;
    EXPECT_EQ(small.get(), 127);
}

TEST(SaturatePolicy, Overflow) {
    EXPECT_EQ((SatI32{kIntMax} + 1).get(), kIntMax);
    EXPECT_EQ((SatI32{kIntMin} - 1).get(), kIntMin);
    EXPECT_EQ((SatI32{-(1 << 20)} * (1 << 20)).get(), kIntMin);
    EXPECT_EQ((-SatI32{kIntMin}).get(), kIntMax);
    EXPECT_EQ((SatI32{5} / 0).get(), kIntMax);
    EXPECT_EQ((SatI32{-5} / 0).get(), kIntMin);
    EXPECT_EQ((SatI32{5} % 0).get(), 0);
    EXPECT_EQ((CheckedValue<uint32_t, SaturatePolicy>{1} - 2u).get(), 0u);
}

TEST(SaturatePolicy, ClampsToTheDomain) {
    EXPECT_EQ(SatI32(150, kPercent).get(), 100);
    EXPECT_EQ(SatI32(-3, kPercent).get(), 0);

    SatI32 v{90, kPercent};
    v += 20;
    EXPECT_EQ(v.get(), 100);
    v *= -1;
    EXPECT_EQ(v.get(), 0);
}

TEST(SaturatePolicy, MixedSignComparisonsAreAccepted) {
    EXPECT_TRUE(SatI32{-1} < 0u);
    EXPECT_TRUE(0u > SatI32{-1});
    EXPECT_FALSE(SatI32{-1} == std::numeric_limits<uint32_t>::max());
}

TEST(SaturatePolicy, NaNIsUnordered) {
    const SatF64 nan{std::numeric_limits<double>::quiet_NaN()};

    EXPECT_FALSE(nan < 1.0);
    EXPECT_FALSE(nan <= 1.0);
    EXPECT_FALSE(nan > 1.0);
    EXPECT_FALSE(nan >= 1.0);
    EXPECT_FALSE(1.0 <= nan);
    EXPECT_FALSE(nan == nan);
    EXPECT_EQ(nan <=> 1.0, std::partial_ordering::unordered);
    EXPECT_TRUE(SatF64{0.5} <= 1.0);
}

TEST(WarnPolicy, NaNComparisonsContinue) {
    const WarnF64 nan{std::numeric_limits<double>::quiet_NaN()};

    EXPECT_FALSE(nan < 1.0);
    EXPECT_FALSE(nan >= 1.0);
    EXPECT_EQ(nan <=> 1.0, std::partial_ordering::unordered);
}

TEST(CustomPolicy, ReceivesOverflows) {
    using Counted = CheckedValue<int32_t, CountingPolicy>;
    CountingPolicy::overflows = 0;

    const Counted doubled = Counted{kIntMax} * 2;
    EXPECT_EQ(doubled.get(), kIntMax);
    EXPECT_EQ(CountingPolicy::overflows, 1);

    const Counted fine = Counted{20} * 2;
    EXPECT_EQ(fine.get(), 40);
    EXPECT_EQ(CountingPolicy::overflows, 1);

    // unary overflow goes to the inherited hook
    EXPECT_EQ((-Counted{kIntMin}).get(), kIntMax);
    EXPECT_EQ(CountingPolicy::overflows, 1);
}
