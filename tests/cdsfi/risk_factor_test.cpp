#include <gtest/gtest.h>

#include <cdsfi/risk_factor.hpp>

#include "test_helpers.hpp"

using namespace cdsfi;
using namespace cdsfi::test;

namespace {

const int128 FLOOR      = fp("0.1");
const int128 CEILING    = fp("0.2");
const int128 BUFFER     = fp("0.05");
const int128 CURVATURE  = fp("0.05");

int128 risk_factor(const std::string& leverage) {
   return calc_risk_factor(fp(leverage), FLOOR, CEILING, BUFFER, CURVATURE);
}

} // namespace

TEST(RiskFactor, KnownValue) {
   // 0.05 * (0.25 - 0.14) / (0.14 - 0.05)
   EXPECT_EQ(risk_factor("0.14"), 61'111'111'111'111'111);
}

TEST(RiskFactor, RangeEnds) {
   EXPECT_EQ(risk_factor("0.1"), 150'000'000'000'000'000);
   EXPECT_EQ(risk_factor("0.2"), 16'666'666'666'666'666);
}

TEST(RiskFactor, MidpointIsWellDefined) {
   EXPECT_EQ(risk_factor("0.15"), 50'000'000'000'000'000);
}

TEST(RiskFactor, LeverageIsClampedToRange) {
   EXPECT_EQ(risk_factor("0.01"), risk_factor("0.1"));
   EXPECT_EQ(risk_factor("0"),    risk_factor("0.1"));
   EXPECT_EQ(risk_factor("0.9"),  risk_factor("0.2"));
}

TEST(RiskFactor, PositiveAndDecreasingInLeverage) {
   int128 prev = risk_factor("0.1");
   for (int128 leverage = FLOOR + fp("0.001"); leverage <= CEILING; leverage += fp("0.001")) {
      int128 rf = calc_risk_factor(leverage, FLOOR, CEILING, BUFFER, CURVATURE);
      ASSERT_GT(rf, 0);
      ASSERT_LT(rf, prev);
      prev = rf;
   }
}

TEST(RiskFactor, UsesPoolParams) {
   pool_params params;
   params.leverage_ratio_floor   = int64_t(FLOOR);
   params.leverage_ratio_ceiling = int64_t(CEILING);
   params.leverage_ratio_buffer  = int64_t(BUFFER);
   params.curvature              = int64_t(CURVATURE);
   EXPECT_EQ(calc_risk_factor(fp("0.14"), params), risk_factor("0.14"));
}

TEST(RiskFactor, CanCalcNeedsMinimumsAndRange) {
   pool_params params;
   params.leverage_ratio_floor    = int64_t(FLOOR);
   params.leverage_ratio_ceiling  = int64_t(CEILING);
   params.min_required_capital    = int64_t(usdc(10'000));
   params.min_required_protection = int64_t(usdc(20'000));

   EXPECT_TRUE(can_calc_risk_factor(usdc(15'000), usdc(100'000), fp("0.15"), params));
   EXPECT_FALSE(can_calc_risk_factor(usdc(9'999), usdc(100'000), fp("0.15"), params));
   EXPECT_FALSE(can_calc_risk_factor(usdc(15'000), usdc(19'999), fp("0.15"), params));
   EXPECT_FALSE(can_calc_risk_factor(usdc(15'000), usdc(100'000), fp("0.05"), params));
   EXPECT_FALSE(can_calc_risk_factor(usdc(15'000), usdc(100'000), fp("0.25"), params));
}

TEST(RiskFactor, MinPremiumRiskFactorReproducesMinRate) {
   uint64_t duration = 180 * DAY_SECONDS;
   int128 rf    = calc_min_premium_risk_factor(fp("0.02"), duration);
   int128 years = int128(duration) * HIGH_PRECISION / SECONDS_IN_YEAR;
   int128 rate  = HIGH_PRECISION - math::exp18(-(years * rf / HIGH_PRECISION));
   EXPECT_EQ(rf, 40'993'537'892'504'496);
   EXPECT_NEAR(to_double(rate), 0.02, 1e-15);
}
