#pragma once

#include <cdsfi/errors.hpp>
#include <cdsfi/fixed_math.hpp>

namespace cdsfi {

/**
 * Economic parameters of a protection pool. Ratios and percentages are scaled by 10^18,
 * capital and protection thresholds are in base units of the settlement token.
 * Every calculation receives the struct explicitly; the pool swaps it as a whole.
 */
struct pool_params {
   int64_t     leverage_ratio_floor         = 500'000'000'000'000'000;     // 0.5
   int64_t     leverage_ratio_ceiling       = 1'000'000'000'000'000'000;   // 1.0
   int64_t     leverage_ratio_buffer        = 50'000'000'000'000'000;      // 0.05
   int64_t     curvature                    = 50'000'000'000'000'000;      // 0.05
   int64_t     min_required_capital         = 0;
   int64_t     min_required_protection      = 0;
   int64_t     min_premium_pct              = 20'000'000'000'000'000;      // 2%
   int64_t     underlying_premium_pct       = 100'000'000'000'000'000;     // 10%
   uint32_t    min_protection_duration_sec  = 10 * DAY_SECONDS;
   uint32_t    renewal_grace_sec            = 14 * DAY_SECONDS;
   uint32_t    open_cycle_duration_sec      = 10 * DAY_SECONDS;
   uint32_t    cycle_duration_sec           = 30 * DAY_SECONDS;
};

inline err validate_pool_params(const pool_params& p) {
   if (p.leverage_ratio_floor <= 0 || p.leverage_ratio_floor >= p.leverage_ratio_ceiling)
      return err::PARAM_ERROR;
   if (p.leverage_ratio_buffer <= 0 || p.curvature <= 0)
      return err::PARAM_ERROR;
   if (p.min_required_capital < 0 || p.min_required_protection < 0)
      return err::PARAM_ERROR;
   if (p.min_premium_pct <= 0 || p.min_premium_pct >= HIGH_PRECISION)
      return err::PARAM_ERROR;
   if (p.underlying_premium_pct < 0 || p.underlying_premium_pct >= HIGH_PRECISION)
      return err::PARAM_ERROR;
   if (p.min_protection_duration_sec == 0 || p.cycle_duration_sec == 0)
      return err::PARAM_ERROR;
   if (p.open_cycle_duration_sec > p.cycle_duration_sec)
      return err::PARAM_ERROR;
   return err::NONE;
}

} // namespace cdsfi
