#pragma once

#include <algorithm>

#include <cdsfi/fixed_math.hpp>
#include <cdsfi/pool_params.hpp>

namespace cdsfi {

/**
 * rf = curvature * ((ceiling + buffer) - L) / (L - (floor - buffer))
 *
 * L is clamped to [floor, ceiling], so the denominator never drops below the buffer.
 * The result is positive and strictly decreasing in L.
 */
inline int128 calc_risk_factor(int128 leverage_ratio,
                               int128 floor,
                               int128 ceiling,
                               int128 buffer,
                               int128 curvature) {
   int128 ratio       = std::min(std::max(leverage_ratio, floor), ceiling);
   int128 numerator   = (ceiling + buffer) - ratio;
   int128 denominator = ratio - (floor - buffer);
   return curvature * numerator / denominator;
}

inline int128 calc_risk_factor(int128 leverage_ratio, const pool_params& params) {
   return calc_risk_factor(leverage_ratio,
                           params.leverage_ratio_floor,
                           params.leverage_ratio_ceiling,
                           params.leverage_ratio_buffer,
                           params.curvature);
}

inline bool can_calc_risk_factor(int128 total_capital,
                                 int128 total_protection,
                                 int128 leverage_ratio,
                                 const pool_params& params) {
   return total_capital >= params.min_required_capital
      && total_protection >= params.min_required_protection
      && leverage_ratio >= params.leverage_ratio_floor
      && leverage_ratio <= params.leverage_ratio_ceiling;
}

// risk factor whose premium rate over duration_sec equals min_premium_pct
inline int128 calc_min_premium_risk_factor(int128 min_premium_pct, uint64_t duration_sec) {
   int128 years = int128(duration_sec) * HIGH_PRECISION / SECONDS_IN_YEAR;
   if (years <= 0) return 0;
   return -math::ln18(HIGH_PRECISION - min_premium_pct) * HIGH_PRECISION / years;
}

} // namespace cdsfi
