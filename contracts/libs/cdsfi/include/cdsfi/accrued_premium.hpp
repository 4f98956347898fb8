#pragma once

#include <cdsfi/fixed_math.hpp>
#include <cdsfi/risk_factor.hpp>

namespace cdsfi {

// Accrued premium follows f(t) = K * (1 - e^(-lambda * t)), t in days, lambda = rf / 365.
//
// f is evaluated at the two ends of an interval and each evaluation is truncated on its
// own, so accrual over any partition of [0, duration] telescopes to f(duration) exactly.
// K is rounded up so that f(duration) equals the quoted premium.

inline int128 decay_exponent(uint64_t elapsed_sec, int128 lambda) {
   return -(int128(elapsed_sec) * lambda / DAY_SECONDS);
}

inline int128 calc_premium_curve(uint64_t elapsed_sec, int128 k, int128 lambda) {
   return math::mul_div(k, HIGH_PRECISION - math::exp18(decay_exponent(elapsed_sec, lambda)), HIGH_PRECISION);
}

/**
 * Derives the curve constants for a premium over duration_sec at the given risk factor.
 * Returns false when the curve cannot reach the premium (1 - e^(-lambda * duration) == 0).
 */
inline bool calc_k_and_lambda(int128 total_premium,
                              uint64_t duration_sec,
                              int128 risk_factor,
                              int128& k,
                              int128& lambda) {
   lambda = risk_factor / YEAR_DAYS;
   int128 span = HIGH_PRECISION - math::exp18(decay_exponent(duration_sec, lambda));
   if (lambda <= 0 || span <= 0) return false;

   k = math::mul_div_up(total_premium, HIGH_PRECISION, span);
   return true;
}

inline bool calc_k_and_lambda(int128 total_premium,
                              uint64_t duration_sec,
                              int128 leverage_ratio,
                              int128 floor,
                              int128 ceiling,
                              int128 buffer,
                              int128 curvature,
                              int128& k,
                              int128& lambda) {
   int128 rf = calc_risk_factor(leverage_ratio, floor, ceiling, buffer, curvature);
   return calc_k_and_lambda(total_premium, duration_sec, rf, k, lambda);
}

// premium accrued between t0 and t1 seconds after the protection started
inline int128 calc_accrued_premium(uint64_t t0_sec, uint64_t t1_sec, int128 k, int128 lambda) {
   return calc_premium_curve(t1_sec, k, lambda) - calc_premium_curve(t0_sec, k, lambda);
}

} // namespace cdsfi
