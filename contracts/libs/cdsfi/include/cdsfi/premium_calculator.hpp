#pragma once

#include <cdsfi/accrued_premium.hpp>
#include <cdsfi/fixed_math.hpp>
#include <cdsfi/pool_params.hpp>
#include <cdsfi/risk_factor.hpp>

namespace cdsfi {

struct premium_quote {
   int128      premium          = 0;
   bool        is_min_premium   = false;
};

/**
 * Upfront premium for protection_amount over duration_sec.
 *
 *    risk rate       = 1 - e^(-years * rf), floored at min_premium_pct
 *    underlying rate = buyer_apr * underlying_premium_pct * years
 *    premium         = protection_amount * (risk rate + underlying rate)
 *
 * The risk factor is only evaluated while the pool holds its minimum capital and
 * protection and the leverage ratio lies in [floor, ceiling]; otherwise the floor applies.
 */
inline premium_quote calc_premium(uint64_t duration_sec,
                                  int128 protection_amount,
                                  int128 buyer_apr,
                                  int128 leverage_ratio,
                                  int128 total_capital,
                                  int128 total_protection,
                                  const pool_params& params) {
   premium_quote quote;
   int128 years = int128(duration_sec) * HIGH_PRECISION / SECONDS_IN_YEAR;

   int128 risk_rate = 0;
   if (can_calc_risk_factor(total_capital, total_protection, leverage_ratio, params)) {
      int128 rf = calc_risk_factor(leverage_ratio, params);
      risk_rate = HIGH_PRECISION - math::exp18(-(years * rf / HIGH_PRECISION));
   }

   if (risk_rate <= params.min_premium_pct) {
      risk_rate            = params.min_premium_pct;
      quote.is_min_premium = true;
   }

   int128 underlying_rate = buyer_apr * params.underlying_premium_pct / HIGH_PRECISION * years / HIGH_PRECISION;
   quote.premium = math::mul_div(protection_amount, risk_rate + underlying_rate, HIGH_PRECISION);
   return quote;
}

// risk factor that shapes the accrual curve of a purchase quoted as `quote`
inline int128 calc_purchase_risk_factor(const premium_quote& quote,
                                        int128 leverage_ratio,
                                        uint64_t duration_sec,
                                        const pool_params& params) {
   if (quote.is_min_premium)
      return calc_min_premium_risk_factor(params.min_premium_pct, duration_sec);
   return calc_risk_factor(leverage_ratio, params);
}

} // namespace cdsfi
