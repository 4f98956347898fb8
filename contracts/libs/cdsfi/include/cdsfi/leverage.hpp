#pragma once

#include <cdsfi/errors.hpp>
#include <cdsfi/fixed_math.hpp>
#include <cdsfi/pool_params.hpp>

namespace cdsfi {

enum class pool_phase: uint8_t {
   OpenToSellers  = 0,
   OpenToBuyers   = 1,
   Open           = 2
};

// capital / protection scaled by 10^18, 0 while no protection is outstanding
inline int128 calc_leverage_ratio(int128 total_capital, int128 total_protection) {
   if (total_protection <= 0) return 0;
   return math::mul_div(total_capital, HIGH_PRECISION, total_protection);
}

inline bool has_min_capital(int128 total_capital, const pool_params& params) {
   return total_capital >= params.min_required_capital;
}

// capital_after includes the deposit
inline err check_deposit(pool_phase phase,
                         int128 capital_after,
                         int128 total_protection,
                         const pool_params& params) {
   if (phase == pool_phase::OpenToBuyers)
      return err::PHASE_MISMATCH;
   if (has_min_capital(capital_after, params)
         && calc_leverage_ratio(capital_after, total_protection) > params.leverage_ratio_ceiling)
      return err::LEVERAGE_TOO_HIGH;
   return err::NONE;
}

// protection_after includes the protection being bought
inline err check_buy_leverage(pool_phase phase,
                              int128 total_capital,
                              int128 protection_after,
                              const pool_params& params) {
   if (phase == pool_phase::OpenToSellers)
      return err::PHASE_MISMATCH;
   if (phase == pool_phase::Open
         && calc_leverage_ratio(total_capital, protection_after) < params.leverage_ratio_floor)
      return err::LEVERAGE_TOO_LOW;
   return err::NONE;
}

inline err check_phase_advance(pool_phase current,
                               int128 total_capital,
                               int128 total_protection,
                               const pool_params& params,
                               pool_phase& next) {
   switch (current) {
      case pool_phase::OpenToSellers:
         if (!has_min_capital(total_capital, params)) return err::INSUFFICIENT_CAPITAL;
         next = pool_phase::OpenToBuyers;
         return err::NONE;
      case pool_phase::OpenToBuyers:
         if (calc_leverage_ratio(total_capital, total_protection) > params.leverage_ratio_ceiling)
            return err::LEVERAGE_TOO_HIGH;
         next = pool_phase::Open;
         return err::NONE;
      default:
         return err::ACTION_REDUNDANT;
   }
}

} // namespace cdsfi
