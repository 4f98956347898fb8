#pragma once

#include <cdsfi/errors.hpp>
#include <cdsfi/fixed_math.hpp>

namespace cdsfi {

enum class lending_pool_status: uint8_t {
   NotSupported            = 0,
   Active                  = 1,
   Expired                 = 2,
   LateWithinGracePeriod   = 3,
   Late                    = 4,
   UnderReview             = 5,
   Defaulted               = 6
};

// what the seers report about an external lending pool
struct lending_pool_feed {
   bool        supported            = false;
   bool        defaulted            = false;
   int64_t     balance              = 0;
   uint64_t    last_payment_at      = 0;
   uint64_t    payment_period_sec   = 0;
   uint64_t    term_end_at          = 0;
};

inline lending_pool_status calc_lending_pool_status(const lending_pool_feed& feed,
                                                    uint64_t late_grace_sec,
                                                    uint64_t now) {
   if (!feed.supported)    return lending_pool_status::NotSupported;
   if (feed.defaulted)     return lending_pool_status::Defaulted;
   if (feed.balance <= 0)  return lending_pool_status::Expired;

   uint64_t payment_due_at = feed.last_payment_at + feed.payment_period_sec;
   if (now > payment_due_at + late_grace_sec) return lending_pool_status::Late;
   if (now > payment_due_at)                  return lending_pool_status::LateWithinGracePeriod;

   if (now >= feed.term_end_at) return lending_pool_status::Expired;
   return lending_pool_status::Active;
}

// any delinquency short of default
inline bool is_late_status(lending_pool_status status) {
   return status == lending_pool_status::LateWithinGracePeriod
       || status == lending_pool_status::Late
       || status == lending_pool_status::UnderReview;
}

inline err check_lending_pool_admissible(lending_pool_status status) {
   switch (status) {
      case lending_pool_status::NotSupported:   return err::LENDING_POOL_UNSUPPORTED;
      case lending_pool_status::Defaulted:      return err::LENDING_POOL_DEFAULTED;
      case lending_pool_status::Expired:        return err::LENDING_POOL_EXPIRED;
      default: break;
   }
   return is_late_status(status) ? err::LENDING_POOL_LATE : err::NONE;
}

/**
 * Purchase eligibility against the lending pool itself: supported, still inside its
 * purchase window unless the buyer already holds protection on the same position, and
 * not insuring more than the buyer's remaining principal.
 */
inline err check_can_buy_protection(lending_pool_status status,
                                    uint64_t purchase_limit_at,
                                    int128 remaining_principal,
                                    int128 protection_amount,
                                    bool has_active_protection,
                                    uint64_t now) {
   if (status == lending_pool_status::NotSupported)
      return err::LENDING_POOL_UNSUPPORTED;
   if (now > purchase_limit_at && !has_active_protection)
      return err::PURCHASE_WINDOW_CLOSED;
   if (protection_amount > remaining_principal)
      return err::PROTECTION_EXCEEDS_PRINCIPAL;
   return err::NONE;
}

// interest the lender keeps after protocol fees, scaled by 10^18
inline int128 calc_buyer_apr(int128 interest_apr, int128 protocol_fee_pct) {
   if (protocol_fee_pct >= HIGH_PRECISION) return 0;
   return interest_apr * (HIGH_PRECISION - protocol_fee_pct) / HIGH_PRECISION;
}

} // namespace cdsfi
