#pragma once

#include <algorithm>

#include <cdsfi/lending_status.hpp>
#include <cdsfi/locked_capital.hpp>

namespace cdsfi {

// pool-wide aggregates the leverage ratio is computed from
struct pool_totals {
   int64_t     capital     = 0;     // backing capital of the shares
   int64_t     protection  = 0;     // outstanding protection, locked lending pools excluded
};

// protection sold on one lending pool
struct lending_exposure {
   int64_t     protection  = 0;
   bool        locked      = false;
};

/**
 * Locks capital against a lending pool. min(capital_at_risk, capital) leaves the backing
 * capital, and the lending pool's protection stops counting toward the pool total until
 * it is unlocked. Returns the amount locked.
 */
inline int64_t lock_record(pool_totals& totals, lending_exposure& exposure, int128 capital_at_risk) {
   int64_t amount     = calc_lock_amount(capital_at_risk, totals.capital);
   totals.capital    -= amount;
   totals.protection -= exposure.protection;
   exposure.locked    = true;
   return amount;
}

inline void unlock_record(pool_totals& totals, lending_exposure& exposure) {
   totals.protection += exposure.protection;
   exposure.locked    = false;
}

// a locked lending pool is already out of the pool total
inline void expire_on_record(pool_totals& totals, lending_exposure& exposure, int64_t expired_protection) {
   if (!exposure.locked) totals.protection -= expired_protection;
   exposure.protection -= expired_protection;
}

// default can come from the feed or be declared by the default state manager
inline bool expires_all_protections(const lending_exposure& exposure,
                                    lending_pool_status feed_status,
                                    lending_pool_status managed_status) {
   return exposure.locked
       && (feed_status == lending_pool_status::Defaulted || managed_status == lending_pool_status::Defaulted);
}

// withdrawal request of one owner for one cycle, and the cycle's aggregate
struct withdrawal_slot {
   int64_t     requested   = 0;
   int64_t     cycle_total = 0;
};

// a later request for the same cycle replaces the earlier one
inline void replace_request(withdrawal_slot& slot, int64_t shares) {
   slot.cycle_total += shares - slot.requested;
   slot.requested    = shares;
}

inline void consume_request(withdrawal_slot& slot, int64_t shares) {
   slot.requested   -= shares;
   slot.cycle_total -= shares;
}

// shrinks the request to the shares still held; returns the excess removed
inline int64_t cap_request(withdrawal_slot& slot, int64_t balance) {
   int64_t held = std::max<int64_t>(balance, 0);
   if (slot.requested <= held) return 0;

   int64_t excess    = slot.requested - held;
   slot.requested   -= excess;
   slot.cycle_total -= excess;
   return excess;
}

} // namespace cdsfi
