#pragma once

#include <algorithm>
#include <vector>

#include <cdsfi/fixed_math.hpp>

namespace cdsfi {

struct locked_capital {
   uint64_t    snapshot_id  = 0;
   int64_t     amount       = 0;
   bool        locked       = true;
};

// exposure of one protection: never more than the buyer still has outstanding
inline int128 calc_capital_at_risk(int128 protection_amount, int128 remaining_principal) {
   return std::max<int128>(0, std::min(protection_amount, remaining_principal));
}

// what can actually be taken out of the pool's backing capital
inline int64_t calc_lock_amount(int128 capital_at_risk, int64_t available_capital) {
   if (capital_at_risk <= 0 || available_capital <= 0) return 0;
   return int64_t(std::min<int128>(capital_at_risk, available_capital));
}

// flips the most recent instance back to unlocked; false when nothing is locked
inline bool unlock_latest(std::vector<locked_capital>& instances) {
   for (auto itr = instances.rbegin(); itr != instances.rend(); ++itr) {
      if (itr->locked) {
         itr->locked = false;
         return true;
      }
   }
   return false;
}

/**
 * Seller's share of every unlocked instance newer than last_claimed_snapshot_id:
 *    balance_at(snapshot) * amount / supply_at(snapshot)
 * latest_snapshot_id receives the newest snapshot that was counted, so passing it back
 * as last_claimed_snapshot_id makes a repeated claim return zero.
 */
template<typename BalanceAt, typename SupplyAt>
int128 calc_claimable_amount(const std::vector<locked_capital>& instances,
                             uint64_t last_claimed_snapshot_id,
                             BalanceAt balance_at,
                             SupplyAt supply_at,
                             uint64_t& latest_snapshot_id) {
   int128 claimable   = 0;
   latest_snapshot_id = last_claimed_snapshot_id;
   for (const auto& instance : instances) {
      if (instance.locked || instance.snapshot_id <= last_claimed_snapshot_id) continue;

      latest_snapshot_id = std::max(latest_snapshot_id, instance.snapshot_id);
      int128 supply = supply_at(instance.snapshot_id);
      if (supply <= 0) continue;

      int128 balance = balance_at(instance.snapshot_id);
      claimable += balance * instance.amount / supply;
   }
   return claimable;
}

} // namespace cdsfi
