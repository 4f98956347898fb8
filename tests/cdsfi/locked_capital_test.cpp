#include <gtest/gtest.h>

#include <vector>

#include <cdsfi/locked_capital.hpp>
#include <cdsfi/snapshot.hpp>

using namespace cdsfi;

namespace {

// share ledger recording checkpoints the way the pool does
struct share_ledger {
   uint64_t                   snapshot_id = 0;
   int64_t                    supply      = 0;
   std::vector<checkpoint>    supply_points;
   int64_t                    balances[2]       = { 0, 0 };
   std::vector<checkpoint>    balance_points[2];

   void change(int owner, int64_t delta) {
      update_checkpoints(supply_points, snapshot_id, supply);
      update_checkpoints(balance_points[owner], snapshot_id, balances[owner]);
      supply            += delta;
      balances[owner]   += delta;
   }

   void move(int from, int to, int64_t amount) {
      update_checkpoints(balance_points[from], snapshot_id, balances[from]);
      update_checkpoints(balance_points[to], snapshot_id, balances[to]);
      balances[from] -= amount;
      balances[to]   += amount;
   }

   uint64_t snapshot() { return ++snapshot_id; }

   int128 claimable(int owner, const std::vector<locked_capital>& instances, uint64_t& last_claimed) {
      uint64_t latest = 0;
      int128 amount = calc_claimable_amount(instances, last_claimed,
         [&](uint64_t s) -> int128 { return value_at(balance_points[owner], s, balances[owner]); },
         [&](uint64_t s) -> int128 { return value_at(supply_points, s, supply); },
         latest);
      last_claimed = latest;
      return amount;
   }
};

} // namespace

TEST(LockedCapital, CapitalAtRiskUsesRemainingPrincipal) {
   EXPECT_EQ(calc_capital_at_risk(100'000, 60'000), 60'000);
   EXPECT_EQ(calc_capital_at_risk(50'000, 60'000), 50'000);
   EXPECT_EQ(calc_capital_at_risk(50'000, 0), 0);
}

TEST(LockedCapital, LockNeverExceedsAvailable) {
   EXPECT_EQ(calc_lock_amount(50'000, 80'000), 50'000);
   EXPECT_EQ(calc_lock_amount(120'000, 80'000), 80'000);
   EXPECT_EQ(calc_lock_amount(120'000, 0), 0);
   EXPECT_EQ(calc_lock_amount(0, 80'000), 0);
}

TEST(LockedCapital, UnlockLatestFlipsMostRecentLocked) {
   std::vector<locked_capital> instances = { {1, 100, false}, {2, 200, true} };
   EXPECT_TRUE(unlock_latest(instances));
   EXPECT_FALSE(instances[1].locked);
   EXPECT_FALSE(unlock_latest(instances));
}

TEST(LockedCapital, ClaimProRataAtSnapshot) {
   share_ledger ledger;
   ledger.change(0, 100);
   ledger.change(1, 200);

   std::vector<locked_capital> instances;
   instances.push_back({ ledger.snapshot(), 50'000, true });

   // balances move after the lock and must not change the entitlement
   ledger.move(1, 0, 150);
   ledger.change(1, 1'000);

   uint64_t last_claimed = 0;
   EXPECT_EQ(ledger.claimable(0, instances, last_claimed), 0);

   ASSERT_TRUE(unlock_latest(instances));
   EXPECT_EQ(ledger.claimable(0, instances, last_claimed), 100 * 50'000 / 300);
   EXPECT_EQ(last_claimed, 1u);

   uint64_t other_claimed = 0;
   EXPECT_EQ(ledger.claimable(1, instances, other_claimed), 200 * 50'000 / 300);
}

TEST(LockedCapital, SecondClaimReturnsNothing) {
   share_ledger ledger;
   ledger.change(0, 300);
   std::vector<locked_capital> instances = { { ledger.snapshot(), 9'000, false } };

   uint64_t last_claimed = 0;
   EXPECT_EQ(ledger.claimable(0, instances, last_claimed), 9'000);
   EXPECT_EQ(ledger.claimable(0, instances, last_claimed), 0);
}

TEST(LockedCapital, ClaimSumsEveryUnlockedInstance) {
   share_ledger ledger;
   ledger.change(0, 100);
   ledger.change(1, 100);
   std::vector<locked_capital> instances;
   instances.push_back({ ledger.snapshot(), 1'000, false });

   ledger.change(1, 200);
   instances.push_back({ ledger.snapshot(), 4'000, false });

   uint64_t last_claimed = 0;
   EXPECT_EQ(ledger.claimable(0, instances, last_claimed), 1'000 / 2 + 4'000 / 4);
   EXPECT_EQ(last_claimed, 2u);
}

TEST(LockedCapital, SellerJoiningAfterLockGetsNothing) {
   share_ledger ledger;
   ledger.change(0, 100);
   std::vector<locked_capital> instances = { { ledger.snapshot(), 5'000, false } };
   ledger.change(1, 100);

   uint64_t late_claimed = 0, early_claimed = 0;
   EXPECT_EQ(ledger.claimable(1, instances, late_claimed), 0);
   EXPECT_EQ(ledger.claimable(0, instances, early_claimed), 5'000);
}

TEST(Snapshot, ValueAtReadsFirstCheckpointAfterSnapshot) {
   std::vector<checkpoint> points;
   update_checkpoints(points, 0, 10);
   EXPECT_TRUE(points.empty());

   update_checkpoints(points, 1, 10);
   update_checkpoints(points, 1, 20);
   update_checkpoints(points, 3, 30);
   ASSERT_EQ(points.size(), 2u);

   EXPECT_EQ(value_at(points, 1, 99), 10);
   EXPECT_EQ(value_at(points, 2, 99), 30);
   EXPECT_EQ(value_at(points, 3, 99), 30);
   EXPECT_EQ(value_at(points, 4, 99), 99);
}
