#include <gtest/gtest.h>

#include <cdsfi/pool_ledger.hpp>

using namespace cdsfi;

namespace {

// pool with 200'000 capital backing 180'000 protection on one lending pool and
// 120'000 on another
class PoolLedgerTest : public ::testing::Test {
protected:
   void SetUp() override {
      totals.capital    = 200'000;
      totals.protection = 300'000;
      exposure.protection = 180'000;
   }

   pool_totals       totals;
   lending_exposure  exposure;
};

// requests of two owners for one cycle, stored the way the pool tables hold them
struct request_book {
   int64_t  requested[2] = { 0, 0 };
   int64_t  cycle_total  = 0;

   withdrawal_slot load(int owner) const { return { requested[owner], cycle_total }; }
   void store(int owner, const withdrawal_slot& slot) {
      requested[owner] = slot.requested;
      cycle_total      = slot.cycle_total;
   }

   void request(int owner, int64_t shares) {
      auto slot = load(owner);
      replace_request(slot, shares);
      store(owner, slot);
   }

   int64_t cap(int owner, int64_t balance) {
      auto slot   = load(owner);
      auto excess = cap_request(slot, balance);
      store(owner, slot);
      return excess;
   }

   void withdraw(int owner, int64_t shares) {
      auto slot = load(owner);
      consume_request(slot, shares);
      store(owner, slot);
   }
};

} // namespace

TEST_F(PoolLedgerTest, LockTakesCapitalAtRisk) {
   // 100'000 protection on 60'000 remaining principal, 80'000 on 90'000
   int128 at_risk = calc_capital_at_risk(100'000, 60'000) + calc_capital_at_risk(80'000, 90'000);

   EXPECT_EQ(lock_record(totals, exposure, at_risk), 140'000);
   EXPECT_EQ(totals.capital, 60'000);
   EXPECT_EQ(totals.protection, 120'000);
   EXPECT_TRUE(exposure.locked);
   EXPECT_EQ(exposure.protection, 180'000);
}

TEST_F(PoolLedgerTest, LockNeverTakesMoreThanAvailable) {
   totals.capital = 50'000;
   EXPECT_EQ(lock_record(totals, exposure, 140'000), 50'000);
   EXPECT_EQ(totals.capital, 0);
   EXPECT_EQ(totals.protection, 120'000);
}

TEST_F(PoolLedgerTest, LockWithNothingAtRiskStillLocks) {
   EXPECT_EQ(lock_record(totals, exposure, 0), 0);
   EXPECT_EQ(totals.capital, 200'000);
   EXPECT_EQ(totals.protection, 120'000);
   EXPECT_TRUE(exposure.locked);
}

TEST_F(PoolLedgerTest, ExpiryWhileLockedIsCountedOnce) {
   lock_record(totals, exposure, 140'000);

   expire_on_record(totals, exposure, 80'000);
   EXPECT_EQ(totals.protection, 120'000);
   EXPECT_EQ(exposure.protection, 100'000);

   unlock_record(totals, exposure);
   EXPECT_FALSE(exposure.locked);
   EXPECT_EQ(totals.protection, 300'000 - 80'000);

   expire_on_record(totals, exposure, 100'000);
   EXPECT_EQ(totals.protection, 120'000);
   EXPECT_EQ(exposure.protection, 0);
}

TEST_F(PoolLedgerTest, UnlockRestoresProtection) {
   lock_record(totals, exposure, 140'000);
   unlock_record(totals, exposure);
   EXPECT_EQ(totals.protection, 300'000);
   EXPECT_EQ(totals.capital, 60'000);
}

TEST_F(PoolLedgerTest, ExpiryWhileUnlockedLeavesPoolTotal) {
   expire_on_record(totals, exposure, 30'000);
   EXPECT_EQ(totals.protection, 270'000);
   EXPECT_EQ(exposure.protection, 150'000);
}

TEST_F(PoolLedgerTest, ProtectionsExpireOnlyOnLockedDefault) {
   EXPECT_FALSE(expires_all_protections(exposure, lending_pool_status::Defaulted, lending_pool_status::Defaulted));

   exposure.locked = true;
   EXPECT_TRUE(expires_all_protections(exposure, lending_pool_status::Defaulted, lending_pool_status::Late));
   EXPECT_TRUE(expires_all_protections(exposure, lending_pool_status::Late, lending_pool_status::Defaulted));
   EXPECT_FALSE(expires_all_protections(exposure, lending_pool_status::Late, lending_pool_status::Late));
   EXPECT_FALSE(expires_all_protections(exposure, lending_pool_status::Late, lending_pool_status::UnderReview));
}

TEST(WithdrawalRequests, LaterRequestReplacesEarlier) {
   request_book book;
   book.request(0, 300);
   book.request(1, 200);
   EXPECT_EQ(book.cycle_total, 500);

   book.request(0, 250);
   EXPECT_EQ(book.requested[0], 250);
   EXPECT_EQ(book.cycle_total, 450);
}

TEST(WithdrawalRequests, TransferCapsPendingRequest) {
   request_book book;
   book.request(0, 300);
   book.request(1, 200);

   // owner 0 transfers 100 of 300 shares away
   EXPECT_EQ(book.cap(0, 200), 100);
   EXPECT_EQ(book.requested[0], 200);
   EXPECT_EQ(book.cycle_total, 400);

   // still covered, nothing changes
   EXPECT_EQ(book.cap(0, 500), 0);
   EXPECT_EQ(book.cycle_total, 400);

   // everything transferred
   EXPECT_EQ(book.cap(0, 0), 200);
   EXPECT_EQ(book.requested[0], 0);
   EXPECT_EQ(book.cycle_total, 200);
   EXPECT_EQ(book.cycle_total, book.requested[0] + book.requested[1]);
}

TEST(WithdrawalRequests, WithdrawConsumesRequest) {
   request_book book;
   book.request(0, 300);
   book.request(1, 200);

   book.withdraw(1, 150);
   EXPECT_EQ(book.requested[1], 50);
   EXPECT_EQ(book.cycle_total, 350);
   EXPECT_EQ(book.cycle_total, book.requested[0] + book.requested[1]);
}
