#include <gtest/gtest.h>

#include <cdsfi/lending_status.hpp>

#include "test_helpers.hpp"

using namespace cdsfi;
using namespace cdsfi::test;

namespace {

const uint64_t LAST_PAYMENT = 1'700'000'000;
const uint64_t PERIOD       = 30 * DAY_SECONDS;
const uint64_t GRACE        = DAY_SECONDS;

lending_pool_feed make_feed() {
   lending_pool_feed feed;
   feed.supported          = true;
   feed.balance            = 1'000'000;
   feed.last_payment_at    = LAST_PAYMENT;
   feed.payment_period_sec = PERIOD;
   feed.term_end_at        = LAST_PAYMENT + 365 * DAY_SECONDS;
   return feed;
}

} // namespace

TEST(LendingStatus, ActiveUntilPaymentDue) {
   auto feed = make_feed();
   EXPECT_EQ(calc_lending_pool_status(feed, GRACE, LAST_PAYMENT + PERIOD), lending_pool_status::Active);
}

TEST(LendingStatus, LateWithinGraceThenLate) {
   auto feed = make_feed();
   EXPECT_EQ(calc_lending_pool_status(feed, GRACE, LAST_PAYMENT + PERIOD + 1), lending_pool_status::LateWithinGracePeriod);
   EXPECT_EQ(calc_lending_pool_status(feed, GRACE, LAST_PAYMENT + PERIOD + GRACE), lending_pool_status::LateWithinGracePeriod);
   EXPECT_EQ(calc_lending_pool_status(feed, GRACE, LAST_PAYMENT + PERIOD + GRACE + 1), lending_pool_status::Late);
}

TEST(LendingStatus, TerminalConditions) {
   auto feed = make_feed();
   feed.defaulted = true;
   EXPECT_EQ(calc_lending_pool_status(feed, GRACE, LAST_PAYMENT), lending_pool_status::Defaulted);

   feed = make_feed();
   feed.balance = 0;
   EXPECT_EQ(calc_lending_pool_status(feed, GRACE, LAST_PAYMENT + 10 * PERIOD), lending_pool_status::Expired);

   feed = make_feed();
   feed.term_end_at = LAST_PAYMENT + DAY_SECONDS;
   EXPECT_EQ(calc_lending_pool_status(feed, GRACE, LAST_PAYMENT + 2 * DAY_SECONDS), lending_pool_status::Expired);

   EXPECT_EQ(calc_lending_pool_status(lending_pool_feed{}, GRACE, LAST_PAYMENT), lending_pool_status::NotSupported);
}

TEST(LendingStatus, LatenessWinsOverTermEnd) {
   auto feed = make_feed();
   feed.term_end_at = LAST_PAYMENT + PERIOD;
   EXPECT_EQ(calc_lending_pool_status(feed, GRACE, LAST_PAYMENT + PERIOD + GRACE + 1), lending_pool_status::Late);
}

TEST(LendingStatus, Admission) {
   EXPECT_EQ(check_lending_pool_admissible(lending_pool_status::Active), err::NONE);
   EXPECT_EQ(check_lending_pool_admissible(lending_pool_status::NotSupported), err::LENDING_POOL_UNSUPPORTED);
   EXPECT_EQ(check_lending_pool_admissible(lending_pool_status::Expired), err::LENDING_POOL_EXPIRED);
   EXPECT_EQ(check_lending_pool_admissible(lending_pool_status::Defaulted), err::LENDING_POOL_DEFAULTED);
   EXPECT_EQ(check_lending_pool_admissible(lending_pool_status::LateWithinGracePeriod), err::LENDING_POOL_LATE);
   EXPECT_EQ(check_lending_pool_admissible(lending_pool_status::Late), err::LENDING_POOL_LATE);
   EXPECT_EQ(check_lending_pool_admissible(lending_pool_status::UnderReview), err::LENDING_POOL_LATE);
}

TEST(LendingStatus, PurchaseWindowAndPrincipal) {
   const uint64_t limit = LAST_PAYMENT + 90 * DAY_SECONDS;
   auto status = lending_pool_status::Active;

   EXPECT_EQ(check_can_buy_protection(status, limit, usdc(100'000), usdc(100'000), false, limit), err::NONE);
   EXPECT_EQ(check_can_buy_protection(status, limit, usdc(100'000), usdc(100'001), false, limit), err::PROTECTION_EXCEEDS_PRINCIPAL);
   EXPECT_EQ(check_can_buy_protection(status, limit, usdc(100'000), usdc(50'000), false, limit + 1), err::PURCHASE_WINDOW_CLOSED);
   EXPECT_EQ(check_can_buy_protection(status, limit, usdc(100'000), usdc(50'000), true, limit + 1), err::NONE);
   EXPECT_EQ(check_can_buy_protection(lending_pool_status::NotSupported, limit, usdc(100'000), usdc(1), false, limit),
             err::LENDING_POOL_UNSUPPORTED);
}

TEST(LendingStatus, BuyerAprAfterProtocolFee) {
   EXPECT_EQ(calc_buyer_apr(fp("0.17"), fp("0.1")), fp("0.153"));
   EXPECT_EQ(calc_buyer_apr(fp("0.17"), 0), fp("0.17"));
   EXPECT_EQ(calc_buyer_apr(fp("0.17"), HIGH_PRECISION), 0);
}
