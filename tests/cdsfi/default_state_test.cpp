#include <gtest/gtest.h>

#include <cdsfi/default_state.hpp>
#include <cdsfi/pool_ledger.hpp>

using namespace cdsfi;

namespace {

const uint64_t T0     = 1'700'000'000;
const uint64_t PERIOD = 30 * DAY_SECONDS;
const uint64_t GRACE  = DAY_SECONDS;

class DefaultStateTest : public ::testing::Test {
protected:
   void SetUp() override {
      feed.supported          = true;
      feed.balance            = 1'000'000;
      feed.last_payment_at    = T0;
      feed.payment_period_sec = PERIOD;
      feed.term_end_at        = T0 + 365 * DAY_SECONDS;
      state = initial_lending_pool_state(observe(T0));
   }

   payment_observation observe(uint64_t now) {
      payment_observation obs;
      obs.status             = calc_lending_pool_status(feed, GRACE, now);
      obs.last_payment_at    = feed.last_payment_at;
      obs.payment_period_sec = feed.payment_period_sec;
      obs.late_grace_sec     = GRACE;
      return obs;
   }

   state_effect assess(uint64_t now) {
      return next_lending_pool_state(state, observe(now), conf, now);
   }

   lending_pool_status status() const { return lending_pool_status(state.status); }

   // pool goes Late one second after its grace period
   void make_late() {
      ASSERT_EQ(assess(T0 + PERIOD + GRACE + 1), state_effect::Lock);
      ASSERT_EQ(status(), lending_pool_status::Late);
   }

   lending_pool_feed   feed;
   default_config      conf;
   lending_pool_state  state;
};

} // namespace

TEST_F(DefaultStateTest, StartsActive) {
   EXPECT_EQ(status(), lending_pool_status::Active);
   EXPECT_EQ(state.last_payment_seen_at, T0);
   EXPECT_EQ(assess(T0 + DAY_SECONDS), state_effect::None);
   EXPECT_EQ(status(), lending_pool_status::Active);
}

TEST_F(DefaultStateTest, MissedPaymentLocksAfterGrace) {
   EXPECT_EQ(assess(T0 + PERIOD + 1), state_effect::None);
   EXPECT_EQ(status(), lending_pool_status::LateWithinGracePeriod);

   EXPECT_EQ(assess(T0 + PERIOD + GRACE), state_effect::None);
   EXPECT_EQ(status(), lending_pool_status::LateWithinGracePeriod);

   EXPECT_EQ(assess(T0 + PERIOD + GRACE + 1), state_effect::Lock);
   EXPECT_EQ(status(), lending_pool_status::Late);
   EXPECT_EQ(state.late_at, T0 + PERIOD + GRACE + 1);
}

TEST_F(DefaultStateTest, PaymentWithinGraceReturnsToActive) {
   EXPECT_EQ(assess(T0 + PERIOD + 1), state_effect::None);
   feed.last_payment_at = T0 + PERIOD + 2;
   EXPECT_EQ(assess(T0 + PERIOD + 3), state_effect::None);
   EXPECT_EQ(status(), lending_pool_status::Active);
}

TEST_F(DefaultStateTest, ReassessingIsNoOp) {
   make_late();
   auto before = state;
   EXPECT_EQ(assess(T0 + PERIOD + GRACE + 100), state_effect::None);
   EXPECT_EQ(state.status, before.status);
   EXPECT_EQ(state.confirmations, before.confirmations);
   EXPECT_EQ(state.last_payment_seen_at, before.last_payment_seen_at);
}

TEST_F(DefaultStateTest, TwoPaymentsUnlock) {
   make_late();

   uint64_t now = T0 + PERIOD + GRACE + 10;
   feed.last_payment_at = now;
   EXPECT_EQ(assess(now + 1), state_effect::None);
   EXPECT_EQ(status(), lending_pool_status::UnderReview);
   EXPECT_EQ(state.confirmations, 1u);

   now += PERIOD;
   feed.last_payment_at = now;
   EXPECT_EQ(assess(now + 1), state_effect::Unlock);
   EXPECT_EQ(status(), lending_pool_status::Active);
   EXPECT_EQ(state.confirmations, 0u);
   EXPECT_EQ(state.late_at, 0u);
}

TEST_F(DefaultStateTest, SinglePaymentUnlockWhenConfigured) {
   conf.confirm_payments = 1;
   make_late();
   feed.last_payment_at = T0 + PERIOD + GRACE + 10;
   EXPECT_EQ(assess(T0 + PERIOD + GRACE + 11), state_effect::Unlock);
   EXPECT_EQ(status(), lending_pool_status::Active);
}

TEST_F(DefaultStateTest, MissedPaymentUnderReviewFallsBackToLate) {
   make_late();

   uint64_t paid_at = T0 + PERIOD + GRACE + 10;
   feed.last_payment_at = paid_at;
   EXPECT_EQ(assess(paid_at + 1), state_effect::None);
   ASSERT_EQ(status(), lending_pool_status::UnderReview);

   // next period passes without a payment
   EXPECT_EQ(assess(paid_at + PERIOD + GRACE + 1), state_effect::None);
   EXPECT_EQ(status(), lending_pool_status::Late);
   EXPECT_EQ(state.confirmations, 0u);
}

TEST_F(DefaultStateTest, DefaultsAfterMissedPeriods) {
   make_late();
   uint64_t deadline = T0 + PERIOD * conf.default_missed_periods + GRACE;

   EXPECT_EQ(assess(deadline), state_effect::None);
   EXPECT_EQ(status(), lending_pool_status::Late);

   EXPECT_EQ(assess(deadline + 1), state_effect::None);
   EXPECT_EQ(status(), lending_pool_status::Defaulted);
}

TEST_F(DefaultStateTest, DeclaredDefaultExpiresProtectionsWhileFeedIsLate) {
   make_late();
   uint64_t now = T0 + PERIOD * conf.default_missed_periods + GRACE + 1;
   EXPECT_EQ(assess(now), state_effect::None);
   ASSERT_EQ(status(), lending_pool_status::Defaulted);

   // the feed never reported the default
   auto feed_status = calc_lending_pool_status(feed, GRACE, now);
   EXPECT_EQ(feed_status, lending_pool_status::Late);

   lending_exposure exposure;
   exposure.protection = 100'000;
   exposure.locked     = true;
   EXPECT_TRUE(expires_all_protections(exposure, feed_status, status()));
   EXPECT_FALSE(expires_all_protections(exposure, feed_status, lending_pool_status::Late));
}

TEST_F(DefaultStateTest, ReportedDefaultWhileLateKeepsLock) {
   make_late();
   feed.defaulted = true;
   EXPECT_EQ(assess(T0 + PERIOD + GRACE + 2), state_effect::None);
   EXPECT_EQ(status(), lending_pool_status::Defaulted);
}

TEST_F(DefaultStateTest, ReportedDefaultWhileActiveLocks) {
   feed.defaulted = true;
   EXPECT_EQ(assess(T0 + 1), state_effect::Lock);
   EXPECT_EQ(status(), lending_pool_status::Defaulted);
}

TEST_F(DefaultStateTest, RepaidWhileLateUnlocksAndExpires) {
   make_late();
   feed.balance = 0;
   EXPECT_EQ(assess(T0 + PERIOD + GRACE + 2), state_effect::Unlock);
   EXPECT_EQ(status(), lending_pool_status::Expired);
}

TEST_F(DefaultStateTest, OverduePastTermEndIsLate) {
   EXPECT_EQ(assess(T0 + 365 * DAY_SECONDS), state_effect::Lock);
   EXPECT_EQ(status(), lending_pool_status::Late);
}

TEST_F(DefaultStateTest, RepaidWhileActiveExpires) {
   feed.balance = 0;
   EXPECT_EQ(assess(T0 + 1), state_effect::None);
   EXPECT_EQ(status(), lending_pool_status::Expired);
}

TEST_F(DefaultStateTest, TerminalStatesStay) {
   feed.defaulted = true;
   assess(T0 + 1);
   ASSERT_EQ(status(), lending_pool_status::Defaulted);

   feed.defaulted       = false;
   feed.last_payment_at = T0 + 2;
   EXPECT_EQ(assess(T0 + 3), state_effect::None);
   EXPECT_EQ(status(), lending_pool_status::Defaulted);

   state = initial_lending_pool_state(observe(T0));
   feed.balance = 0;
   assess(T0 + 1);
   ASSERT_EQ(status(), lending_pool_status::Expired);
   feed.balance = 1'000;
   EXPECT_EQ(assess(T0 + PERIOD + GRACE + 1), state_effect::None);
   EXPECT_EQ(status(), lending_pool_status::Expired);
}

TEST(DefaultConfig, Validation) {
   default_config conf;
   EXPECT_EQ(validate_default_config(conf), err::NONE);
   conf.confirm_payments = 0;
   EXPECT_EQ(validate_default_config(conf), err::PARAM_ERROR);
   conf.confirm_payments       = 2;
   conf.default_missed_periods = 0;
   EXPECT_EQ(validate_default_config(conf), err::PARAM_ERROR);
}
