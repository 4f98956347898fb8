#include <cds.defstate/cds.defstate.hpp>
#include <cds.pool/cds.pool.db.hpp>
#include <cds.refpools/cds.refpools.hpp>

#include <cdsfi/snapshot.hpp>

#include <eosio/system.hpp>

#include <tuple>

namespace cdsfi {

using namespace std;

#define NOTIFY_ACTION(action_type, ...) \
     { cds_defstate::action_type act{ _self, { {_self, "active"_n} } };\
            act.send( __VA_ARGS__ );}

static uint64_t now_sec() {
   return current_time_point().sec_since_epoch();
}

void cds_defstate::init(const name& admin, const name& registrar) {
   require_auth(get_self());
   CHECKC(is_account(admin), err::ACCOUNT_INVALID, "admin not exist")
   CHECKC(is_account(registrar), err::ACCOUNT_INVALID, "registrar not exist")

   _gstate.admin      = admin;
   _gstate.registrar  = registrar;
}

void cds_defstate::setconfig(const uint32_t& confirm_payments, const uint32_t& default_missed_periods) {
   require_auth(_gstate.admin);

   default_config conf;
   conf.confirm_payments        = confirm_payments;
   conf.default_missed_periods  = default_missed_periods;
   auto code = validate_default_config(conf);
   CHECKC(code == err::NONE, code, "confirm payments and missed periods must be positive")

   _gstate.conf = conf;
}

/**
 * 注册保护池
 * the pool must already name this contract as its default state manager
 */
void cds_defstate::registerpool(const name& pool) {
   require_auth(_gstate.registrar);

   pool_global_singleton pool_global(pool, pool.value);
   CHECKC(pool_global.exists(), err::RECORD_NOT_FOUND, "pool not initialized: " + pool.to_string())
   auto pool_state = pool_global.get();
   CHECKC(pool_state.defstate_contract == get_self(), err::CONTRACT_MISMATCH, "pool is bound to another default state manager")

   poolstate_t::idx_t pools(get_self(), get_self().value);
   CHECKC(pools.find(pool.value) == pools.end(), err::RECORD_EXISTING, "pool already registered")

   auto itr = pools.emplace(get_self(), [&](auto& row) {
      row.pool           = pool;
      row.refpools       = pool_state.refpools_contract;
      row.registered_at  = current_time_point();
   });
   _assess_pool(pools, itr, now_sec());
}

void cds_defstate::assessstates() {
   auto now = now_sec();
   poolstate_t::idx_t pools(get_self(), get_self().value);
   for (auto itr = pools.begin(); itr != pools.end(); ++itr) {
      _assess_pool(pools, itr, now);
   }
}

void cds_defstate::assessbatch(const vector<name>& pools_to_assess) {
   CHECKC(!pools_to_assess.empty(), err::PARAM_ERROR, "no pools to assess")

   auto now = now_sec();
   poolstate_t::idx_t pools(get_self(), get_self().value);
   for (const auto& pool : pools_to_assess) {
      auto itr = pools.find(pool.value);
      CHECKC(itr != pools.end(), err::RECORD_NOT_FOUND, "pool not registered: " + pool.to_string())
      _assess_pool(pools, itr, now);
   }
}

void cds_defstate::_assess_pool(poolstate_t::idx_t& pools, poolstate_t::idx_t::const_iterator itr, const uint64_t& now) {
   const auto pool      = itr->pool;
   const auto refpools  = itr->refpools;
   const auto grace     = cds_refpools::get_late_grace(refpools);

   lendpool_t::idx_t lendpools(refpools, refpools.value);
   lendstate_t::idx_t states(get_self(), pool.value);

   for (auto lp = lendpools.begin(); lp != lendpools.end(); ++lp) {
      auto feed = lp->feed();

      payment_observation obs;
      obs.status              = calc_lending_pool_status(feed, grace, now);
      obs.last_payment_at     = feed.last_payment_at;
      obs.payment_period_sec  = feed.payment_period_sec;
      obs.late_grace_sec      = grace;

      auto state_itr = states.find(lp->lending_pool.value);
      if (state_itr == states.end()) {
         state_itr = states.emplace(get_self(), [&](auto& row) {
            row.lending_pool  = lp->lending_pool;
            row.state         = initial_lending_pool_state(obs);
            row.updated_at    = time_point_sec(now);
         });
      }

      auto state  = state_itr->state;
      auto from   = state.status;
      auto effect = next_lending_pool_state(state, obs, _gstate.conf, now);

      bool unlocked = false;
      states.modify(state_itr, same_payer, [&](auto& row) {
         row.state = state;
         if (effect == state_effect::Unlock) unlocked = unlock_latest(row.locked_capitals);
         if (from != state.status) row.updated_at = time_point_sec(now);
      });

      if (from != state.status) {
         NOTIFY_ACTION(notifystatus_action, pool, lp->lending_pool, from, state.status)
      }

      // the pool answers a lock with onlocked, which appends the instance
      if (effect == state_effect::Lock) {
         eosio::action(
            permission_level{get_self(), "active"_n},
            pool,
            "lockcapital"_n,
            std::make_tuple(lp->lending_pool)).send();
      } else if (unlocked) {
         eosio::action(
            permission_level{get_self(), "active"_n},
            pool,
            "unlockpool"_n,
            std::make_tuple(lp->lending_pool)).send();
      }
   }

   pools.modify(itr, same_payer, [&](auto& row) {
      row.updated_at = time_point_sec(now);
   });

   NOTIFY_ACTION(notifyassess_action, pool, time_point_sec(now))
}

void cds_defstate::onlocked(const name& pool, const name& lending_pool, const uint64_t& snapshot_id, const asset& amount) {
   require_auth(pool);
   _require_registered(pool);
   CHECKC(amount.amount >= 0, err::NOT_POSITIVE, "locked amount must not be negative")

   lendstate_t::idx_t states(get_self(), pool.value);
   auto itr = states.find(lending_pool.value);
   CHECKC(itr != states.end(), err::RECORD_NOT_FOUND, "lending pool state not found: " + lending_pool.to_string())
   CHECKC(itr->locked_capitals.empty() || itr->locked_capitals.back().snapshot_id < snapshot_id,
          err::ACTION_REDUNDANT, "snapshot already recorded: " + to_string(snapshot_id))

   states.modify(itr, same_payer, [&](auto& row) {
      locked_capital instance;
      instance.snapshot_id  = snapshot_id;
      instance.amount       = amount.amount;
      instance.locked       = true;
      row.locked_capitals.push_back(instance);
   });
}

void cds_defstate::calcclaim(const name& pool, const name& seller, const name& receiver) {
   require_auth(pool);
   _require_registered(pool);

   claim_t::idx_t claims(get_self(), pool.value);
   auto itr = claims.find(seller.value);
   map<name, uint64_t> last_claimed;
   if (itr != claims.end()) last_claimed = itr->last_claimed;

   auto claimable = _calc_claimable(pool, seller, last_claimed);

   if (itr == claims.end()) {
      claims.emplace(get_self(), [&](auto& row) {
         row.seller        = seller;
         row.last_claimed  = last_claimed;
      });
   } else {
      claims.modify(itr, same_payer, [&](auto& row) {
         row.last_claimed  = last_claimed;
      });
   }

   pool_global_singleton pool_global(pool, pool.value);
   asset quantity((int64_t)claimable, pool_global.get().underlying.get_symbol());
   if (quantity.amount > 0) {
      eosio::action(
         permission_level{get_self(), "active"_n},
         pool,
         "payunlocked"_n,
         std::make_tuple(seller, receiver, quantity)).send();
   }

   NOTIFY_ACTION(notifyclaim_action, pool, seller, quantity)
}

asset cds_defstate::getclaimable(const name& pool, const name& seller) {
   _require_registered(pool);

   map<name, uint64_t> last_claimed;
   claim_t::idx_t claims(get_self(), pool.value);
   auto itr = claims.find(seller.value);
   if (itr != claims.end()) last_claimed = itr->last_claimed;

   auto claimable = _calc_claimable(pool, seller, last_claimed);
   pool_global_singleton pool_global(pool, pool.value);
   return asset((int64_t)claimable, pool_global.get().underlying.get_symbol());
}

uint8_t cds_defstate::getlpstatus(const name& pool, const name& lending_pool) {
   return uint8_t(get_managed_status(get_self(), pool, lending_pool));
}

/**
 * Sums the seller's part of every unlocked instance it has not claimed yet, using the
 * share balance and supply recorded by the pool at each lock snapshot, and advances
 * `last_claimed` past the instances counted.
 */
int128_t cds_defstate::_calc_claimable(const name& pool, const name& seller, map<name, uint64_t>& last_claimed) {
   pool_global_singleton pool_global(pool, pool.value);
   CHECKC(pool_global.exists(), err::RECORD_NOT_FOUND, "pool not initialized: " + pool.to_string())
   const auto pool_state = pool_global.get();

   seller_t::idx_t sellers(pool, pool.value);
   auto seller_itr = sellers.find(seller.value);

   auto balance_at = [&](uint64_t snapshot_id) -> int128 {
      if (seller_itr == sellers.end()) return 0;
      return value_at(seller_itr->checkpoints, snapshot_id, seller_itr->shares.amount);
   };
   auto supply_at = [&](uint64_t snapshot_id) -> int128 {
      return value_at(pool_state.supply_checkpoints, snapshot_id, pool_state.total_shares.amount);
   };

   int128_t claimable = 0;
   lendstate_t::idx_t states(get_self(), pool.value);
   for (auto itr = states.begin(); itr != states.end(); ++itr) {
      uint64_t last   = 0;
      auto last_itr   = last_claimed.find(itr->lending_pool);
      if (last_itr != last_claimed.end()) last = last_itr->second;

      uint64_t latest = last;
      claimable += calc_claimable_amount(itr->locked_capitals, last, balance_at, supply_at, latest);
      if (latest > last) last_claimed[itr->lending_pool] = latest;
   }
   CHECKC(claimable <= asset::max_amount, err::OVERSIZED, "claimable amount overflow")
   return claimable;
}

void cds_defstate::_require_registered(const name& pool) {
   poolstate_t::idx_t pools(get_self(), get_self().value);
   CHECKC(pools.find(pool.value) != pools.end(), err::NO_AUTH, "pool not registered: " + pool.to_string())
}

void cds_defstate::notifyassess(const name& pool, const time_point_sec& assessed_at) {
   require_auth(get_self());
   require_recipient(get_self());
}

void cds_defstate::notifystatus(const name& pool, const name& lending_pool, const uint8_t& from, const uint8_t& to) {
   require_auth(get_self());
   require_recipient(get_self());
}

void cds_defstate::notifyclaim(const name& pool, const name& seller, const asset& quantity) {
   require_auth(get_self());
   require_recipient(get_self());
}

} // namespace cdsfi
