#pragma once

#include <eosio/action.hpp>
#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/singleton.hpp>

#include <string>
#include <vector>

#include <cds.pool/cds.pool.db.hpp>
#include <cdsfi/pool_ledger.hpp>
#include <cdsfi/premium_calculator.hpp>

namespace cdsfi {

using std::string;
using std::vector;

using namespace eosio;

static constexpr eosio::name active_perm{"active"_n};

/**
 * The `cds.pool` contract is one protection pool. Sellers deposit the settlement token and
 * receive pool shares; buyers pay a premium to protect a lending position in one of the
 * reference lending pools. Premium is earned by the sellers along a per-protection
 * exponential curve, and capital is locked by the default state manager while a lending
 * pool is late.
 *
 * Transfer memos:
 *    deposit[:receiver]
 *    buy:<lending_pool>:<position_id>:<protection_amount>:<duration_sec>
 *    renew:<lending_pool>:<position_id>:<protection_amount>:<duration_sec>
 * For buy and renew the transferred quantity is the maximum premium; the rest is refunded.
 */
class [[eosio::contract("cds.pool")]] cds_pool : public contract {
public:
   using contract::contract;

   cds_pool(name receiver, name code, datastream<const char*> ds)
   : contract(receiver, code, ds),
     _global(get_self(), get_self().value) {
      _gstate = _global.exists() ? _global.get() : pool_global_t{};
   }

   ~cds_pool() {
      _global.set(_gstate, get_self());
   }

   //admin
   ACTION init(const name& admin,
               const extended_symbol& underlying,
               const symbol_code& share_code,
               const name& refpools_contract,
               const name& defstate_contract);
   ACTION setparams(const pool_params& params);
   ACTION setpause(const bool& paused);
   ACTION movephase();

   //sellers
   ACTION reqwithdraw(const name& owner, const asset& shares);
   ACTION withdraw(const name& owner, const asset& shares, const name& receiver);
   ACTION transfer(const name& from, const name& to, const asset& shares, const string& memo);
   ACTION claimunlock(const name& owner, const name& receiver);

   //anyone
   ACTION accrue(const vector<name>& lending_pools);

   //default state manager
   ACTION lockcapital(const name& lending_pool);
   ACTION unlockpool(const name& lending_pool);
   ACTION payunlocked(const name& seller, const name& receiver, const asset& quantity);

   //views
   [[eosio::action]] asset calcpremium(const name& lending_pool, const asset& protection_amount, const uint32_t& duration_sec);
   [[eosio::action]] asset getmaxprot(const name& buyer, const name& lending_pool, const uint64_t& position_id);
   [[eosio::action]] uint64_t getleverage();

   [[eosio::on_notify("*::transfer")]]
   void on_transfer(const name& from, const name& to, const asset& quantity, const string& memo);

   //notifications
   ACTION notifyinit(const name& admin, const extended_symbol& underlying, const symbol& share_symbol);
   using notifyinit_action    = action_wrapper<"notifyinit"_n,   &cds_pool::notifyinit>;
   ACTION notifybuy(const protection_t& protection, const bool& renewal);
   using notifybuy_action     = action_wrapper<"notifybuy"_n,    &cds_pool::notifybuy>;
   ACTION notifyexpire(const uint64_t& protection_id, const name& buyer, const name& lending_pool);
   using notifyexpire_action  = action_wrapper<"notifyexpire"_n, &cds_pool::notifyexpire>;
   ACTION notifydepo(const name& owner, const asset& quantity, const asset& shares);
   using notifydepo_action    = action_wrapper<"notifydepo"_n,   &cds_pool::notifydepo>;
   ACTION notifyreqwd(const name& owner, const asset& shares, const uint64_t& cycle_index);
   using notifyreqwd_action   = action_wrapper<"notifyreqwd"_n,  &cds_pool::notifyreqwd>;
   ACTION notifywdraw(const name& owner, const asset& shares, const asset& quantity);
   using notifywdraw_action   = action_wrapper<"notifywdraw"_n,  &cds_pool::notifywdraw>;
   ACTION notifyaccr(const name& lending_pool, const asset& accrued, const asset& total_accrued);
   using notifyaccr_action    = action_wrapper<"notifyaccr"_n,   &cds_pool::notifyaccr>;
   ACTION notifylock(const name& lending_pool, const uint64_t& snapshot_id, const asset& locked);
   using notifylock_action    = action_wrapper<"notifylock"_n,   &cds_pool::notifylock>;
   ACTION notifyunlock(const name& lending_pool, const asset& protection);
   using notifyunlock_action  = action_wrapper<"notifyunlock"_n, &cds_pool::notifyunlock>;
   ACTION notifyphase(const uint8_t& phase);
   using notifyphase_action   = action_wrapper<"notifyphase"_n,  &cds_pool::notifyphase>;

private:
   pool_global_singleton   _global;
   pool_global_t           _gstate;

   // ========= core flows =========
   void _on_deposit(const name& from, const name& receiver, const asset& quantity);
   void _on_buy(const name& buyer,
                const asset& max_premium,
                const name& lending_pool,
                const uint64_t& position_id,
                const asset& protection_amount,
                const uint32_t& duration_sec,
                const bool& renewal);

   // ========= cycle & accrual =========
   cycle_state _refresh_cycle();
   void _accrue_all(const uint64_t& now);
   void _accrue_lending_pool(lendrecord_t::idx_t& records, lendrecord_t::idx_t::const_iterator itr, const uint64_t& now);
   lendrecord_t::idx_t::const_iterator _get_or_create_record(lendrecord_t::idx_t& records, const name& lending_pool);

   // ========= protections =========
   bool _find_protections(const name& buyer,
                          const name& lending_pool,
                          const uint64_t& position_id,
                          protection_t& latest,
                          bool& has_active);
   premium_quote _quote(const name& lending_pool, const asset& protection_amount, const uint32_t& duration_sec);

   // ========= shares =========
   asset _shares_from_amount(const asset& amount) const;
   asset _amount_from_shares(const asset& shares) const;
   void _mint(const name& owner, const asset& shares);
   void _burn(const name& owner, const asset& shares);
   void _move_shares(const name& from, const name& to, const asset& shares);
   void _cap_withdrawal_requests(const name& owner, const asset& balance);
   asset _balance_of(const name& owner) const;

   // ========= aggregates =========
   pool_totals _totals() const;
   void _set_totals(const pool_totals& totals);
   static lending_exposure _exposure_of(const lendrecord_t& record);

   void _check_not_paused() const;
};

} // namespace cdsfi
