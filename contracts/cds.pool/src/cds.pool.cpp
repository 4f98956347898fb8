#include <cds.pool/cds.pool.hpp>
#include <cds.refpools/cds.refpools.hpp>
#include <cds.defstate/cds.defstate.hpp>
#include <amax.token.hpp>

#include <cdsfi/locked_capital.hpp>
#include <cdsfi/memo.hpp>
#include <cdsfi/pool_ledger.hpp>
#include <cdsfi/protection.hpp>

#include <utils.hpp>
#include <eosio/system.hpp>
#include <eosio/time.hpp>

#include <tuple>

namespace cdsfi {

using namespace std;

#define NOTIFY_ACTION(action_type, ...) \
     { cds_pool::action_type act{ _self, { {_self, active_perm} } };\
            act.send( __VA_ARGS__ );}

static constexpr int64_t DEFAULT_MIN_CAPITAL = 100'000;         // whole tokens

static uint64_t now_sec() {
   return current_time_point().sec_since_epoch();
}

static int64_t calc_precision(uint8_t digits) {
   int64_t p = 1;
   for (uint8_t i = 0; i < digits; ++i) p *= 10;
   return p;
}

void cds_pool::init(const name& admin,
                    const extended_symbol& underlying,
                    const symbol_code& share_code,
                    const name& refpools_contract,
                    const name& defstate_contract) {
   require_auth(get_self());
   CHECKC(_gstate.admin == name(), err::RECORD_EXISTING, "pool already initialized")
   CHECKC(is_account(admin), err::ACCOUNT_INVALID, "admin not exist")
   CHECKC(is_account(underlying.get_contract()), err::ACCOUNT_INVALID, "token contract not exist")
   CHECKC(is_account(refpools_contract), err::ACCOUNT_INVALID, "refpools contract not exist")
   CHECKC(is_account(defstate_contract), err::ACCOUNT_INVALID, "defstate contract not exist")

   const auto& sym = underlying.get_symbol();
   CHECKC(sym.is_valid() && share_code.is_valid(), err::SYMBOL_MISMATCH, "invalid symbol")
   CHECKC(sym.precision() <= 8, err::SYMBOL_MISMATCH, "token precision too large")

   _gstate.admin                   = admin;
   _gstate.underlying              = underlying;
   _gstate.share_symbol            = symbol(share_code, sym.precision());
   _gstate.refpools_contract       = refpools_contract;
   _gstate.defstate_contract       = defstate_contract;

   _gstate.params                       = pool_params{};
   _gstate.params.min_required_capital  = DEFAULT_MIN_CAPITAL * calc_precision(sym.precision());
   _gstate.params_version               = 1;
   _gstate.phase                        = uint8_t(pool_phase::OpenToSellers);
   start_pool_cycle(_gstate.cycle, now_sec());

   _gstate.total_stoken_underlying = asset(0, sym);
   _gstate.total_premium           = asset(0, sym);
   _gstate.total_premium_accrued   = asset(0, sym);
   _gstate.total_protection        = asset(0, sym);
   _gstate.total_shares            = asset(0, _gstate.share_symbol);

   NOTIFY_ACTION(notifyinit_action, admin, underlying, _gstate.share_symbol)
}

void cds_pool::setparams(const pool_params& params) {
   require_auth(_gstate.admin);
   auto code = validate_pool_params(params);
   CHECKC(code == err::NONE, code, "invalid pool params")

   // close the running cycle under the old durations first
   _refresh_cycle();
   _gstate.params = params;
   _gstate.params_version++;
}

void cds_pool::setpause(const bool& paused) {
   require_auth(_gstate.admin);
   _gstate.paused = paused;
}

void cds_pool::movephase() {
   require_auth(_gstate.admin);
   _accrue_all(now_sec());

   pool_phase next = pool_phase(_gstate.phase);
   auto code = check_phase_advance(pool_phase(_gstate.phase),
                                   _gstate.total_stoken_underlying.amount,
                                   _gstate.total_protection.amount,
                                   _gstate.params,
                                   next);
   CHECKC(code == err::NONE, code, "pool phase cannot advance from " + to_string(_gstate.phase))
   _gstate.phase = uint8_t(next);

   NOTIFY_ACTION(notifyphase_action, _gstate.phase)
}

void cds_pool::on_transfer(const name& from, const name& to, const asset& quantity, const string& memo) {
   if (from == get_self() || to != get_self()) return;

   CHECKC(get_first_receiver() == _gstate.underlying.get_contract(), err::CONTRACT_MISMATCH, "unsupported token contract")
   CHECKC(quantity.symbol == _gstate.underlying.get_symbol(), err::SYMBOL_MISMATCH, "unsupported token symbol")
   CHECKC(quantity.amount > 0, err::NOT_POSITIVE, "quantity must be positive")
   _check_not_paused();

   auto parts = split(memo, ":");
   CHECKC(parts.size() >= 1, err::MEMO_FORMAT_ERROR, "invalid memo")
   const string cmd = string(parts[0]);

   // ---- deposit[:receiver] ----
   if (cmd == "deposit") {
      CHECKC(parts.size() <= 2, err::MEMO_FORMAT_ERROR, "invalid deposit memo")
      name receiver = parts.size() == 2 ? name(parts[1]) : from;
      CHECKC(is_account(receiver), err::ACCOUNT_INVALID, "receiver not exist")
      _on_deposit(from, receiver, quantity);
      return;
   }

   // ---- buy|renew:lending_pool:position_id:protection_amount:duration_sec ----
   if (cmd == "buy" || cmd == "renew") {
      CHECKC(parts.size() == 5, err::MEMO_FORMAT_ERROR, "invalid " + cmd + " memo")
      uint64_t position_id = 0, amount = 0, duration_sec = 0;
      CHECKC(parse_uint64(parts[2], position_id)
             && parse_uint64(parts[3], amount)
             && parse_uint64(parts[4], duration_sec), err::MEMO_FORMAT_ERROR, "invalid number in memo")
      CHECKC(amount > 0 && amount <= (uint64_t)asset::max_amount, err::OVERSIZED, "protection amount out of range")
      CHECKC(duration_sec <= UINT32_MAX, err::OVERSIZED, "duration out of range")

      _on_buy(from, quantity, name(parts[1]), position_id,
              asset((int64_t)amount, quantity.symbol), (uint32_t)duration_sec, cmd == "renew");
      return;
   }

   CHECKC(false, err::MEMO_FORMAT_ERROR, "invalid memo command: " + cmd)
}

void cds_pool::_on_deposit(const name& from, const name& receiver, const asset& quantity) {
   CHECKC(pool_phase(_gstate.phase) != pool_phase::OpenToBuyers, err::PHASE_MISMATCH, "deposits are closed while the pool is open to buyers")
   CHECKC(_refresh_cycle() == cycle_state::Open, err::POOL_NOT_OPEN, "pool cycle is locked")
   _accrue_all(now_sec());

   auto shares = _shares_from_amount(quantity);
   _mint(receiver, shares);
   _gstate.total_stoken_underlying += quantity;

   auto code = check_deposit(pool_phase(_gstate.phase),
                             _gstate.total_stoken_underlying.amount,
                             _gstate.total_protection.amount,
                             _gstate.params);
   CHECKC(code == err::NONE, code, "leverage ratio above ceiling after deposit")

   NOTIFY_ACTION(notifydepo_action, receiver, quantity, shares)
}

void cds_pool::_on_buy(const name& buyer,
                       const asset& max_premium,
                       const name& lending_pool,
                       const uint64_t& position_id,
                       const asset& protection_amount,
                       const uint32_t& duration_sec,
                       const bool& renewal) {
   CHECKC(pool_phase(_gstate.phase) != pool_phase::OpenToSellers, err::PHASE_MISMATCH, "pool is not open to buyers")
   _refresh_cycle();
   auto now = now_sec();

   auto status = cds_refpools::get_lending_pool_status(_gstate.refpools_contract, lending_pool, now);
   auto code   = check_lending_pool_admissible(status);
   CHECKC(code == err::NONE, code, "lending pool not admissible, status: " + to_string((int)status))

   lendrecord_t::idx_t records(get_self(), get_self().value);
   auto record = _get_or_create_record(records, lending_pool);
   CHECKC(!record->locked, err::LENDING_POOL_LATE, "capital is locked for lending pool")
   _accrue_lending_pool(records, record, now);

   protection_t latest;
   bool has_active   = false;
   bool has_previous = _find_protections(buyer, lending_pool, position_id, latest, has_active);
   if (renewal) {
      code = check_protection_renewal(has_previous, latest.expires_at(), now, _gstate.params);
      CHECKC(code == err::NONE, code, "no renewable protection on position " + to_string(position_id))
   }

   auto remaining = cds_refpools::get_remaining_principal(_gstate.refpools_contract, lending_pool, buyer, position_id);
   code = check_can_buy_protection(status,
                                   record->purchase_limit_at.sec_since_epoch(),
                                   remaining,
                                   protection_amount.amount,
                                   has_active || renewal,
                                   now);
   CHECKC(code == err::NONE, code, "protection purchase not allowed")

   code = check_protection_duration(duration_sec, now,
                                    next_cycle_end(_gstate.cycle, _gstate.params.cycle_duration_sec),
                                    _gstate.params);
   CHECKC(code == err::NONE, code, "invalid protection duration: " + to_string(duration_sec))

   code = check_buy_leverage(pool_phase(_gstate.phase),
                             _gstate.total_stoken_underlying.amount,
                             (int128_t)_gstate.total_protection.amount + protection_amount.amount,
                             _gstate.params);
   CHECKC(code == err::NONE, code, "leverage ratio below floor after purchase")

   // price against the pool before this purchase
   auto leverage = calc_leverage_ratio(_gstate.total_stoken_underlying.amount, _gstate.total_protection.amount);
   auto quote    = _quote(lending_pool, protection_amount, duration_sec);
   CHECKC(quote.premium > 0 && quote.premium <= asset::max_amount, err::MATH_DOMAIN, "premium out of range")

   asset premium((int64_t)quote.premium, protection_amount.symbol);
   CHECKC(premium <= max_premium, err::PREMIUM_EXCEEDS_MAX,
          "premium " + premium.to_string() + " exceeds max premium " + max_premium.to_string())

   int128_t k = 0, lambda = 0;
   auto rf = calc_purchase_risk_factor(quote, leverage, duration_sec, _gstate.params);
   CHECKC(calc_k_and_lambda(premium.amount, duration_sec, rf, k, lambda), err::MATH_DOMAIN, "cannot derive premium curve")

   protection_t protection(++_gstate.last_protection_id);
   protection.buyer             = buyer;
   protection.premium           = premium;
   protection.started_at        = time_point_sec(now);
   protection.k                 = k;
   protection.lambda            = lambda;
   protection.lending_pool      = lending_pool;
   protection.position_id       = position_id;
   protection.protection_amount = protection_amount;
   protection.duration_sec      = duration_sec;
   protection.is_min_premium    = quote.is_min_premium;

   protection_t::idx_t protections(get_self(), get_self().value);
   protections.emplace(get_self(), [&](auto& row) { row = protection; });

   records.modify(record, same_payer, [&](auto& row) {
      row.active_protections.push_back(protection.id);
      row.total_premium    += premium;
      row.total_protection += protection_amount;
   });
   _gstate.total_premium    += premium;
   _gstate.total_protection += protection_amount;

   auto refund = max_premium - premium;
   if (refund.amount > 0) TRANSFER( _gstate.underlying.get_contract(), buyer, refund, "premium refund" )

   NOTIFY_ACTION(notifybuy_action, protection, renewal)
}

void cds_pool::reqwithdraw(const name& owner, const asset& shares) {
   require_auth(owner);
   _check_not_paused();
   CHECKC(shares.symbol == _gstate.share_symbol, err::SYMBOL_MISMATCH, "share symbol mismatch")
   CHECKC(shares.amount > 0, err::NOT_POSITIVE, "shares must be positive")
   CHECKC(shares <= _balance_of(owner), err::INSUFFICIENT_BALANCE, "insufficient shares")

   _refresh_cycle();
   auto cycle_index = withdrawal_cycle_index(_gstate.cycle);

   wdrequest_t::idx_t requests(get_self(), cycle_index);
   wdtotal_t::idx_t totals(get_self(), get_self().value);
   auto itr       = requests.find(owner.value);
   auto total_itr = totals.find(cycle_index);

   withdrawal_slot slot;
   if (itr != requests.end())          slot.requested   = itr->shares.amount;
   if (total_itr != totals.end())      slot.cycle_total = total_itr->total_requested.amount;
   replace_request(slot, shares.amount);

   if (itr == requests.end()) {
      requests.emplace(get_self(), [&](auto& row) {
         row.owner        = owner;
         row.shares       = shares;
         row.requested_at = current_time_point();
      });
   } else {
      requests.modify(itr, same_payer, [&](auto& row) {
         row.shares       = shares;
         row.requested_at = current_time_point();
      });
   }

   if (total_itr == totals.end()) {
      totals.emplace(get_self(), [&](auto& row) {
         row.cycle_index     = cycle_index;
         row.total_requested = asset(slot.cycle_total, _gstate.share_symbol);
      });
   } else {
      totals.modify(total_itr, same_payer, [&](auto& row) {
         row.total_requested.amount = slot.cycle_total;
      });
   }

   NOTIFY_ACTION(notifyreqwd_action, owner, shares, cycle_index)
}

void cds_pool::withdraw(const name& owner, const asset& shares, const name& receiver) {
   require_auth(owner);
   _check_not_paused();
   CHECKC(is_account(receiver), err::ACCOUNT_INVALID, "receiver not exist")
   CHECKC(shares.symbol == _gstate.share_symbol, err::SYMBOL_MISMATCH, "share symbol mismatch")
   CHECKC(shares.amount > 0, err::NOT_POSITIVE, "shares must be positive")
   CHECKC(_refresh_cycle() == cycle_state::Open, err::POOL_NOT_OPEN, "pool cycle is locked")

   auto cycle_index = _gstate.cycle.index;
   wdrequest_t::idx_t requests(get_self(), cycle_index);
   auto itr = requests.find(owner.value);
   CHECKC(itr != requests.end(), err::WITHDRAWAL_NOT_REQUESTED, "no withdrawal request for cycle " + to_string(cycle_index))
   CHECKC(shares <= itr->shares, err::WITHDRAWAL_EXCEEDS_REQUEST, "withdrawal exceeds requested " + itr->shares.to_string())
   CHECKC(shares <= _balance_of(owner), err::INSUFFICIENT_BALANCE, "insufficient shares")

   _accrue_all(now_sec());
   auto quantity = _amount_from_shares(shares);
   CHECKC(quantity.amount > 0, err::NOT_POSITIVE, "withdrawal amount too small")
   CHECKC(quantity <= _gstate.total_stoken_underlying, err::INSUFFICIENT_CAPITAL, "insufficient pool capital")

   wdtotal_t::idx_t totals(get_self(), get_self().value);
   auto total_itr = totals.find(cycle_index);

   withdrawal_slot slot;
   slot.requested = itr->shares.amount;
   if (total_itr != totals.end()) slot.cycle_total = total_itr->total_requested.amount;
   consume_request(slot, shares.amount);

   if (slot.requested == 0) {
      requests.erase(itr);
   } else {
      requests.modify(itr, same_payer, [&](auto& row) { row.shares.amount = slot.requested; });
   }
   if (total_itr != totals.end()) {
      totals.modify(total_itr, same_payer, [&](auto& row) { row.total_requested.amount = slot.cycle_total; });
   }

   _burn(owner, shares);
   _gstate.total_stoken_underlying -= quantity;
   TRANSFER( _gstate.underlying.get_contract(), receiver, quantity, "withdraw" )

   NOTIFY_ACTION(notifywdraw_action, owner, shares, quantity)
}

void cds_pool::transfer(const name& from, const name& to, const asset& shares, const string& memo) {
   require_auth(from);
   _check_not_paused();
   CHECKC(from != to, err::ACCOUNT_INVALID, "cannot transfer to self")
   CHECKC(is_account(to), err::ACCOUNT_INVALID, "to account does not exist")
   CHECKC(shares.symbol == _gstate.share_symbol, err::SYMBOL_MISMATCH, "share symbol mismatch")
   CHECKC(shares.amount > 0, err::NOT_POSITIVE, "shares must be positive")
   CHECKC(memo.size() <= 256, err::OVERSIZED, "memo has more than 256 bytes")
   CHECKC(shares <= _balance_of(from), err::INSUFFICIENT_BALANCE, "insufficient shares")

   require_recipient(from);
   require_recipient(to);

   _move_shares(from, to, shares);
   _cap_withdrawal_requests(from, _balance_of(from));
}

void cds_pool::claimunlock(const name& owner, const name& receiver) {
   require_auth(owner);
   _check_not_paused();
   CHECKC(is_account(receiver), err::ACCOUNT_INVALID, "receiver not exist")

   eosio::action(
      permission_level{get_self(), active_perm},
      _gstate.defstate_contract,
      "calcclaim"_n,
      std::make_tuple(get_self(), owner, receiver)).send();
}

void cds_pool::accrue(const vector<name>& lending_pools) {
   auto now = now_sec();
   if (lending_pools.empty()) {
      _accrue_all(now);
      return;
   }

   lendrecord_t::idx_t records(get_self(), get_self().value);
   for (const auto& lending_pool : lending_pools) {
      auto itr = records.find(lending_pool.value);
      CHECKC(itr != records.end(), err::RECORD_NOT_FOUND, "lending pool not found: " + lending_pool.to_string())
      _accrue_lending_pool(records, itr, now);
   }
}

void cds_pool::lockcapital(const name& lending_pool) {
   require_auth(_gstate.defstate_contract);
   auto now = now_sec();

   lendrecord_t::idx_t records(get_self(), get_self().value);
   auto record = _get_or_create_record(records, lending_pool);
   CHECKC(!record->locked, err::ACTION_REDUNDANT, "lending pool already locked")
   _accrue_lending_pool(records, record, now);

   protection_t::idx_t protections(get_self(), get_self().value);
   int128_t at_risk = 0;
   for (const auto& id : record->active_protections) {
      auto itr = protections.find(id);
      CHECKC(itr != protections.end(), err::SYSTEM_ERROR, "protection not found: " + to_string(id))
      auto remaining = cds_refpools::get_remaining_principal(_gstate.refpools_contract, lending_pool, itr->buyer, itr->position_id);
      at_risk += calc_capital_at_risk(itr->protection_amount.amount, remaining);
   }

   auto snapshot_id = ++_gstate.snapshot_id;
   auto totals      = _totals();
   auto exposure    = _exposure_of(*record);
   asset locked(lock_record(totals, exposure, at_risk), _gstate.total_stoken_underlying.symbol);
   _set_totals(totals);

   records.modify(record, same_payer, [&](auto& row) { row.locked = exposure.locked; });

   eosio::action(
      permission_level{get_self(), active_perm},
      _gstate.defstate_contract,
      "onlocked"_n,
      std::make_tuple(get_self(), lending_pool, snapshot_id, locked)).send();

   NOTIFY_ACTION(notifylock_action, lending_pool, snapshot_id, locked)
}

void cds_pool::unlockpool(const name& lending_pool) {
   require_auth(_gstate.defstate_contract);

   lendrecord_t::idx_t records(get_self(), get_self().value);
   auto record = records.find(lending_pool.value);
   CHECKC(record != records.end(), err::RECORD_NOT_FOUND, "lending pool not found: " + lending_pool.to_string())
   CHECKC(record->locked, err::STATUS_ERROR, "lending pool is not locked")
   _accrue_lending_pool(records, record, now_sec());

   auto totals   = _totals();
   auto exposure = _exposure_of(*record);
   unlock_record(totals, exposure);
   _set_totals(totals);

   records.modify(record, same_payer, [&](auto& row) { row.locked = exposure.locked; });

   NOTIFY_ACTION(notifyunlock_action, lending_pool, record->total_protection)
}

void cds_pool::payunlocked(const name& seller, const name& receiver, const asset& quantity) {
   require_auth(_gstate.defstate_contract);
   CHECKC(quantity.symbol == _gstate.underlying.get_symbol(), err::SYMBOL_MISMATCH, "unlocked capital symbol mismatch")
   CHECKC(quantity.amount > 0, err::NOT_POSITIVE, "unlocked capital must be positive")

   TRANSFER( _gstate.underlying.get_contract(), receiver, quantity, "unlocked capital: " + seller.to_string() )
}

asset cds_pool::calcpremium(const name& lending_pool, const asset& protection_amount, const uint32_t& duration_sec) {
   CHECKC(protection_amount.symbol == _gstate.underlying.get_symbol(), err::SYMBOL_MISMATCH, "protection symbol mismatch")
   auto quote = _quote(lending_pool, protection_amount, duration_sec);
   CHECKC(quote.premium <= asset::max_amount, err::MATH_DOMAIN, "premium out of range")
   return asset((int64_t)quote.premium, protection_amount.symbol);
}

asset cds_pool::getmaxprot(const name& buyer, const name& lending_pool, const uint64_t& position_id) {
   auto remaining = cds_refpools::get_remaining_principal(_gstate.refpools_contract, lending_pool, buyer, position_id);
   return asset(remaining, _gstate.underlying.get_symbol());
}

uint64_t cds_pool::getleverage() {
   auto leverage = calc_leverage_ratio(_gstate.total_stoken_underlying.amount, _gstate.total_protection.amount);
   return leverage > UINT64_MAX ? UINT64_MAX : (uint64_t)leverage;
}

cycle_state cds_pool::_refresh_cycle() {
   return refresh_pool_cycle(_gstate.cycle,
                             _gstate.params.open_cycle_duration_sec,
                             _gstate.params.cycle_duration_sec,
                             now_sec());
}

void cds_pool::_accrue_all(const uint64_t& now) {
   lendrecord_t::idx_t records(get_self(), get_self().value);
   for (auto itr = records.begin(); itr != records.end(); ++itr) {
      _accrue_lending_pool(records, itr, now);
   }
}

void cds_pool::_accrue_lending_pool(lendrecord_t::idx_t& records, lendrecord_t::idx_t::const_iterator itr, const uint64_t& now) {
   auto last_accrued_at = itr->last_accrued_at.sec_since_epoch();
   if (now <= last_accrued_at) return;

   // once capital is locked against a defaulted pool its protections stop earning
   auto exposure     = _exposure_of(*itr);
   bool expire_all   = false;
   if (exposure.locked) {
      auto feed_status    = cds_refpools::get_lending_pool_status(_gstate.refpools_contract, itr->lending_pool, now);
      auto managed_status = cds_defstate::get_managed_status(_gstate.defstate_contract, get_self(), itr->lending_pool);
      expire_all = expires_all_protections(exposure, feed_status, managed_status);
   }
   const auto& sym   = _gstate.total_stoken_underlying.symbol;

   protection_t::idx_t protections(get_self(), get_self().value);
   int128_t accrued = 0;
   asset expired_protection(0, sym);
   vector<uint64_t> still_active;

   for (const auto& id : itr->active_protections) {
      auto pitr = protections.find(id);
      CHECKC(pitr != protections.end(), err::SYSTEM_ERROR, "protection not found: " + to_string(id))

      protection_terms terms;
      terms.started_at   = pitr->started_at.sec_since_epoch();
      terms.duration_sec = pitr->duration_sec;
      terms.k            = pitr->k;
      terms.lambda       = pitr->lambda;

      bool expired = false;
      accrued += calc_protection_accrual(terms, last_accrued_at, now, expired);

      if (expired || expire_all) {
         protections.modify(pitr, same_payer, [&](auto& row) { row.expired = true; });
         expired_protection += pitr->protection_amount;
         NOTIFY_ACTION(notifyexpire_action, pitr->id, pitr->buyer, pitr->lending_pool)
      } else {
         still_active.push_back(id);
      }
   }

   auto totals = _totals();
   expire_on_record(totals, exposure, expired_protection.amount);
   _set_totals(totals);

   records.modify(itr, same_payer, [&](auto& row) {
      row.active_protections      = still_active;
      row.total_protection.amount = exposure.protection;
      row.last_accrued_at         = time_point_sec(now);
   });

   if (accrued > 0) {
      asset accrued_premium((int64_t)accrued, sym);
      _gstate.total_premium_accrued   += accrued_premium;
      _gstate.total_stoken_underlying += accrued_premium;
      NOTIFY_ACTION(notifyaccr_action, itr->lending_pool, accrued_premium, _gstate.total_premium_accrued)
   }
}

lendrecord_t::idx_t::const_iterator cds_pool::_get_or_create_record(lendrecord_t::idx_t& records, const name& lending_pool) {
   auto itr = records.find(lending_pool.value);
   if (itr != records.end()) return itr;

   lendpool_t::idx_t lendpools(_gstate.refpools_contract, _gstate.refpools_contract.value);
   auto lp = lendpools.find(lending_pool.value);
   CHECKC(lp != lendpools.end(), err::LENDING_POOL_UNSUPPORTED, "lending pool not supported: " + lending_pool.to_string())

   const auto& sym = _gstate.total_stoken_underlying.symbol;
   return records.emplace(get_self(), [&](auto& row) {
      row.lending_pool      = lending_pool;
      row.protocol          = lp->protocol;
      row.added_at          = lp->added_at;
      row.purchase_limit_at = lp->purchase_limit_at;
      row.last_accrued_at   = time_point_sec(now_sec());
      row.total_premium     = asset(0, sym);
      row.total_protection  = asset(0, sym);
   });
}

bool cds_pool::_find_protections(const name& buyer,
                                 const name& lending_pool,
                                 const uint64_t& position_id,
                                 protection_t& latest,
                                 bool& has_active) {
   protection_t::idx_t protections(get_self(), get_self().value);
   auto by_position = protections.get_index<"byposition"_n>();
   uint128_t key    = (uint128_t(lending_pool.value) << 64) | position_id;

   bool found = false;
   has_active = false;
   for (auto itr = by_position.lower_bound(key); itr != by_position.end() && itr->by_position() == key; ++itr) {
      if (itr->buyer != buyer) continue;
      if (!itr->expired) has_active = true;
      if (!found || itr->id > latest.id) {
         latest = *itr;
         found  = true;
      }
   }
   return found;
}

premium_quote cds_pool::_quote(const name& lending_pool, const asset& protection_amount, const uint32_t& duration_sec) {
   auto leverage  = calc_leverage_ratio(_gstate.total_stoken_underlying.amount, _gstate.total_protection.amount);
   auto buyer_apr = cds_refpools::get_buyer_apr(_gstate.refpools_contract, lending_pool);
   return calc_premium(duration_sec,
                       protection_amount.amount,
                       buyer_apr,
                       leverage,
                       _gstate.total_stoken_underlying.amount,
                       _gstate.total_protection.amount,
                       _gstate.params);
}

asset cds_pool::_shares_from_amount(const asset& amount) const {
   if (_gstate.total_shares.amount == 0) {
      return asset(amount.amount, _gstate.share_symbol);
   }
   CHECKC(_gstate.total_stoken_underlying.amount > 0, err::INSUFFICIENT_CAPITAL, "pool has no backing capital")
   int128_t numerator   = (int128_t)amount.amount * _gstate.total_shares.amount;
   int64_t  share_value = static_cast<int64_t>(numerator / _gstate.total_stoken_underlying.amount);
   CHECKC(share_value > 0, err::NOT_POSITIVE, "deposit amount too small")
   return asset(share_value, _gstate.share_symbol);
}

asset cds_pool::_amount_from_shares(const asset& shares) const {
   const auto& sym = _gstate.total_stoken_underlying.symbol;
   if (_gstate.total_shares.amount == 0) return asset(0, sym);
   int128_t numerator    = (int128_t)shares.amount * _gstate.total_stoken_underlying.amount;
   int64_t  asset_amount = static_cast<int64_t>(numerator / _gstate.total_shares.amount);
   return asset(asset_amount, sym);
}

void cds_pool::_mint(const name& owner, const asset& shares) {
   update_checkpoints(_gstate.supply_checkpoints, _gstate.snapshot_id, _gstate.total_shares.amount);
   _gstate.total_shares += shares;

   seller_t::idx_t sellers(get_self(), get_self().value);
   auto itr = sellers.find(owner.value);
   if (itr == sellers.end()) {
      sellers.emplace(get_self(), [&](auto& row) {
         row.owner = owner;
         update_checkpoints(row.checkpoints, _gstate.snapshot_id, 0);
         row.shares     = shares;
         row.updated_at = current_time_point();
      });
   } else {
      sellers.modify(itr, same_payer, [&](auto& row) {
         update_checkpoints(row.checkpoints, _gstate.snapshot_id, row.shares.amount);
         row.shares    += shares;
         row.updated_at = current_time_point();
      });
   }
}

void cds_pool::_burn(const name& owner, const asset& shares) {
   seller_t::idx_t sellers(get_self(), get_self().value);
   auto itr = sellers.find(owner.value);
   CHECKC(itr != sellers.end() && itr->shares >= shares, err::INSUFFICIENT_BALANCE, "insufficient shares")

   update_checkpoints(_gstate.supply_checkpoints, _gstate.snapshot_id, _gstate.total_shares.amount);
   _gstate.total_shares -= shares;

   sellers.modify(itr, same_payer, [&](auto& row) {
      update_checkpoints(row.checkpoints, _gstate.snapshot_id, row.shares.amount);
      row.shares    -= shares;
      row.updated_at = current_time_point();
   });
   _cap_withdrawal_requests(owner, itr->shares);
}

void cds_pool::_move_shares(const name& from, const name& to, const asset& shares) {
   seller_t::idx_t sellers(get_self(), get_self().value);
   auto from_itr = sellers.find(from.value);
   CHECKC(from_itr != sellers.end() && from_itr->shares >= shares, err::INSUFFICIENT_BALANCE, "insufficient shares")

   sellers.modify(from_itr, same_payer, [&](auto& row) {
      update_checkpoints(row.checkpoints, _gstate.snapshot_id, row.shares.amount);
      row.shares    -= shares;
      row.updated_at = current_time_point();
   });

   auto to_itr = sellers.find(to.value);
   if (to_itr == sellers.end()) {
      sellers.emplace(get_self(), [&](auto& row) {
         row.owner = to;
         update_checkpoints(row.checkpoints, _gstate.snapshot_id, 0);
         row.shares     = shares;
         row.updated_at = current_time_point();
      });
   } else {
      sellers.modify(to_itr, same_payer, [&](auto& row) {
         update_checkpoints(row.checkpoints, _gstate.snapshot_id, row.shares.amount);
         row.shares    += shares;
         row.updated_at = current_time_point();
      });
   }
}

// pending requests never exceed what the owner still holds
void cds_pool::_cap_withdrawal_requests(const name& owner, const asset& balance) {
   wdtotal_t::idx_t totals(get_self(), get_self().value);
   auto first = _gstate.cycle.index;
   for (auto cycle_index = first; cycle_index <= first + 2; ++cycle_index) {
      wdrequest_t::idx_t requests(get_self(), cycle_index);
      auto itr = requests.find(owner.value);
      if (itr == requests.end()) continue;

      auto total_itr = totals.find(cycle_index);
      withdrawal_slot slot;
      slot.requested = itr->shares.amount;
      if (total_itr != totals.end()) slot.cycle_total = total_itr->total_requested.amount;
      if (cap_request(slot, balance.amount) == 0) continue;

      if (slot.requested == 0) {
         requests.erase(itr);
      } else {
         requests.modify(itr, same_payer, [&](auto& row) { row.shares.amount = slot.requested; });
      }
      if (total_itr != totals.end()) {
         totals.modify(total_itr, same_payer, [&](auto& row) { row.total_requested.amount = slot.cycle_total; });
      }
   }
}

pool_totals cds_pool::_totals() const {
   pool_totals totals;
   totals.capital    = _gstate.total_stoken_underlying.amount;
   totals.protection = _gstate.total_protection.amount;
   return totals;
}

void cds_pool::_set_totals(const pool_totals& totals) {
   _gstate.total_stoken_underlying.amount = totals.capital;
   _gstate.total_protection.amount        = totals.protection;
}

lending_exposure cds_pool::_exposure_of(const lendrecord_t& record) {
   lending_exposure exposure;
   exposure.protection = record.total_protection.amount;
   exposure.locked     = record.locked;
   return exposure;
}

asset cds_pool::_balance_of(const name& owner) const {
   seller_t::idx_t sellers(get_self(), get_self().value);
   auto itr = sellers.find(owner.value);
   if (itr == sellers.end()) return asset(0, _gstate.share_symbol);
   return itr->shares;
}

void cds_pool::_check_not_paused() const {
   CHECKC(!_gstate.paused, err::PAUSED, "pool paused")
}

void cds_pool::notifyinit(const name& admin, const extended_symbol& underlying, const symbol& share_symbol) {
   require_auth(get_self());
   require_recipient(get_self());
}

void cds_pool::notifybuy(const protection_t& protection, const bool& renewal) {
   require_auth(get_self());
   require_recipient(get_self());
}

void cds_pool::notifyexpire(const uint64_t& protection_id, const name& buyer, const name& lending_pool) {
   require_auth(get_self());
   require_recipient(get_self());
}

void cds_pool::notifydepo(const name& owner, const asset& quantity, const asset& shares) {
   require_auth(get_self());
   require_recipient(get_self());
}

void cds_pool::notifyreqwd(const name& owner, const asset& shares, const uint64_t& cycle_index) {
   require_auth(get_self());
   require_recipient(get_self());
}

void cds_pool::notifywdraw(const name& owner, const asset& shares, const asset& quantity) {
   require_auth(get_self());
   require_recipient(get_self());
}

void cds_pool::notifyaccr(const name& lending_pool, const asset& accrued, const asset& total_accrued) {
   require_auth(get_self());
   require_recipient(get_self());
}

void cds_pool::notifylock(const name& lending_pool, const uint64_t& snapshot_id, const asset& locked) {
   require_auth(get_self());
   require_recipient(get_self());
}

void cds_pool::notifyunlock(const name& lending_pool, const asset& protection) {
   require_auth(get_self());
   require_recipient(get_self());
}

void cds_pool::notifyphase(const uint8_t& phase) {
   require_auth(get_self());
   require_recipient(get_self());
}

} // namespace cdsfi
