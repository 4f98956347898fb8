#pragma once

#include <eosio/action.hpp>
#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/singleton.hpp>

#include <string>
#include <vector>

#include <cds.defstate/cds.defstate.db.hpp>

namespace cdsfi {

using std::string;
using std::vector;

using namespace eosio;

/**
 * The `cds.defstate` contract tracks, for every registered protection pool and every
 * lending pool in its basket, the status of that lending pool. Assessment reads the
 * reference lending pools, advances each status and calls back into the protection pool
 * to lock or unlock capital. Unlocked capital is claimed by the sellers who held shares
 * when it was locked.
 */
class [[eosio::contract("cds.defstate")]] cds_defstate : public contract {
public:
   using contract::contract;

   cds_defstate(name receiver, name code, datastream<const char*> ds)
   : contract(receiver, code, ds),
     _global(get_self(), get_self().value) {
      _gstate = _global.exists() ? _global.get() : defstate_global_t{};
   }

   ~cds_defstate() {
      _global.set(_gstate, get_self());
   }

   //admin
   ACTION init(const name& admin, const name& registrar);
   ACTION setconfig(const uint32_t& confirm_payments, const uint32_t& default_missed_periods);

   //registrar
   ACTION registerpool(const name& pool);

   //anyone
   ACTION assessstates();
   ACTION assessbatch(const vector<name>& pools);

   //protection pool
   ACTION onlocked(const name& pool, const name& lending_pool, const uint64_t& snapshot_id, const asset& amount);
   ACTION calcclaim(const name& pool, const name& seller, const name& receiver);

   //views
   [[eosio::action]] asset getclaimable(const name& pool, const name& seller);
   [[eosio::action]] uint8_t getlpstatus(const name& pool, const name& lending_pool);

   //notifications
   ACTION notifyassess(const name& pool, const time_point_sec& assessed_at);
   using notifyassess_action  = action_wrapper<"notifyassess"_n, &cds_defstate::notifyassess>;
   ACTION notifystatus(const name& pool, const name& lending_pool, const uint8_t& from, const uint8_t& to);
   using notifystatus_action  = action_wrapper<"notifystatus"_n, &cds_defstate::notifystatus>;
   ACTION notifyclaim(const name& pool, const name& seller, const asset& quantity);
   using notifyclaim_action   = action_wrapper<"notifyclaim"_n,  &cds_defstate::notifyclaim>;

   // status of a lending pool as tracked for one protection pool
   static lending_pool_status get_managed_status( const name& defstate_contract, const name& pool, const name& lending_pool ) {
      lendstate_t::idx_t states( defstate_contract, pool.value );
      auto itr = states.find( lending_pool.value );
      if( itr == states.end() ) return lending_pool_status::NotSupported;
      return lending_pool_status( itr->state.status );
   }

private:
   defstate_global_singleton    _global;
   defstate_global_t            _gstate;

   void _assess_pool(poolstate_t::idx_t& pools, poolstate_t::idx_t::const_iterator itr, const uint64_t& now);
   void _require_registered(const name& pool);
   int128_t _calc_claimable(const name& pool, const name& seller, map<name, uint64_t>& last_claimed);
};

} // namespace cdsfi
