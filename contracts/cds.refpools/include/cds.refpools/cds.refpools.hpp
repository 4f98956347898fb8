#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/action.hpp>

#include <string>
#include <vector>

#include <cds.refpools/cds.refpools.db.hpp>

namespace cdsfi {

using std::string;
using std::vector;

using namespace eosio;

/**
 * The `cds.refpools` contract is the basket of reference lending pools a protection pool
 * sells protection on. Seers feed it the state of every external lending pool (payments,
 * outstanding balance, default flag) and of the insured lending positions; from that it
 * reports lending pool status, remaining principal and buyer APR.
 *
 * The static helpers read the tables of a deployed `cds.refpools` account and are used by
 * the protection pool and the default state manager.
 */
class [[eosio::contract("cds.refpools")]] cds_refpools : public contract {
   public:
      using contract::contract;

   cds_refpools(eosio::name receiver, eosio::name code, datastream<const char*> ds): contract(receiver, code, ds),
        _global(get_self(), get_self().value)
    {
      _gstate = _global.exists() ? _global.get() : refpools_global_t{};
    }

    ~cds_refpools() { _global.set( _gstate, get_self() ); }

   //admin
   ACTION init( const name& admin, const uint32_t& late_grace_sec );
   ACTION setgrace( const uint32_t& late_grace_sec );
   ACTION addseer( const name& seer );
   ACTION delseer( const name& seer );
   ACTION addlendpool( const name& lending_pool,
                       const name& protocol,
                       const uint32_t& purchase_limit_days,
                       const uint32_t& payment_period_sec,
                       const time_point_sec& term_end_at,
                       const int64_t& balance,
                       const uint64_t& interest_apr,
                       const uint64_t& protocol_fee_pct );

   //seer
   ACTION updatepool( const name& seer,
                      const name& lending_pool,
                      const time_point_sec& last_payment_at,
                      const int64_t& balance,
                      const time_point_sec& term_end_at,
                      const bool& defaulted );
   ACTION setapr( const name& seer, const name& lending_pool, const uint64_t& interest_apr, const uint64_t& protocol_fee_pct );
   ACTION setposition( const name& seer,
                       const name& lending_pool,
                       const uint64_t& position_id,
                       const name& owner,
                       const int64_t& remaining_principal );

   //views
   [[eosio::action]] uint8_t getstatus( const name& lending_pool );
   [[eosio::action]] int64_t getprincipal( const name& lending_pool, const name& holder, const uint64_t& position_id );
   [[eosio::action]] uint64_t getbuyerapr( const name& lending_pool );
   [[eosio::action]] bool canbuy( const name& buyer,
                                  const name& lending_pool,
                                  const uint64_t& position_id,
                                  const int64_t& protection_amount,
                                  const bool& has_active_protection );
   [[eosio::action]] vector<lendpool_status_info> assessstate();

   static lending_pool_status get_lending_pool_status( const name& refpools_contract, const name& lending_pool, const uint64_t& now ) {
      lendpool_t::idx_t lendpools( refpools_contract, refpools_contract.value );
      auto itr = lendpools.find( lending_pool.value );
      if( itr == lendpools.end() ) return lending_pool_status::NotSupported;
      return calc_lending_pool_status( itr->feed(), get_late_grace( refpools_contract ), now );
   }

   static uint32_t get_late_grace( const name& refpools_contract ) {
      refpools_global_singleton global( refpools_contract, refpools_contract.value );
      return global.exists() ? global.get().late_grace_sec : refpools_global_t{}.late_grace_sec;
   }

   static int64_t get_remaining_principal( const name& refpools_contract, const name& lending_pool, const name& holder, const uint64_t& position_id ) {
      lendpos_t::idx_t positions( refpools_contract, lending_pool.value );
      auto itr = positions.find( position_id );
      if( itr == positions.end() || itr->owner != holder ) return 0;
      return itr->remaining_principal;
   }

   static int128_t get_buyer_apr( const name& refpools_contract, const name& lending_pool ) {
      lendpool_t::idx_t lendpools( refpools_contract, refpools_contract.value );
      auto itr = lendpools.find( lending_pool.value );
      if( itr == lendpools.end() ) return 0;
      return calc_buyer_apr( itr->interest_apr, itr->protocol_fee_pct );
   }

   private:
      refpools_global_singleton    _global;
      refpools_global_t            _gstate;

      void _check_seer( const name& seer );
      lendpool_t::idx_t::const_iterator _require_lendpool( lendpool_t::idx_t& lendpools, const name& lending_pool );
};

} //namespace cdsfi
