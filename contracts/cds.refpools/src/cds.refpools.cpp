#include <cds.refpools/cds.refpools.hpp>

#include <eosio/system.hpp>

namespace cdsfi {

using namespace std;

void cds_refpools::init( const name& admin, const uint32_t& late_grace_sec ) {
   require_auth( get_self() );
   CHECKC( is_account(admin), err::ACCOUNT_INVALID, "admin not exist" )
   CHECKC( late_grace_sec > 0, err::NOT_POSITIVE, "late grace must be positive" )

   _gstate.admin           = admin;
   _gstate.late_grace_sec  = late_grace_sec;
}

void cds_refpools::setgrace( const uint32_t& late_grace_sec ) {
   require_auth( _gstate.admin );
   CHECKC( late_grace_sec > 0, err::NOT_POSITIVE, "late grace must be positive" )
   _gstate.late_grace_sec = late_grace_sec;
}

/**
 * 添加预言人
 */
void cds_refpools::addseer( const name& seer ) {
   require_auth( _gstate.admin );
   CHECKC( is_account(seer), err::ACCOUNT_INVALID, "seer not exist" )

   seer_t::idx_t seers( get_self(), get_self().value );
   CHECKC( seers.find(seer.value) == seers.end(), err::RECORD_EXISTING, "seer account is existing" )
   seers.emplace( get_self(), [&]( auto& s ) { s.seer = seer; });
}

void cds_refpools::delseer( const name& seer ) {
   require_auth( _gstate.admin );

   seer_t::idx_t seers( get_self(), get_self().value );
   auto itr = seers.find( seer.value );
   CHECKC( itr != seers.end(), err::RECORD_NOT_FOUND, "seer account is invalid" )
   seers.erase( itr );
}

void cds_refpools::addlendpool( const name& lending_pool,
                                const name& protocol,
                                const uint32_t& purchase_limit_days,
                                const uint32_t& payment_period_sec,
                                const time_point_sec& term_end_at,
                                const int64_t& balance,
                                const uint64_t& interest_apr,
                                const uint64_t& protocol_fee_pct ) {
   require_auth( _gstate.admin );
   CHECKC( lending_pool.value != 0, err::PARAM_ERROR, "lending pool name required" )
   CHECKC( payment_period_sec > 0, err::NOT_POSITIVE, "payment period must be positive" )
   CHECKC( protocol_fee_pct < HIGH_PRECISION, err::PARAM_ERROR, "protocol fee must be below 100%" )

   lendpool_t::idx_t lendpools( get_self(), get_self().value );
   CHECKC( lendpools.find(lending_pool.value) == lendpools.end(), err::RECORD_EXISTING, "lending pool already added" )

   auto now = current_time_point();
   lendpool_t pool( lending_pool );
   pool.protocol            = protocol;
   pool.added_at            = now;
   pool.purchase_limit_at   = now + eosio::days( purchase_limit_days );
   pool.payment_period_sec  = payment_period_sec;
   pool.term_end_at         = term_end_at;
   pool.last_payment_at     = now;
   pool.balance             = balance;
   pool.interest_apr        = interest_apr;
   pool.protocol_fee_pct    = protocol_fee_pct;
   pool.updated_at          = now;

   // only healthy lending pools can join the basket
   auto status = calc_lending_pool_status( pool.feed(), _gstate.late_grace_sec, now.sec_since_epoch() );
   CHECKC( status == lending_pool_status::Active, err::STATUS_ERROR,
           "lending pool is not active, status: " + to_string( (int)status ) )

   lendpools.emplace( get_self(), [&]( auto& row ) { row = pool; });
}

void cds_refpools::updatepool( const name& seer,
                               const name& lending_pool,
                               const time_point_sec& last_payment_at,
                               const int64_t& balance,
                               const time_point_sec& term_end_at,
                               const bool& defaulted ) {
   _check_seer( seer );
   CHECKC( balance >= 0, err::NOT_POSITIVE, "balance must not be negative" )

   lendpool_t::idx_t lendpools( get_self(), get_self().value );
   auto itr = _require_lendpool( lendpools, lending_pool );
   CHECKC( last_payment_at >= itr->last_payment_at, err::PARAM_ERROR, "last payment cannot move backwards" )
   CHECKC( last_payment_at.sec_since_epoch() <= current_time_point().sec_since_epoch(), err::PARAM_ERROR, "last payment in the future" )
   CHECKC( !itr->defaulted || defaulted, err::STATUS_ERROR, "defaulted lending pool cannot recover" )

   lendpools.modify( itr, same_payer, [&]( auto& row ) {
      row.last_payment_at  = last_payment_at;
      row.balance          = balance;
      row.term_end_at      = term_end_at;
      row.defaulted        = defaulted;
      row.updated_at       = current_time_point();
   });
}

void cds_refpools::setapr( const name& seer, const name& lending_pool, const uint64_t& interest_apr, const uint64_t& protocol_fee_pct ) {
   _check_seer( seer );
   CHECKC( protocol_fee_pct < HIGH_PRECISION, err::PARAM_ERROR, "protocol fee must be below 100%" )

   lendpool_t::idx_t lendpools( get_self(), get_self().value );
   auto itr = _require_lendpool( lendpools, lending_pool );
   lendpools.modify( itr, same_payer, [&]( auto& row ) {
      row.interest_apr     = interest_apr;
      row.protocol_fee_pct = protocol_fee_pct;
      row.updated_at       = current_time_point();
   });
}

void cds_refpools::setposition( const name& seer,
                                const name& lending_pool,
                                const uint64_t& position_id,
                                const name& owner,
                                const int64_t& remaining_principal ) {
   _check_seer( seer );
   CHECKC( remaining_principal >= 0, err::NOT_POSITIVE, "remaining principal must not be negative" )
   CHECKC( is_account(owner), err::ACCOUNT_INVALID, "owner not exist" )

   lendpool_t::idx_t lendpools( get_self(), get_self().value );
   _require_lendpool( lendpools, lending_pool );

   lendpos_t::idx_t positions( get_self(), lending_pool.value );
   auto itr = positions.find( position_id );
   if( itr == positions.end() ) {
      positions.emplace( get_self(), [&]( auto& row ) {
         row.id                  = position_id;
         row.owner               = owner;
         row.remaining_principal = remaining_principal;
         row.updated_at          = current_time_point();
      });
   } else {
      positions.modify( itr, same_payer, [&]( auto& row ) {
         row.owner               = owner;
         row.remaining_principal = remaining_principal;
         row.updated_at          = current_time_point();
      });
   }
}

uint8_t cds_refpools::getstatus( const name& lending_pool ) {
   return (uint8_t)get_lending_pool_status( get_self(), lending_pool, current_time_point().sec_since_epoch() );
}

int64_t cds_refpools::getprincipal( const name& lending_pool, const name& holder, const uint64_t& position_id ) {
   return get_remaining_principal( get_self(), lending_pool, holder, position_id );
}

uint64_t cds_refpools::getbuyerapr( const name& lending_pool ) {
   return (uint64_t)get_buyer_apr( get_self(), lending_pool );
}

bool cds_refpools::canbuy( const name& buyer,
                           const name& lending_pool,
                           const uint64_t& position_id,
                           const int64_t& protection_amount,
                           const bool& has_active_protection ) {
   lendpool_t::idx_t lendpools( get_self(), get_self().value );
   auto itr = lendpools.find( lending_pool.value );
   if( itr == lendpools.end() ) return false;

   auto now    = current_time_point().sec_since_epoch();
   auto status = calc_lending_pool_status( itr->feed(), _gstate.late_grace_sec, now );
   auto code   = check_can_buy_protection( status,
                                           itr->purchase_limit_at.sec_since_epoch(),
                                           get_remaining_principal( get_self(), lending_pool, buyer, position_id ),
                                           protection_amount,
                                           has_active_protection,
                                           now );
   return code == err::NONE;
}

vector<lendpool_status_info> cds_refpools::assessstate() {
   vector<lendpool_status_info> infos;
   auto now = current_time_point().sec_since_epoch();

   lendpool_t::idx_t lendpools( get_self(), get_self().value );
   for( auto itr = lendpools.begin(); itr != lendpools.end(); ++itr ) {
      auto status = calc_lending_pool_status( itr->feed(), _gstate.late_grace_sec, now );
      infos.push_back( { itr->lending_pool, (uint8_t)status } );
   }
   return infos;
}

void cds_refpools::_check_seer( const name& seer ) {
   require_auth( seer );
   seer_t::idx_t seers( get_self(), get_self().value );
   CHECKC( seers.find(seer.value) != seers.end(), err::NO_AUTH, "seer account is invalid" )
}

lendpool_t::idx_t::const_iterator cds_refpools::_require_lendpool( lendpool_t::idx_t& lendpools, const name& lending_pool ) {
   auto itr = lendpools.find( lending_pool.value );
   CHECKC( itr != lendpools.end(), err::RECORD_NOT_FOUND, "lending pool not found: " + lending_pool.to_string() )
   return itr;
}

} //namespace cdsfi
