#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/singleton.hpp>
#include <eosio/time.hpp>

#include <string>

#include <cdsfi/errors.hpp>
#include <cdsfi/lending_status.hpp>

namespace cdsfi {

using namespace eosio;
using std::string;

#define CHECKC(exp, code, msg) \
   { if (!(exp)) eosio::check(false, std::string("[[") + std::to_string((int)code) + std::string("]] ") + msg); }

#define REFPOOLS_TBL struct [[eosio::table, eosio::contract("cds.refpools")]]
#define REFPOOLS_NTBL(name) struct [[eosio::table(name), eosio::contract("cds.refpools")]]

REFPOOLS_NTBL("global") refpools_global_t {
    name                admin;
    uint32_t            late_grace_sec = DAY_SECONDS;           // grace after a missed payment

    EOSLIB_SERIALIZE( refpools_global_t, (admin)(late_grace_sec) )
};
typedef eosio::singleton< "global"_n, refpools_global_t > refpools_global_singleton;

//scope: self
REFPOOLS_TBL seer_t {
    name                seer;

    seer_t() {}
    seer_t(const name& s): seer(s) {}

    uint64_t primary_key() const { return seer.value; }

    typedef eosio::multi_index< "seers"_n, seer_t > idx_t;

    EOSLIB_SERIALIZE( seer_t, (seer) )
};

//scope: self
REFPOOLS_TBL lendpool_t {
    name                lending_pool;
    name                protocol;                               // goldfinch, ...
    time_point_sec      added_at;
    time_point_sec      purchase_limit_at;                      // new buyers accepted until
    uint32_t            payment_period_sec = 0;
    time_point_sec      term_end_at;
    time_point_sec      last_payment_at;
    int64_t             balance = 0;                            // outstanding loan, settlement units
    uint64_t            interest_apr = 0;                       // 10^18 scale
    uint64_t            protocol_fee_pct = 0;                   // 10^18 scale
    bool                defaulted = false;
    time_point_sec      updated_at;

    lendpool_t() {}
    lendpool_t(const name& lp): lending_pool(lp) {}

    uint64_t primary_key() const { return lending_pool.value; }

    lending_pool_feed feed() const {
        lending_pool_feed f;
        f.supported           = true;
        f.defaulted           = defaulted;
        f.balance             = balance;
        f.last_payment_at     = last_payment_at.sec_since_epoch();
        f.payment_period_sec  = payment_period_sec;
        f.term_end_at         = term_end_at.sec_since_epoch();
        return f;
    }

    typedef eosio::multi_index< "lendpools"_n, lendpool_t > idx_t;

    EOSLIB_SERIALIZE( lendpool_t, (lending_pool)(protocol)(added_at)(purchase_limit_at)
                                  (payment_period_sec)(term_end_at)(last_payment_at)
                                  (balance)(interest_apr)(protocol_fee_pct)(defaulted)(updated_at) )
};

//scope: lending_pool
REFPOOLS_TBL lendpos_t {
    uint64_t            id = 0;                                 // position id in the lending protocol
    name                owner;
    int64_t             remaining_principal = 0;
    time_point_sec      updated_at;

    lendpos_t() {}
    lendpos_t(const uint64_t& i): id(i) {}

    uint64_t primary_key() const { return id; }

    typedef eosio::multi_index< "lendpos"_n, lendpos_t > idx_t;

    EOSLIB_SERIALIZE( lendpos_t, (id)(owner)(remaining_principal)(updated_at) )
};

struct lendpool_status_info {
    name                lending_pool;
    uint8_t             status = 0;

    EOSLIB_SERIALIZE( lendpool_status_info, (lending_pool)(status) )
};

} // namespace cdsfi
