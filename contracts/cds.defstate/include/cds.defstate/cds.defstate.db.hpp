#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/singleton.hpp>
#include <eosio/time.hpp>

#include <map>
#include <string>
#include <vector>

#include <cdsfi/default_state.hpp>
#include <cdsfi/errors.hpp>
#include <cdsfi/locked_capital.hpp>

namespace cdsfi {

using namespace eosio;
using std::map;
using std::string;
using std::vector;

#define CHECKC(exp, code, msg) \
   { if (!(exp)) eosio::check(false, std::string("[[") + std::to_string((int)code) + std::string("]] ") + msg); }

#define DEFSTATE_TBL struct [[eosio::table, eosio::contract("cds.defstate")]]
#define DEFSTATE_NTBL(name) struct [[eosio::table(name), eosio::contract("cds.defstate")]]

DEFSTATE_NTBL("global") defstate_global_t {
    name                admin;
    name                registrar;                              // may register protection pools
    default_config      conf;

    EOSLIB_SERIALIZE( defstate_global_t, (admin)(registrar)(conf) )
};
typedef eosio::singleton< "global"_n, defstate_global_t > defstate_global_singleton;

// 已注册保护池
//scope: self
DEFSTATE_TBL poolstate_t {
    name                pool;
    name                refpools;                               // basket the pool sells protection on
    time_point_sec      registered_at;
    time_point_sec      updated_at;                             // last assessment

    poolstate_t() {}
    poolstate_t(const name& p): pool(p) {}

    uint64_t primary_key() const { return pool.value; }

    typedef eosio::multi_index< "poolstates"_n, poolstate_t > idx_t;

    EOSLIB_SERIALIZE( poolstate_t, (pool)(refpools)(registered_at)(updated_at) )
};

// 借贷池状态
//scope: pool
DEFSTATE_TBL lendstate_t {
    name                        lending_pool;
    lending_pool_state          state;
    vector<locked_capital>      locked_capitals;                // one per lock, oldest first
    time_point_sec              updated_at;

    lendstate_t() {}
    lendstate_t(const name& lp): lending_pool(lp) {}

    uint64_t primary_key() const { return lending_pool.value; }

    typedef eosio::multi_index< "lendstates"_n, lendstate_t > idx_t;

    EOSLIB_SERIALIZE( lendstate_t, (lending_pool)(state)(locked_capitals)(updated_at) )
};

// 卖方领取进度
//scope: pool
DEFSTATE_TBL claim_t {
    name                        seller;
    map<name, uint64_t>         last_claimed;                   // lending pool -> snapshot id

    claim_t() {}
    claim_t(const name& s): seller(s) {}

    uint64_t primary_key() const { return seller.value; }

    typedef eosio::multi_index< "claims"_n, claim_t > idx_t;

    EOSLIB_SERIALIZE( claim_t, (seller)(last_claimed) )
};

} // namespace cdsfi
