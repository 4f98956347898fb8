#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/singleton.hpp>
#include <eosio/time.hpp>

#include <string>
#include <vector>

#include <cdsfi/errors.hpp>
#include <cdsfi/leverage.hpp>
#include <cdsfi/pool_cycle.hpp>
#include <cdsfi/pool_params.hpp>
#include <cdsfi/snapshot.hpp>

namespace cdsfi {

using namespace eosio;
using std::string;
using std::vector;

#define CHECKC(exp, code, msg) \
   { if (!(exp)) eosio::check(false, std::string("[[") + std::to_string((int)code) + std::string("]] ") + msg); }

#define POOL_TBL struct [[eosio::table, eosio::contract("cds.pool")]]
#define POOL_NTBL(name) struct [[eosio::table(name), eosio::contract("cds.pool")]]

// =====================================================
// 全局配置
// =====================================================
POOL_NTBL("global") pool_global_t {
    name                admin;
    name                refpools_contract;                      // basket of reference lending pools
    name                defstate_contract;                      // only caller of lock/unlock
    extended_symbol     underlying;                             // settlement token
    symbol              share_symbol;
    pool_params         params;
    uint64_t            params_version = 0;                     // +1 on every setparams
    uint8_t             phase = 0;                              // pool_phase
    pool_cycle          cycle;
    bool                paused = false;

    asset               total_stoken_underlying;                // capital backing the shares
    asset               total_premium;                          // premium collected
    asset               total_premium_accrued;                  // premium earned so far
    asset               total_protection;                       // protection outstanding
    asset               total_shares;
    vector<checkpoint>  supply_checkpoints;
    uint64_t            snapshot_id = 0;                        // latest snapshot taken
    uint64_t            last_protection_id = 0;

    EOSLIB_SERIALIZE( pool_global_t, (admin)(refpools_contract)(defstate_contract)(underlying)(share_symbol)
                                     (params)(params_version)(phase)(cycle)(paused)
                                     (total_stoken_underlying)(total_premium)(total_premium_accrued)
                                     (total_protection)(total_shares)(supply_checkpoints)
                                     (snapshot_id)(last_protection_id) )
};
typedef eosio::singleton< "global"_n, pool_global_t > pool_global_singleton;

// 卖方份额
//scope: self
POOL_TBL seller_t {
    name                owner;
    asset               shares;
    vector<checkpoint>  checkpoints;                            // balance at past snapshots
    time_point_sec      updated_at;

    seller_t() {}
    seller_t(const name& o): owner(o) {}

    uint64_t primary_key() const { return owner.value; }

    typedef eosio::multi_index< "sellers"_n, seller_t > idx_t;

    EOSLIB_SERIALIZE( seller_t, (owner)(shares)(checkpoints)(updated_at) )
};

// 提取申请
//scope: cycle index the request becomes withdrawable in
POOL_TBL wdrequest_t {
    name                owner;
    asset               shares;
    time_point_sec      requested_at;

    wdrequest_t() {}
    wdrequest_t(const name& o): owner(o) {}

    uint64_t primary_key() const { return owner.value; }

    typedef eosio::multi_index< "wdrequests"_n, wdrequest_t > idx_t;

    EOSLIB_SERIALIZE( wdrequest_t, (owner)(shares)(requested_at) )
};

//scope: self
POOL_TBL wdtotal_t {
    uint64_t            cycle_index = 0;
    asset               total_requested;

    wdtotal_t() {}
    wdtotal_t(const uint64_t& i): cycle_index(i) {}

    uint64_t primary_key() const { return cycle_index; }

    typedef eosio::multi_index< "wdtotals"_n, wdtotal_t > idx_t;

    EOSLIB_SERIALIZE( wdtotal_t, (cycle_index)(total_requested) )
};

// 借贷池敞口
//scope: self
POOL_TBL lendrecord_t {
    name                lending_pool;
    name                protocol;
    time_point_sec      added_at;
    time_point_sec      purchase_limit_at;
    time_point_sec      last_accrued_at;
    asset               total_premium;
    asset               total_protection;                       // protection outstanding on this pool
    bool                locked = false;
    vector<uint64_t>    active_protections;

    lendrecord_t() {}
    lendrecord_t(const name& lp): lending_pool(lp) {}

    uint64_t primary_key() const { return lending_pool.value; }

    typedef eosio::multi_index< "lendrecords"_n, lendrecord_t > idx_t;

    EOSLIB_SERIALIZE( lendrecord_t, (lending_pool)(protocol)(added_at)(purchase_limit_at)(last_accrued_at)
                                    (total_premium)(total_protection)(locked)(active_protections) )
};

// 保护仓位
//scope: self
POOL_TBL protection_t {
    uint64_t            id = 0;                                 // starts at 1
    name                buyer;
    asset               premium;
    time_point_sec      started_at;
    int128_t            k = 0;                                  // accrual curve constants
    int128_t            lambda = 0;
    name                lending_pool;
    uint64_t            position_id = 0;                        // lending position insured
    asset               protection_amount;
    uint32_t            duration_sec = 0;
    bool                is_min_premium = false;
    bool                expired = false;

    protection_t() {}
    protection_t(const uint64_t& i): id(i) {}

    uint64_t primary_key() const { return id; }
    uint64_t by_buyer() const { return buyer.value; }
    uint128_t by_position() const { return (uint128_t(lending_pool.value) << 64) | position_id; }

    uint64_t expires_at() const { return started_at.sec_since_epoch() + duration_sec; }

    typedef eosio::multi_index< "protections"_n, protection_t,
        indexed_by<"bybuyer"_n,    const_mem_fun<protection_t, uint64_t,  &protection_t::by_buyer>>,
        indexed_by<"byposition"_n, const_mem_fun<protection_t, uint128_t, &protection_t::by_position>>
    > idx_t;

    EOSLIB_SERIALIZE( protection_t, (id)(buyer)(premium)(started_at)(k)(lambda)
                                    (lending_pool)(position_id)(protection_amount)(duration_sec)
                                    (is_min_premium)(expired) )
};

} // namespace cdsfi
