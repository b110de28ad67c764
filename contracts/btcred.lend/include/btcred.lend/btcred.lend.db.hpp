#pragma once

#include <eosio/asset.hpp>
#include <eosio/crypto.hpp>
#include <eosio/singleton.hpp>
#include <eosio/system.hpp>
#include <eosio/time.hpp>

#include <btcred.const.hpp>

#include <string>
#include <string_view>

namespace btcred {

using namespace std;
using namespace eosio;

//transfer memos
static constexpr string_view    MEMO_DEPOSIT        = "deposit";        //deposit:<id hex>, collateral token
static constexpr string_view    MEMO_REPAY          = "repay";          //borrow token
static constexpr string_view    MEMO_LIQUIDATE      = "liquidate";      //liquidate:<owner>, borrow token
static constexpr string_view    MEMO_LIQUIDITY      = "liquidity";      //borrow token, admin only

#define LEND_TBL struct [[eosio::table, eosio::contract("btcred.lend")]]
#define LEND_NTBL(name) struct [[eosio::table(name), eosio::contract("btcred.lend")]]

LEND_NTBL("global") lend_global_t {
    name                admin;
    name                score_registry;                         //btcred.score account
    extended_symbol     collateral_token;
    extended_symbol     borrow_token;
    uint64_t            interest_ratio          = 0;            //annual, bps: 5% = 500

    asset               total_collateral;                       //collateral_token symbol
    asset               total_borrowed;                         //borrow_token symbol
    asset               available_liquidity;                    //borrow_token symbol
    bool                enabled                 = false;        //set by init

    EOSLIB_SERIALIZE( lend_global_t, (admin)(score_registry)(collateral_token)(borrow_token)(interest_ratio)
                                     (total_collateral)(total_borrowed)(available_liquidity)(enabled) )
};
typedef eosio::singleton< "global"_n, lend_global_t > lend_global_singleton;

//Scope: _self
//Note: rows are kept after full repayment or liquidation
LEND_TBL position_t {
    name                owner;                          //PK
    asset               collateral;                     //collateral_token symbol
    asset               principal;                      //borrow_token symbol, interest settled up to borrowed_at
    time_point_sec      borrowed_at;                    //0 when there is no principal
    checksum256         score_hash;                     //linked score id, zero before first deposit
    uint64_t            cached_ratio    = 0;            //ratio applied at the last deposit or borrow
    time_point_sec      created_at;

    position_t() {}
    position_t(const name& o): owner(o) {}

    uint64_t primary_key()const { return owner.value; }

    bool has_score()const { return score_hash != checksum256(); }

    typedef eosio::multi_index< "positions"_n, position_t > tbl_t;

    EOSLIB_SERIALIZE( position_t, (owner)(collateral)(principal)(borrowed_at)(score_hash)(cached_ratio)(created_at) )
};

} //namespace btcred
