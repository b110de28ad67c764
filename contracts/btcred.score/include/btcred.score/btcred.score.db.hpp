#pragma once

#include <eosio/asset.hpp>
#include <eosio/crypto.hpp>
#include <eosio/singleton.hpp>
#include <eosio/system.hpp>
#include <eosio/time.hpp>

#include <btcred.const.hpp>

#include <string>

namespace btcred {

using namespace std;
using namespace eosio;

#define SCORE_TBL struct [[eosio::table, eosio::contract("btcred.score")]]
#define SCORE_NTBL(name) struct [[eosio::table(name), eosio::contract("btcred.score")]]

SCORE_NTBL("global") score_global_t {
    name                admin;
    uint64_t            last_score_id           = 0;
    bool                enabled                 = false;        //set by init

    EOSLIB_SERIALIZE( score_global_t, (admin)(last_score_id)(enabled) )
};
typedef eosio::singleton< "global"_n, score_global_t > score_global_singleton;

//Scope: _self
//Note: rows are never erased, score == 0 is never stored
SCORE_TBL score_t {
    uint64_t            id;                             //PK
    checksum256         hash;                           //sha256 of the btc address
    uint16_t            score           = 0;
    name                owner;                          //registering account
    time_point_sec      last_updated;

    score_t() {}
    score_t(const uint64_t& i): id(i) {}

    uint64_t    primary_key()const { return id; }
    checksum256 by_hash()const { return hash; }

    typedef eosio::multi_index< "scores"_n, score_t,
        indexed_by<"byhash"_n, const_mem_fun<score_t, checksum256, &score_t::by_hash>>
    > idx_t;

    EOSLIB_SERIALIZE( score_t, (id)(hash)(score)(owner)(last_updated) )
};

//Scope: _self
SCORE_TBL scorer_t {
    name                account;                        //PK
    time_point_sec      approved_at;

    scorer_t() {}
    scorer_t(const name& a): account(a) {}

    uint64_t primary_key()const { return account.value; }

    typedef eosio::multi_index< "scorers"_n, scorer_t > idx_t;

    EOSLIB_SERIALIZE( scorer_t, (account)(approved_at) )
};

} //namespace btcred
