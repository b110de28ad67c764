#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>

#include <string>

#define TRANSFER(bank, to, quantity, memo) \
    {	btcred::token::transfer_action act{ bank, { {_self, active_perm} } };\
            act.send( _self, to, quantity , memo );}

namespace btcred {

    using std::string;
    using namespace eosio;

    /**
     * Transfer interface of an eosio.token compatible contract.
     * Only declared here so that pool payouts can be sent as inline actions;
     * inbound funds arrive through the token's transfer notification.
     */
    class [[eosio::contract("token")]] token : public contract {
    public:
        using contract::contract;

        [[eosio::action]]
        void transfer(const name& from, const name& to, const asset& quantity, const string& memo);

        using transfer_action = eosio::action_wrapper<"transfer"_n, &token::transfer>;
    };

} //namespace btcred
