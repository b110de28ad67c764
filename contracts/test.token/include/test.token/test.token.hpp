#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/singleton.hpp>
#include <string>

namespace btcred {

    using std::string;
    using namespace eosio;

    /**
     * Single-symbol fungible token used as the collateral and borrow token
     * collaborator in the lending pool tests. One deployment carries one symbol;
     * only the issuer can mint and it mints into its own balance.
     */
    class [[eosio::contract("test.token")]] test_token : public contract
    {
    public:
        using contract::contract;

        test_token(eosio::name receiver, eosio::name code, datastream<const char*> ds):
            contract(receiver, code, ds), _global(_self, _self.value)
        {
            _g = _global.exists() ? _global.get() : global_t{};
        }

        ~test_token() { _global.set( _g, get_self() ); }

        ACTION init(const name& issuer, const asset& max_supply) {
            require_auth( _self );
            check( is_account(issuer), "issuer account does not exist" );
            check( max_supply.is_valid() && max_supply.amount > 0, "invalid max supply" );
            check( !_g.max_supply.symbol.is_valid(), "token already initialized" );

            _g.issuer       = issuer;
            _g.max_supply   = max_supply;
            _g.supply       = asset(0, max_supply.symbol);
        }

        /**
         * @param to - must be the issuer
         */
        ACTION issue(const name& to, const asset& quantity, const string& memo);

        /**
         * Moves `quantity` from `from` to `to` and notifies both accounts.
         */
        ACTION transfer(const name& from, const name& to, const asset& quantity, const string& memo);

        static asset get_balance(const name& token_contract_account, const name& owner, const symbol_code& sym_code)
        {
            accounts accountstable(token_contract_account, owner.value);
            const auto& ac = accountstable.get(sym_code.raw());
            return ac.balance;
        }

        using transfer_action = eosio::action_wrapper<"transfer"_n, &test_token::transfer>;

    private:
        struct [[eosio::table("global"), eosio::contract("test.token")]] global_t {
            asset supply;
            asset max_supply;
            name issuer;

            EOSLIB_SERIALIZE( global_t, (supply)(max_supply)(issuer) )
        };
        typedef eosio::singleton< "global"_n, global_t > global_singleton;

        struct [[eosio::table, eosio::contract("test.token")]] account
        {
            asset balance;

            uint64_t primary_key() const { return balance.symbol.code().raw(); }

            EOSLIB_SERIALIZE( account, (balance) )
        };
        typedef eosio::multi_index<"accounts"_n, account> accounts;

        void sub_balance(const name& owner, const asset& value);
        void add_balance(const name& owner, const asset& value, const name& ram_payer);

        global_singleton    _global;
        global_t            _g;
    };

}
