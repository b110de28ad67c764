#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/permission.hpp>
#include <eosio/action.hpp>

#include <string>

#include <btcred.lend/btcred.lend.db.hpp>

namespace btcred {

using std::string;
using std::vector;

using namespace eosio;

enum class err: uint8_t {
   NONE                    = 0,
   RECORD_NOT_FOUND        = 1,
   RECORD_EXISTING         = 2,
   CONTRACT_MISMATCH       = 3,
   SYMBOL_MISMATCH         = 4,
   MEMO_FORMAT_ERROR       = 6,
   PAUSED                  = 7,
   NO_AUTH                 = 8,
   NOT_POSITIVE            = 9,
   OVERSIZED               = 11,
   ACCOUNT_INVALID         = 15,
   ADMIN_ONLY              = 24,
   NO_VALID_SCORE          = 25,
   NO_SCORE_LINKED         = 26,
   EXCEEDS_CAPACITY        = 27,
   INSUFFICIENT_LIQUIDITY  = 28,
   NO_DEBT                 = 29,
   DEBT_OUTSTANDING        = 30,
   POSITION_HEALTHY        = 31,
   TRANSFER_FAILED         = 32,
   SYSTEM_ERROR            = 200
};

/**
 * The `btcred.lend` contract is a single-asset lending pool. Borrowers lock the
 * collateral token against a registered bitcoin credibility score and borrow
 * the borrow token up to `collateral * 10000 / ratio`, where the ratio comes
 * from the score registry. Debt accrues simple interest at `interest_ratio`.
 *
 * Funds come in as token transfers with a memo:
 *    collateral token: "deposit:<score id hex>"
 *    borrow token:     "repay" | "liquidate:<owner>" | "liquidity" (admin)
 * and go out as inline transfers signed by the pool.
 */
class [[eosio::contract("btcred.lend")]] btcred_lend : public contract {
   public:
      using contract::contract;

   btcred_lend(eosio::name receiver, eosio::name code, datastream<const char*> ds): contract(receiver, code, ds),
        _global(get_self(), get_self().value)
    {
      _gstate = _global.exists() ? _global.get() : lend_global_t{};
    }

    ~btcred_lend() { _global.set( _gstate, get_self() ); }

   [[eosio::on_notify("*::transfer")]]
   void ontransfer( const name& from, const name& to, const asset& quant, const string& memo );

   //admin
   ACTION init( const name& admin, const name& score_registry,
                const extended_symbol& collateral_token, const extended_symbol& borrow_token,
                const uint64_t& interest_ratio );

   //user
   ACTION borrow( const name& owner, const asset& quantity );
   ACTION withdraw( const name& owner, const asset& quantity );

   //read out, always aborts with the result
   ACTION tgetpos( const name& owner );
   ACTION tgetpool();

   ACTION ondeposit( const name& owner, const asset& quantity, const checksum256& id );
   using ondeposit_action     = action_wrapper<"ondeposit"_n,    &btcred_lend::ondeposit>;

   ACTION onborrow( const name& owner, const asset& quantity, const uint64_t& ratio );
   using onborrow_action      = action_wrapper<"onborrow"_n,     &btcred_lend::onborrow>;

   ACTION onrepay( const name& owner, const asset& quantity );
   using onrepay_action       = action_wrapper<"onrepay"_n,      &btcred_lend::onrepay>;

   ACTION onwithdraw( const name& owner, const asset& quantity );
   using onwithdraw_action    = action_wrapper<"onwithdraw"_n,   &btcred_lend::onwithdraw>;

   ACTION onliquidate( const name& owner, const name& liquidator, const asset& debt_repaid, const asset& collateral_seized );
   using onliquidate_action   = action_wrapper<"onliquidate"_n,  &btcred_lend::onliquidate>;

   private:
      void _on_deposit( const name& from, const checksum256& id, const asset& quant, const time_point_sec& now );
      void _on_repay( const name& from, const asset& quant, const time_point_sec& now );
      void _on_liquidate( const name& liquidator, const name& owner, const asset& quant, const time_point_sec& now );
      void _on_add_liquidity( const name& from, const asset& quant );

      bool _is_collateral_token( const name& bank, const asset& quant ) const {
         return bank == _gstate.collateral_token.get_contract() && quant.symbol == _gstate.collateral_token.get_symbol();
      }

      bool _is_borrow_token( const name& bank, const asset& quant ) const {
         return bank == _gstate.borrow_token.get_contract() && quant.symbol == _gstate.borrow_token.get_symbol();
      }

      lend_global_singleton      _global;
      lend_global_t              _gstate;
};
} //namespace btcred
