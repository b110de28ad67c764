#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/permission.hpp>
#include <eosio/action.hpp>

#include <string>

#include <btcred.score/btcred.score.db.hpp>
#include <btcred.score/btcred.score.oracle.hpp>

namespace btcred {

using std::string;
using std::vector;

using namespace eosio;

enum class err: uint8_t {
   NONE                 = 0,
   RECORD_NOT_FOUND     = 1,
   RECORD_EXISTING      = 2,
   PAUSED               = 7,
   NO_AUTH              = 8,
   TIME_PREMATURE       = 13,
   ACCOUNT_INVALID      = 15,
   SCORE_OUT_OF_RANGE   = 23,
   ADMIN_ONLY           = 24,
   SYSTEM_ERROR         = 200
};

/**
 * The `btcred.score` contract keeps the credibility score registered for each
 * bitcoin address (identified by the sha256 of the address) and derives the
 * collateral tier and ratio the lending pool applies to it.
 *
 * Scores are written by approved scorers. A registered score may later be
 * refreshed by its owner or by any approved scorer, at most once per cooldown.
 */
class [[eosio::contract("btcred.score")]] btcred_score : public contract {
   public:
      using contract::contract;

   btcred_score(eosio::name receiver, eosio::name code, datastream<const char*> ds): contract(receiver, code, ds),
        _global(get_self(), get_self().value)
    {
      _gstate = _global.exists() ? _global.get() : score_global_t{};
    }

    ~btcred_score() { _global.set( _gstate, get_self() ); }

   //admin
   ACTION init( const name& admin );
   ACTION addscorer( const name& admin, const name& scorer );
   ACTION delscorer( const name& admin, const name& scorer );

   //scorer
   /**
    * @param scorer - approved scorer, becomes the record owner
    * @param id - sha256 of the bitcoin address
    * @param score - 650..850
    * @param proof - opaque payload, kept for future proof verification
    */
   ACTION regscore( const name& scorer, const checksum256& id, const uint16_t& score, const vector<checksum256>& proof );
   ACTION updatescore( const name& caller, const checksum256& id, const uint16_t& new_score, const vector<checksum256>& proof );

   //read out, always aborts with the result
   ACTION tgetscore( const checksum256& id );
   ACTION tgetscorer( const name& account );

   ACTION onregister( const checksum256& id, const name& owner, const uint16_t& score,
                      const uint8_t& tier, const uint32_t& ratio, const time_point_sec& timestamp );
   using onregister_action    = action_wrapper<"onregister"_n,  &btcred_score::onregister>;

   ACTION onupdate( const checksum256& id, const uint16_t& old_score, const uint16_t& new_score, const time_point_sec& timestamp );
   using onupdate_action      = action_wrapper<"onupdate"_n,    &btcred_score::onupdate>;

   ACTION onapprove( const name& scorer );
   using onapprove_action     = action_wrapper<"onapprove"_n,   &btcred_score::onapprove>;

   ACTION onrevoke( const name& scorer );
   using onrevoke_action      = action_wrapper<"onrevoke"_n,    &btcred_score::onrevoke>;

   private:
      bool _is_admin( const name& account ) const {
         return account == _gstate.admin;
      }

      bool _is_approved_scorer( const name& account ) {
         return score_oracle(get_self()).is_approved_scorer(account);
      }

      void _set_scorer( const name& scorer, const bool& approved );

      score_global_singleton     _global;
      score_global_t             _gstate;
};
} //namespace btcred
