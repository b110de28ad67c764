#include <btcred.score/btcred.score.hpp>

#include <btcred.utils.hpp>
#include <btcred.math.hpp>
#include <eosio/time.hpp>

namespace btcred {
using namespace std;

#define NOTIFY_REGISTER( id, owner, score, tier, ratio, timestamp ) \
     { btcred_score::onregister_action act{ _self, { {_self, active_perm} } };\
	        act.send( id, owner, score, tier, ratio, timestamp );}

#define NOTIFY_UPDATE( id, old_score, new_score, timestamp ) \
     { btcred_score::onupdate_action act{ _self, { {_self, active_perm} } };\
	        act.send( id, old_score, new_score, timestamp );}

#define NOTIFY_APPROVE( scorer ) \
     { btcred_score::onapprove_action act{ _self, { {_self, active_perm} } };\
	        act.send( scorer );}

#define NOTIFY_REVOKE( scorer ) \
     { btcred_score::onrevoke_action act{ _self, { {_self, active_perm} } };\
	        act.send( scorer );}

void btcred_score::init( const name& admin ) {
   require_auth( _self );
   CHECKC( !_gstate.enabled, err::RECORD_EXISTING, "already initialized" )
   CHECKC( is_account(admin), err::ACCOUNT_INVALID, "admin account does not exist: " + admin.to_string() )

   _gstate.admin     = admin;
   _gstate.enabled   = true;

   //the admin is a scorer from the start and can be revoked like any other
   _set_scorer( admin, true );
}

void btcred_score::addscorer( const name& admin, const name& scorer ) {
   require_auth( admin );
   CHECKC( _is_admin(admin), err::ADMIN_ONLY, "admin only" )
   CHECKC( is_account(scorer), err::ACCOUNT_INVALID, "scorer account does not exist: " + scorer.to_string() )

   _set_scorer( scorer, true );
   NOTIFY_APPROVE( scorer )
}

void btcred_score::delscorer( const name& admin, const name& scorer ) {
   require_auth( admin );
   CHECKC( _is_admin(admin), err::ADMIN_ONLY, "admin only" )

   _set_scorer( scorer, false );
   NOTIFY_REVOKE( scorer )
}

void btcred_score::regscore( const name& scorer, const checksum256& id, const uint16_t& score, const vector<checksum256>& proof ) {
   require_auth( scorer );
   CHECKC( _gstate.enabled, err::PAUSED, "not effective yet" )
   CHECKC( math::score_in_range(score), err::SCORE_OUT_OF_RANGE, "score out of range: " + to_string(score) )
   CHECKC( _is_approved_scorer(scorer), err::NO_AUTH, "not an approved scorer: " + scorer.to_string() )
   CHECKC( score_oracle(get_self()).get_score(id) == 0, err::RECORD_EXISTING, "score already registered" )

   const auto now = time_point_sec( current_time_point() );
   auto scores = score_t::idx_t(_self, _self.value);
   scores.emplace( _self, [&]( auto& row ) {
      row.id            = ++_gstate.last_score_id;
      row.hash          = id;
      row.score         = score;
      row.owner         = scorer;
      row.last_updated  = now;
   });

   auto tier = math::score_tier(score);
   TRACE_L("regscore: ", checksum256_to_hex(id), " score: ", score, " tier: ", tier);
   NOTIFY_REGISTER( id, scorer, score, tier, math::tier_ratio(tier), now )
}

void btcred_score::updatescore( const name& caller, const checksum256& id, const uint16_t& new_score, const vector<checksum256>& proof ) {
   require_auth( caller );
   CHECKC( _gstate.enabled, err::PAUSED, "not effective yet" )
   CHECKC( math::score_in_range(new_score), err::SCORE_OUT_OF_RANGE, "score out of range: " + to_string(new_score) )

   auto scores    = score_t::idx_t(_self, _self.value);
   auto hash_idx  = scores.get_index<"byhash"_n>();
   auto itr       = hash_idx.find(id);
   CHECKC( itr != hash_idx.end() && itr->score != 0, err::RECORD_NOT_FOUND, "score not registered" )
   CHECKC( caller == itr->owner || _is_approved_scorer(caller), err::NO_AUTH, "neither owner nor approved scorer: " + caller.to_string() )

   const auto now = time_point_sec( current_time_point() );
   auto elapsed   = now.sec_since_epoch() - itr->last_updated.sec_since_epoch();
   CHECKC( now >= itr->last_updated && elapsed >= UPDATE_COOLDOWN_SECONDS, err::TIME_PREMATURE,
           "update cooldown active, seconds left: " + to_string(UPDATE_COOLDOWN_SECONDS - elapsed) )

   auto old_score = itr->score;
   hash_idx.modify( itr, same_payer, [&]( auto& row ) {
      row.score         = new_score;
      row.last_updated  = now;
   });

   NOTIFY_UPDATE( id, old_score, new_score, now )
}

void btcred_score::tgetscore( const checksum256& id ) {
   auto oracle = score_oracle(get_self());
   CHECKC( false, err::SYSTEM_ERROR, "score: " + to_string(oracle.get_score(id))
                                    + ", tier: " + to_string(oracle.get_score_tier(id))
                                    + ", ratio: " + to_string(oracle.get_collateral_ratio(id))
                                    + ", owner: " + oracle.get_owner(id).to_string()
                                    + ", updated_at: " + to_string(oracle.get_last_updated(id).sec_since_epoch()) )
}

void btcred_score::tgetscorer( const name& account ) {
   auto oracle = score_oracle(get_self());
   CHECKC( false, err::SYSTEM_ERROR, "approved: " + to_string(oracle.is_approved_scorer(account) ? 1 : 0)
                                    + ", admin: " + to_string(oracle.is_admin(account) ? 1 : 0) )
}

void btcred_score::_set_scorer( const name& scorer, const bool& approved ) {
   auto scorers = scorer_t::idx_t(_self, _self.value);
   auto itr = scorers.find(scorer.value);

   if (approved && itr == scorers.end()) {
      scorers.emplace( _self, [&]( auto& row ) {
         row.account       = scorer;
         row.approved_at   = time_point_sec( current_time_point() );
      });
   } else if (!approved && itr != scorers.end()) {
      scorers.erase( itr );
   }
}

void btcred_score::onregister( const checksum256& id, const name& owner, const uint16_t& score,
                               const uint8_t& tier, const uint32_t& ratio, const time_point_sec& timestamp ) {
   require_auth( get_self() );
}

void btcred_score::onupdate( const checksum256& id, const uint16_t& old_score, const uint16_t& new_score, const time_point_sec& timestamp ) {
   require_auth( get_self() );
}

void btcred_score::onapprove( const name& scorer ) {
   require_auth( get_self() );
   require_recipient( scorer );
}

void btcred_score::onrevoke( const name& scorer ) {
   require_auth( get_self() );
   require_recipient( scorer );
}

} //namespace btcred
