#include <btcred.lend/btcred.lend.hpp>
#include <btcred.lend/btcred.lend.reader.hpp>
#include <btcred.lend/btcred.lend.utils.hpp>
#include <btcred.score/btcred.score.oracle.hpp>

#include <btcred.token.hpp>
#include <btcred.utils.hpp>
#include <eosio/time.hpp>

namespace btcred {
using namespace std;

#define NOTIFY_DEPOSIT( owner, quantity, id ) \
     { btcred_lend::ondeposit_action act{ _self, { {_self, active_perm} } };\
	        act.send( owner, quantity, id );}

#define NOTIFY_BORROW( owner, quantity, ratio ) \
     { btcred_lend::onborrow_action act{ _self, { {_self, active_perm} } };\
	        act.send( owner, quantity, ratio );}

#define NOTIFY_REPAY( owner, quantity ) \
     { btcred_lend::onrepay_action act{ _self, { {_self, active_perm} } };\
	        act.send( owner, quantity );}

#define NOTIFY_WITHDRAW( owner, quantity ) \
     { btcred_lend::onwithdraw_action act{ _self, { {_self, active_perm} } };\
	        act.send( owner, quantity );}

#define NOTIFY_LIQUIDATE( owner, liquidator, debt_repaid, collateral_seized ) \
     { btcred_lend::onliquidate_action act{ _self, { {_self, active_perm} } };\
	        act.send( owner, liquidator, debt_repaid, collateral_seized );}

void btcred_lend::init( const name& admin, const name& score_registry,
                        const extended_symbol& collateral_token, const extended_symbol& borrow_token,
                        const uint64_t& interest_ratio ) {
   require_auth( _self );
   CHECKC( !_gstate.enabled, err::RECORD_EXISTING, "already initialized" )
   CHECKC( is_account(admin), err::ACCOUNT_INVALID, "admin account does not exist: " + admin.to_string() )
   CHECKC( is_account(score_registry), err::ACCOUNT_INVALID, "score registry does not exist: " + score_registry.to_string() )
   CHECKC( is_account(collateral_token.get_contract()), err::CONTRACT_MISMATCH, "collateral token contract does not exist" )
   CHECKC( is_account(borrow_token.get_contract()), err::CONTRACT_MISMATCH, "borrow token contract does not exist" )
   CHECKC( interest_ratio <= MAX_INTEREST_RATIO, err::OVERSIZED, "interest ratio too large: " + to_string(interest_ratio) )

   _gstate.admin                 = admin;
   _gstate.score_registry        = score_registry;
   _gstate.collateral_token      = collateral_token;
   _gstate.borrow_token          = borrow_token;
   _gstate.interest_ratio        = interest_ratio;
   _gstate.total_collateral      = asset(0, collateral_token.get_symbol());
   _gstate.total_borrowed        = asset(0, borrow_token.get_symbol());
   _gstate.available_liquidity   = asset(0, borrow_token.get_symbol());
   _gstate.enabled               = true;
}

/**
 * @param memo:
 *       collateral token: "deposit:<score id hex>"
 *       borrow token:     "repay" | "liquidate:<owner>" | "liquidity"
 */
void btcred_lend::ontransfer( const name& from, const name& to, const asset& quant, const string& memo ) {
   if (from == get_self() || to != get_self()) return;

   CHECKC( _gstate.enabled, err::PAUSED, "not effective yet" )
   CHECKC( quant.amount > 0, err::NOT_POSITIVE, "quantity must be positive" )

   const auto now    = time_point_sec( current_time_point() );
   auto token_bank   = get_first_receiver();
   auto parts        = split( memo, ":" );

   if (parts[0] == MEMO_DEPOSIT) {
      CHECKC( parts.size() == 2, err::MEMO_FORMAT_ERROR, "memo format error: " + memo )
      CHECKC( _is_collateral_token(token_bank, quant), err::SYMBOL_MISMATCH,
              "collateral token expected: " + token_bank.to_string() + " " + quant.to_string() )
      _on_deposit( from, hex_to_checksum256(parts[1]), quant, now );
      return;
   }

   CHECKC( _is_borrow_token(token_bank, quant), err::SYMBOL_MISMATCH,
           "borrow token expected: " + token_bank.to_string() + " " + quant.to_string() )

   if (parts[0] == MEMO_REPAY && parts.size() == 1) {
      _on_repay( from, quant, now );
   } else if (parts[0] == MEMO_LIQUIDATE && parts.size() == 2) {
      _on_liquidate( from, name(parts[1]), quant, now );
   } else if (parts[0] == MEMO_LIQUIDITY && parts.size() == 1) {
      _on_add_liquidity( from, quant );
   } else {
      CHECKC( false, err::MEMO_FORMAT_ERROR, "memo format error: " + memo )
   }
}

void btcred_lend::_on_deposit( const name& from, const checksum256& id, const asset& quant, const time_point_sec& now ) {
   auto oracle = score_oracle(_gstate.score_registry);
   auto score  = oracle.get_score(id);
   CHECKC( score >= MIN_SCORE, err::NO_VALID_SCORE, "no valid score for: " + checksum256_to_hex(id) )
   auto ratio  = oracle.get_collateral_ratio(id);

   auto positions = position_t::tbl_t(_self, _self.value);
   auto itr = positions.find(from.value);
   if (itr == positions.end()) {
      positions.emplace( _self, [&]( auto& row ) {
         row.owner         = from;
         row.collateral    = quant;
         row.principal     = asset(0, _gstate.borrow_token.get_symbol());
         row.score_hash    = id;
         row.cached_ratio  = ratio;
         row.created_at    = now;
      });
   } else {
      positions.modify( itr, same_payer, [&]( auto& row ) {
         row.collateral    += quant;
         row.score_hash    = id;
         row.cached_ratio  = ratio;
      });
   }

   _gstate.total_collateral += quant;
   NOTIFY_DEPOSIT( from, quant, id )
}

void btcred_lend::borrow( const name& owner, const asset& quantity ) {
   require_auth( owner );
   CHECKC( _gstate.enabled, err::PAUSED, "not effective yet" )
   CHECKC( quantity.symbol == _gstate.borrow_token.get_symbol(), err::SYMBOL_MISMATCH, "symbol mismatch: " + quantity.to_string() )
   CHECKC( quantity.amount > 0, err::NOT_POSITIVE, "quantity must be positive" )

   auto positions = position_t::tbl_t(_self, _self.value);
   auto itr = positions.find(owner.value);
   CHECKC( itr != positions.end() && itr->has_score(), err::NO_SCORE_LINKED, "no score linked: " + owner.to_string() )

   const auto now    = time_point_sec( current_time_point() );
   auto ratio        = score_oracle(_gstate.score_registry).get_collateral_ratio(itr->score_hash);
   auto max_borrow   = calc_max_borrow( itr->collateral, ratio, quantity.symbol );
   auto total_debt   = calc_total_debt( itr->principal, _gstate.interest_ratio, itr->borrowed_at, now );

   CHECKC( total_debt + quantity <= max_borrow, err::EXCEEDS_CAPACITY,
           "exceeds capacity: " + (total_debt + quantity).to_string() + " > " + max_borrow.to_string() )
   CHECKC( quantity <= _gstate.available_liquidity, err::INSUFFICIENT_LIQUIDITY,
           "insufficient liquidity: " + _gstate.available_liquidity.to_string() )

   //accrued interest is folded into the principal
   positions.modify( itr, same_payer, [&]( auto& row ) {
      row.principal     = total_debt + quantity;
      row.borrowed_at   = now;
      row.cached_ratio  = ratio;
   });

   _gstate.total_borrowed        += quantity;
   _gstate.available_liquidity   -= quantity;

   TRANSFER( _gstate.borrow_token.get_contract(), owner, quantity, "borrow" )
   TRACE_L("borrow: ", owner, " ", quantity, " ratio: ", ratio);
   NOTIFY_BORROW( owner, quantity, ratio )
}

void btcred_lend::_on_repay( const name& from, const asset& quant, const time_point_sec& now ) {
   auto positions = position_t::tbl_t(_self, _self.value);
   auto itr = positions.find(from.value);
   CHECKC( itr != positions.end(), err::NO_DEBT, "no debt: " + from.to_string() )

   auto total_debt = calc_total_debt( itr->principal, _gstate.interest_ratio, itr->borrowed_at, now );
   CHECKC( total_debt.amount > 0, err::NO_DEBT, "no debt: " + from.to_string() )

   auto repay_quant = quant < total_debt ? quant : total_debt;

   positions.modify( itr, same_payer, [&]( auto& row ) {
      if (repay_quant >= row.principal) {
         row.principal     = asset(0, row.principal.symbol);
         row.borrowed_at   = time_point_sec();
      } else {
         row.principal     -= repay_quant;
         row.borrowed_at   = now;
      }
   });

   _gstate.total_borrowed        -= repay_quant < _gstate.total_borrowed ? repay_quant : _gstate.total_borrowed;
   _gstate.available_liquidity   += repay_quant;

   if (quant > repay_quant)
      TRANSFER( _gstate.borrow_token.get_contract(), from, quant - repay_quant, "repay refund" )

   NOTIFY_REPAY( from, repay_quant )
}

void btcred_lend::withdraw( const name& owner, const asset& quantity ) {
   require_auth( owner );
   CHECKC( _gstate.enabled, err::PAUSED, "not effective yet" )
   CHECKC( quantity.symbol == _gstate.collateral_token.get_symbol(), err::SYMBOL_MISMATCH, "symbol mismatch: " + quantity.to_string() )
   CHECKC( quantity.amount > 0, err::NOT_POSITIVE, "quantity must be positive" )

   const auto now = time_point_sec( current_time_point() );
   auto positions = position_t::tbl_t(_self, _self.value);
   auto itr = positions.find(owner.value);
   if (itr != positions.end()) {
      auto total_debt = calc_total_debt( itr->principal, _gstate.interest_ratio, itr->borrowed_at, now );
      CHECKC( total_debt.amount == 0, err::DEBT_OUTSTANDING, "debt outstanding: " + total_debt.to_string() )
   }
   CHECKC( itr != positions.end() && quantity <= itr->collateral, err::OVERSIZED, "exceeds deposited collateral" )

   positions.modify( itr, same_payer, [&]( auto& row ) {
      row.collateral    -= quantity;
   });
   _gstate.total_collateral -= quantity;

   TRANSFER( _gstate.collateral_token.get_contract(), owner, quantity, "withdraw" )
   NOTIFY_WITHDRAW( owner, quantity )
}

//permissionless, the liquidator pays the whole accrued debt and takes the collateral
void btcred_lend::_on_liquidate( const name& liquidator, const name& owner, const asset& quant, const time_point_sec& now ) {
   auto positions = position_t::tbl_t(_self, _self.value);
   auto itr = positions.find(owner.value);
   CHECKC( itr != positions.end(), err::POSITION_HEALTHY, "position healthy: " + owner.to_string() )

   auto total_debt   = calc_total_debt( itr->principal, _gstate.interest_ratio, itr->borrowed_at, now );
   auto health       = calc_health_factor( itr->collateral, total_debt );
   CHECKC( health < LIQUIDATION_THRESHOLD, err::POSITION_HEALTHY, "position healthy, health factor: " + to_string(health) )
   CHECKC( quant >= total_debt, err::TRANSFER_FAILED, "must pay the total debt: " + total_debt.to_string() )

   auto collateral   = itr->collateral;
   auto seize        = calc_liquidation_seize( collateral );

   positions.modify( itr, same_payer, [&]( auto& row ) {
      row.collateral    = asset(0, row.collateral.symbol);
      row.principal     = asset(0, row.principal.symbol);
      row.borrowed_at   = time_point_sec();
   });

   _gstate.total_collateral      -= collateral;
   _gstate.total_borrowed        -= total_debt < _gstate.total_borrowed ? total_debt : _gstate.total_borrowed;
   _gstate.available_liquidity   += total_debt;

   if (quant > total_debt)
      TRANSFER( _gstate.borrow_token.get_contract(), liquidator, quant - total_debt, "liquidate refund" )
   if (seize.amount > 0)
      TRANSFER( _gstate.collateral_token.get_contract(), liquidator, seize, "liquidate:" + owner.to_string() )

   NOTIFY_LIQUIDATE( owner, liquidator, total_debt, seize )
}

void btcred_lend::_on_add_liquidity( const name& from, const asset& quant ) {
   CHECKC( from == _gstate.admin, err::ADMIN_ONLY, "admin only" )
   _gstate.available_liquidity += quant;
}

void btcred_lend::tgetpos( const name& owner ) {
   const auto now = time_point_sec( current_time_point() );
   auto reader    = lend_reader(get_self());
   auto pos       = reader.get_position(owner, now);
   CHECKC( false, err::SYSTEM_ERROR, "collateral: " + pos.collateral.to_string()
                                    + ", borrowed: " + reader.get_borrowed(owner).to_string()
                                    + ", total_debt: " + pos.total_debt.to_string()
                                    + ", max_borrow: " + reader.get_max_borrow(owner).to_string()
                                    + ", health_factor: " + to_string(reader.get_health_factor(owner, now))
                                    + ", cached_ratio: " + to_string(pos.cached_ratio)
                                    + ", liquidatable: " + to_string(pos.liquidatable ? 1 : 0) )
}

void btcred_lend::tgetpool() {
   auto reader = lend_reader(get_self());
   auto& g     = reader.global();
   CHECKC( false, err::SYSTEM_ERROR, "total_collateral: " + g.total_collateral.to_string()
                                    + ", total_borrowed: " + g.total_borrowed.to_string()
                                    + ", available_liquidity: " + reader.get_available_liquidity().to_string()
                                    + ", interest_ratio: " + to_string(g.interest_ratio) )
}

void btcred_lend::ondeposit( const name& owner, const asset& quantity, const checksum256& id ) {
   require_auth( get_self() );
   require_recipient( owner );
}

void btcred_lend::onborrow( const name& owner, const asset& quantity, const uint64_t& ratio ) {
   require_auth( get_self() );
   require_recipient( owner );
}

void btcred_lend::onrepay( const name& owner, const asset& quantity ) {
   require_auth( get_self() );
   require_recipient( owner );
}

void btcred_lend::onwithdraw( const name& owner, const asset& quantity ) {
   require_auth( get_self() );
   require_recipient( owner );
}

void btcred_lend::onliquidate( const name& owner, const name& liquidator, const asset& debt_repaid, const asset& collateral_seized ) {
   require_auth( get_self() );
   require_recipient( owner );
}

} //namespace btcred
