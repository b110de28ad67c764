#pragma once

#include <btcred.lend/btcred.lend.db.hpp>
#include <btcred.lend/btcred.lend.utils.hpp>
#include <btcred.score/btcred.score.oracle.hpp>

namespace btcred {

struct position_info {
    asset       collateral;
    asset       total_debt;
    uint64_t    cached_ratio    = 0;
    bool        liquidatable    = false;
};

/**
 * Read-only view of a deployed lending pool. Debt figures are accrued up to
 * the `now` passed in; nothing here writes.
 */
class lend_reader {
   public:
      explicit lend_reader(const name& pool): _pool(pool), _positions(pool, pool.value) {
         lend_global_singleton global(pool, pool.value);
         _gstate = global.exists() ? global.get() : lend_global_t{};
      }

      asset get_collateral(const name& owner) {
         auto itr = _positions.find(owner.value);
         return itr != _positions.end() ? itr->collateral : asset(0, _gstate.collateral_token.get_symbol());
      }

      //stored principal, without interest accrued since the last settlement
      asset get_borrowed(const name& owner) {
         auto itr = _positions.find(owner.value);
         return itr != _positions.end() ? itr->principal : asset(0, _gstate.borrow_token.get_symbol());
      }

      asset get_total_debt(const name& owner, const time_point_sec& now) {
         auto itr = _positions.find(owner.value);
         if (itr == _positions.end()) return asset(0, _gstate.borrow_token.get_symbol());
         return calc_total_debt(itr->principal, _gstate.interest_ratio, itr->borrowed_at, now);
      }

      //capacity at the registry's live ratio, debt not deducted
      asset get_max_borrow(const name& owner) {
         auto itr = _positions.find(owner.value);
         if (itr == _positions.end() || !itr->has_score())
            return asset(0, _gstate.borrow_token.get_symbol());

         auto ratio = score_oracle(_gstate.score_registry).get_collateral_ratio(itr->score_hash);
         return calc_max_borrow(itr->collateral, ratio, _gstate.borrow_token.get_symbol());
      }

      uint64_t get_health_factor(const name& owner, const time_point_sec& now) {
         return calc_health_factor(get_collateral(owner), get_total_debt(owner, now));
      }

      position_info get_position(const name& owner, const time_point_sec& now) {
         position_info info;
         info.collateral   = get_collateral(owner);
         info.total_debt   = get_total_debt(owner, now);
         auto itr = _positions.find(owner.value);
         info.cached_ratio = itr != _positions.end() ? itr->cached_ratio : 0;
         info.liquidatable = calc_health_factor(info.collateral, info.total_debt) < LIQUIDATION_THRESHOLD;
         return info;
      }

      asset get_available_liquidity() const { return _gstate.available_liquidity; }

      const lend_global_t& global() const { return _gstate; }

   private:
      name                    _pool;
      position_t::tbl_t       _positions;
      lend_global_t           _gstate;
};

} //namespace btcred
