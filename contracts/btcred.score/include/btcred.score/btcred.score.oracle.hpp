#pragma once

#include <btcred.score/btcred.score.db.hpp>
#include <btcred.math.hpp>

namespace btcred {

/**
 * Read-only view of a deployed score registry, resolved by account name.
 * This is how other contracts (the lending pool) consume scores: the registry
 * account is injected at their init and every read goes to its tables.
 */
class score_oracle {
   public:
      explicit score_oracle(const name& registry):
         _registry(registry), _scores(registry, registry.value), _scorers(registry, registry.value) {}

      uint16_t get_score(const checksum256& id) {
         auto rec = _find(id);
         return rec ? rec->score : 0;
      }

      name get_owner(const checksum256& id) {
         auto rec = _find(id);
         return rec ? rec->owner : name();
      }

      time_point_sec get_last_updated(const checksum256& id) {
         auto rec = _find(id);
         return rec ? rec->last_updated : time_point_sec();
      }

      uint32_t get_collateral_ratio(const checksum256& id) {
         return math::collateral_ratio(get_score(id));
      }

      uint8_t get_score_tier(const checksum256& id) {
         return math::score_tier(get_score(id));
      }

      bool is_approved_scorer(const name& account) {
         return _scorers.find(account.value) != _scorers.end();
      }

      bool is_admin(const name& account) {
         score_global_singleton global(_registry, _registry.value);
         return global.exists() && global.get().admin == account;
      }

      const name& registry() const { return _registry; }

   private:
      const score_t* _find(const checksum256& id) {
         auto hash_idx = _scores.get_index<"byhash"_n>();
         auto itr = hash_idx.find(id);
         if (itr == hash_idx.end()) return nullptr;
         return &*itr;
      }

      name                 _registry;
      score_t::idx_t       _scores;
      scorer_t::idx_t      _scorers;
};

} //namespace btcred
