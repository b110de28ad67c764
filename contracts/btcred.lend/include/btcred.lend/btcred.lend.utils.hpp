#pragma once

#include <eosio/asset.hpp>
#include <eosio/time.hpp>

#include <btcred.math.hpp>
#include <btcred.utils.hpp>

#include <limits>

namespace btcred {

using namespace eosio;

//principal plus simple interest since borrowed_at, in the principal's symbol
inline asset calc_total_debt( const asset& principal, const uint64_t& interest_ratio,
                              const time_point_sec& borrowed_at, const time_point_sec& now ) {
    auto debt = math::accrue( principal.amount, interest_ratio, borrowed_at.sec_since_epoch(), now.sec_since_epoch() );
    CHECK( debt <= std::numeric_limits<int64_t>::max(), "accrued debt overflow" );
    return asset( (int64_t)debt, principal.symbol );
}

//collateral and debt amounts are compared one to one
inline asset calc_max_borrow( const asset& collateral, const uint64_t& ratio, const symbol& borrow_sym ) {
    return asset( math::max_borrow(collateral.amount, ratio), borrow_sym );
}

inline uint64_t calc_health_factor( const asset& collateral, const asset& total_debt ) {
    return math::health_factor( collateral.amount, total_debt.amount );
}

inline asset calc_liquidation_seize( const asset& collateral ) {
    return asset( math::liquidation_seize(collateral.amount), collateral.symbol );
}

} //namespace btcred
