#pragma once

#include <cstdint>
#include <limits>

#include <btcred.const.hpp>

/**
 * Fixed-point integer math shared by the score registry and the lending pool.
 * Plain integers in, plain integers out: amounts are raw asset amounts, ratios
 * are basis points and times are seconds since epoch. Every product is taken in
 * 128 bits before the final floor division.
 */
namespace btcred { namespace math {

    typedef __int128            int128;
    typedef unsigned __int128   uint128;

    inline bool score_in_range(uint16_t score) {
        return score >= MIN_SCORE && score <= MAX_SCORE;
    }

    //0 is reserved for "not registered"
    inline uint8_t score_tier(uint16_t score) {
        if (score == 0)                 return 0;
        if (score >= TIER1_MIN_SCORE)   return 1;
        if (score >= TIER2_MIN_SCORE)   return 2;
        if (score >= TIER3_MIN_SCORE)   return 3;
        return 4;
    }

    inline uint32_t tier_ratio(uint8_t tier) {
        switch (tier) {
            case 1:  return TIER1_RATIO;
            case 2:  return TIER2_RATIO;
            case 3:  return TIER3_RATIO;
            case 4:  return TIER4_RATIO;
            default: return DEFAULT_RATIO;
        }
    }

    inline uint32_t collateral_ratio(uint16_t score) {
        return tier_ratio(score_tier(score));
    }

    /**
     * principal + principal * rate * elapsed / (10000 * YEAR_SECONDS)
     *
     * borrowed_at == 0 means the principal has never been touched (or was fully
     * repaid) and carries no interest. A clock behind borrowed_at accrues nothing.
     */
    inline int128 accrue(int64_t principal, uint64_t rate_bps, uint32_t borrowed_at, uint32_t now) {
        if (principal <= 0 || borrowed_at == 0 || now <= borrowed_at)
            return principal;

        int128 elapsed  = now - borrowed_at;
        int128 interest = (int128)principal * rate_bps * elapsed / ((int128)PCT_BOOST * YEAR_SECONDS);
        return principal + interest;
    }

    //collateral * 10000 / ratio, floored
    inline int64_t max_borrow(int64_t collateral, uint64_t ratio_bps) {
        if (collateral <= 0 || ratio_bps == 0) return 0;
        return (int64_t)((int128)collateral * PCT_BOOST / ratio_bps);
    }

    //collateral * 10000 / debt, MAX_HEALTH_FACTOR when there is no debt
    inline uint64_t health_factor(int64_t collateral, int64_t debt) {
        if (debt <= 0) return MAX_HEALTH_FACTOR;
        if (collateral <= 0) return 0;

        uint128 factor = (uint128)collateral * PCT_BOOST / (uint128)debt;
        if (factor > std::numeric_limits<uint64_t>::max())
            return std::numeric_limits<uint64_t>::max();
        return (uint64_t)factor;
    }

    inline bool is_liquidatable(int64_t collateral, int64_t debt) {
        return health_factor(collateral, debt) < LIQUIDATION_THRESHOLD;
    }

    //collateral plus the bonus, never more than what was deposited
    inline int64_t liquidation_seize(int64_t collateral) {
        if (collateral <= 0) return 0;
        int128 with_bonus = (int128)collateral + (int128)collateral * LIQUIDATION_BONUS / PCT_BOOST;
        return with_bonus < collateral ? (int64_t)with_bonus : collateral;
    }

} } //btcred::math
