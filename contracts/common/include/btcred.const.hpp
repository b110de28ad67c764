#pragma once

#include <cstdint>

namespace btcred {

static constexpr uint64_t  PCT_BOOST                 = 10000;                    //100% in bps
static constexpr uint64_t  DAY_SECONDS               = 24 * 60 * 60;
static constexpr uint64_t  YEAR_SECONDS              = 24 * 60 * 60 * 365;
static constexpr uint64_t  MAX_INTEREST_RATIO        = 100000;                   //1000% per year, keeps accrual inside int128

//score registry
static constexpr uint16_t  MIN_SCORE                 = 650;
static constexpr uint16_t  MAX_SCORE                 = 850;
static constexpr uint32_t  UPDATE_COOLDOWN_SECONDS   = 30 * DAY_SECONDS;         //2,592,000

static constexpr uint16_t  TIER1_MIN_SCORE           = 800;
static constexpr uint16_t  TIER2_MIN_SCORE           = 750;
static constexpr uint16_t  TIER3_MIN_SCORE           = 700;

static constexpr uint32_t  TIER1_RATIO               = 11000;                    //110%
static constexpr uint32_t  TIER2_RATIO               = 11500;                    //115%
static constexpr uint32_t  TIER3_RATIO               = 12000;                    //120%
static constexpr uint32_t  TIER4_RATIO               = 13000;                    //130%
static constexpr uint32_t  DEFAULT_RATIO             = 15000;                    //150%, unregistered

//lending pool
static constexpr uint64_t  LIQUIDATION_THRESHOLD     = 10000;                    //health factor below 100%
static constexpr uint64_t  LIQUIDATION_BONUS         = 500;                      //5%
static constexpr uint64_t  MAX_HEALTH_FACTOR         = 99999;                    //no debt

} //namespace btcred
