#ifndef INCENTIVE_INCENTIVE_HPP
#define INCENTIVE_INCENTIVE_HPP

// =============================================================================
// Incentive - In-range liquidity reward distribution
//
// Components:
//   RangeAccumulator   (tick-indexed rewards-per-liquidity)
//   PositionAccrual    (per-position snapshot and claimable balance)
//   EpochPipeline      (single-token, two-day activation delay)
//   MultiStreamLedger  (multi-token fixed-duration streams)
//   ClaimAggregator    (owner -> pool -> position index)
//
// =============================================================================

#include "types.hpp"
#include "math.hpp"
#include "log.hpp"
#include "config.hpp"
#include "tick_bitmap.hpp"
#include "range_accumulator.hpp"
#include "position.hpp"
#include "token_ledger.hpp"
#include "claim_aggregator.hpp"
#include "distributor.hpp"
#include "epoch_pipeline.hpp"
#include "stream_ledger.hpp"

#endif // INCENTIVE_INCENTIVE_HPP
