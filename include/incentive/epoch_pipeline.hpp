#ifndef INCENTIVE_EPOCH_PIPELINE_HPP
#define INCENTIVE_EPOCH_PIPELINE_HPP

#include <map>
#include <optional>
#include <unordered_map>

#include "distributor.hpp"

namespace incentive {

// =============================================================================
// Epoch Info (one per pool)
// =============================================================================

struct EpochInfo {
    uint64_t window_start = 0;
    uint64_t window_end = 0;              // window_start + EPOCH_LENGTH
    U128 stream_rate = 0;                 // Streaming during [window_start, window_end)
    U128 next_stream_rate = 0;            // Streams in the following window
    U128 queued_stream_rate = 0;          // Streams two windows ahead
    std::map<uint64_t, U128> scheduled_bucket;   // Day -> deposits not yet streaming
};

// =============================================================================
// EpochPipeline - single-token, day-quantised reward pipeline
// =============================================================================
//
// A deposit made on day N is bucketed for day N+2 and streams at
// amount / EPOCH_LENGTH for that whole day. A deposit therefore cannot be
// front-run by liquidity added after it becomes visible.

class EpochPipeline : public RewardDistributor {
public:
    static constexpr uint64_t EPOCH_LENGTH = durations::DAY;
    static constexpr uint64_t ACTIVATION_DELAY_DAYS = 2;

    EpochPipeline(const DistributorConfig& config, TokenLedger& ledger,
                  IPoolManager& pool_manager, Clock clock = {});

    // Pull `amount` of the reward token from `caller` into custody and
    // schedule it for the day two days from now. Reward depositor only.
    int32_t add_rewards(const Address& caller, const PoolKey& pool, U128 amount);

    // Rotate every elapsed window; syncs the accumulator at each boundary
    int32_t roll_if_needed(const PoolKey& pool);

    std::optional<EpochInfo> epoch_info(const PoolKey& pool) const;
    U128 scheduled_bucket(const PoolKey& pool, uint64_t day) const;

    static uint64_t day_of(uint64_t timestamp) { return timestamp / EPOCH_LENGTH; }

    U128 total_deposited() const { return total_deposited_; }
    // Rounding remainders of promoted buckets, left in custody
    U128 dust() const { return dust_; }

protected:
    void advance(RewardPool& pool, int32_t active_tick, uint64_t now) override;
    RangeAccumulator projected(const RewardPool& pool, int32_t active_tick, uint64_t now) const override;
    void on_pool_registered(RewardPool& pool) override;

private:
    // Rolled (and, given a tick, synced) pool state, built on copies
    struct Staged {
        RangeAccumulator accumulator;
        EpochInfo info;
        U128 dust;
    };
    Staged stage(const RewardPool& pool, std::optional<int32_t> active_tick, uint64_t now) const;
    void commit(RewardPool& pool, Staged&& staged);

    void roll(RangeAccumulator& accumulator, EpochInfo& info, uint64_t now, U128& dust) const;
    void rotate(RangeAccumulator& accumulator, EpochInfo& info, U128& dust) const;
    bool fast_forward(RangeAccumulator& accumulator, EpochInfo& info, uint64_t now) const;

    static U128 rate_of(const EpochInfo& info, uint64_t day);

    std::unordered_map<PoolId, EpochInfo> epochs_;
    U128 total_deposited_ = 0;
    U128 dust_ = 0;
};

} // namespace incentive

#endif // INCENTIVE_EPOCH_PIPELINE_HPP
