// =============================================================================
// epoch_pipeline.cpp - Day-quantised activation pipeline
// =============================================================================

#include "incentive/epoch_pipeline.hpp"
#include "incentive/log.hpp"

#include <string>
#include <utility>

namespace incentive {

EpochPipeline::EpochPipeline(const DistributorConfig& config, TokenLedger& ledger,
                             IPoolManager& pool_manager, Clock clock)
    : RewardDistributor(config, ledger, pool_manager, std::move(clock)) {}

// =============================================================================
// Deposits
// =============================================================================

int32_t EpochPipeline::add_rewards(const Address& caller, const PoolKey& key, U128 amount) {
    if (caller != config().reward_depositor) {
        log::warn("add_rewards rejected: " + addresses::to_hex(caller) + " is not the reward depositor");
        return errors::UNAUTHORIZED;
    }
    if (amount == 0) {
        return errors::INVALID_AMOUNT;
    }

    RewardPool* pool = get_pool(key);
    if (!pool) {
        return errors::POOL_NOT_REGISTERED;
    }

    const Currency& token = config().reward_token;
    if (ledger().balance_of(token, caller) < amount) {
        return errors::INSUFFICIENT_BALANCE;
    }

    commit(*pool, stage(*pool, std::nullopt, now()));
    EpochInfo& info = epochs_.at(key.id());

    uint64_t target_day = day_of(info.window_start) + ACTIVATION_DELAY_DAYS;
    U128& bucket = info.scheduled_bucket[target_day];
    U128 previous_bucket = bucket;
    U128 previous_queued = info.queued_stream_rate;

    bucket = math::checked_add(bucket, amount);
    info.queued_stream_rate = bucket / EPOCH_LENGTH;

    int32_t rc = pull(token, caller, amount);
    if (rc != errors::OK) {
        if (previous_bucket == 0) {
            info.scheduled_bucket.erase(target_day);
        } else {
            info.scheduled_bucket[target_day] = previous_bucket;
        }
        info.queued_stream_rate = previous_queued;
        return rc;
    }
    total_deposited_ = math::checked_add(total_deposited_, amount);

    log::info("scheduled " + math::to_string(amount) + " for pool " + std::to_string(key.id()) +
              " on day " + std::to_string(target_day));
    return errors::OK;
}

// =============================================================================
// Window Rotation
// =============================================================================

int32_t EpochPipeline::roll_if_needed(const PoolKey& key) {
    RewardPool* pool = get_pool(key);
    if (!pool) {
        return errors::POOL_NOT_REGISTERED;
    }
    commit(*pool, stage(*pool, std::nullopt, now()));
    return errors::OK;
}

U128 EpochPipeline::rate_of(const EpochInfo& info, uint64_t day) {
    auto it = info.scheduled_bucket.find(day);
    return it != info.scheduled_bucket.end() ? it->second / EPOCH_LENGTH : 0;
}

void EpochPipeline::rotate(RangeAccumulator& accumulator, EpochInfo& info, U128& dust) const {
    uint64_t boundary = info.window_end;

    // Stream the closing window up to its end at the last known tick
    accumulator.sync({config().reward_token}, {info.stream_rate}, accumulator.active_tick(), boundary);

    uint64_t new_day = day_of(boundary);
    info.stream_rate = info.next_stream_rate;
    info.next_stream_rate = info.queued_stream_rate;
    info.queued_stream_rate = rate_of(info, new_day + ACTIVATION_DELAY_DAYS);

    auto it = info.scheduled_bucket.find(new_day);
    if (it != info.scheduled_bucket.end()) {
        dust = math::checked_add(dust, it->second % EPOCH_LENGTH);
        info.scheduled_bucket.erase(it);
    }

    info.window_start = boundary;
    info.window_end = boundary + EPOCH_LENGTH;
}

// Jump over windows that would only rotate zeros. Returns false when the
// next window has something to stream.
bool EpochPipeline::fast_forward(RangeAccumulator& accumulator, EpochInfo& info, uint64_t now) const {
    if (info.stream_rate != 0 || info.next_stream_rate != 0 || info.queued_stream_rate != 0) {
        return false;
    }

    uint64_t day = day_of(info.window_start);
    uint64_t target = day_of(now);
    auto next_bucket = info.scheduled_bucket.upper_bound(day);
    if (next_bucket != info.scheduled_bucket.end()) {
        uint64_t bucket_day = next_bucket->first;
        uint64_t limit = bucket_day > ACTIVATION_DELAY_DAYS ? bucket_day - ACTIVATION_DELAY_DAYS : 0;
        if (limit < target) target = limit;
    }
    if (target <= day + 1) {
        return false;
    }

    uint64_t start = target * EPOCH_LENGTH;
    accumulator.sync({config().reward_token}, {U128(0)}, accumulator.active_tick(), start);

    info.window_start = start;
    info.window_end = start + EPOCH_LENGTH;
    info.queued_stream_rate = rate_of(info, target + ACTIVATION_DELAY_DAYS);
    return true;
}

void EpochPipeline::roll(RangeAccumulator& accumulator, EpochInfo& info, uint64_t now, U128& dust) const {
    while (info.window_end <= now) {
        if (fast_forward(accumulator, info, now)) continue;
        rotate(accumulator, info, dust);
    }
}

EpochPipeline::Staged EpochPipeline::stage(const RewardPool& pool, std::optional<int32_t> active_tick,
                                           uint64_t now) const {
    Staged staged{pool.accumulator, epochs_.at(pool.key.id()), dust_};
    roll(staged.accumulator, staged.info, now, staged.dust);
    if (active_tick) {
        staged.accumulator.sync({config().reward_token}, {staged.info.stream_rate}, *active_tick, now);
    }
    return staged;
}

// Nothing is written until every rotation and sync has succeeded
void EpochPipeline::commit(RewardPool& pool, Staged&& staged) {
    EpochInfo& info = epochs_.at(pool.key.id());
    uint64_t from_day = day_of(info.window_start);

    pool.accumulator = std::move(staged.accumulator);
    info = std::move(staged.info);
    dust_ = staged.dust;

    if (day_of(info.window_start) != from_day) {
        log::debug("pool " + std::to_string(pool.key.id()) + " rolled from day " + std::to_string(from_day) +
                   " to day " + std::to_string(day_of(info.window_start)) +
                   " stream_rate=" + math::to_string(info.stream_rate));
    }
}

// =============================================================================
// Distributor Hooks
// =============================================================================

void EpochPipeline::advance(RewardPool& pool, int32_t active_tick, uint64_t now) {
    commit(pool, stage(pool, active_tick, now));
}

RangeAccumulator EpochPipeline::projected(const RewardPool& pool, int32_t active_tick, uint64_t now) const {
    return stage(pool, active_tick, now).accumulator;
}

void EpochPipeline::on_pool_registered(RewardPool& pool) {
    pool.accumulator.token_slot(config().reward_token);

    EpochInfo info;
    info.window_start = day_of(pool.accumulator.last_sync()) * EPOCH_LENGTH;
    info.window_end = info.window_start + EPOCH_LENGTH;
    epochs_[pool.key.id()] = info;
}

// =============================================================================
// Queries
// =============================================================================

std::optional<EpochInfo> EpochPipeline::epoch_info(const PoolKey& key) const {
    auto it = epochs_.find(key.id());
    if (it == epochs_.end()) return std::nullopt;
    return it->second;
}

U128 EpochPipeline::scheduled_bucket(const PoolKey& key, uint64_t day) const {
    auto it = epochs_.find(key.id());
    if (it == epochs_.end()) return 0;
    auto bucket = it->second.scheduled_bucket.find(day);
    return bucket != it->second.scheduled_bucket.end() ? bucket->second : 0;
}

} // namespace incentive
