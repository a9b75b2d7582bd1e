// =============================================================================
// distributor.cpp - Shared pool, position and claim bookkeeping
// =============================================================================

#include "incentive/distributor.hpp"
#include "incentive/log.hpp"

#include <algorithm>
#include <chrono>
#include <string>
#include <utility>

namespace incentive {

namespace {

uint64_t wall_clock_seconds() {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count()
    );
}

// Negated liquidity for a full withdrawal
I128 removal_delta(U128 liquidity) {
    if (liquidity > static_cast<U128>(math::I128_MAX)) {
        throw MathError("liquidity too large for a signed delta");
    }
    return -static_cast<I128>(liquidity);
}

// Scoped in-flight marker for the payout path
class InFlight {
public:
    explicit InFlight(bool& flag) : flag_(flag) { flag_ = true; }
    ~InFlight() { flag_ = false; }

    InFlight(const InFlight&) = delete;
    InFlight& operator=(const InFlight&) = delete;

private:
    bool& flag_;
};

} // anonymous namespace

// =============================================================================
// Constructor
// =============================================================================

RewardDistributor::RewardDistributor(const DistributorConfig& config, TokenLedger& ledger,
                                     IPoolManager& pool_manager, Clock clock)
    : config_(config),
      ledger_(ledger),
      pool_manager_(pool_manager),
      clock_(clock ? std::move(clock) : Clock(wall_clock_seconds)) {
    log::set_level(log::parse_level(config_.log_level));
}

// =============================================================================
// Internal Helpers
// =============================================================================

RewardPool* RewardDistributor::get_pool(const PoolKey& key) {
    auto it = pools_.find(key.id());
    return it != pools_.end() ? &it->second : nullptr;
}

const RewardPool* RewardDistributor::get_pool(const PoolKey& key) const {
    auto it = pools_.find(key.id());
    return it != pools_.end() ? &it->second : nullptr;
}

int32_t RewardDistributor::pull(const Currency& token, const Address& from, U128 amount) {
    return ledger_.transfer(token, from, config_.custody, amount);
}

int32_t RewardDistributor::sync_pool(RewardPool& pool) {
    auto tick = pool_manager_.get_tick(pool.key);
    if (!tick) {
        return errors::POOL_NOT_INITIALIZED;
    }
    advance(pool, *tick, now());
    ++total_pokes_;
    return errors::OK;
}

int32_t RewardDistributor::validate_update(const PositionUpdate& update, RewardPool*& pool) {
    pool = get_pool(update.pool);
    if (!pool) {
        return errors::POOL_NOT_REGISTERED;
    }
    if (!RangeAccumulator::valid_range(update.tick_lower, update.tick_upper,
                                       pool->accumulator.tick_spacing())) {
        return errors::INVALID_TICK_RANGE;
    }
    return errors::OK;
}

// =============================================================================
// Accrual
// =============================================================================

void RewardDistributor::accrue_position(RewardPool& pool, PositionInfo& position) {
    const auto& tokens = pool.accumulator.tokens();
    for (size_t slot = 0; slot < tokens.size(); ++slot) {
        U256 current = pool.accumulator.range_value(tokens[slot], position.tick_lower, position.tick_upper);
        PositionAccrual& accrual = position.accrual(slot);

        // A live range can never have earned more than the whole pool
        if (position.liquidity != 0 &&
            accrual.growth(current) > pool.accumulator.cumulative(tokens[slot])) {
            throw InvariantError("position reward growth exceeds pool accumulator");
        }
        accrual.accrue(position.liquidity, current);
    }
}

void RewardDistributor::snapshot_position(RewardPool& pool, PositionInfo& position) {
    const auto& tokens = pool.accumulator.tokens();
    for (size_t slot = 0; slot < tokens.size(); ++slot) {
        position.accrual(slot).rewards_per_liquidity_last_x128 =
            pool.accumulator.range_value(tokens[slot], position.tick_lower, position.tick_upper);
    }
}

TokenAmounts RewardDistributor::pending_for(const RangeAccumulator& accumulator,
                                            const PositionInfo& position) const {
    TokenAmounts amounts;
    const auto& tokens = accumulator.tokens();
    for (size_t slot = 0; slot < tokens.size(); ++slot) {
        U256 current = accumulator.range_value(tokens[slot], position.tick_lower, position.tick_upper);
        PositionAccrual accrual = slot < position.rewards.size() ? position.rewards[slot] : PositionAccrual{};

        if (position.liquidity != 0 &&
            accrual.growth(current) > accumulator.cumulative(tokens[slot])) {
            throw InvariantError("position reward growth exceeds pool accumulator");
        }

        U128 amount = accrual.pending(position.liquidity, current);
        if (amount != 0) {
            amounts[tokens[slot]] = amount;
        }
    }
    return amounts;
}

RangeAccumulator RewardDistributor::accumulator_now(const RewardPool& pool) const {
    auto tick = pool_manager_.get_tick(pool.key);
    uint64_t t = now();
    if (!tick || t < pool.accumulator.last_sync()) {
        return pool.accumulator;
    }
    return projected(pool, *tick, t);
}

TokenAmounts RewardDistributor::owed(const Address& owner, const std::vector<PoolKey>& pools,
                                     bool at_now) const {
    TokenAmounts total;
    std::vector<PoolId> seen;
    for (const auto& pool_key : pools) {
        if (std::find(seen.begin(), seen.end(), pool_key.id()) != seen.end()) continue;
        seen.push_back(pool_key.id());

        const RewardPool* pool = get_pool(pool_key);
        if (!pool) continue;
        std::vector<PositionKey> keys = index_.positions_of(owner, pool_key.id());
        if (keys.empty()) continue;

        RangeAccumulator current = at_now ? accumulator_now(*pool) : pool->accumulator;
        for (PositionKey key : keys) {
            auto it = pool->positions.find(key);
            if (it == pool->positions.end()) continue;
            merge_amounts(total, pending_for(current, it->second));
        }
    }
    return total;
}

void RewardDistributor::apply_liquidity(RewardPool& pool, PositionInfo& position, I128 delta) {
    U128 next = math::add_delta(position.liquidity, delta);

    accrue_position(pool, position);
    pool.accumulator.modify_liquidity(position.tick_lower, position.tick_upper, delta);
    position.liquidity = next;

    // Tick (re)initialization can move the range value; restart from here
    snapshot_position(pool, position);
}

// =============================================================================
// Pools
// =============================================================================

int32_t RewardDistributor::register_pool(const PoolKey& key) {
    if (pools_.find(key.id()) != pools_.end()) {
        return errors::POOL_ALREADY_REGISTERED;
    }
    if (key.tick_spacing <= 0) {
        return errors::INVALID_TICK_RANGE;
    }

    auto tick = pool_manager_.get_tick(key);
    if (!tick) {
        return errors::POOL_NOT_INITIALIZED;
    }

    auto it = pools_.emplace(
        key.id(), RewardPool{key, RangeAccumulator(key.tick_spacing, *tick, now()), {}}).first;
    on_pool_registered(it->second);

    log::info("registered pool " + std::to_string(key.id()) + " at tick " + std::to_string(*tick));
    return errors::OK;
}

bool RewardDistributor::pool_registered(const PoolKey& key) const {
    return get_pool(key) != nullptr;
}

int32_t RewardDistributor::poke_pool(const PoolKey& key) {
    RewardPool* pool = get_pool(key);
    if (!pool) {
        return errors::POOL_NOT_REGISTERED;
    }
    int32_t rc = sync_pool(*pool);
    if (rc == errors::OK) {
        log::debug("poked pool " + std::to_string(key.id()) +
                   " tick=" + std::to_string(pool->accumulator.active_tick()) +
                   " active_liquidity=" + math::to_string(pool->accumulator.active_liquidity()));
    }
    return rc;
}

// =============================================================================
// Position Manager Callbacks
// =============================================================================

int32_t RewardDistributor::notify_subscribe(const PositionUpdate& update) {
    RewardPool* pool = nullptr;
    int32_t rc = validate_update(update, pool);
    if (rc != errors::OK) return rc;
    if (update.liquidity_delta < 0) return errors::INVALID_AMOUNT;

    auto it = pool->positions.find(update.key);
    if (it != pool->positions.end()) {
        PositionInfo& existing = it->second;
        if (existing.subscribed) return errors::POSITION_EXISTS;
        if (existing.owner != update.owner) return errors::UNAUTHORIZED;
        if (existing.tick_lower != update.tick_lower || existing.tick_upper != update.tick_upper) {
            return errors::INVALID_TICK_RANGE;
        }
    }

    rc = sync_pool(*pool);
    if (rc != errors::OK) return rc;

    if (it != pool->positions.end()) {
        // Resubscribe of a closed record still holding unclaimed rewards
        apply_liquidity(*pool, it->second, update.liquidity_delta);
        it->second.subscribed = true;
    } else {
        PositionInfo position{update.owner, update.pool.id(), update.tick_lower, update.tick_upper,
                              0, true, {}};
        apply_liquidity(*pool, position, update.liquidity_delta);
        pool->positions.emplace(update.key, std::move(position));
    }
    index_.track(update.owner, update.pool.id(), update.key);

    log::info("subscribed position " + std::to_string(update.key) +
              " owner=" + addresses::to_hex(update.owner) +
              " range=[" + std::to_string(update.tick_lower) + ", " + std::to_string(update.tick_upper) +
              ") liquidity=" + math::to_string(update.liquidity_delta));
    return errors::OK;
}

int32_t RewardDistributor::notify_modify_liquidity(const PositionUpdate& update) {
    RewardPool* pool = nullptr;
    int32_t rc = validate_update(update, pool);
    if (rc != errors::OK) return rc;

    auto it = pool->positions.find(update.key);
    if (it == pool->positions.end()) {
        // First deposit into a range creates the position
        if (update.liquidity_delta > 0) return notify_subscribe(update);
        return errors::POSITION_NOT_FOUND;
    }

    PositionInfo& position = it->second;
    if (!position.subscribed) return errors::POSITION_NOT_FOUND;
    if (position.owner != update.owner) return errors::UNAUTHORIZED;

    rc = sync_pool(*pool);
    if (rc != errors::OK) return rc;

    apply_liquidity(*pool, position, update.liquidity_delta);

    log::debug("modified position " + std::to_string(update.key) +
               " delta=" + math::to_string(update.liquidity_delta) +
               " liquidity=" + math::to_string(position.liquidity));
    return errors::OK;
}

int32_t RewardDistributor::notify_unsubscribe(const PositionUpdate& update) {
    RewardPool* pool = nullptr;
    int32_t rc = validate_update(update, pool);
    if (rc != errors::OK) return rc;

    auto it = pool->positions.find(update.key);
    if (it == pool->positions.end() || !it->second.subscribed) {
        return errors::POSITION_NOT_FOUND;
    }
    PositionInfo& position = it->second;
    if (position.owner != update.owner) return errors::UNAUTHORIZED;

    rc = sync_pool(*pool);
    if (rc != errors::OK) return rc;

    // Accrued rewards stay claimable; the index entry is swept on claim
    apply_liquidity(*pool, position, removal_delta(position.liquidity));
    position.subscribed = false;

    log::info("unsubscribed position " + std::to_string(update.key));
    return errors::OK;
}

int32_t RewardDistributor::notify_burn(const PositionUpdate& update) {
    RewardPool* pool = nullptr;
    int32_t rc = validate_update(update, pool);
    if (rc != errors::OK) return rc;

    auto it = pool->positions.find(update.key);
    if (it == pool->positions.end()) {
        return errors::POSITION_NOT_FOUND;
    }
    PositionInfo& position = it->second;
    if (position.owner != update.owner) return errors::UNAUTHORIZED;

    rc = sync_pool(*pool);
    if (rc != errors::OK) return rc;

    if (position.liquidity != 0) {
        apply_liquidity(*pool, position, removal_delta(position.liquidity));
    } else {
        accrue_position(*pool, position);
    }
    position.subscribed = false;

    log::info("burned position " + std::to_string(update.key));
    return errors::OK;
}

// =============================================================================
// Claims
// =============================================================================

ClaimAggregator::Collected RewardDistributor::collect_position(RewardPool& pool, PositionKey key) {
    auto it = pool.positions.find(key);
    if (it == pool.positions.end()) {
        // Stale index entry
        return {{}, true};
    }

    PositionInfo& position = it->second;
    accrue_position(pool, position);

    ClaimAggregator::Collected collected{{}, false};
    const auto& tokens = pool.accumulator.tokens();
    for (size_t slot = 0; slot < position.rewards.size() && slot < tokens.size(); ++slot) {
        U128 amount = position.rewards[slot].claim();
        if (amount != 0) {
            collected.amounts[tokens[slot]] = amount;
        }
    }

    collected.prunable = position.prunable();
    if (collected.prunable) {
        pool.positions.erase(it);
    }
    return collected;
}

int32_t RewardDistributor::check_custody(const TokenAmounts& amounts) const {
    for (const auto& [token, amount] : amounts) {
        U128 held = ledger_.balance_of(token, config_.custody);
        if (held < amount) {
            log::error("claim of " + math::to_string(amount) + " exceeds custody balance " +
                       math::to_string(held) + " of token " + addresses::to_hex(token.addr));
            return errors::INSUFFICIENT_BALANCE;
        }
    }
    return errors::OK;
}

void RewardDistributor::pay_out(const TokenAmounts& amounts, const Address& recipient) {
    for (const auto& [token, amount] : amounts) {
        if (amount == 0) continue;
        int32_t rc = ledger_.transfer(token, config_.custody, recipient, amount);
        if (rc != errors::OK) {
            // Custody was checked before any state changed
            throw InvariantError(std::string("payout transfer failed: ") + errors::to_string(rc));
        }
    }
}

int32_t RewardDistributor::claim(const Address& owner, const PoolKey& pool_key, PositionKey key,
                                 const Address& recipient, TokenAmounts* paid) {
    if (claim_in_flight_) {
        log::warn("claim rejected: operation in progress");
        return errors::REENTRANCY;
    }

    RewardPool* pool = get_pool(pool_key);
    if (!pool) return errors::POOL_NOT_REGISTERED;

    auto it = pool->positions.find(key);
    if (it == pool->positions.end()) return errors::POSITION_NOT_FOUND;
    if (it->second.owner != owner) return errors::UNAUTHORIZED;

    int32_t rc = sync_pool(*pool);
    if (rc != errors::OK) return rc;

    rc = check_custody(pending_for(pool->accumulator, it->second));
    if (rc != errors::OK) return rc;

    InFlight guard(claim_in_flight_);

    // All bookkeeping is final before any token moves
    ClaimAggregator::Collected collected = collect_position(*pool, key);
    if (collected.prunable) {
        index_.untrack(owner, pool_key.id(), key);
    }
    pay_out(collected.amounts, recipient);

    ++total_claims_;
    if (paid) *paid = collected.amounts;

    log::info("claimed position " + std::to_string(key) + " for " + addresses::to_hex(owner));
    return errors::OK;
}

int32_t RewardDistributor::claim_all_for_owner(const Address& owner, const std::vector<PoolKey>& pools,
                                               const Address& recipient, TokenAmounts* paid) {
    if (claim_in_flight_) {
        log::warn("claim_all rejected: operation in progress");
        return errors::REENTRANCY;
    }

    std::vector<PoolKey> targets;
    std::vector<PoolId> ids;
    for (const auto& key : pools) {
        if (!get_pool(key)) return errors::POOL_NOT_REGISTERED;
        if (std::find(ids.begin(), ids.end(), key.id()) != ids.end()) continue;
        targets.push_back(key);
        ids.push_back(key.id());
    }

    for (const auto& key : targets) {
        int32_t rc = sync_pool(*get_pool(key));
        if (rc != errors::OK) return rc;
    }

    int32_t rc = check_custody(owed(owner, targets, false));
    if (rc != errors::OK) return rc;

    InFlight guard(claim_in_flight_);

    TokenAmounts total = index_.collect(owner, ids,
        [this](PoolId id, PositionKey key) {
            return collect_position(pools_.at(id), key);
        },
        true);
    pay_out(total, recipient);

    ++total_claims_;
    if (paid) *paid = total;

    log::info("claimed " + std::to_string(total.size()) + " token(s) across " +
              std::to_string(ids.size()) + " pool(s) for " + addresses::to_hex(owner));
    return errors::OK;
}

TokenAmounts RewardDistributor::pending_rewards(const PoolKey& pool_key, PositionKey key) const {
    const RewardPool* pool = get_pool(pool_key);
    if (!pool) return {};
    auto it = pool->positions.find(key);
    if (it == pool->positions.end()) return {};
    return pending_for(accumulator_now(*pool), it->second);
}

TokenAmounts RewardDistributor::pending_rewards_owner(const Address& owner,
                                                      const std::vector<PoolKey>& pools) const {
    return owed(owner, pools, true);
}

// =============================================================================
// Queries
// =============================================================================

std::optional<PositionInfo> RewardDistributor::get_position(const PoolKey& pool_key, PositionKey key) const {
    const RewardPool* pool = get_pool(pool_key);
    if (!pool) return std::nullopt;
    auto it = pool->positions.find(key);
    if (it == pool->positions.end()) return std::nullopt;
    return it->second;
}

std::vector<PositionKey> RewardDistributor::positions_of(const Address& owner, const PoolKey& pool) const {
    return index_.positions_of(owner, pool.id());
}

const RangeAccumulator* RewardDistributor::accumulator(const PoolKey& pool_key) const {
    const RewardPool* pool = get_pool(pool_key);
    return pool ? &pool->accumulator : nullptr;
}

RewardDistributor::Stats RewardDistributor::get_stats() const {
    uint64_t positions = 0;
    for (const auto& [id, pool] : pools_) {
        positions += pool.positions.size();
    }
    return Stats{
        static_cast<uint64_t>(pools_.size()),
        positions,
        static_cast<uint64_t>(index_.size()),
        total_pokes_,
        total_claims_
    };
}

} // namespace incentive
