#ifndef INCENTIVE_DISTRIBUTOR_HPP
#define INCENTIVE_DISTRIBUTOR_HPP

#include <functional>
#include <optional>
#include <unordered_map>
#include <vector>

#include "claim_aggregator.hpp"
#include "config.hpp"
#include "position.hpp"
#include "range_accumulator.hpp"
#include "token_ledger.hpp"
#include "types.hpp"

namespace incentive {

// =============================================================================
// Pool Manager Interface
// =============================================================================

class IPoolManager {
public:
    virtual ~IPoolManager() = default;

    // Current active tick, or nullopt if the pool is not initialized
    virtual std::optional<int32_t> get_tick(const PoolKey& key) const = 0;
};

// =============================================================================
// Position Manager Subscriber Interface
// =============================================================================

class ISubscriber {
public:
    virtual ~ISubscriber() = default;

    virtual int32_t notify_subscribe(const PositionUpdate& update) = 0;
    virtual int32_t notify_unsubscribe(const PositionUpdate& update) = 0;
    virtual int32_t notify_modify_liquidity(const PositionUpdate& update) = 0;
    virtual int32_t notify_burn(const PositionUpdate& update) = 0;
};

// =============================================================================
// Reward Pool (accumulator + positions of one pool)
// =============================================================================

struct RewardPool {
    PoolKey key;
    RangeAccumulator accumulator;
    std::unordered_map<PositionKey, PositionInfo> positions;
};

// =============================================================================
// RewardDistributor - shared base of the epoch pipeline and stream ledger
// =============================================================================
//
// Owns the per-pool accumulators, the position records and the owner index.
// Subclasses decide what rate each token streams at by implementing advance().

class RewardDistributor : public ISubscriber {
public:
    using Clock = std::function<uint64_t()>;

    RewardDistributor(const DistributorConfig& config, TokenLedger& ledger,
                      IPoolManager& pool_manager, Clock clock = {});
    ~RewardDistributor() override = default;

    // Non-copyable
    RewardDistributor(const RewardDistributor&) = delete;
    RewardDistributor& operator=(const RewardDistributor&) = delete;

    // =========================================================================
    // Pools
    // =========================================================================

    int32_t register_pool(const PoolKey& key);
    bool pool_registered(const PoolKey& key) const;

    // Bring the pool's accumulator up to now at the pool manager's active tick.
    // Idempotent; safe to call at any time.
    int32_t poke_pool(const PoolKey& key);

    // =========================================================================
    // Position Manager Callbacks
    // =========================================================================

    int32_t notify_subscribe(const PositionUpdate& update) override;
    int32_t notify_unsubscribe(const PositionUpdate& update) override;
    int32_t notify_modify_liquidity(const PositionUpdate& update) override;
    int32_t notify_burn(const PositionUpdate& update) override;

    // =========================================================================
    // Claims
    // =========================================================================

    // Claim everything accrued by one position to `recipient`
    int32_t claim(const Address& owner, const PoolKey& pool, PositionKey key,
                  const Address& recipient, TokenAmounts* paid = nullptr);

    // Claim across all of the owner's indexed positions in `pools`
    int32_t claim_all_for_owner(const Address& owner, const std::vector<PoolKey>& pools,
                                const Address& recipient, TokenAmounts* paid = nullptr);

    // Read-only projections at now(): the pool is advanced on a copy of its
    // accumulator, so a claim made at the same instant pays the same amounts
    TokenAmounts pending_rewards(const PoolKey& pool, PositionKey key) const;
    TokenAmounts pending_rewards_owner(const Address& owner, const std::vector<PoolKey>& pools) const;

    // =========================================================================
    // Queries
    // =========================================================================

    std::optional<PositionInfo> get_position(const PoolKey& pool, PositionKey key) const;
    std::vector<PositionKey> positions_of(const Address& owner, const PoolKey& pool) const;
    const RangeAccumulator* accumulator(const PoolKey& pool) const;
    const DistributorConfig& config() const { return config_; }
    uint64_t now() const { return clock_(); }

    struct Stats {
        uint64_t total_pools;
        uint64_t total_positions;
        uint64_t indexed_positions;
        uint64_t total_pokes;
        uint64_t total_claims;
    };
    Stats get_stats() const;

protected:
    // Accrue the pool from its last sync up to `now`, crossing to active_tick
    virtual void advance(RewardPool& pool, int32_t active_tick, uint64_t now) = 0;
    // The accumulator advance() would produce, without committing anything
    virtual RangeAccumulator projected(const RewardPool& pool, int32_t active_tick, uint64_t now) const = 0;
    virtual void on_pool_registered(RewardPool& pool) { (void)pool; }

    RewardPool* get_pool(const PoolKey& key);
    const RewardPool* get_pool(const PoolKey& key) const;

    // Move `amount` of `token` from `from` into custody
    int32_t pull(const Currency& token, const Address& from, U128 amount);

    TokenLedger& ledger() { return ledger_; }
    const TokenLedger& ledger() const { return ledger_; }

private:
    int32_t sync_pool(RewardPool& pool);
    int32_t validate_update(const PositionUpdate& update, RewardPool*& pool);

    // Fold pending growth into every token's accrued balance
    void accrue_position(RewardPool& pool, PositionInfo& position);
    // Move every token's snapshot to the current range value
    void snapshot_position(RewardPool& pool, PositionInfo& position);
    TokenAmounts pending_for(const RangeAccumulator& accumulator, const PositionInfo& position) const;
    // Accumulator at now() when the pool can be advanced, else as of the last sync
    RangeAccumulator accumulator_now(const RewardPool& pool) const;
    TokenAmounts owed(const Address& owner, const std::vector<PoolKey>& pools, bool at_now) const;
    // Liquidity change with accrue-before and snapshot-after
    void apply_liquidity(RewardPool& pool, PositionInfo& position, I128 delta);
    // Zero the accrued balances, erase the record if prunable
    ClaimAggregator::Collected collect_position(RewardPool& pool, PositionKey key);

    int32_t check_custody(const TokenAmounts& amounts) const;
    void pay_out(const TokenAmounts& amounts, const Address& recipient);

    DistributorConfig config_;
    TokenLedger& ledger_;
    IPoolManager& pool_manager_;
    Clock clock_;

    std::unordered_map<PoolId, RewardPool> pools_;
    ClaimAggregator index_;

    // Set while a claim is paying out
    bool claim_in_flight_ = false;

    uint64_t total_pokes_ = 0;
    uint64_t total_claims_ = 0;
};

} // namespace incentive

#endif // INCENTIVE_DISTRIBUTOR_HPP
