// =============================================================================
// claim_aggregator.cpp - Owner position index
// =============================================================================

#include "incentive/claim_aggregator.hpp"
#include "incentive/math.hpp"

namespace incentive {

void merge_amounts(TokenAmounts& into, const TokenAmounts& from) {
    for (const auto& [token, amount] : from) {
        if (amount == 0) continue;
        into[token] = math::checked_add(into[token], amount);
    }
}

void ClaimAggregator::track(const Address& owner, PoolId pool, PositionKey key) {
    index_[owner][pool].insert(key);
}

void ClaimAggregator::untrack(const Address& owner, PoolId pool, PositionKey key) {
    auto owner_it = index_.find(owner);
    if (owner_it == index_.end()) return;

    auto pool_it = owner_it->second.find(pool);
    if (pool_it == owner_it->second.end()) return;

    pool_it->second.erase(key);
    if (pool_it->second.empty()) {
        owner_it->second.erase(pool_it);
        if (owner_it->second.empty()) {
            index_.erase(owner_it);
        }
    }
}

bool ClaimAggregator::is_tracked(const Address& owner, PoolId pool, PositionKey key) const {
    auto owner_it = index_.find(owner);
    if (owner_it == index_.end()) return false;
    auto pool_it = owner_it->second.find(pool);
    return pool_it != owner_it->second.end() && pool_it->second.count(key) != 0;
}

std::vector<PositionKey> ClaimAggregator::positions_of(const Address& owner, PoolId pool) const {
    auto owner_it = index_.find(owner);
    if (owner_it == index_.end()) return {};
    auto pool_it = owner_it->second.find(pool);
    if (pool_it == owner_it->second.end()) return {};
    return {pool_it->second.begin(), pool_it->second.end()};
}

std::vector<PoolId> ClaimAggregator::pools_of(const Address& owner) const {
    std::vector<PoolId> pools;
    auto owner_it = index_.find(owner);
    if (owner_it == index_.end()) return pools;
    for (const auto& [pool, keys] : owner_it->second) {
        pools.push_back(pool);
    }
    return pools;
}

size_t ClaimAggregator::size() const {
    size_t count = 0;
    for (const auto& [owner, pools] : index_) {
        for (const auto& [pool, keys] : pools) {
            count += keys.size();
        }
    }
    return count;
}

TokenAmounts ClaimAggregator::collect(const Address& owner, const std::vector<PoolId>& pools,
                                      const Collector& collector, bool prune) {
    TokenAmounts total;
    std::vector<std::pair<PoolId, PositionKey>> swept;

    for (PoolId pool : pools) {
        // Copy: the collector may touch the index through its owner
        for (PositionKey key : positions_of(owner, pool)) {
            Collected result = collector(pool, key);
            merge_amounts(total, result.amounts);
            if (result.prunable) {
                swept.emplace_back(pool, key);
            }
        }
    }

    if (prune) {
        for (const auto& [pool, key] : swept) {
            untrack(owner, pool, key);
        }
    }
    return total;
}

} // namespace incentive
