#ifndef INCENTIVE_CLAIM_AGGREGATOR_HPP
#define INCENTIVE_CLAIM_AGGREGATOR_HPP

#include <functional>
#include <map>
#include <set>
#include <vector>

#include "types.hpp"

namespace incentive {

// =============================================================================
// ClaimAggregator - owner -> pool -> position key index
// =============================================================================
//
// Entries are appended on subscribe or first deposit. Unsubscribe and burn
// leave them in place; an entry is swept only when a collect pass reports it
// prunable (zero liquidity, nothing left to claim).

class ClaimAggregator {
public:
    // Result of visiting one indexed position
    struct Collected {
        TokenAmounts amounts;
        bool prunable;
    };
    using Collector = std::function<Collected(PoolId, PositionKey)>;

    void track(const Address& owner, PoolId pool, PositionKey key);
    void untrack(const Address& owner, PoolId pool, PositionKey key);
    bool is_tracked(const Address& owner, PoolId pool, PositionKey key) const;

    std::vector<PositionKey> positions_of(const Address& owner, PoolId pool) const;
    std::vector<PoolId> pools_of(const Address& owner) const;
    size_t size() const;

    // Visit every indexed position of `owner` in `pools` and sum the amounts.
    // With prune set, entries reported prunable are removed afterwards.
    TokenAmounts collect(const Address& owner, const std::vector<PoolId>& pools,
                         const Collector& collector, bool prune);

private:
    std::map<Address, std::map<PoolId, std::set<PositionKey>>> index_;
};

// Add every amount of `from` into `into` (checked)
void merge_amounts(TokenAmounts& into, const TokenAmounts& from);

} // namespace incentive

#endif // INCENTIVE_CLAIM_AGGREGATOR_HPP
