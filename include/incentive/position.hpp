#ifndef INCENTIVE_POSITION_HPP
#define INCENTIVE_POSITION_HPP

#include <vector>

#include "math.hpp"
#include "types.hpp"

namespace incentive {

// =============================================================================
// PositionAccrual - per-position, per-token reward snapshot
// =============================================================================

struct PositionAccrual {
    U256 rewards_per_liquidity_last_x128;   // Range value at the last accrue
    U128 rewards_accrued = 0;               // Claimable balance

    // Fold growth since the snapshot into rewards_accrued and move the
    // snapshot to current_range_value. Returns the newly accrued amount.
    // current_range_value must come from the live accumulator.
    U128 accrue(U128 liquidity, const U256& current_range_value);

    // Return and zero the claimable balance
    U128 claim();

    // rewards_accrued plus what accrue() would add, without mutating
    U128 pending(U128 liquidity, const U256& current_range_value) const;

    U256 growth(const U256& current_range_value) const {
        return current_range_value - rewards_per_liquidity_last_x128;
    }
};

// =============================================================================
// Position Info
// =============================================================================

struct PositionInfo {
    Address owner;
    PoolId pool_id;
    int32_t tick_lower;
    int32_t tick_upper;
    U128 liquidity;
    bool subscribed;
    std::vector<PositionAccrual> rewards;   // Indexed by accumulator token slot

    // Accrual record for a slot, created on first use
    PositionAccrual& accrual(size_t slot) {
        if (rewards.size() <= slot) rewards.resize(slot + 1);
        return rewards[slot];
    }

    bool has_unclaimed() const {
        for (const auto& r : rewards) {
            if (r.rewards_accrued != 0) return true;
        }
        return false;
    }

    // Deferred cleanup: no liquidity left and fully claimed
    bool prunable() const { return liquidity == 0 && !has_unclaimed(); }
};

} // namespace incentive

#endif // INCENTIVE_POSITION_HPP
