// =============================================================================
// position.cpp - Position reward accrual
// =============================================================================

#include "incentive/position.hpp"

namespace incentive {

U128 PositionAccrual::accrue(U128 liquidity, const U256& current_range_value) {
    U128 earned = 0;
    if (liquidity != 0) {
        earned = math::mul_shift128(growth(current_range_value), liquidity);
    }
    rewards_accrued = math::checked_add(rewards_accrued, earned);
    rewards_per_liquidity_last_x128 = current_range_value;
    return earned;
}

U128 PositionAccrual::claim() {
    U128 amount = rewards_accrued;
    rewards_accrued = 0;
    return amount;
}

U128 PositionAccrual::pending(U128 liquidity, const U256& current_range_value) const {
    if (liquidity == 0) return rewards_accrued;
    return math::checked_add(rewards_accrued,
                             math::mul_shift128(growth(current_range_value), liquidity));
}

} // namespace incentive
