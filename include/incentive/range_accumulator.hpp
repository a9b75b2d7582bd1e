#ifndef INCENTIVE_RANGE_ACCUMULATOR_HPP
#define INCENTIVE_RANGE_ACCUMULATOR_HPP

#include <map>
#include <optional>
#include <vector>

#include "math.hpp"
#include "tick_bitmap.hpp"
#include "types.hpp"

namespace incentive {

// =============================================================================
// Tick Info
// =============================================================================

struct TickInfo {
    U128 liquidity_gross;        // Total liquidity referencing this tick
    I128 liquidity_net;          // Net liquidity change when crossed upward
    // Per token slot; slots registered after the tick was initialized read as 0
    std::vector<U256> rewards_per_liquidity_outside_x128;
};

// =============================================================================
// RangeAccumulator - per-pool tick-indexed rewards-per-liquidity
// =============================================================================
//
// Same mechanics as fee growth inside a concentrated-liquidity pool, with the
// growth driven by external per-second reward rates instead of swap fees.
// A position is in range when tick_lower <= active_tick < tick_upper.

class RangeAccumulator {
public:
    RangeAccumulator(int32_t tick_spacing, int32_t active_tick, uint64_t now);

    // =========================================================================
    // Core Operations
    // =========================================================================

    // Accrue tokens[i] at rates[i] for (last_sync, now] over the active
    // liquidity, then cross every initialized tick up to active_tick.
    void sync(const std::vector<Currency>& tokens, const std::vector<U128>& rates,
              int32_t active_tick, uint64_t now);

    // Rewards per liquidity earned inside [tick_lower, tick_upper). Modular:
    // only the difference between two readings is meaningful.
    // An uninitialized bound reads as if initialized now (outside = cumulative
    // at or below the active tick, else 0), not as a fixed 0 / cumulative
    // sentinel; the two readings differ by a constant, so payouts match.
    U256 range_value(const Currency& token, int32_t tick_lower, int32_t tick_upper) const;

    // Add or remove liquidity for a range at the current active tick
    void modify_liquidity(int32_t tick_lower, int32_t tick_upper, I128 liquidity_delta);

    // =========================================================================
    // Tokens
    // =========================================================================

    // Slot for a token, registering it on first use
    size_t token_slot(const Currency& token);
    std::optional<size_t> find_token(const Currency& token) const;
    const std::vector<Currency>& tokens() const { return tokens_; }

    // =========================================================================
    // Queries
    // =========================================================================

    U256 cumulative(const Currency& token) const;
    U128 active_liquidity() const { return active_liquidity_; }
    int32_t active_tick() const { return active_tick_; }
    uint64_t last_sync() const { return last_sync_; }
    int32_t tick_spacing() const { return bitmap_.tick_spacing(); }

    std::optional<TickInfo> get_tick(int32_t tick) const;
    bool is_initialized(int32_t tick) const { return bitmap_.is_initialized(tick); }
    size_t initialized_tick_count() const { return bitmap_.initialized_count(); }
    const std::map<int32_t, TickInfo>& ticks() const { return ticks_; }

    // Range bounds, ordering and spacing alignment
    static bool valid_range(int32_t tick_lower, int32_t tick_upper, int32_t tick_spacing);

private:
    U256 outside(int32_t tick, size_t slot) const;
    void init_outside(int32_t tick, TickInfo& info) const;
    std::vector<int32_t> ticks_to_cross(int32_t from, int32_t to) const;

    std::vector<Currency> tokens_;
    std::vector<U256> cumulative_;       // Per slot, Q128, never decreases
    std::map<int32_t, TickInfo> ticks_;
    TickBitmap bitmap_;
    U128 active_liquidity_;
    int32_t active_tick_;
    uint64_t last_sync_;
};

} // namespace incentive

#endif // INCENTIVE_RANGE_ACCUMULATOR_HPP
