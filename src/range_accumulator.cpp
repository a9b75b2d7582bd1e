// =============================================================================
// range_accumulator.cpp - Tick-indexed rewards-per-liquidity accumulator
// =============================================================================

#include "incentive/range_accumulator.hpp"

#include <stdexcept>
#include <string>

namespace incentive {

// =============================================================================
// Constructor
// =============================================================================

RangeAccumulator::RangeAccumulator(int32_t tick_spacing, int32_t active_tick, uint64_t now)
    : bitmap_(tick_spacing),
      active_liquidity_(0),
      active_tick_(active_tick),
      last_sync_(now) {}

// =============================================================================
// Tokens
// =============================================================================

size_t RangeAccumulator::token_slot(const Currency& token) {
    if (auto slot = find_token(token)) return *slot;
    tokens_.push_back(token);
    cumulative_.emplace_back();
    return tokens_.size() - 1;
}

std::optional<size_t> RangeAccumulator::find_token(const Currency& token) const {
    for (size_t i = 0; i < tokens_.size(); ++i) {
        if (tokens_[i] == token) return i;
    }
    return std::nullopt;
}

U256 RangeAccumulator::cumulative(const Currency& token) const {
    auto slot = find_token(token);
    return slot ? cumulative_[*slot] : U256{};
}

// =============================================================================
// Sync
// =============================================================================

void RangeAccumulator::sync(const std::vector<Currency>& tokens, const std::vector<U128>& rates,
                            int32_t active_tick, uint64_t now) {
    if (tokens.size() != rates.size()) {
        throw std::invalid_argument("sync: tokens and rates differ in length");
    }
    if (now < last_sync_) {
        throw InvariantError("sync: timestamp " + std::to_string(now) +
                             " precedes last sync " + std::to_string(last_sync_));
    }

    std::vector<size_t> slots;
    slots.reserve(tokens.size());
    for (const auto& token : tokens) {
        slots.push_back(token_slot(token));
    }

    // Stage the accrual; only in-range liquidity earns for this interval
    std::vector<U256> next_cumulative = cumulative_;
    uint64_t dt = now - last_sync_;
    if (dt > 0 && active_liquidity_ > 0) {
        for (size_t i = 0; i < slots.size(); ++i) {
            if (rates[i] == 0) continue;
            U256 increment = math::rpl_increment(rates[i], dt, active_liquidity_);
            next_cumulative[slots[i]] = math::checked_add(next_cumulative[slots[i]], increment);
        }
    }

    // Stage the crossings
    bool upward = active_tick > active_tick_;
    std::vector<int32_t> crossed = ticks_to_cross(active_tick_, active_tick);
    U128 liquidity = active_liquidity_;
    for (int32_t tick : crossed) {
        I128 net = ticks_.at(tick).liquidity_net;
        liquidity = math::add_delta(liquidity, upward ? net : math::checked_sub(I128(0), net));
    }

    // Commit
    cumulative_ = std::move(next_cumulative);
    for (int32_t tick : crossed) {
        auto& outside = ticks_.at(tick).rewards_per_liquidity_outside_x128;
        outside.resize(cumulative_.size());
        for (size_t slot = 0; slot < cumulative_.size(); ++slot) {
            outside[slot] = cumulative_[slot] - outside[slot];
        }
    }
    active_liquidity_ = liquidity;
    active_tick_ = active_tick;
    last_sync_ = now;
}

std::vector<int32_t> RangeAccumulator::ticks_to_cross(int32_t from, int32_t to) const {
    std::vector<int32_t> crossed;
    if (to > from) {
        // Upward: every initialized tick in (from, to]
        int32_t cursor = from;
        while (auto next = bitmap_.next_initialized_tick(cursor, false)) {
            if (*next > to) break;
            crossed.push_back(*next);
            cursor = *next;
        }
    } else if (to < from) {
        // Downward: every initialized tick in (to, from]
        int32_t cursor = from;
        while (auto next = bitmap_.next_initialized_tick(cursor, true)) {
            if (*next <= to) break;
            crossed.push_back(*next);
            cursor = *next - 1;
        }
    }
    return crossed;
}

// =============================================================================
// Range Value
// =============================================================================

U256 RangeAccumulator::outside(int32_t tick, size_t slot) const {
    auto it = ticks_.find(tick);
    if (it != ticks_.end()) {
        const auto& values = it->second.rewards_per_liquidity_outside_x128;
        return slot < values.size() ? values[slot] : U256{};
    }
    // Uninitialized: read as if initialized now
    return tick <= active_tick_ ? cumulative_[slot] : U256{};
}

U256 RangeAccumulator::range_value(const Currency& token, int32_t tick_lower, int32_t tick_upper) const {
    auto slot = find_token(token);
    if (!slot) return U256{};

    const U256& global = cumulative_[*slot];

    U256 outside_lower = outside(tick_lower, *slot);
    U256 below = active_tick_ >= tick_lower ? outside_lower : global - outside_lower;

    U256 outside_upper = outside(tick_upper, *slot);
    U256 above = active_tick_ < tick_upper ? outside_upper : global - outside_upper;

    return global - below - above;
}

// =============================================================================
// Modify Liquidity
// =============================================================================

bool RangeAccumulator::valid_range(int32_t tick_lower, int32_t tick_upper, int32_t tick_spacing) {
    if (tick_spacing <= 0) return false;
    if (tick_lower >= tick_upper) return false;
    if (tick_lower < tick_math::MIN_TICK || tick_upper > tick_math::MAX_TICK) return false;
    return tick_lower % tick_spacing == 0 && tick_upper % tick_spacing == 0;
}

void RangeAccumulator::init_outside(int32_t tick, TickInfo& info) const {
    // Convention: all growth so far happened below an initialized tick at or
    // below the active tick
    info.rewards_per_liquidity_outside_x128.assign(cumulative_.size(), U256{});
    if (tick <= active_tick_) {
        info.rewards_per_liquidity_outside_x128 = cumulative_;
    }
}

void RangeAccumulator::modify_liquidity(int32_t tick_lower, int32_t tick_upper, I128 liquidity_delta) {
    if (!valid_range(tick_lower, tick_upper, tick_spacing())) {
        throw std::invalid_argument("invalid tick range [" + std::to_string(tick_lower) + ", " +
                                    std::to_string(tick_upper) + ")");
    }
    if (liquidity_delta == 0) return;

    auto staged = [this](int32_t tick) {
        auto it = ticks_.find(tick);
        if (it != ticks_.end()) return it->second;
        TickInfo fresh{0, 0, {}};
        init_outside(tick, fresh);
        return fresh;
    };

    // Stage both boundary ticks and the active liquidity
    TickInfo lower = staged(tick_lower);
    U128 lower_gross_before = lower.liquidity_gross;
    lower.liquidity_gross = math::add_delta(lower.liquidity_gross, liquidity_delta);
    lower.liquidity_net = math::checked_add(lower.liquidity_net, liquidity_delta);

    TickInfo upper = staged(tick_upper);
    U128 upper_gross_before = upper.liquidity_gross;
    upper.liquidity_gross = math::add_delta(upper.liquidity_gross, liquidity_delta);
    upper.liquidity_net = math::checked_sub(upper.liquidity_net, liquidity_delta);  // Opposite sign for upper

    U128 active = active_liquidity_;
    if (active_tick_ >= tick_lower && active_tick_ < tick_upper) {
        active = math::add_delta(active, liquidity_delta);
    }

    // Commit
    auto commit = [this](int32_t tick, U128 gross_before, TickInfo&& info) {
        bool flipped = (gross_before == 0) != (info.liquidity_gross == 0);
        if (flipped) {
            bitmap_.flip_tick(tick);
        }
        if (info.liquidity_gross == 0) {
            ticks_.erase(tick);
        } else {
            ticks_[tick] = std::move(info);
        }
    };
    commit(tick_lower, lower_gross_before, std::move(lower));
    commit(tick_upper, upper_gross_before, std::move(upper));
    active_liquidity_ = active;
}

// =============================================================================
// Queries
// =============================================================================

std::optional<TickInfo> RangeAccumulator::get_tick(int32_t tick) const {
    auto it = ticks_.find(tick);
    return it != ticks_.end() ? std::optional{it->second} : std::nullopt;
}

} // namespace incentive
