// =============================================================================
// tick_bitmap.cpp - Initialized tick bitmap
// =============================================================================

#include "incentive/tick_bitmap.hpp"

#include <stdexcept>
#include <string>

namespace incentive {

TickBitmap::TickBitmap(int32_t tick_spacing)
    : tick_spacing_(tick_spacing) {
    if (tick_spacing <= 0) {
        throw std::invalid_argument("tick spacing must be positive");
    }
}

// Floor division (rounds toward negative infinity)
int32_t TickBitmap::compress(int32_t tick) const {
    int32_t compressed = tick / tick_spacing_;
    if (tick < 0 && tick % tick_spacing_ != 0) --compressed;
    return compressed;
}

std::pair<int16_t, int> TickBitmap::position(int32_t compressed) {
    int32_t word = compressed >= 0
        ? compressed / WORD_BITS
        : -((-compressed - 1) / WORD_BITS) - 1;
    int bit = static_cast<int>(compressed - word * WORD_BITS);
    return {static_cast<int16_t>(word), bit};
}

void TickBitmap::flip_tick(int32_t tick) {
    if (tick % tick_spacing_ != 0) {
        throw std::invalid_argument("tick " + std::to_string(tick) +
                                    " not aligned to spacing " + std::to_string(tick_spacing_));
    }

    auto [word, bit] = position(tick / tick_spacing_);
    auto& bits = words_[word];
    bits.flip(static_cast<size_t>(bit));
    if (bits.none()) {
        words_.erase(word);
    }
}

bool TickBitmap::is_initialized(int32_t tick) const {
    if (tick % tick_spacing_ != 0) return false;
    auto [word, bit] = position(tick / tick_spacing_);
    auto it = words_.find(word);
    return it != words_.end() && it->second.test(static_cast<size_t>(bit));
}

std::optional<int32_t> TickBitmap::next_initialized_tick(int32_t tick, bool lte) const {
    if (words_.empty()) return std::nullopt;

    auto to_tick = [this](int16_t word, int bit) {
        return (static_cast<int32_t>(word) * WORD_BITS + bit) * tick_spacing_;
    };

    if (lte) {
        auto [word, bit] = position(compress(tick));

        // Same word, at or below the starting bit
        auto it = words_.find(word);
        if (it != words_.end()) {
            for (int b = bit; b >= 0; --b) {
                if (it->second.test(static_cast<size_t>(b))) return to_tick(word, b);
            }
        }

        // Highest bit of the nearest lower non-empty word
        auto lower = words_.lower_bound(word);
        if (lower == words_.begin()) return std::nullopt;
        --lower;
        for (int b = WORD_BITS - 1; b >= 0; --b) {
            if (lower->second.test(static_cast<size_t>(b))) return to_tick(lower->first, b);
        }
        return std::nullopt;
    }

    auto [word, bit] = position(compress(tick) + 1);

    // Same word, at or above the starting bit
    auto it = words_.find(word);
    if (it != words_.end()) {
        for (int b = bit; b < WORD_BITS; ++b) {
            if (it->second.test(static_cast<size_t>(b))) return to_tick(word, b);
        }
    }

    // Lowest bit of the nearest higher non-empty word
    auto upper = words_.upper_bound(word);
    if (upper == words_.end()) return std::nullopt;
    for (int b = 0; b < WORD_BITS; ++b) {
        if (upper->second.test(static_cast<size_t>(b))) return to_tick(upper->first, b);
    }
    return std::nullopt;
}

size_t TickBitmap::initialized_count() const {
    size_t count = 0;
    for (const auto& [word, bits] : words_) {
        count += bits.count();
    }
    return count;
}

} // namespace incentive
