#ifndef INCENTIVE_TICK_BITMAP_HPP
#define INCENTIVE_TICK_BITMAP_HPP

#include <bitset>
#include <map>
#include <optional>
#include <utility>

#include "types.hpp"

namespace incentive {

// =============================================================================
// TickBitmap - sparse bitmap of initialized ticks
// =============================================================================
//
// Ticks are compressed by the tick spacing; each compressed tick maps to
// (word, bit) with 256 ticks per word. Empty words are not stored, so a search
// skips gaps in O(log words).

class TickBitmap {
public:
    static constexpr int WORD_BITS = 256;

    explicit TickBitmap(int32_t tick_spacing);

    // Toggle the initialized state of a tick (must be a multiple of the spacing)
    void flip_tick(int32_t tick);

    bool is_initialized(int32_t tick) const;

    // lte = true: greatest initialized tick <= tick
    // lte = false: least initialized tick > tick
    std::optional<int32_t> next_initialized_tick(int32_t tick, bool lte) const;

    size_t initialized_count() const;
    size_t word_count() const { return words_.size(); }
    int32_t tick_spacing() const { return tick_spacing_; }

private:
    int32_t compress(int32_t tick) const;
    static std::pair<int16_t, int> position(int32_t compressed);

    std::map<int16_t, std::bitset<WORD_BITS>> words_;
    int32_t tick_spacing_;
};

} // namespace incentive

#endif // INCENTIVE_TICK_BITMAP_HPP
