// Incentive - shared test fixtures

#ifndef INCENTIVE_TEST_SUPPORT_HPP
#define INCENTIVE_TEST_SUPPORT_HPP

#include <algorithm>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_tostring.hpp>
#include <incentive/incentive.hpp>

// Readable failure messages for the 128/256-bit types
namespace Catch {
template <>
struct StringMaker<incentive::U128> {
    static std::string convert(incentive::U128 v) { return incentive::math::to_string(v); }
};
template <>
struct StringMaker<incentive::I128> {
    static std::string convert(incentive::I128 v) { return incentive::math::to_string(v); }
};
template <>
struct StringMaker<incentive::U256> {
    static std::string convert(const incentive::U256& v) { return incentive::math::to_string(v); }
};
} // namespace Catch

namespace incentive::testing {

// Pool manager with settable active ticks
class MockPoolManager : public IPoolManager {
public:
    void set_tick(const PoolKey& key, int32_t tick) { ticks_[key.id()] = tick; }
    void clear(const PoolKey& key) { ticks_.erase(key.id()); }

    std::optional<int32_t> get_tick(const PoolKey& key) const override {
        auto it = ticks_.find(key.id());
        if (it == ticks_.end()) return std::nullopt;
        return it->second;
    }

private:
    std::map<PoolId, int32_t> ticks_;
};

// Manually advanced clock
struct ManualClock {
    uint64_t time = 0;

    RewardDistributor::Clock fn() {
        return [this]() { return time; };
    }
    void advance(uint64_t seconds) { time += seconds; }
};

inline Currency token(uint16_t id) {
    return Currency{addresses::from_id(id)};
}

inline PoolKey make_pool(uint16_t a = 0x100, uint16_t b = 0x101, int32_t tick_spacing = 60) {
    return PoolKey{token(a), token(b), 3000, tick_spacing, Address{}};
}

inline PositionUpdate make_update(const Address& owner, const PoolKey& pool,
                                  int32_t tick_lower, int32_t tick_upper,
                                  I128 liquidity_delta, uint64_t salt = 0) {
    return PositionUpdate{owner, position_key(owner, pool.id(), tick_lower, tick_upper, salt),
                          pool, tick_lower, tick_upper, liquidity_delta};
}

// Widest range aligned to a spacing of 60
constexpr int32_t FULL_LOWER = -887220;
constexpr int32_t FULL_UPPER = 887220;

const Address ADMIN = addresses::from_id(0xA0);
const Address DEPOSITOR = addresses::from_id(0xB0);
const Address CUSTODY = addresses::from_id(0xC0);
const Address ALICE = addresses::from_id(0x01);
const Address BOB = addresses::from_id(0x02);
const Currency REWARD = token(0x200);

inline DistributorConfig make_config() {
    DistributorConfig config;
    config.admin = ADMIN;
    config.reward_depositor = DEPOSITOR;
    config.custody = CUSTODY;
    config.reward_token = REWARD;
    config.log_level = "off";
    return config;
}

// Seeded random position manager traffic against one pool. Every callback
// it issues is valid and must succeed.
class PositionTraffic {
public:
    PositionTraffic(RewardDistributor& dist, const PoolKey& pool, uint32_t seed)
        : dist_(dist), pool_(pool), rng_(seed) {}

    std::mt19937& rng() { return rng_; }

    void callback() {
        switch (rng_() % 3) {
            case 0: subscribe(); break;
            case 1: modify(); break;
            default: burn(); break;
        }
    }

    int32_t random_tick() { return static_cast<int32_t>(rng_() % 1500) - 750; }
    const Address& random_owner() { return rng_() % 2 == 0 ? ALICE : BOB; }

    // Sum of pending rewards over every position ever opened
    TokenAmounts pending() const {
        TokenAmounts total;
        for (const auto& p : positions_) {
            merge_amounts(total, dist_.pending_rewards(pool_, p.update.key));
        }
        return total;
    }

    size_t opened() const { return positions_.size(); }

private:
    struct Tracked {
        PositionUpdate update;
        U128 liquidity;
        bool burned;
    };

    void subscribe() {
        int32_t a = static_cast<int32_t>(rng_() % 21) * 60 - 600;
        int32_t b = static_cast<int32_t>(rng_() % 21) * 60 - 600;
        if (a == b) b = a + 60;
        const Address& owner = random_owner();
        I128 liquidity = static_cast<I128>(1 + rng_() % 10000);

        PositionUpdate update = make_update(owner, pool_, std::min(a, b), std::max(a, b),
                                            liquidity, next_salt_++);
        REQUIRE(dist_.notify_subscribe(update) == errors::OK);
        positions_.push_back(Tracked{update, static_cast<U128>(liquidity), false});
    }

    // Random open position, optionally only those holding liquidity
    Tracked* pick(bool with_liquidity) {
        std::vector<size_t> open;
        for (size_t i = 0; i < positions_.size(); ++i) {
            if (positions_[i].burned) continue;
            if (with_liquidity && positions_[i].liquidity == 0) continue;
            open.push_back(i);
        }
        if (open.empty()) return nullptr;
        return &positions_[open[rng_() % open.size()]];
    }

    void modify() {
        Tracked* p = pick(false);
        if (!p) {
            subscribe();
            return;
        }

        // A withdrawn record may have been pruned by a claim; a deposit reopens it
        PositionUpdate update = p->update;
        if (p->liquidity != 0 && rng_() % 2 == 0) {
            U128 cut = 1 + rng_() % static_cast<uint64_t>(p->liquidity);
            update.liquidity_delta = -static_cast<I128>(cut);
            p->liquidity -= cut;
        } else {
            U128 add = 1 + rng_() % 10000;
            update.liquidity_delta = static_cast<I128>(add);
            p->liquidity += add;
        }
        REQUIRE(dist_.notify_modify_liquidity(update) == errors::OK);
    }

    void burn() {
        Tracked* p = pick(true);
        if (!p) return;
        REQUIRE(dist_.notify_burn(p->update) == errors::OK);
        p->burned = true;
        p->liquidity = 0;
    }

    RewardDistributor& dist_;
    PoolKey pool_;
    std::mt19937 rng_;
    std::vector<Tracked> positions_;
    uint64_t next_salt_ = 1;
};

} // namespace incentive::testing

#endif // INCENTIVE_TEST_SUPPORT_HPP
