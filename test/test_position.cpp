// Incentive - Position Accrual Tests

#include <catch2/catch_test_macros.hpp>

#include "test_support.hpp"

using namespace incentive;
using namespace incentive::testing;

TEST_CASE("Position accrual", "[position]") {
    PositionAccrual accrual;

    SECTION("Accrue folds growth and moves the snapshot") {
        REQUIRE(accrual.accrue(1000, math::q128()) == U128(1000));
        REQUIRE(accrual.rewards_accrued == U128(1000));
        REQUIRE(accrual.rewards_per_liquidity_last_x128 == math::q128());

        // Zero liquidity earns nothing but still snapshots
        U256 two = math::q128() + math::q128();
        REQUIRE(accrual.accrue(0, two) == U128(0));
        REQUIRE(accrual.rewards_accrued == U128(1000));
        REQUIRE(accrual.rewards_per_liquidity_last_x128 == two);
    }

    SECTION("Claim zeroes the balance and keeps the snapshot") {
        accrual.accrue(250, math::q128());
        REQUIRE(accrual.claim() == U128(250));
        REQUIRE(accrual.claim() == U128(0));
        REQUIRE(accrual.rewards_per_liquidity_last_x128 == math::q128());
    }

    SECTION("Pending does not mutate") {
        accrual.accrue(10, math::q128());
        U256 later = math::q128() + math::q128();
        REQUIRE(accrual.pending(10, later) == U128(20));
        REQUIRE(accrual.rewards_accrued == U128(10));
        REQUIRE(accrual.rewards_per_liquidity_last_x128 == math::q128());
        REQUIRE(accrual.pending(0, later) == U128(10));
    }

    SECTION("Growth is modular across wrapped range values") {
        accrual.rewards_per_liquidity_last_x128 = U256(0) - U256(5);
        U256 current = math::q128() - U256(5);
        REQUIRE(accrual.growth(current) == math::q128());
        REQUIRE(accrual.accrue(7, current) == U128(7));
    }

    SECTION("Fractional growth floors") {
        U256 half(U128(1) << 127);
        REQUIRE(accrual.accrue(3, half) == U128(1));
    }
}

TEST_CASE("Position prunability", "[position]") {
    PositionInfo info{ALICE, 1, -60, 60, 0, false, {}};
    REQUIRE(info.prunable());

    info.accrual(2).rewards_accrued = 5;
    REQUIRE(info.rewards.size() == 3);
    REQUIRE(info.has_unclaimed());
    REQUIRE_FALSE(info.prunable());

    info.rewards[2].claim();
    REQUIRE(info.prunable());

    info.liquidity = 5;
    REQUIRE_FALSE(info.prunable());
}

TEST_CASE("Re-minting into a cleared range re-snapshots", "[position][regression]") {
    MockPoolManager pools;
    TokenLedger ledger;
    ManualClock clock{1000};

    DistributorConfig config = make_config();
    config.stream_duration = 1000;
    config.whitelisted_tokens = {REWARD};
    MultiStreamLedger dist(config, ledger, pools, clock.fn());

    PoolKey pool = make_pool();
    pools.set_tick(pool, 0);
    REQUIRE(dist.register_pool(pool) == errors::OK);

    PositionUpdate bob = make_update(BOB, pool, 60, 180, 1000);
    PositionUpdate alice = make_update(ALICE, pool, -60, 60, 1000);
    REQUIRE(dist.notify_subscribe(bob) == errors::OK);
    REQUIRE(dist.notify_subscribe(alice) == errors::OK);

    ledger.mint(REWARD, ADMIN, 1000000);
    REQUIRE(dist.create_incentive(ADMIN, pool, REWARD, 1000000) == errors::OK);
    REQUIRE(dist.stream(pool, REWARD)->rate_per_second == U128(1000));

    // Alice earns alone for 100s, then the price leaves her range and she exits
    clock.time = 1100;
    pools.set_tick(pool, 120);
    PositionUpdate withdraw = alice;
    withdraw.liquidity_delta = -1000;
    REQUIRE(dist.notify_modify_liquidity(withdraw) == errors::OK);
    REQUIRE(dist.get_position(pool, alice.key)->liquidity == U128(0));
    REQUIRE_FALSE(dist.accumulator(pool)->is_initialized(-60));
    REQUIRE(dist.pending_rewards(pool, alice.key).at(REWARD) == U128(100000));

    // Re-mint out of range into the cleared lower tick
    clock.time = 1200;
    REQUIRE(dist.notify_modify_liquidity(alice) == errors::OK);
    REQUIRE(dist.accumulator(pool)->is_initialized(-60));

    // Price returns; nothing earned while out of range
    clock.time = 1300;
    pools.set_tick(pool, 0);
    TokenAmounts paid;
    REQUIRE(dist.claim(ALICE, pool, alice.key, ALICE, &paid) == errors::OK);
    REQUIRE(paid.at(REWARD) == U128(100000));
    REQUIRE(dist.pending_rewards(pool, bob.key).at(REWARD) == U128(200000));

    clock.time = 1400;
    REQUIRE(dist.claim(ALICE, pool, alice.key, ALICE, &paid) == errors::OK);
    REQUIRE(paid.at(REWARD) == U128(100000));

    REQUIRE(ledger.balance_of(REWARD, ALICE) == U128(200000));
    REQUIRE(ledger.balance_of(REWARD, CUSTODY) == U128(800000));
    REQUIRE(ledger.balance_of(REWARD, CUSTODY) >= dist.pending_rewards(pool, bob.key).at(REWARD));
}
