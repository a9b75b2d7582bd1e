// Incentive - Multi-Stream Ledger Tests

#include <catch2/catch_test_macros.hpp>

#include "test_support.hpp"

#include <vector>

using namespace incentive;
using namespace incentive::testing;

namespace {

const Currency BONUS = token(0x201);

struct StreamFixture {
    MockPoolManager pools;
    TokenLedger ledger;
    ManualClock clock{1000};
    MultiStreamLedger dist{config(), ledger, pools, clock.fn()};
    PoolKey pool = make_pool();

    static DistributorConfig config() {
        DistributorConfig c = make_config();
        c.stream_duration = 1000;
        c.whitelisted_tokens = {REWARD};
        return c;
    }

    StreamFixture() {
        pools.set_tick(pool, 0);
        REQUIRE(dist.register_pool(pool) == errors::OK);
    }

    void fund(const Currency& token, U128 amount) {
        ledger.mint(token, ADMIN, amount);
        REQUIRE(dist.create_incentive(ADMIN, pool, token, amount) == errors::OK);
    }

    PositionUpdate subscribe(const Address& owner, U128 liquidity) {
        PositionUpdate update = make_update(owner, pool, FULL_LOWER, FULL_UPPER,
                                            static_cast<I128>(liquidity));
        REQUIRE(dist.notify_subscribe(update) == errors::OK);
        return update;
    }
};

} // anonymous namespace

TEST_CASE("Token whitelist", "[stream]") {
    StreamFixture f;
    REQUIRE(f.dist.is_whitelisted(REWARD));
    REQUIRE_FALSE(f.dist.is_whitelisted(BONUS));

    REQUIRE(f.dist.whitelist_token(ALICE, BONUS, true) == errors::UNAUTHORIZED);
    REQUIRE_FALSE(f.dist.is_whitelisted(BONUS));

    REQUIRE(f.dist.whitelist_token(ADMIN, BONUS, true) == errors::OK);
    REQUIRE(f.dist.is_whitelisted(BONUS));

    REQUIRE(f.dist.whitelist_token(ADMIN, BONUS, false) == errors::OK);
    REQUIRE_FALSE(f.dist.is_whitelisted(BONUS));
}

TEST_CASE("Incentive validation", "[stream]") {
    StreamFixture f;
    f.ledger.mint(REWARD, ADMIN, 5000);
    f.ledger.mint(BONUS, ADMIN, 5000);

    REQUIRE(f.dist.create_incentive(ALICE, f.pool, REWARD, 5000) == errors::UNAUTHORIZED);
    REQUIRE(f.dist.create_incentive(ADMIN, f.pool, BONUS, 5000) == errors::TOKEN_NOT_WHITELISTED);
    REQUIRE(f.dist.create_incentive(ADMIN, f.pool, REWARD, 0) == errors::INVALID_AMOUNT);
    REQUIRE(f.dist.create_incentive(ADMIN, make_pool(0x400, 0x401), REWARD, 5000) ==
            errors::POOL_NOT_REGISTERED);
    REQUIRE(f.dist.create_incentive(ADMIN, f.pool, REWARD, 5001) == errors::INSUFFICIENT_BALANCE);

    // Less than one unit per second over the duration
    REQUIRE(f.dist.create_incentive(ADMIN, f.pool, REWARD, 999) == errors::INVALID_AMOUNT);

    REQUIRE_FALSE(f.dist.stream(f.pool, REWARD).has_value());
    REQUIRE(f.ledger.balance_of(REWARD, ADMIN) == U128(5000));
    REQUIRE(f.ledger.balance_of(REWARD, CUSTODY) == U128(0));
}

TEST_CASE("Fresh stream", "[stream]") {
    StreamFixture f;
    f.fund(REWARD, 1000500);

    auto s = f.dist.stream(f.pool, REWARD);
    REQUIRE(s.has_value());
    REQUIRE(s->rate_per_second == U128(1000));
    REQUIRE(s->finish_timestamp == 2000);
    REQUIRE(s->remaining_amount == U128(1000500));
    REQUIRE(f.dist.incentive_tokens(f.pool) == std::vector<Currency>{REWARD});
    REQUIRE(f.ledger.balance_of(REWARD, CUSTODY) == U128(1000500));
}

TEST_CASE("Top-up extends over a fresh duration", "[stream]") {
    StreamFixture f;
    f.fund(REWARD, 1000000);

    f.clock.time = 1400;
    f.fund(REWARD, 600000);

    // 400s streamed: 600000 left + 600000 new over 1000s
    auto s = f.dist.stream(f.pool, REWARD);
    REQUIRE(s->remaining_amount == U128(1200000));
    REQUIRE(s->rate_per_second == U128(1200));
    REQUIRE(s->finish_timestamp == 2400);
}

TEST_CASE("Streams stop at their finish", "[stream]") {
    StreamFixture f;
    PositionUpdate alice = f.subscribe(ALICE, 1000);
    f.fund(REWARD, 1000500);

    f.clock.time = 2500;
    REQUIRE(f.dist.poke_pool(f.pool) == errors::OK);

    auto s = f.dist.stream(f.pool, REWARD);
    REQUIRE(s->rate_per_second == U128(0));
    REQUIRE(s->remaining_amount == U128(500));
    REQUIRE(f.dist.pending_rewards(f.pool, alice.key).at(REWARD) == U128(1000000));

    SECTION("Nothing more accrues after expiry") {
        f.clock.time = 9000;
        REQUIRE(f.dist.poke_pool(f.pool) == errors::OK);
        REQUIRE(f.dist.pending_rewards(f.pool, alice.key).at(REWARD) == U128(1000000));
    }

    SECTION("Funding an expired stream starts fresh on top of the dust") {
        f.clock.time = 3000;
        f.fund(REWARD, 1000000);
        s = f.dist.stream(f.pool, REWARD);
        REQUIRE(s->remaining_amount == U128(1000500));
        REQUIRE(s->rate_per_second == U128(1000));
        REQUIRE(s->finish_timestamp == 4000);

        // Idle gap 2500..3000 earned nothing
        f.clock.time = 3100;
        REQUIRE(f.dist.poke_pool(f.pool) == errors::OK);
        REQUIRE(f.dist.pending_rewards(f.pool, alice.key).at(REWARD) == U128(1100000));
    }
}

TEST_CASE("Multiple tokens with staggered finishes", "[stream]") {
    StreamFixture f;
    REQUIRE(f.dist.whitelist_token(ADMIN, BONUS, true) == errors::OK);
    PositionUpdate alice = f.subscribe(ALICE, 1000);
    PositionUpdate bob = f.subscribe(BOB, 3000);

    f.fund(REWARD, 4000000);           // 4000/s until 2000
    f.clock.time = 1500;
    f.fund(BONUS, 8000000);            // 8000/s until 2500

    // One poke long after both finish
    f.clock.time = 5000;
    REQUIRE(f.dist.poke_pool(f.pool) == errors::OK);

    TokenAmounts a = f.dist.pending_rewards(f.pool, alice.key);
    TokenAmounts b = f.dist.pending_rewards(f.pool, bob.key);
    REQUIRE(a.at(REWARD) == U128(1000000));
    REQUIRE(b.at(REWARD) == U128(3000000));
    REQUIRE(a.at(BONUS) == U128(2000000));
    REQUIRE(b.at(BONUS) == U128(6000000));

    REQUIRE(f.dist.stream(f.pool, REWARD)->remaining_amount == U128(0));
    REQUIRE(f.dist.stream(f.pool, BONUS)->remaining_amount == U128(0));

    TokenAmounts paid;
    REQUIRE(f.dist.claim_all_for_owner(BOB, {f.pool}, BOB, &paid) == errors::OK);
    REQUIRE(paid.size() == 2);
    REQUIRE(f.ledger.balance_of(BONUS, BOB) == U128(6000000));
    REQUIRE(f.ledger.balance_of(BONUS, CUSTODY) == U128(2000000));
}

TEST_CASE("Pending projects streams to now", "[stream]") {
    StreamFixture f;
    PositionUpdate alice = f.subscribe(ALICE, 1000);
    f.fund(REWARD, 1000000);

    // No poke since funding: the projection runs on a copy
    f.clock.time = 1500;
    REQUIRE(f.dist.pending_rewards(f.pool, alice.key).at(REWARD) == U128(500000));
    REQUIRE(f.dist.pending_rewards_owner(ALICE, {f.pool}).at(REWARD) == U128(500000));
    REQUIRE(f.dist.stream(f.pool, REWARD)->remaining_amount == U128(1000000));
    REQUIRE(f.dist.accumulator(f.pool)->last_sync() == 1000);

    SECTION("A claim at the same instant pays the projection") {
        TokenAmounts paid;
        REQUIRE(f.dist.claim(ALICE, f.pool, alice.key, ALICE, &paid) == errors::OK);
        REQUIRE(paid.at(REWARD) == U128(500000));
    }

    SECTION("Projection stops at the finish") {
        f.clock.time = 2700;
        REQUIRE(f.dist.pending_rewards(f.pool, alice.key).at(REWARD) == U128(1000000));
        REQUIRE(f.dist.stream(f.pool, REWARD)->rate_per_second == U128(1000));
    }
}

TEST_CASE("A clock step back leaves streams intact", "[stream][regression]") {
    StreamFixture f;
    PositionUpdate alice = f.subscribe(ALICE, 1000);
    f.fund(REWARD, 1000000);

    f.clock.time = 1500;
    REQUIRE(f.dist.claim(ALICE, f.pool, alice.key, ALICE) == errors::OK);
    REQUIRE(f.dist.stream(f.pool, REWARD)->remaining_amount == U128(500000));

    f.clock.time = 1400;
    REQUIRE_THROWS_AS(f.dist.poke_pool(f.pool), InvariantError);
    REQUIRE(f.dist.stream(f.pool, REWARD)->remaining_amount == U128(500000));
    REQUIRE(f.dist.accumulator(f.pool)->last_sync() == 1500);

    f.clock.time = 1600;
    REQUIRE(f.dist.poke_pool(f.pool) == errors::OK);
    REQUIRE(f.dist.stream(f.pool, REWARD)->remaining_amount == U128(400000));
    REQUIRE(f.dist.pending_rewards(f.pool, alice.key).at(REWARD) == U128(100000));
}

TEST_CASE("Randomized stream conservation", "[stream][fuzz]") {
    StreamFixture f;
    REQUIRE(f.dist.whitelist_token(ADMIN, BONUS, true) == errors::OK);
    const std::vector<Currency> tokens{REWARD, BONUS};

    PositionTraffic traffic(f.dist, f.pool, 7321);
    auto& rng = traffic.rng();
    TokenAmounts deposited;

    for (int step = 0; step < 400; ++step) {
        f.clock.time += rng() % 300;

        switch (rng() % 6) {
            case 0: {
                const Currency& t = tokens[rng() % tokens.size()];
                U128 amount = 1000 + rng() % 500000;
                f.fund(t, amount);
                deposited[t] += amount;
                break;
            }
            case 1:
            case 2:
                traffic.callback();
                break;
            case 3:
                f.pools.set_tick(f.pool, traffic.random_tick());
                break;
            case 4: {
                const Address& owner = traffic.random_owner();
                REQUIRE(f.dist.claim_all_for_owner(owner, {f.pool}, owner) == errors::OK);
                break;
            }
            default:
                break;
        }

        REQUIRE(f.dist.poke_pool(f.pool) == errors::OK);
        TokenAmounts pending = traffic.pending();

        for (const Currency& t : tokens) {
            U128 claimed = f.ledger.balance_of(t, ALICE) + f.ledger.balance_of(t, BOB);
            U128 custody = f.ledger.balance_of(t, CUSTODY);
            U128 owed = pending.count(t) ? pending.at(t) : U128(0);
            auto s = f.dist.stream(f.pool, t);
            U128 remaining = s ? s->remaining_amount : U128(0);

            REQUIRE(custody + claimed == deposited[t]);
            REQUIRE(claimed + owed + remaining <= deposited[t]);
            REQUIRE(owed <= custody);
        }
    }
    REQUIRE(traffic.opened() > 0);
}
