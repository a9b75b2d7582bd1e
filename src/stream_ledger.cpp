// =============================================================================
// stream_ledger.cpp - Multi-token continuous incentive streams
// =============================================================================

#include "incentive/stream_ledger.hpp"
#include "incentive/log.hpp"

#include <string>
#include <utility>

namespace incentive {

MultiStreamLedger::MultiStreamLedger(const DistributorConfig& config, TokenLedger& ledger,
                                     IPoolManager& pool_manager, Clock clock)
    : RewardDistributor(config, ledger, pool_manager, std::move(clock)),
      whitelist_(config.whitelisted_tokens.begin(), config.whitelisted_tokens.end()) {}

// =============================================================================
// Whitelist
// =============================================================================

int32_t MultiStreamLedger::whitelist_token(const Address& caller, const Currency& token, bool allowed) {
    if (caller != config().admin) {
        log::warn("whitelist_token rejected: " + addresses::to_hex(caller) + " is not the admin");
        return errors::UNAUTHORIZED;
    }

    if (allowed) {
        whitelist_.insert(token);
    } else {
        whitelist_.erase(token);
    }
    log::info(std::string(allowed ? "whitelisted " : "delisted ") + addresses::to_hex(token.addr));
    return errors::OK;
}

bool MultiStreamLedger::is_whitelisted(const Currency& token) const {
    return whitelist_.count(token) != 0;
}

// =============================================================================
// Incentives
// =============================================================================

int32_t MultiStreamLedger::create_incentive(const Address& caller, const PoolKey& key,
                                            const Currency& token, U128 amount) {
    if (caller != config().admin) {
        log::warn("create_incentive rejected: " + addresses::to_hex(caller) + " is not the admin");
        return errors::UNAUTHORIZED;
    }
    if (!is_whitelisted(token)) {
        return errors::TOKEN_NOT_WHITELISTED;
    }
    if (amount == 0) {
        return errors::INVALID_AMOUNT;
    }

    RewardPool* pool = get_pool(key);
    if (!pool) {
        return errors::POOL_NOT_REGISTERED;
    }
    if (ledger().balance_of(token, caller) < amount) {
        return errors::INSUFFICIENT_BALANCE;
    }

    // Stream everything owed so far at the old rates
    int32_t rc = poke_pool(key);
    if (rc != errors::OK) {
        return rc;
    }

    uint64_t t = now();
    StreamMap& streams = streams_[key.id()];
    auto found = streams.find(token);
    bool existed = found != streams.end();
    IncentiveStream previous = existed ? found->second : IncentiveStream{};
    IncentiveStream next;
    next.remaining_amount = math::checked_add(previous.remaining_amount, amount);
    next.rate_per_second = next.remaining_amount / duration();
    next.finish_timestamp = t + duration();
    if (next.rate_per_second == 0) {
        return errors::INVALID_AMOUNT;
    }

    pool->accumulator.token_slot(token);
    streams[token] = next;

    rc = pull(token, caller, amount);
    if (rc != errors::OK) {
        if (existed) {
            streams[token] = previous;
        } else {
            streams.erase(token);
        }
        return rc;
    }

    bool extended = previous.rate_per_second != 0 && previous.finish_timestamp > t;
    log::info(std::string(extended ? "extended" : "created") + " incentive of " + math::to_string(amount) +
              " " + addresses::to_hex(token.addr) + " on pool " + std::to_string(key.id()) +
              " rate=" + math::to_string(next.rate_per_second) +
              " finish=" + std::to_string(next.finish_timestamp));
    return errors::OK;
}

// =============================================================================
// Stream Sync
// =============================================================================

void MultiStreamLedger::sync_segment(RangeAccumulator& accumulator, StreamMap& streams,
                                     int32_t active_tick, uint64_t until) {
    uint64_t dt = until - accumulator.last_sync();

    std::vector<Currency> tokens;
    std::vector<U128> rates;
    for (auto& [token, s] : streams) {
        if (s.rate_per_second == 0 || s.finish_timestamp <= accumulator.last_sync()) continue;
        tokens.push_back(token);
        rates.push_back(s.rate_per_second);

        U256 streamed = math::mul(s.rate_per_second, dt);
        U128 taken = streamed < U256(s.remaining_amount) ? streamed.lo : s.remaining_amount;
        s.remaining_amount -= taken;
    }

    accumulator.sync(tokens, rates, active_tick, until);
}

MultiStreamLedger::Staged MultiStreamLedger::stage(const RewardPool& pool, int32_t active_tick,
                                                   uint64_t now) const {
    uint64_t from = pool.accumulator.last_sync();
    if (now < from) {
        throw InvariantError("stream sync: timestamp " + std::to_string(now) +
                             " precedes last sync " + std::to_string(from));
    }

    auto found = streams_.find(pool.key.id());
    Staged staged{pool.accumulator, found != streams_.end() ? found->second : StreamMap{}};

    // Split at every finish inside the interval so no token streams past it
    std::set<uint64_t> stops;
    for (const auto& [token, s] : staged.streams) {
        if (s.rate_per_second != 0 && s.finish_timestamp > from && s.finish_timestamp < now) {
            stops.insert(s.finish_timestamp);
        }
    }
    for (uint64_t stop : stops) {
        sync_segment(staged.accumulator, staged.streams, staged.accumulator.active_tick(), stop);
    }
    sync_segment(staged.accumulator, staged.streams, active_tick, now);

    for (auto& [token, s] : staged.streams) {
        if (now >= s.finish_timestamp) {
            s.rate_per_second = 0;
        }
    }
    return staged;
}

// =============================================================================
// Distributor Hooks
// =============================================================================

void MultiStreamLedger::advance(RewardPool& pool, int32_t active_tick, uint64_t now) {
    Staged staged = stage(pool, active_tick, now);

    // Commit only after every segment synced
    StreamMap& streams = streams_[pool.key.id()];
    for (const auto& [token, s] : staged.streams) {
        auto previous = streams.find(token);
        if (previous != streams.end() && previous->second.rate_per_second != 0 && s.rate_per_second == 0) {
            log::debug("stream of " + addresses::to_hex(token.addr) + " on pool " +
                       std::to_string(pool.key.id()) + " finished, dust=" +
                       math::to_string(s.remaining_amount));
        }
    }
    pool.accumulator = std::move(staged.accumulator);
    streams = std::move(staged.streams);
}

RangeAccumulator MultiStreamLedger::projected(const RewardPool& pool, int32_t active_tick,
                                              uint64_t now) const {
    return stage(pool, active_tick, now).accumulator;
}

// =============================================================================
// Queries
// =============================================================================

std::optional<IncentiveStream> MultiStreamLedger::stream(const PoolKey& key, const Currency& token) const {
    auto pool = streams_.find(key.id());
    if (pool == streams_.end()) return std::nullopt;
    auto it = pool->second.find(token);
    if (it == pool->second.end()) return std::nullopt;
    return it->second;
}

std::vector<Currency> MultiStreamLedger::incentive_tokens(const PoolKey& key) const {
    std::vector<Currency> tokens;
    auto pool = streams_.find(key.id());
    if (pool == streams_.end()) return tokens;
    for (const auto& [token, s] : pool->second) {
        tokens.push_back(token);
    }
    return tokens;
}

} // namespace incentive
