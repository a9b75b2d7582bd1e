#ifndef INCENTIVE_STREAM_LEDGER_HPP
#define INCENTIVE_STREAM_LEDGER_HPP

#include <map>
#include <optional>
#include <set>
#include <unordered_map>
#include <vector>

#include "distributor.hpp"

namespace incentive {

// =============================================================================
// Incentive Stream (one per pool per token)
// =============================================================================

struct IncentiveStream {
    U128 rate_per_second = 0;
    uint64_t finish_timestamp = 0;
    U128 remaining_amount = 0;      // Not yet streamed (dust once finished)
};

// =============================================================================
// MultiStreamLedger - continuous fixed-duration streams, any whitelisted token
// =============================================================================
//
// A top-up restarts the full duration with everything still unstreamed:
//   remaining' = remaining + amount
//   rate'      = remaining' / duration
//   finish'    = now + duration

class MultiStreamLedger : public RewardDistributor {
public:
    MultiStreamLedger(const DistributorConfig& config, TokenLedger& ledger,
                      IPoolManager& pool_manager, Clock clock = {});

    // Admin only
    int32_t whitelist_token(const Address& caller, const Currency& token, bool allowed);
    bool is_whitelisted(const Currency& token) const;

    // Admin only; pulls `amount` of `token` from `caller` and starts or
    // extends the pool's stream for that token
    int32_t create_incentive(const Address& caller, const PoolKey& pool,
                             const Currency& token, U128 amount);

    std::optional<IncentiveStream> stream(const PoolKey& pool, const Currency& token) const;
    std::vector<Currency> incentive_tokens(const PoolKey& pool) const;
    uint64_t duration() const { return config().stream_duration; }

protected:
    void advance(RewardPool& pool, int32_t active_tick, uint64_t now) override;
    RangeAccumulator projected(const RewardPool& pool, int32_t active_tick, uint64_t now) const override;

private:
    using StreamMap = std::map<Currency, IncentiveStream>;

    // Pool accumulator and streams advanced on copies
    struct Staged {
        RangeAccumulator accumulator;
        StreamMap streams;
    };
    Staged stage(const RewardPool& pool, int32_t active_tick, uint64_t now) const;

    // Sync [last_sync, until] with every stream live over the whole segment
    static void sync_segment(RangeAccumulator& accumulator, StreamMap& streams,
                             int32_t active_tick, uint64_t until);

    std::set<Currency> whitelist_;
    std::unordered_map<PoolId, StreamMap> streams_;
};

} // namespace incentive

#endif // INCENTIVE_STREAM_LEDGER_HPP
