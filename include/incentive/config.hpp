#ifndef INCENTIVE_CONFIG_HPP
#define INCENTIVE_CONFIG_HPP

#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"

namespace incentive {

// =============================================================================
// Distributor Configuration
// =============================================================================

struct DistributorConfig {
    Address admin{};                 // Whitelisting and incentive creation
    Address reward_depositor{};      // Sole caller of add_rewards (fee buyback)
    Address custody{};               // Holder of undistributed rewards
    Currency reward_token{};         // Epoch pipeline reward token
    uint64_t stream_duration = durations::WEEK;
    std::string log_level = "info";
    std::vector<Currency> whitelisted_tokens;

    // Load from a JSON file; throws std::runtime_error on I/O or parse errors
    static DistributorConfig from_file(std::string_view path);

    // Parse a JSON document; missing keys keep their defaults
    static DistributorConfig from_json(std::string_view content);
};

} // namespace incentive

#endif // INCENTIVE_CONFIG_HPP
