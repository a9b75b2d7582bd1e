// =============================================================================
// config.cpp - Distributor configuration (JSON)
// =============================================================================

#include "incentive/config.hpp"
#include "incentive/log.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace incentive {

using json = nlohmann::json;

namespace {

Address read_address(const json& j, const char* key, const Address& fallback) {
    if (!j.contains(key)) return fallback;
    return addresses::from_hex(j.at(key).get<std::string>());
}

} // namespace

DistributorConfig DistributorConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

DistributorConfig DistributorConfig::from_json(std::string_view content) {
    DistributorConfig config;

    json data;
    try {
        data = json::parse(content);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Invalid config JSON: ") + e.what());
    }
    if (!data.is_object()) {
        throw std::runtime_error("Config root must be a JSON object");
    }

    try {
        config.admin = read_address(data, "admin", config.admin);
        config.reward_depositor = read_address(data, "reward_depositor", config.reward_depositor);
        config.custody = read_address(data, "custody", config.custody);
        config.reward_token = Currency{read_address(data, "reward_token", config.reward_token.addr)};
        config.stream_duration = data.value("stream_duration", config.stream_duration);
        config.log_level = data.value("log_level", config.log_level);

        json tokens = data.value("whitelisted_tokens", json::array());
        if (!tokens.is_array()) {
            throw std::runtime_error("whitelisted_tokens must be an array");
        }
        for (const auto& token : tokens) {
            config.whitelisted_tokens.emplace_back(addresses::from_hex(token.get<std::string>()));
        }

        // Validate eagerly so a typo fails at load time
        log::parse_level(config.log_level);
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid config value: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("Invalid config value: ") + e.what());
    }

    if (config.stream_duration == 0) {
        throw std::runtime_error("stream_duration must be positive");
    }
    return config;
}

} // namespace incentive
