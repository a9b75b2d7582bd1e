#ifndef INCENTIVE_LOG_HPP
#define INCENTIVE_LOG_HPP

#include <cstdint>
#include <string_view>

namespace incentive::log {

enum class Level : uint8_t {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    OFF = 4
};

void set_level(Level level);
Level level();

// "debug", "info", "warn", "error", "off"; throws std::invalid_argument otherwise
Level parse_level(std::string_view name);

void debug(std::string_view msg);
void info(std::string_view msg);
void warn(std::string_view msg);
void error(std::string_view msg);

} // namespace incentive::log

#endif // INCENTIVE_LOG_HPP
