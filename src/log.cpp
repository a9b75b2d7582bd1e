// =============================================================================
// log.cpp - Levelled logging to stdout/stderr
// =============================================================================

#include "incentive/log.hpp"

#include <atomic>
#include <cstdio>
#include <stdexcept>
#include <string>

namespace incentive::log {

namespace {

std::atomic<Level> g_level{Level::INFO};

void write(Level at, std::FILE* out, const char* tag, std::string_view msg) {
    if (at < g_level.load(std::memory_order_relaxed)) return;
    std::fprintf(out, "[%s] %.*s\n", tag, static_cast<int>(msg.size()), msg.data());
}

} // anonymous namespace

void set_level(Level level) {
    g_level.store(level, std::memory_order_relaxed);
}

Level level() {
    return g_level.load(std::memory_order_relaxed);
}

Level parse_level(std::string_view name) {
    if (name == "debug") return Level::DEBUG;
    if (name == "info") return Level::INFO;
    if (name == "warn") return Level::WARN;
    if (name == "error") return Level::ERROR;
    if (name == "off") return Level::OFF;
    throw std::invalid_argument("unknown log level: " + std::string(name));
}

void debug(std::string_view msg) { write(Level::DEBUG, stdout, "DEBUG", msg); }
void info(std::string_view msg) { write(Level::INFO, stdout, "INFO", msg); }
void warn(std::string_view msg) { write(Level::WARN, stderr, "WARN", msg); }
void error(std::string_view msg) { write(Level::ERROR, stderr, "ERROR", msg); }

} // namespace incentive::log
