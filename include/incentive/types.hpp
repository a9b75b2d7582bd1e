#ifndef INCENTIVE_TYPES_HPP
#define INCENTIVE_TYPES_HPP

#include <cstdint>
#include <array>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>

namespace incentive {

// =============================================================================
// Integer Types
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;

// =============================================================================
// Addresses (EVM 20-byte accounts)
// =============================================================================

using Address = std::array<uint8_t, 20>;

namespace addresses {

inline bool is_zero(const Address& a) {
    for (uint8_t b : a) if (b != 0) return false;
    return true;
}

// Parse "0x" + 40 hex digits
inline Address from_hex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    if (hex.size() != 40) {
        throw std::invalid_argument("address must have 40 hex digits: " + std::string(hex));
    }

    auto nibble = [&hex](char c) -> uint8_t {
        if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
        if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
        if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
        throw std::invalid_argument("invalid hex digit in address: " + std::string(hex));
    };

    Address addr{};
    for (size_t i = 0; i < addr.size(); ++i) {
        addr[i] = static_cast<uint8_t>((nibble(hex[2 * i]) << 4) | nibble(hex[2 * i + 1]));
    }
    return addr;
}

inline std::string to_hex(const Address& a) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(42);
    for (uint8_t b : a) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

// Short test/fixture addresses: 0x00..00NNNN
constexpr Address from_id(uint16_t id) {
    Address addr = {};
    addr[18] = static_cast<uint8_t>((id >> 8) & 0xFF);
    addr[19] = static_cast<uint8_t>(id & 0xFF);
    return addr;
}

} // namespace addresses

// =============================================================================
// Currency Type (Token Address)
// =============================================================================

struct Currency {
    Address addr;

    Currency() : addr{} {}
    explicit Currency(const Address& a) : addr(a) {}

    bool is_native() const { return addresses::is_zero(addr); }

    bool operator==(const Currency& other) const { return addr == other.addr; }
    bool operator!=(const Currency& other) const { return addr != other.addr; }
    bool operator<(const Currency& other) const { return addr < other.addr; }
};

// Per-token amounts, ordered by token address
using TokenAmounts = std::map<Currency, U128>;

// =============================================================================
// Pool Key (Unique Pool Identifier)
// =============================================================================

using PoolId = uint64_t;

struct PoolKey {
    Currency currency0;      // Sorted: currency0 < currency1
    Currency currency1;
    uint32_t fee;            // Fee in hundredths of a bip
    int32_t tick_spacing;
    Address hooks;           // Hook contract address (0 = no hooks)

    // Compute pool ID hash
    PoolId id() const {
        uint64_t h = 0;
        for (auto b : currency0.addr) h = h * 31 + b;
        for (auto b : currency1.addr) h = h * 31 + b;
        h = h * 31 + fee;
        h = h * 31 + static_cast<uint64_t>(static_cast<uint32_t>(tick_spacing));
        for (auto b : hooks) h = h * 31 + b;
        return h;
    }

    bool operator==(const PoolKey& other) const {
        return currency0 == other.currency0 &&
               currency1 == other.currency1 &&
               fee == other.fee &&
               tick_spacing == other.tick_spacing &&
               hooks == other.hooks;
    }
};

// =============================================================================
// Position Key
// =============================================================================

using PositionKey = uint64_t;

// Stable key for (owner or NFT id, pool, range, salt)
inline PositionKey position_key(const Address& owner, PoolId pool_id,
                                int32_t tick_lower, int32_t tick_upper,
                                uint64_t salt = 0) {
    uint64_t h = salt;
    for (uint8_t b : owner) h = h * 31 + b;
    h = h * 31 + pool_id;
    // Offset ticks to ensure positive values for hashing
    h = h * 31 + static_cast<uint64_t>(static_cast<uint32_t>(tick_lower + 1000000));
    h = h * 31 + static_cast<uint64_t>(static_cast<uint32_t>(tick_upper + 1000000));
    return h;
}

// Position manager notification payload
struct PositionUpdate {
    Address owner;
    PositionKey key;
    PoolKey pool;
    int32_t tick_lower;
    int32_t tick_upper;
    I128 liquidity_delta;    // Positive = add, negative = remove
};

// =============================================================================
// Tick Bounds
// =============================================================================

namespace tick_math {
constexpr int32_t MIN_TICK = -887272;
constexpr int32_t MAX_TICK = 887272;
}

// =============================================================================
// Time
// =============================================================================

namespace durations {
constexpr uint64_t DAY = 86400;
constexpr uint64_t WEEK = 7 * DAY;
}

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;
constexpr int32_t POOL_NOT_INITIALIZED = -1;
constexpr int32_t POOL_ALREADY_REGISTERED = -2;
constexpr int32_t INVALID_TICK_RANGE = -3;
constexpr int32_t POOL_NOT_REGISTERED = -5;
constexpr int32_t INVALID_AMOUNT = -6;
constexpr int32_t TOKEN_NOT_WHITELISTED = -7;
constexpr int32_t INSUFFICIENT_BALANCE = -10;
constexpr int32_t POSITION_NOT_FOUND = -12;
constexpr int32_t POSITION_EXISTS = -13;
constexpr int32_t REENTRANCY = -30;
constexpr int32_t UNAUTHORIZED = -40;

inline const char* to_string(int32_t code) {
    switch (code) {
        case OK: return "ok";
        case POOL_NOT_INITIALIZED: return "pool not initialized";
        case POOL_ALREADY_REGISTERED: return "pool already registered";
        case INVALID_TICK_RANGE: return "invalid tick range";
        case POOL_NOT_REGISTERED: return "pool not registered";
        case INVALID_AMOUNT: return "invalid amount";
        case TOKEN_NOT_WHITELISTED: return "token not whitelisted";
        case INSUFFICIENT_BALANCE: return "insufficient balance";
        case POSITION_NOT_FOUND: return "position not found";
        case POSITION_EXISTS: return "position exists";
        case REENTRANCY: return "operation in progress";
        case UNAUTHORIZED: return "unauthorized";
        default: return "unknown error";
    }
}
}

} // namespace incentive

#endif // INCENTIVE_TYPES_HPP
