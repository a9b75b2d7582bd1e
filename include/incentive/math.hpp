#ifndef INCENTIVE_MATH_HPP
#define INCENTIVE_MATH_HPP

#include <stdexcept>
#include <string>

#include "types.hpp"

namespace incentive {

// =============================================================================
// Errors
// =============================================================================

// Overflow, underflow or division by zero in accounting arithmetic
class MathError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Accounting invariant broken (e.g. a position owed more than its range earned)
class InvariantError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// =============================================================================
// 256-bit Unsigned Integer (two U128 limbs)
// =============================================================================
//
// operator+ and operator- wrap modulo 2^256. Accumulators that must never
// wrap go through math::checked_add / math::checked_sub.

struct U256 {
    U128 lo;  // Low 128 bits
    U128 hi;  // High 128 bits

    U256() : lo(0), hi(0) {}
    U256(U128 l) : lo(l), hi(0) {}
    U256(U128 l, U128 h) : lo(l), hi(h) {}

    bool operator==(const U256& other) const {
        return lo == other.lo && hi == other.hi;
    }
    bool operator!=(const U256& other) const { return !(*this == other); }
    bool operator<(const U256& other) const {
        return hi < other.hi || (hi == other.hi && lo < other.lo);
    }
    bool operator>(const U256& other) const { return other < *this; }
    bool operator<=(const U256& other) const { return !(other < *this); }
    bool operator>=(const U256& other) const { return !(*this < other); }

    U256 operator+(const U256& other) const {
        U256 r;
        r.lo = lo + other.lo;
        r.hi = hi + other.hi + (r.lo < lo ? 1 : 0);
        return r;
    }

    U256 operator-(const U256& other) const {
        U256 r;
        r.lo = lo - other.lo;
        r.hi = hi - other.hi - (lo < other.lo ? 1 : 0);
        return r;
    }

    bool is_zero() const { return lo == 0 && hi == 0; }
};

namespace math {

constexpr U128 U128_MAX = ~U128(0);
constexpr I128 I128_MAX = static_cast<I128>(U128_MAX >> 1);
constexpr I128 I128_MIN = -I128_MAX - 1;

// 2^128 as a U256
inline U256 q128() { return U256(0, 1); }

// Full 256-bit product of two U128 values
U256 mul(U128 a, U128 b);

// floor(num / denom); throws MathError on zero denominator
U256 div(const U256& num, U128 denom);

// floor(a * b / denom); throws MathError if the result exceeds 128 bits
U128 mul_div(U128 a, U128 b, U128 denom);

// floor(x * y / 2^128); throws MathError if the result exceeds 128 bits
U128 mul_shift128(const U256& x, U128 y);

// floor(rate * dt * 2^128 / liquidity), the Q128 reward-per-liquidity increment
U256 rpl_increment(U128 rate, uint64_t dt, U128 liquidity);

// Checked arithmetic (throws MathError instead of wrapping)
U256 checked_add(const U256& a, const U256& b);
U256 checked_sub(const U256& a, const U256& b);
U128 checked_add(U128 a, U128 b);
U128 checked_sub(U128 a, U128 b);
I128 checked_add(I128 a, I128 b);
I128 checked_sub(I128 a, I128 b);

// Apply a signed liquidity delta; underflow and overflow are fatal
U128 add_delta(U128 x, I128 y);

// Magnitude of a signed value as unsigned
inline U128 abs_u128(I128 x) {
    return x < 0 ? static_cast<U128>(-(x + 1)) + 1 : static_cast<U128>(x);
}

// Decimal rendering for logs and test messages
std::string to_string(U128 v);
std::string to_string(I128 v);
std::string to_string(const U256& v);

} // namespace math

} // namespace incentive

#endif // INCENTIVE_MATH_HPP
