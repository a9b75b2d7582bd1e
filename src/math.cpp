// =============================================================================
// math.cpp - 256-bit accounting arithmetic
// =============================================================================

#include "incentive/math.hpp"

#include <algorithm>

namespace incentive {
namespace math {

namespace {

constexpr U128 MASK64 = (U128(1) << 64) - 1;

// Divide (rem_hi * 2^128 + lo) by denom where rem_hi < denom.
// The quotient fits in 128 bits; restoring division one bit at a time.
U128 div_narrow(U128 rem_hi, U128 lo, U128 denom) {
    U128 rem = rem_hi;
    U128 quot = 0;
    for (int i = 127; i >= 0; --i) {
        bool carry = (rem >> 127) != 0;
        rem = (rem << 1) | ((lo >> i) & 1);
        quot <<= 1;
        // With carry set the true remainder is 2^128 + rem, which exceeds denom
        if (carry || rem >= denom) {
            rem -= denom;
            quot |= 1;
        }
    }
    return quot;
}

} // anonymous namespace

// =============================================================================
// Multiplication / Division
// =============================================================================

U256 mul(U128 a, U128 b) {
    // Split into 64-bit halves to avoid overflow
    U128 a_lo = a & MASK64;
    U128 a_hi = a >> 64;
    U128 b_lo = b & MASK64;
    U128 b_hi = b >> 64;

    // Cross products
    U128 p0 = a_lo * b_lo;
    U128 p1 = a_lo * b_hi;
    U128 p2 = a_hi * b_lo;
    U128 p3 = a_hi * b_hi;

    // Accumulate with carry
    U128 mid = (p0 >> 64) + (p1 & MASK64) + (p2 & MASK64);
    U128 carry = mid >> 64;

    U256 result;
    result.lo = (p0 & MASK64) | (mid << 64);
    result.hi = p3 + (p1 >> 64) + (p2 >> 64) + carry;
    return result;
}

U256 div(const U256& num, U128 denom) {
    if (denom == 0) {
        throw MathError("division by zero");
    }
    if (num.hi == 0) {
        return U256(num.lo / denom);
    }

    U256 quot;
    quot.hi = num.hi / denom;
    quot.lo = div_narrow(num.hi % denom, num.lo, denom);
    return quot;
}

U128 mul_div(U128 a, U128 b, U128 denom) {
    U256 q = div(mul(a, b), denom);
    if (q.hi != 0) {
        throw MathError("mul_div overflow");
    }
    return q.lo;
}

U128 mul_shift128(const U256& x, U128 y) {
    // x * y = x.hi * y * 2^128 + x.lo * y, so the floor of the shift is exact
    U256 high = mul(x.hi, y);
    U256 low = mul(x.lo, y);
    U256 result = checked_add(high, U256(low.hi));
    if (result.hi != 0) {
        throw MathError("mul_shift128 overflow");
    }
    return result.lo;
}

U256 rpl_increment(U128 rate, uint64_t dt, U128 liquidity) {
    if (liquidity == 0) {
        throw MathError("reward increment with zero liquidity");
    }
    U256 emitted = mul(rate, static_cast<U128>(dt));
    if (emitted.hi != 0) {
        throw MathError("emission overflow");
    }
    // emitted << 128
    return div(U256(0, emitted.lo), liquidity);
}

// =============================================================================
// Checked Arithmetic
// =============================================================================

U256 checked_add(const U256& a, const U256& b) {
    U256 r = a + b;
    if (r < a) {
        throw MathError("U256 addition overflow");
    }
    return r;
}

U256 checked_sub(const U256& a, const U256& b) {
    if (a < b) {
        throw MathError("U256 subtraction underflow");
    }
    return a - b;
}

U128 checked_add(U128 a, U128 b) {
    U128 r = a + b;
    if (r < a) {
        throw MathError("U128 addition overflow");
    }
    return r;
}

U128 checked_sub(U128 a, U128 b) {
    if (a < b) {
        throw MathError("U128 subtraction underflow");
    }
    return a - b;
}

I128 checked_add(I128 a, I128 b) {
    if ((b > 0 && a > I128_MAX - b) || (b < 0 && a < I128_MIN - b)) {
        throw MathError("I128 addition overflow");
    }
    return a + b;
}

I128 checked_sub(I128 a, I128 b) {
    if ((b < 0 && a > I128_MAX + b) || (b > 0 && a < I128_MIN + b)) {
        throw MathError("I128 subtraction overflow");
    }
    return a - b;
}

U128 add_delta(U128 x, I128 y) {
    if (y < 0) {
        U128 magnitude = abs_u128(y);
        if (magnitude > x) {
            throw MathError("liquidity underflow");
        }
        return x - magnitude;
    }
    return checked_add(x, static_cast<U128>(y));
}

// =============================================================================
// Formatting
// =============================================================================

std::string to_string(U128 v) {
    if (v == 0) return "0";
    std::string out;
    while (v != 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(v % 10)));
        v /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::string to_string(I128 v) {
    if (v < 0) return "-" + to_string(abs_u128(v));
    return to_string(static_cast<U128>(v));
}

std::string to_string(const U256& v) {
    if (v.hi == 0) return to_string(v.lo);

    // Repeated division by 10^19 keeps each chunk within 64 bits
    constexpr U128 CHUNK = 10000000000000000000ULL;
    std::string out;
    U256 n = v;
    while (!n.is_zero()) {
        U256 q = div(n, CHUNK);
        U256 product = mul(q.lo, CHUNK) + U256(0, q.hi * CHUNK);
        U256 r = n - product;
        std::string part = to_string(r.lo);
        n = q;
        if (!n.is_zero()) {
            part.insert(0, 19 - part.size(), '0');
        }
        out.insert(0, part);
    }
    return out;
}

} // namespace math
} // namespace incentive
