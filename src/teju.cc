// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "teju.h"
#include "teju_tables.h"

#include <cstdint>

#if defined(__SIZEOF_INT128__)
#define TEJU_HAS_UINT128 1
#elif defined(_MSC_VER) && defined(_M_X64)
#define TEJU_HAS_X64_INTRINSICS 1
#endif

#if TEJU_HAS_X64_INTRINSICS
#include <intrin.h>
#endif

using namespace teju;
using namespace teju::impl;

//==================================================================================================
//
//==================================================================================================

namespace {

struct DecimalDigits {
    uint64_t digits;
    int exponent;
};

inline uint32_t Lo32(uint64_t x) {
    return static_cast<uint32_t>(x);
}

inline uint32_t Hi32(uint64_t x) {
    return static_cast<uint32_t>(x >> 32);
}

inline Uint64x2 Mul128(uint64_t a, uint64_t b)
{
#if TEJU_HAS_UINT128
    __extension__ using uint128_t = unsigned __int128;

    const uint128_t product = uint128_t{a} * b;

    const uint64_t lo = static_cast<uint64_t>(product);
    const uint64_t hi = static_cast<uint64_t>(product >> 64);
    return {hi, lo};
#elif TEJU_HAS_X64_INTRINSICS
    uint64_t hi;
    uint64_t lo = _umul128(a, b, &hi);
    return {hi, lo};
#else
    const uint64_t b00 = uint64_t{Lo32(a)} * Lo32(b);
    const uint64_t b01 = uint64_t{Lo32(a)} * Hi32(b);
    const uint64_t b10 = uint64_t{Hi32(a)} * Lo32(b);
    const uint64_t b11 = uint64_t{Hi32(a)} * Hi32(b);

    const uint64_t mid1 = b10 + Hi32(b00);
    const uint64_t mid2 = b01 + Lo32(mid1);

    const uint64_t hi = b11 + Hi32(mid1) + Hi32(mid2);
    const uint64_t lo = (uint64_t{Lo32(mid2)} << 32) | Lo32(b00);
    return {hi, lo};
#endif
}

// Returns floor(x * M / 2^128).
inline uint64_t MulShift(uint64_t x, const Uint64x2& M)
{
    const Uint64x2 p1 = Mul128(x, M.hi);
    const Uint64x2 p0 = Mul128(x, M.lo);

    const uint64_t lo = p1.lo + p0.hi;
    const uint64_t carry = lo < p1.lo ? 1 : 0;
    return p1.hi + carry;
}

// Returns floor(2^k * M / 2^128).
inline uint64_t MulShiftPow2(int k, const Uint64x2& M)
{
    TEJU_ASSERT(k > 0);
    TEJU_ASSERT(k < 64);
    return M.hi >> (64 - k);
}

inline bool IsMultipleOfPow5(uint64_t n, int k)
{
    const MultInverse& inv = ComputeMultInverse(k);
    return n * inv.multiplier <= inv.bound;
}

// Returns whether n is a multiple of 5^f, for 0 <= f < 27. False otherwise.
inline bool IsTie(uint64_t n, int f)
{
    return 0 <= f && f < MultInverseCount && IsMultipleOfPow5(n, f);
}

// n = (odd) * 2^r. Returns whether the interval bound n * 2^(e0 - shift) / 10^f is an integer.
// For f = 0 we have e0 = 0 and only the power of two matters. For f > 0, e0 - shift >= f and the
// bound is an integer iff n is a multiple of 5^f.
inline bool IsIntegralBound(uint64_t n, int f, int r, int shift)
{
    if (f == 0)
        return r >= shift;
    return f > 0 && IsTie(n, f);
}

inline bool IsEven(uint64_t n)
{
    return n % 2 == 0;
}

// c2 = floor(2 * c'), where c' = v * 10^-f.
// Returns whether round(c') = floor(c') + 1, using round-half-even.
inline bool ShouldRoundUp(uint64_t c2, int f)
{
    return !(IsEven(c2) || (IsEven(c2 / 2) && IsTie(c2, -f)));
}

inline uint64_t RotateRight1(uint64_t x)
{
    return (x >> 1) | (x << 63);
}

inline DecimalDigits RemoveTrailingZeros(uint64_t digits, int exponent)
{
    // n is a multiple of 10 iff rotr(n * 5^-1, 1) <= floor((2^64 - 1) / 10),
    // in which case rotr(n * 5^-1, 1) = n / 10.
    constexpr uint64_t Inv5 = 0xCCCCCCCCCCCCCCCD;
    constexpr uint64_t Bound = UINT64_MAX / 10;

    TEJU_ASSERT(digits != 0);

    for (;;)
    {
        const uint64_t q = RotateRight1(digits * Inv5);
        if (q > Bound)
            break;
        digits = q;
        ++exponent;
    }

    return {digits, exponent};
}

template <typename Float>
Interval ComputeIntervalImpl(const Decomposed<Float>& dec)
{
    using Fp = IEEE<Float>;

    TEJU_ASSERT(dec.cls == FloatClass::normal || dec.cls == FloatClass::subnormal);

    const uint64_t m = dec.mantissa;
    const int e = dec.exponent;

    const int f = FloorLog10Pow2(e);
    const int r = FloorLog10Pow2Residual(e);
    const Uint64x2& mult = ComputeScaledPow10(f);

    Interval iv;
    iv.exponent = f;
    iv.residual = r;
    iv.centered = m != Fp::HiddenBit || e == Fp::MinExponent;

    if (iv.centered)
    {
        // [(2m - 1) 2^(e-1), (2m + 1) 2^(e-1)]
        const uint64_t ma = (2 * m - 1) << r;
        const uint64_t mb = (2 * m + 1) << r;

        iv.lower = MulShift(ma, mult);
        iv.upper = MulShift(mb, mult);
        iv.lower_inclusive = IsEven(m) && IsIntegralBound(ma, f, r, 1);
        iv.upper_inclusive = IsEven(m) || !IsIntegralBound(mb, f, r, 1);
    }
    else
    {
        // [(4m - 1) 2^(e-2), (2m + 1) 2^(e-1)]
        const uint64_t ma = (4 * m - 1) << r;
        const uint64_t mb = (2 * m + 1) << r;

        iv.lower = MulShift(ma, mult) / 2;
        iv.upper = MulShift(mb, mult);
        // m = 2^(p-1) is even, so both bounds are inclusive if they are integers.
        iv.lower_inclusive = IsIntegralBound(ma, f, r, 2);
        iv.upper_inclusive = true;
    }

    return iv;
}

template <typename Float>
DecimalDigits ToDecimalImpl(const Decomposed<Float>& dec)
{
    using Fp = IEEE<Float>;

    const uint64_t m = dec.mantissa;
    const int e = dec.exponent;

    // Small integers: v = m * 2^e with -p < e <= 0 is an integer iff the low -e bits of m are zero.
    if (-Fp::SignificandSize < e && e <= 0)
    {
        const uint64_t mask = (uint64_t{1} << -e) - 1;
        if ((m & mask) == 0)
        {
            return RemoveTrailingZeros(m >> -e, 0);
        }
    }

    const Interval iv = ComputeIntervalImpl(dec);

    const int f = iv.exponent;
    const int r = iv.residual;
    const Uint64x2& mult = ComputeScaledPow10(f);

    const uint64_t a = iv.lower;
    const uint64_t b = iv.upper;

    if (iv.centered)
    {
        // Try one digit less: s = 10 * floor(b / 10) is the largest multiple of 10 <= b.
        const uint64_t q = b / 10;
        const uint64_t s = q * 10;

        if (a < s)
        {
            if (s < b || iv.upper_inclusive)
                return RemoveTrailingZeros(q, f + 1);
        }
        else if (s == a && iv.lower_inclusive)
        {
            return RemoveTrailingZeros(q, f + 1);
        }
        else if ((a + b) % 2 != 0)
        {
            // a + b is odd: the closest integer to v * 10^-f is (a + b + 1) / 2.
            return {(a + b) / 2 + 1, f};
        }

        const uint64_t c2 = MulShift((4 * m) << r, mult);
        const uint64_t c = c2 / 2;
        return {c + ShouldRoundUp(c2, f), f};
    }

    if (a < b)
    {
        const uint64_t q = b / 10;
        const uint64_t s = q * 10;

        if (a < s)
        {
            if (s < b || iv.upper_inclusive)
                return RemoveTrailingZeros(q, f + 1);
        }
        else if (s == a && iv.lower_inclusive)
        {
            return RemoveTrailingZeros(q, f + 1);
        }

        // v is not the midpoint of [a, b] here. Compute the closest integer directly.
        const uint64_t c2 = MulShiftPow2(Fp::SignificandSize + r + 1, mult);
        const uint64_t c = c2 / 2;
        const bool round_up = (c == a && !iv.lower_inclusive) || ShouldRoundUp(c2, f);
        return {c + round_up, f};
    }

    if (iv.lower_inclusive)
    {
        return RemoveTrailingZeros(a, f);
    }

    // No integer in the interval at 10^f. Use the next smaller power of ten.
    const uint64_t c2 = MulShift((40 * m) << r, mult);
    const uint64_t c = c2 / 2;
    return {c + ShouldRoundUp(c2, f), f - 1};
}

} // namespace

//==================================================================================================
// ToDecimal
//==================================================================================================

Interval teju::impl::ComputeInterval(const Decomposed<float>& dec)
{
    return ComputeIntervalImpl(dec);
}

Interval teju::impl::ComputeInterval(const Decomposed<double>& dec)
{
    return ComputeIntervalImpl(dec);
}

teju::F32ToDecimalResult teju::ToDecimal(float value)
{
    const auto dec = Decompose(value);
    TEJU_ASSERT(dec.cls != FloatClass::infinity);
    TEJU_ASSERT(dec.cls != FloatClass::nan);

    // Zero. Also infinity, if the checks above are disabled.
    if (dec.mantissa == 0)
        return {0, 0};

    const DecimalDigits res = ToDecimalImpl(dec);
    TEJU_ASSERT(res.digits <= 999999999u);

    return {static_cast<uint32_t>(res.digits), res.exponent};
}

teju::F64ToDecimalResult teju::ToDecimal(double value)
{
    const auto dec = Decompose(value);
    TEJU_ASSERT(dec.cls != FloatClass::infinity);
    TEJU_ASSERT(dec.cls != FloatClass::nan);

    // Zero. Also infinity, if the checks above are disabled.
    if (dec.mantissa == 0)
        return {0, 0};

    const DecimalDigits res = ToDecimalImpl(dec);
    TEJU_ASSERT(res.digits <= 99999999999999999u);

    return {res.digits, res.exponent};
}
