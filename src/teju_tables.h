// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "ieee.h"

#include <cstdint>

namespace teju {
namespace impl {

struct Uint64x2 {
    uint64_t hi;
    uint64_t lo;
};

// n is a multiple of 5^k iff n * multiplier <= bound (mod 2^64).
struct MultInverse {
    uint64_t multiplier; // = 5^-k mod 2^64
    uint64_t bound;      // = floor((2^64 - 1) / 5^k)
};

// Range of f = FloorLog10Pow2(e) for all finite double-precision numbers.
// Single-precision numbers only need f in [-45, 31].
constexpr int MinDecExp = -324;
constexpr int MaxDecExp =  292;

// Largest k + 1 such that 5^k fits into 64 bits.
constexpr int MultInverseCount = 27;

// Returns floor(x / 2^n).
TEJU_INLINE int64_t FloorDivPow2(int64_t x, int n)
{
    // Technically, right-shift of negative integers is implementation defined...
    return x < 0 ? ~(~x >> n) : (x >> n);
}

// Returns floor(log_10(2^e)).
TEJU_INLINE int FloorLog10Pow2(int e)
{
    TEJU_ASSERT(e >= -112815);
    TEJU_ASSERT(e <=  112815);
    return static_cast<int>(FloorDivPow2(int64_t{e} * 1292913987, 32));
}

// Returns e - e0, where e0 is the smallest binary exponent with FloorLog10Pow2(e0) == FloorLog10Pow2(e).
// The result is in [0, 3].
TEJU_INLINE int FloorLog10Pow2Residual(int e)
{
    TEJU_ASSERT(e >= -112815);
    TEJU_ASSERT(e <=  112815);
    const uint32_t r = static_cast<uint32_t>(int64_t{e} * 1292913987);
    return static_cast<int>(r / 1292913987);
}

// Returns M = ceil(2^(e0 - 1 + 128) / 10^f), where e0 is the smallest binary exponent with
// FloorLog10Pow2(e0) == f.
// 2^127 <= M < 2^128.
//
// PRE: MinDecExp <= f <= MaxDecExp
const Uint64x2& ComputeScaledPow10(int f);

// PRE: 0 <= k < MultInverseCount
const MultInverse& ComputeMultInverse(int k);

} // namespace impl
} // namespace teju
