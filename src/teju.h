// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "ieee.h"

#include <cstdint>

namespace teju {

// value = digits * 10^exponent
struct F32ToDecimalResult {
    uint32_t digits;
    int exponent;
};

struct F64ToDecimalResult {
    uint64_t digits;
    int exponent;
};

// F32ToDecimalResult dec = ToDecimal(value);
//
// Computes the shortest decimal representation of |value|, i.e. the decimal digits which
//  1. round back to |value| when read in (using round-to-nearest-even),
//  2. are as short as possible,
//  3. are as close to |value| as possible; ties are broken towards the even digit.
//
// The digits never have trailing zeros. Zero is returned as {0, 0}.
// The sign of the input is ignored.
//
// PRE: value must be finite.
F32ToDecimalResult ToDecimal(float value);
F64ToDecimalResult ToDecimal(double value);

namespace impl {

// The rounding interval of a binary floating-point number v, scaled by 10^-exponent, in integer
// form.
//
// lower and upper are the floors of the scaled interval bounds. lower_inclusive is true iff the
// integer 'lower' itself belongs to the interval, upper_inclusive likewise for 'upper'.
//
// The interval is centered around v, unless v is a power of two with a normal predecessor, in
// which case the lower bound is only half as far away from v as the upper bound.
struct Interval {
    uint64_t lower;
    uint64_t upper;
    int exponent;  // = FloorLog10Pow2(e)
    int residual;  // = FloorLog10Pow2Residual(e)
    bool lower_inclusive;
    bool upper_inclusive;
    bool centered;
};

// PRE: dec.cls is FloatClass::normal or FloatClass::subnormal.
Interval ComputeInterval(const Decomposed<float>& dec);
Interval ComputeInterval(const Decomposed<double>& dec);

} // namespace impl
} // namespace teju
