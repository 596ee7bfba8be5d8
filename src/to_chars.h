// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "format_digits.h"

namespace teju {

// Maximum number of characters ToChars writes, for any value and any notation.
//
// Notation::decimal dominates:
//  double: "-0." + 323 zeros + "5" (-5e-324)                 = 327
//  float:  "-0." + 44 zeros + "1"  (-1e-45)                  = 48
// Integers are shorter even with a trailing ".0" (max. 1 + 309 + 2, resp. 1 + 39 + 2), and so is
// the scientific notation (max. 1 + 17 + 1 + 2 + 1 + 3, resp. 1 + 9 + 1 + 2 + 1 + 2).
template <typename Float> struct MaxChars;
template <> struct MaxChars<float>  { static constexpr int value = 48; };
template <> struct MaxChars<double> { static constexpr int value = 327; };

// char* output_end = ToChars(buffer, value, notation, force_trailing_dot_zero);
//
// Converts the given floating-point number into decimal form and stores the result in the given
// buffer.
//
// The buffer must be large enough, i.e. >= MaxChars<Float>::value.
// The output is _not_ null-terminated.
//
// The digits are optimal, i.e. the output string
//  1. rounds back to the input number when read in (using round-to-nearest-even),
//  2. is as short as possible,
//  3. is as close to the input number as possible.
//
// Special values are printed as "inf", "-inf" and "NaN" in all notations. Zero is printed as
// "0" (or "0e0" in scientific notation), negative zero with a leading minus sign.
char* ToChars(char* buffer, float value, Notation notation = Notation::automatic, bool force_trailing_dot_zero = false);
char* ToChars(char* buffer, double value, Notation notation = Notation::automatic, bool force_trailing_dot_zero = false);

// Same as ToChars, but skips the checks for infinities and NaNs.
//
// PRE: value must be finite.
// With TEJU_ASSERT disabled, non-finite inputs produce an unspecified (but valid) number.
char* FiniteToChars(char* buffer, float value, Notation notation = Notation::automatic, bool force_trailing_dot_zero = false);
char* FiniteToChars(char* buffer, double value, Notation notation = Notation::automatic, bool force_trailing_dot_zero = false);

// char* output_end = Dtoa(buffer, value);
//
// Shorthand for ToChars(buffer, value) using Notation::automatic. The output never has more than
// 24 characters.
//
// The buffer must be large enough, i.e. >= DtoaMinBufferLength, resp. >= FtoaMinBufferLength.

constexpr int DtoaMinBufferLength = 64;
constexpr int FtoaMinBufferLength = 32;

char* Dtoa(char* buffer, double value);
char* Ftoa(char* buffer, float value);

} // namespace teju
