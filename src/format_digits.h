// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "ieee.h"

#include <cstddef>
#include <cstdint>
#include <cstring>

namespace teju {

enum class Notation {
    automatic,  // similar to printf("%g"), see FormatDigits
    decimal,    // [-]digits[.digits], never uses an exponent
    scientific, // [-]d[.digits]e[-]exponent
};

namespace impl {

//==================================================================================================
// PrintDecimalDigits
//==================================================================================================
// Constant data: 200 bytes

TEJU_INLINE char* Utoa_2Digits(char* buf, uint32_t digits)
{
    static constexpr char Digits100[200] = {
        '0','0','0','1','0','2','0','3','0','4','0','5','0','6','0','7','0','8','0','9',
        '1','0','1','1','1','2','1','3','1','4','1','5','1','6','1','7','1','8','1','9',
        '2','0','2','1','2','2','2','3','2','4','2','5','2','6','2','7','2','8','2','9',
        '3','0','3','1','3','2','3','3','3','4','3','5','3','6','3','7','3','8','3','9',
        '4','0','4','1','4','2','4','3','4','4','4','5','4','6','4','7','4','8','4','9',
        '5','0','5','1','5','2','5','3','5','4','5','5','5','6','5','7','5','8','5','9',
        '6','0','6','1','6','2','6','3','6','4','6','5','6','6','6','7','6','8','6','9',
        '7','0','7','1','7','2','7','3','7','4','7','5','7','6','7','7','7','8','7','9',
        '8','0','8','1','8','2','8','3','8','4','8','5','8','6','8','7','8','8','8','9',
        '9','0','9','1','9','2','9','3','9','4','9','5','9','6','9','7','9','8','9','9',
    };

    TEJU_ASSERT(digits <= 99);
    std::memcpy(buf, &Digits100[2*digits], 2*sizeof(char));
    return buf + 2;
}

TEJU_INLINE char* Utoa_4Digits(char* buf, uint32_t digits)
{
    TEJU_ASSERT(digits <= 9999);
    const uint32_t q = digits / 100;
    const uint32_t r = digits % 100;
    Utoa_2Digits(buf + 0, q);
    Utoa_2Digits(buf + 2, r);
    return buf + 4;
}

TEJU_INLINE char* Utoa_8Digits(char* buf, uint32_t digits)
{
    TEJU_ASSERT(digits <= 99999999);
    const uint32_t q = digits / 10000;
    const uint32_t r = digits % 10000;
    Utoa_4Digits(buf + 0, q);
    Utoa_4Digits(buf + 4, r);
    return buf + 8;
}

TEJU_INLINE int DecimalLength(uint32_t v)
{
    TEJU_ASSERT(v >= 1);
    TEJU_ASSERT(v <= 999999999);

    if (v >= 100000000) { return 9; }
    if (v >= 10000000) { return 8; }
    if (v >= 1000000) { return 7; }
    if (v >= 100000) { return 6; }
    if (v >= 10000) { return 5; }
    if (v >= 1000) { return 4; }
    if (v >= 100) { return 3; }
    if (v >= 10) { return 2; }
    return 1;
}

TEJU_INLINE int DecimalLength(uint64_t v)
{
    TEJU_ASSERT(v >= 1);
    TEJU_ASSERT(v <= 99999999999999999ull);

    if (v >= 10000000000000000ull) { return 17; }
    if (v >= 1000000000000000ull) { return 16; }
    if (v >= 100000000000000ull) { return 15; }
    if (v >= 10000000000000ull) { return 14; }
    if (v >= 1000000000000ull) { return 13; }
    if (v >= 100000000000ull) { return 12; }
    if (v >= 10000000000ull) { return 11; }
    if (v >= 1000000000ull) { return 10; }
    if (v >= 100000000ull) { return 9; }
    if (v >= 10000000ull) { return 8; }
    if (v >= 1000000ull) { return 7; }
    if (v >= 100000ull) { return 6; }
    if (v >= 10000ull) { return 5; }
    if (v >= 1000ull) { return 4; }
    if (v >= 100ull) { return 3; }
    if (v >= 10ull) { return 2; }
    return 1;
}

TEJU_INLINE void PrintDecimalDigits(char* buf, uint32_t output, int output_length)
{
    while (output >= 10000)
    {
        TEJU_ASSERT(output_length > 4);
        const uint32_t q = output / 10000;
        const uint32_t r = output % 10000;
        output = q;
        output_length -= 4;
        Utoa_4Digits(buf + output_length, r);
    }

    if (output >= 100)
    {
        TEJU_ASSERT(output_length > 2);
        const uint32_t q = output / 100;
        const uint32_t r = output % 100;
        output = q;
        output_length -= 2;
        Utoa_2Digits(buf + output_length, r);
    }

    if (output >= 10)
    {
        TEJU_ASSERT(output_length == 2);
        Utoa_2Digits(buf, output);
    }
    else
    {
        TEJU_ASSERT(output_length == 1);
        buf[0] = static_cast<char>('0' + output);
    }
}

TEJU_INLINE void PrintDecimalDigits(char* buf, uint64_t output, int output_length)
{
    // At most 17 digits. Cut off 8 digits if necessary, so that the rest fits into uint32_t.
    if (static_cast<uint32_t>(output >> 32) != 0)
    {
        TEJU_ASSERT(output_length > 8);
        const uint64_t q = output / 100000000;
        const uint32_t r = static_cast<uint32_t>(output % 100000000);
        output = q;
        output_length -= 8;
        Utoa_8Digits(buf + output_length, r);
    }

    TEJU_ASSERT(output <= UINT32_MAX);
    PrintDecimalDigits(buf, static_cast<uint32_t>(output), output_length);
}

// Reference implementation: one digit per division.
template <typename UnsignedInt>
TEJU_INLINE void PrintDecimalDigitsNaive(char* buf, UnsignedInt output, int output_length)
{
    for (int i = output_length - 1; i >= 0; --i)
    {
        buf[i] = static_cast<char>('0' + output % 10);
        output /= 10;
    }
    TEJU_ASSERT(output == 0);
}

//==================================================================================================
// FormatDigits
//==================================================================================================

// Appends the decimal representation of the exponent 'value' to buffer. A minus sign is written
// for negative values, there is no plus sign and there are no leading zeros.
// Returns a pointer to the element following the digits.
//
// PRE: -1000 < value < 1000
TEJU_INLINE char* ExponentToString(char* buffer, int value)
{
    TEJU_ASSERT(value > -1000);
    TEJU_ASSERT(value <  1000);

    if (value < 0)
    {
        *buffer++ = '-';
        value = -value;
    }

    const uint32_t k = static_cast<uint32_t>(value);
    if (k < 10)
    {
        *buffer++ = static_cast<char>('0' + k);
    }
    else if (k < 100)
    {
        buffer = Utoa_2Digits(buffer, k);
    }
    else
    {
        const uint32_t r = k % 10;
        const uint32_t q = k / 10;
        buffer = Utoa_2Digits(buffer, q);
        *buffer++ = static_cast<char>('0' + r);
    }

    return buffer;
}

// PRE: The digits have already been written to buffer[0, num_digits).
TEJU_INLINE char* FormatFixed(char* buffer, intptr_t num_digits, intptr_t decimal_point, bool force_trailing_dot_zero)
{
    TEJU_ASSERT(buffer != nullptr);
    TEJU_ASSERT(num_digits >= 1);

    if (num_digits <= decimal_point)
    {
        // digits[000]
        std::memset(buffer + num_digits, '0', static_cast<size_t>(decimal_point - num_digits));
        buffer += decimal_point;
        if (force_trailing_dot_zero)
        {
            *buffer++ = '.';
            *buffer++ = '0';
        }
        return buffer;
    }
    else if (0 < decimal_point)
    {
        // dig.its
        std::memmove(buffer + (decimal_point + 1), buffer + decimal_point, static_cast<size_t>(num_digits - decimal_point));
        buffer[decimal_point] = '.';
        return buffer + (num_digits + 1);
    }
    else // decimal_point <= 0
    {
        // 0.[000]digits
        std::memmove(buffer + (2 + -decimal_point), buffer, static_cast<size_t>(num_digits));
        buffer[0] = '0';
        buffer[1] = '.';
        std::memset(buffer + 2, '0', static_cast<size_t>(-decimal_point));
        return buffer + (2 + (-decimal_point) + num_digits);
    }
}

// PRE: The digits have already been written to buffer[0, num_digits).
TEJU_INLINE char* FormatScientific(char* buffer, intptr_t num_digits, int exponent, bool force_trailing_dot_zero)
{
    TEJU_ASSERT(buffer != nullptr);
    TEJU_ASSERT(num_digits >= 1);

    if (num_digits == 1)
    {
        // de123
        buffer += 1;
        if (force_trailing_dot_zero)
        {
            *buffer++ = '.';
            *buffer++ = '0';
        }
    }
    else
    {
        // d.igitse123
        std::memmove(buffer + 2, buffer + 1, static_cast<size_t>(num_digits - 1));
        buffer[1] = '.';
        buffer += 1 + num_digits;
    }

    buffer[0] = 'e';
    buffer = ExponentToString(buffer + 1, exponent);

    return buffer;
}

} // namespace impl

// Prints digits * 10^exponent in the given notation and returns a pointer to the element
// following the output. The output is _not_ null-terminated.
//
// Notation::automatic uses the decimal layout if the decimal point falls into (-5, 16] relative
// to the first digit, and the scientific layout otherwise:
//      1234e7   -> 12340000000
//      1234e-1  -> 123.4
//      1234e-6  -> 0.001234
//      1e30     -> 1e30
//      1234e30  -> 1.234e33
//
// If force_trailing_dot_zero is true, outputs which would look like integers get a ".0"
// appended to the digits (e.g. "1.0", "1.0e30").
//
// PRE: DecimalLength(digits) <= 17
// PRE: The buffer must be large enough to hold the output.
template <typename UnsignedInt>
TEJU_INLINE char* FormatDigits(char* buffer, UnsignedInt digits, int exponent,
                               Notation notation = Notation::automatic, bool force_trailing_dot_zero = false)
{
    int num_digits = 1;
    if (digits == 0)
    {
        buffer[0] = '0';
        exponent = 0;
    }
    else
    {
        num_digits = impl::DecimalLength(digits);
        impl::PrintDecimalDigits(buffer, digits, num_digits);
    }

    const int decimal_point = num_digits + exponent;

    bool use_fixed = true;
    switch (notation)
    {
    case Notation::decimal:
        use_fixed = true;
        break;
    case Notation::scientific:
        use_fixed = false;
        break;
    case Notation::automatic:
        {
            constexpr int MinExp = -5;
            constexpr int MaxExp = 16;
            use_fixed = MinExp < decimal_point && decimal_point <= MaxExp;
        }
        break;
    }

    return use_fixed
        ? impl::FormatFixed(buffer, num_digits, decimal_point, force_trailing_dot_zero)
        : impl::FormatScientific(buffer, num_digits, decimal_point - 1, force_trailing_dot_zero);
}

} // namespace teju
