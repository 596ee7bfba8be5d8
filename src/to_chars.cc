// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "to_chars.h"
#include "teju.h"

#include <cstring>

using namespace teju;

//==================================================================================================
// ToChars
//==================================================================================================

namespace {

template <typename Float>
inline char* FiniteToCharsImpl(char* buffer, Float value, Notation notation, bool force_trailing_dot_zero)
{
    const IEEE<Float> v(value);
    TEJU_ASSERT(v.IsFinite());

    if (v.SignBit())
    {
        *buffer++ = '-';
    }

    // Zero is handled by FormatDigits.
    const auto dec = ToDecimal(v.AbsValue());
    return FormatDigits(buffer, dec.digits, dec.exponent, notation, force_trailing_dot_zero);
}

template <typename Float>
inline char* ToCharsImpl(char* buffer, Float value, Notation notation, bool force_trailing_dot_zero)
{
    const IEEE<Float> v(value);

    if (!v.IsFinite())
    {
        if (v.IsNaN())
        {
            std::memcpy(buffer, "NaN", 3);
            return buffer + 3;
        }
        if (v.SignBit())
        {
            *buffer++ = '-';
        }
        std::memcpy(buffer, "inf", 3);
        return buffer + 3;
    }

    return FiniteToCharsImpl(buffer, value, notation, force_trailing_dot_zero);
}

} // namespace

char* teju::ToChars(char* buffer, float value, Notation notation, bool force_trailing_dot_zero)
{
    return ToCharsImpl(buffer, value, notation, force_trailing_dot_zero);
}

char* teju::ToChars(char* buffer, double value, Notation notation, bool force_trailing_dot_zero)
{
    return ToCharsImpl(buffer, value, notation, force_trailing_dot_zero);
}

char* teju::FiniteToChars(char* buffer, float value, Notation notation, bool force_trailing_dot_zero)
{
    return FiniteToCharsImpl(buffer, value, notation, force_trailing_dot_zero);
}

char* teju::FiniteToChars(char* buffer, double value, Notation notation, bool force_trailing_dot_zero)
{
    return FiniteToCharsImpl(buffer, value, notation, force_trailing_dot_zero);
}

//==================================================================================================
// Dtoa
//==================================================================================================

char* teju::Dtoa(char* buffer, double value)
{
    return ToCharsImpl(buffer, value, Notation::automatic, false);
}

char* teju::Ftoa(char* buffer, float value)
{
    return ToCharsImpl(buffer, value, Notation::automatic, false);
}
