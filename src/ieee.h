// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <cassert>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>

// TEJU_CHECKED=1 turns every internal check into a hard failure, which is reported on stderr and
// terminates the process, regardless of NDEBUG.
#ifndef TEJU_CHECKED
#define TEJU_CHECKED 0
#endif

#ifndef TEJU_ASSERT
#if TEJU_CHECKED
#define TEJU_ASSERT(X) ((X) ? static_cast<void>(0) : ::teju::impl::AssertionFailed(__FILE__, __LINE__, #X))
#else
#define TEJU_ASSERT(X) assert(X)
#endif
#endif

#ifndef TEJU_INLINE
#define TEJU_INLINE inline
#endif

namespace teju {
namespace impl {

[[noreturn]] TEJU_INLINE void AssertionFailed(const char* file, int line, const char* expr)
{
    std::fprintf(stderr, "%s:%d: assertion failed: %s\n", file, line, expr);
    std::fflush(stderr);
    std::abort();
}

template <typename Dest, typename Source>
TEJU_INLINE Dest ReinterpretBits(Source source)
{
    static_assert(sizeof(Dest) == sizeof(Source), "size mismatch");

    Dest dest;
    std::memcpy(&dest, &source, sizeof(Source));
    return dest;
}

} // namespace impl

enum class FloatClass {
    zero,
    subnormal,
    normal,
    infinity,
    nan,
};

template <int Precision> struct BitsType;
template <> struct BitsType<24> { using type = uint32_t; };
template <> struct BitsType<53> { using type = uint64_t; };

template <typename Float>
struct IEEE
{
    static_assert(std::numeric_limits<Float>::is_iec559 &&
                  ((std::numeric_limits<Float>::digits == 24 && std::numeric_limits<Float>::max_exponent == 128) ||
                   (std::numeric_limits<Float>::digits == 53 && std::numeric_limits<Float>::max_exponent == 1024)),
        "IEEE-754 single- or double-precision implementation required");

    using value_type = Float;
    using bits_type = typename BitsType<std::numeric_limits<Float>::digits>::type;

    static constexpr int       SignificandSize = std::numeric_limits<value_type>::digits; // = p   (includes the hidden bit)
    static constexpr int       ExponentBias    = std::numeric_limits<value_type>::max_exponent - 1 + (SignificandSize - 1);
    static constexpr int       MaxExponent     = std::numeric_limits<value_type>::max_exponent - 1 - (SignificandSize - 1);
    static constexpr int       MinExponent     = std::numeric_limits<value_type>::min_exponent - 1 - (SignificandSize - 1);
    static constexpr bits_type MaxIeeeExponent = bits_type{2 * std::numeric_limits<value_type>::max_exponent - 1};
    static constexpr bits_type HiddenBit       = bits_type{1} << (SignificandSize - 1);   // = 2^(p-1)
    static constexpr bits_type SignificandMask = HiddenBit - 1;                           // = 2^(p-1) - 1
    static constexpr bits_type ExponentMask    = MaxIeeeExponent << (SignificandSize - 1);
    static constexpr bits_type SignMask        = ~(~bits_type{0} >> 1);

    bits_type bits;

    explicit IEEE(bits_type bits_) : bits(bits_) {}
    explicit IEEE(value_type value) : bits(impl::ReinterpretBits<bits_type>(value)) {}

    bits_type PhysicalSignificand() const {
        return bits & SignificandMask;
    }

    bits_type PhysicalExponent() const {
        return (bits & ExponentMask) >> (SignificandSize - 1);
    }

    bool IsFinite() const {
        return (bits & ExponentMask) != ExponentMask;
    }

    bool IsInf() const {
        return (bits & ExponentMask) == ExponentMask && (bits & SignificandMask) == 0;
    }

    bool IsNaN() const {
        return (bits & ExponentMask) == ExponentMask && (bits & SignificandMask) != 0;
    }

    bool IsZero() const {
        return (bits & ~SignMask) == 0;
    }

    bool SignBit() const {
        return (bits & SignMask) != 0;
    }

    value_type Value() const {
        return impl::ReinterpretBits<value_type>(bits);
    }

    value_type AbsValue() const {
        return impl::ReinterpretBits<value_type>(bits & ~SignMask);
    }

    FloatClass Classify() const
    {
        const bits_type f = PhysicalSignificand();
        const bits_type e = PhysicalExponent();

        if (e == MaxIeeeExponent)
            return f == 0 ? FloatClass::infinity : FloatClass::nan;
        if (e == 0)
            return f == 0 ? FloatClass::zero : FloatClass::subnormal;
        return FloatClass::normal;
    }
};

// |value| = mantissa * 2^exponent, for finite values.
//
// Zero and subnormal numbers have an implicit bit of 0 and the minimum exponent, normal numbers
// have an implicit bit of 1. For infinities and NaNs the mantissa holds the raw significand field
// and the exponent is meaningless.
template <typename Float>
struct Decomposed
{
    using bits_type = typename IEEE<Float>::bits_type;

    bits_type mantissa;
    int exponent;
    bool sign;
    FloatClass cls;
};

template <typename Float>
TEJU_INLINE Decomposed<Float> Decompose(IEEE<Float> value)
{
    using Fp = IEEE<Float>;

    const auto f = value.PhysicalSignificand();
    const auto e = value.PhysicalExponent();

    Decomposed<Float> dec{};
    dec.sign = value.SignBit();
    dec.cls = value.Classify();

    switch (dec.cls)
    {
    case FloatClass::zero:
    case FloatClass::subnormal:
        dec.mantissa = f;
        dec.exponent = Fp::MinExponent;
        break;
    case FloatClass::normal:
        dec.mantissa = Fp::HiddenBit | f;
        dec.exponent = static_cast<int>(e) - Fp::ExponentBias;
        break;
    case FloatClass::infinity:
    case FloatClass::nan:
        dec.mantissa = f;
        dec.exponent = 0;
        break;
    }

    return dec;
}

template <typename Float>
TEJU_INLINE Decomposed<Float> Decompose(Float value)
{
    return Decompose(IEEE<Float>(value));
}

} // namespace teju
