// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "to_chars.h"

#include <cstddef>
#include <string_view>
#include <type_traits>

namespace teju {

// Fixed-size storage for the textual representation of a single floating-point number.
//
//  teju::Buffer<double> buffer;
//  std::string_view str = buffer.Format(1.234);   // "1.234"
//
// The returned view points into the buffer and stays valid until the next call to one of the
// Format functions or until the buffer is destroyed.
//
// A buffer may be reused, but must not be shared between threads without synchronization.
template <typename Float>
class Buffer
{
    static_assert(std::is_same<Float, float>::value || std::is_same<Float, double>::value,
        "Buffer requires float or double");

public:
    static constexpr int Capacity = MaxChars<Float>::value;

    // Shortest representation, using Notation::automatic.
    std::string_view Format(Float value, bool force_trailing_dot_zero = false) {
        return View(ToChars(data_, value, Notation::automatic, force_trailing_dot_zero));
    }

    // Shortest representation, always without an exponent.
    std::string_view FormatDecimal(Float value, bool force_trailing_dot_zero = false) {
        return View(ToChars(data_, value, Notation::decimal, force_trailing_dot_zero));
    }

    // Shortest representation, always with an exponent.
    std::string_view FormatScientific(Float value, bool force_trailing_dot_zero = false) {
        return View(ToChars(data_, value, Notation::scientific, force_trailing_dot_zero));
    }

    // Same as Format, but skips the checks for infinities and NaNs.
    // PRE: value must be finite.
    std::string_view FormatFinite(Float value, bool force_trailing_dot_zero = false) {
        return View(FiniteToChars(data_, value, Notation::automatic, force_trailing_dot_zero));
    }

    // Same as FormatScientific, but skips the checks for infinities and NaNs.
    // PRE: value must be finite.
    std::string_view FormatScientificFinite(Float value, bool force_trailing_dot_zero = false) {
        return View(FiniteToChars(data_, value, Notation::scientific, force_trailing_dot_zero));
    }

private:
    std::string_view View(const char* end) const
    {
        TEJU_ASSERT(end - data_ <= Capacity);
        return std::string_view(data_, static_cast<size_t>(end - data_));
    }

    char data_[Capacity];
};

} // namespace teju
