#pragma once

#include <cassert>
#include <cstdint>
#include <string>

// value = (negative ? -1 : 1) * digits * 10^exponent
struct ScanNumberResult {
    bool negative;
    std::string digits;
    int exponent;
};

inline bool IsDigit(char ch)
{
    return '0' <= ch && ch <= '9';
}

inline int DigitValue(char ch)
{
    assert(IsDigit(ch));
    return ch - '0';
}

// Splits a number of the form [-]digits[.digits][(e|E)[+|-]digits] into its significant digits
// and a decimal exponent. Leading and trailing zeros are removed from the digits, so that
// "1.50", "0.15e1" and "15e-1" all give {"15", -1}. Zero is returned as {"0", 0}.
inline ScanNumberResult ScanNumber(char const* next, char const* last)
{
    ScanNumberResult res{false, std::string(), 0};

    assert(next != last);
    if (*next == '-')
    {
        res.negative = true;
        ++next;
        assert(next != last);
    }

    assert(IsDigit(*next));

    // Integer part. Leading zeros are not significant.
    while (next != last && *next == '0')
        ++next;
    while (next != last && IsDigit(*next))
    {
        res.digits += *next;
        ++next;
    }

    if (next != last && *next == '.')
    {
        ++next;
        assert(next != last);
        assert(IsDigit(*next));

        while (next != last && IsDigit(*next))
        {
            if (!res.digits.empty() || *next != '0')
                res.digits += *next;
            --res.exponent;
            ++next;
        }
    }

    if (next != last && (*next == 'e' || *next == 'E'))
    {
        ++next;
        assert(next != last);

        bool const exp_is_neg = (*next == '-');
        if (exp_is_neg || *next == '+')
        {
            ++next;
            assert(next != last);
        }

        // No overflow checks...
        int e = 0;
        while (next != last)
        {
            e = 10 * e + DigitValue(*next);
            ++next;
        }

        res.exponent += exp_is_neg ? -e : e;
    }

    assert(next == last);

    // Move trailing zeros into the exponent
    while (!res.digits.empty() && res.digits.back() == '0')
    {
        res.digits.pop_back();
        res.exponent++;
    }

    // Normalize "0.0", "0" and "0e0"
    if (res.digits.empty())
    {
        res.digits = "0";
        res.exponent = 0;
    }

    return res;
}

inline ScanNumberResult ScanNumber(std::string const& str)
{
    char const* next = str.c_str();
    char const* last = str.c_str() + str.size();

    return ScanNumber(next, last);
}
