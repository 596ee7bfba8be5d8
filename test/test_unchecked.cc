#include "catch2/catch.hpp"

#include "buffer.h"
#include "teju.h"

#include <cstdint>
#include <cstring>
#include <limits>
#include <string_view>

#if TEJU_CHECKED || !defined(NDEBUG)
#error "test_unchecked must be built with TEJU_CHECKED=0 and NDEBUG"
#endif

// [-]digits[.digits][e[-]digits]
static bool IsNumber(std::string_view str)
{
    size_t i = 0;
    const auto digits = [&]() {
        const size_t start = i;
        while (i < str.size() && '0' <= str[i] && str[i] <= '9')
            ++i;
        return i > start;
    };

    if (i < str.size() && str[i] == '-')
        ++i;
    if (!digits())
        return false;
    if (i < str.size() && str[i] == '.')
    {
        ++i;
        if (!digits())
            return false;
    }
    if (i < str.size() && str[i] == 'e')
    {
        ++i;
        if (i < str.size() && str[i] == '-')
            ++i;
        if (!digits())
            return false;
    }
    return i == str.size();
}

template <typename Float, typename Bits>
static Float FromBits(Bits bits)
{
    static_assert(sizeof(Float) == sizeof(Bits), "size mismatch");

    Float f;
    std::memcpy(&f, &bits, sizeof(Bits));
    return f;
}

TEST_CASE("FormatFinite - non-finite input without checks")
{
    teju::Buffer<double> buffer;

    const double values[] = {
        std::numeric_limits<double>::infinity(),
        -std::numeric_limits<double>::infinity(),
        std::numeric_limits<double>::quiet_NaN(),
        FromBits<double>(uint64_t{0x7FF0000000000001}),
        FromBits<double>(uint64_t{0xFFFFFFFFFFFFFFFF}),
    };

    for (const double value : values)
    {
        CAPTURE(value);
        CHECK(IsNumber(buffer.FormatFinite(value)));
        CHECK(IsNumber(buffer.FormatFinite(value, true)));
        CHECK(IsNumber(buffer.FormatScientificFinite(value)));
    }

    // The checked entry points are not affected.
    CHECK(buffer.Format(std::numeric_limits<double>::infinity()) == "inf");
    CHECK(buffer.Format(-std::numeric_limits<double>::infinity()) == "-inf");
    CHECK(buffer.Format(std::numeric_limits<double>::quiet_NaN()) == "NaN");
}

TEST_CASE("FormatFinite - non-finite input without checks, single precision")
{
    teju::Buffer<float> buffer;

    const float values[] = {
        std::numeric_limits<float>::infinity(),
        -std::numeric_limits<float>::infinity(),
        std::numeric_limits<float>::quiet_NaN(),
        FromBits<float>(uint32_t{0x7F800001}),
        FromBits<float>(uint32_t{0xFFFFFFFF}),
    };

    for (const float value : values)
    {
        CAPTURE(value);
        CHECK(IsNumber(buffer.FormatFinite(value)));
        CHECK(IsNumber(buffer.FormatScientificFinite(value, true)));
    }

    CHECK(buffer.Format(std::numeric_limits<float>::infinity()) == "inf");
}

TEST_CASE("ToDecimal - infinity without checks")
{
    const auto dec64 = teju::ToDecimal(std::numeric_limits<double>::infinity());
    CHECK(dec64.digits == 0);
    CHECK(dec64.exponent == 0);

    const auto dec32 = teju::ToDecimal(std::numeric_limits<float>::infinity());
    CHECK(dec32.digits == 0);
    CHECK(dec32.exponent == 0);
}
