#include "catch2/catch.hpp"

#include "buffer.h"
#include "format_digits.h"
#include "to_chars.h"

#include <cstdint>
#include <cstring>
#include <limits>
#include <random>
#include <string>
#include <string_view>

//==================================================================================================
//
//==================================================================================================

template <typename UnsignedInt>
static std::string FormatToString(UnsignedInt digits, int exponent,
                                  teju::Notation notation = teju::Notation::automatic, bool force_trailing_dot_zero = false)
{
    char buf[400];
    char* end = teju::FormatDigits(buf, digits, exponent, notation, force_trailing_dot_zero);
    return std::string(buf, end);
}

static std::string ExponentToString(int value)
{
    char buf[16];
    char* end = teju::impl::ExponentToString(buf, value);
    return std::string(buf, end);
}

template <typename UnsignedInt>
static void CheckPrintDecimalDigits(UnsignedInt value)
{
    CAPTURE(value);

    const int length = teju::impl::DecimalLength(value);

    char buf0[32];
    teju::impl::PrintDecimalDigits(buf0, value, length);

    char buf1[32];
    teju::impl::PrintDecimalDigitsNaive(buf1, value, length);

    CHECK(std::string(buf0, buf0 + length) == std::string(buf1, buf1 + length));
    CHECK(std::string(buf0, buf0 + length) == std::to_string(value));
}

//==================================================================================================
// Renderer
//==================================================================================================

TEST_CASE("DecimalLength")
{
    CHECK(teju::impl::DecimalLength(uint32_t{1}) == 1);
    CHECK(teju::impl::DecimalLength(uint32_t{9}) == 1);
    CHECK(teju::impl::DecimalLength(uint32_t{10}) == 2);
    CHECK(teju::impl::DecimalLength(uint32_t{999999999}) == 9);

    CHECK(teju::impl::DecimalLength(uint64_t{1}) == 1);
    CHECK(teju::impl::DecimalLength(uint64_t{4294967296}) == 10);
    CHECK(teju::impl::DecimalLength(uint64_t{9999999999999999}) == 16);
    CHECK(teju::impl::DecimalLength(uint64_t{10000000000000000}) == 17);
    CHECK(teju::impl::DecimalLength(uint64_t{99999999999999999}) == 17);
}

TEST_CASE("PrintDecimalDigits - two digits at a time")
{
    uint64_t pow10 = 1;
    for (int i = 0; i < 17; ++i)
    {
        CheckPrintDecimalDigits(pow10);
        CheckPrintDecimalDigits(pow10 * 9 + (pow10 - 1));
        if (pow10 > 1)
            CheckPrintDecimalDigits(pow10 + 1);
        pow10 *= 10;
    }

    for (uint32_t i = 1; i < 100000; ++i)
    {
        CheckPrintDecimalDigits(i);
    }

    std::mt19937_64 rng(314);
    for (int i = 0; i < 100000; ++i)
    {
        const uint64_t v = rng() % 100000000000000000ull;
        if (v != 0)
            CheckPrintDecimalDigits(v);

        const uint32_t w = static_cast<uint32_t>(rng() % 1000000000);
        if (w != 0)
            CheckPrintDecimalDigits(w);
    }
}

TEST_CASE("ExponentToString")
{
    CHECK(ExponentToString(0) == "0");
    CHECK(ExponentToString(7) == "7");
    CHECK(ExponentToString(-7) == "-7");
    CHECK(ExponentToString(10) == "10");
    CHECK(ExponentToString(-45) == "-45");
    CHECK(ExponentToString(99) == "99");
    CHECK(ExponentToString(100) == "100");
    CHECK(ExponentToString(308) == "308");
    CHECK(ExponentToString(-324) == "-324");
}

TEST_CASE("FormatDigits - automatic")
{
    CHECK(FormatToString(uint64_t{1234}, 7) == "12340000000");
    CHECK(FormatToString(uint64_t{1234}, -1) == "123.4");
    CHECK(FormatToString(uint64_t{1234}, -6) == "0.001234");
    CHECK(FormatToString(uint64_t{1}, 30) == "1e30");
    CHECK(FormatToString(uint64_t{1234}, 30) == "1.234e33");
    CHECK(FormatToString(uint64_t{1234}, -30) == "1.234e-27");
    CHECK(FormatToString(uint64_t{1234}, -3) == "1.234");
    CHECK(FormatToString(uint64_t{1}, 0) == "1");
    CHECK(FormatToString(uint64_t{0}, 0) == "0");
    CHECK(FormatToString(uint32_t{5}, -1) == "0.5");

    // The decimal point position (relative to the first digit) decides: (-5, 16].
    CHECK(FormatToString(uint64_t{1}, 15) == "1000000000000000");
    CHECK(FormatToString(uint64_t{1}, 16) == "1e16");
    CHECK(FormatToString(uint64_t{12345678901234567}, -1) == "1234567890123456.7");
    CHECK(FormatToString(uint64_t{12345678901234567}, 0) == "1.2345678901234567e16");
    CHECK(FormatToString(uint64_t{1}, -5) == "0.00001");
    CHECK(FormatToString(uint64_t{1}, -6) == "1e-6");
    CHECK(FormatToString(uint64_t{12}, -6) == "0.000012");
    CHECK(FormatToString(uint64_t{12}, -7) == "1.2e-6");
}

TEST_CASE("FormatDigits - decimal")
{
    const auto decimal = teju::Notation::decimal;

    CHECK(FormatToString(uint64_t{1234}, 7, decimal) == "12340000000");
    CHECK(FormatToString(uint64_t{1234}, -1, decimal) == "123.4");
    CHECK(FormatToString(uint64_t{1234}, -3, decimal) == "1.234");
    CHECK(FormatToString(uint64_t{1}, 30, decimal) == "1" + std::string(30, '0'));
    CHECK(FormatToString(uint64_t{1}, -10, decimal) == "0.0000000001");
    CHECK(FormatToString(uint64_t{5}, -324, decimal) == "0." + std::string(323, '0') + "5");
    CHECK(FormatToString(uint64_t{0}, 0, decimal) == "0");
}

TEST_CASE("FormatDigits - scientific")
{
    const auto scientific = teju::Notation::scientific;

    CHECK(FormatToString(uint64_t{1234}, -3, scientific) == "1.234e0");
    CHECK(FormatToString(uint64_t{1234}, -2, scientific) == "1.234e1");
    CHECK(FormatToString(uint64_t{1234}, 7, scientific) == "1.234e10");
    CHECK(FormatToString(uint64_t{1}, 0, scientific) == "1e0");
    CHECK(FormatToString(uint64_t{1}, -3, scientific) == "1e-3");
    CHECK(FormatToString(uint64_t{5}, -324, scientific) == "5e-324");
    CHECK(FormatToString(uint64_t{17976931348623157}, 292, scientific) == "1.7976931348623157e308");
    CHECK(FormatToString(uint64_t{0}, 0, scientific) == "0e0");
}

TEST_CASE("FormatDigits - trailing dot zero")
{
    CHECK(FormatToString(uint64_t{1}, 0, teju::Notation::automatic, true) == "1.0");
    CHECK(FormatToString(uint64_t{0}, 0, teju::Notation::automatic, true) == "0.0");
    CHECK(FormatToString(uint64_t{1234}, 2, teju::Notation::automatic, true) == "123400.0");
    CHECK(FormatToString(uint64_t{1}, 30, teju::Notation::automatic, true) == "1.0e30");
    CHECK(FormatToString(uint64_t{12}, -1, teju::Notation::automatic, true) == "1.2");
    CHECK(FormatToString(uint64_t{1}, 5, teju::Notation::decimal, true) == "100000.0");
    CHECK(FormatToString(uint64_t{5}, -1, teju::Notation::scientific, true) == "5.0e-1");
    CHECK(FormatToString(uint64_t{15}, -1, teju::Notation::scientific, true) == "1.5e0");
}

//==================================================================================================
// Buffer
//==================================================================================================

TEST_CASE("Buffer - special values")
{
    teju::Buffer<double> buffer;

    const double inf = std::numeric_limits<double>::infinity();
    const double nan = std::numeric_limits<double>::quiet_NaN();

    CHECK(buffer.Format(0.0) == "0");
    CHECK(buffer.Format(-0.0) == "-0");
    CHECK(buffer.Format(inf) == "inf");
    CHECK(buffer.Format(-inf) == "-inf");
    CHECK(buffer.Format(nan) == "NaN");
    CHECK(buffer.Format(-nan) == "NaN");

    CHECK(buffer.FormatDecimal(0.0) == "0");
    CHECK(buffer.FormatDecimal(-0.0) == "-0");
    CHECK(buffer.FormatDecimal(inf) == "inf");
    CHECK(buffer.FormatDecimal(-inf) == "-inf");
    CHECK(buffer.FormatDecimal(nan) == "NaN");

    CHECK(buffer.FormatScientific(0.0) == "0e0");
    CHECK(buffer.FormatScientific(-0.0) == "-0e0");
    CHECK(buffer.FormatScientific(inf) == "inf");
    CHECK(buffer.FormatScientific(-inf) == "-inf");
    CHECK(buffer.FormatScientific(nan) == "NaN");

    CHECK(buffer.Format(0.0, true) == "0.0");
    CHECK(buffer.Format(-0.0, true) == "-0.0");
    CHECK(buffer.Format(inf, true) == "inf");

    // NaN payloads and signs are not printed.
    uint64_t bits = 0xFFF0000000000123;
    double payload_nan;
    std::memcpy(&payload_nan, &bits, sizeof(double));
    CHECK(buffer.Format(payload_nan) == "NaN");
}

TEST_CASE("Buffer - special values, single precision")
{
    teju::Buffer<float> buffer;

    CHECK(buffer.Format(0.0f) == "0");
    CHECK(buffer.Format(-0.0f) == "-0");
    CHECK(buffer.Format(std::numeric_limits<float>::infinity()) == "inf");
    CHECK(buffer.Format(-std::numeric_limits<float>::infinity()) == "-inf");
    CHECK(buffer.Format(std::numeric_limits<float>::quiet_NaN()) == "NaN");
    CHECK(buffer.FormatScientific(-0.0f) == "-0e0");
}

TEST_CASE("Buffer - notations")
{
    teju::Buffer<double> buffer;

    CHECK(buffer.FormatDecimal(1.234) == "1.234");
    CHECK(buffer.FormatScientific(1.234) == "1.234e0");
    CHECK(buffer.Format(1.234) == "1.234");
    CHECK(buffer.Format(1.0) == "1");
    CHECK(buffer.Format(1.0, true) == "1.0");
    CHECK(buffer.Format(-1.5) == "-1.5");
    CHECK(buffer.Format(123.456) == "123.456");
    CHECK(buffer.Format(0.1) == "0.1");
    CHECK(buffer.Format(0.0001) == "0.0001");
    CHECK(buffer.Format(0.00001) == "0.00001");
    CHECK(buffer.Format(0.000001) == "1e-6");
    CHECK(buffer.Format(1e15) == "1000000000000000");
    CHECK(buffer.Format(1e16) == "1e16");
    CHECK(buffer.Format(1e30, true) == "1.0e30");
    CHECK(buffer.Format(1e100) == "1e100");
    CHECK(buffer.Format(1.5e300) == "1.5e300");
    CHECK(buffer.Format(5e-324) == "5e-324");
    CHECK(buffer.Format(-5e-324) == "-5e-324");
    CHECK(buffer.Format(std::numeric_limits<double>::max()) == "1.7976931348623157e308");
    CHECK(buffer.Format(std::numeric_limits<double>::min()) == "2.2250738585072014e-308");
    CHECK(buffer.Format(9007199254740992.0) == "9007199254740992");

    CHECK(buffer.FormatDecimal(1e21) == "1000000000000000000000");
    CHECK(buffer.FormatDecimal(1.5e-7) == "0.00000015");
    CHECK(buffer.FormatDecimal(-2.5) == "-2.5");

    CHECK(buffer.FormatScientific(1e23) == "1e23");
    CHECK(buffer.FormatScientific(123.0) == "1.23e2");
    CHECK(buffer.FormatScientific(0.001) == "1e-3");
    CHECK(buffer.FormatScientific(1e-7, true) == "1.0e-7");
    CHECK(buffer.FormatScientific(-5e-324) == "-5e-324");

    CHECK(buffer.FormatFinite(2.5) == "2.5");
    CHECK(buffer.FormatFinite(-0.0) == "-0");

    CHECK(buffer.FormatScientificFinite(1.234) == "1.234e0");
    CHECK(buffer.FormatScientificFinite(-1e23) == "-1e23");
    CHECK(buffer.FormatScientificFinite(0.001, true) == "1.0e-3");
    CHECK(buffer.FormatScientificFinite(-0.0) == "-0e0");
}

TEST_CASE("Buffer - notations, single precision")
{
    teju::Buffer<float> buffer;

    CHECK(buffer.Format(1.0f) == "1");
    CHECK(buffer.Format(0.1f) == "0.1");
    CHECK(buffer.Format(1.234f) == "1.234");
    CHECK(buffer.FormatScientific(1.234f) == "1.234e0");
    CHECK(buffer.FormatDecimal(1.234f) == "1.234");
    CHECK(buffer.Format(16777216.0f) == "16777216");
    CHECK(buffer.Format(1e10f) == "10000000000");
    CHECK(buffer.Format(std::numeric_limits<float>::max()) == "3.4028235e38");
    CHECK(buffer.Format(std::numeric_limits<float>::denorm_min()) == "1e-45");
    CHECK(buffer.FormatDecimal(std::numeric_limits<float>::max()) == "34028235" + std::string(31, '0'));
    CHECK(buffer.FormatFinite(0.5f) == "0.5");
    CHECK(buffer.FormatScientificFinite(0.5f) == "5e-1");
    CHECK(buffer.FormatScientificFinite(std::numeric_limits<float>::max()) == "3.4028235e38");
}

TEST_CASE("Buffer - capacity")
{
    static_assert(teju::Buffer<double>::Capacity == 327, "");
    static_assert(teju::Buffer<float>::Capacity == 48, "");

    teju::Buffer<double> buffer64;

    const std::string_view min64 = buffer64.FormatDecimal(-std::numeric_limits<double>::denorm_min());
    CHECK(min64.size() == teju::Buffer<double>::Capacity);
    CHECK(min64 == "-0." + std::string(323, '0') + "5");

    const std::string_view max64 = buffer64.FormatDecimal(-std::numeric_limits<double>::max());
    CHECK(max64.size() == 1 + 309);
    CHECK(max64 == "-17976931348623157" + std::string(292, '0'));

    CHECK(buffer64.FormatDecimal(-std::numeric_limits<double>::max(), true).size() == 1 + 309 + 2);

    teju::Buffer<float> buffer32;

    const std::string_view min32 = buffer32.FormatDecimal(-std::numeric_limits<float>::denorm_min());
    CHECK(min32.size() == teju::Buffer<float>::Capacity);
    CHECK(min32 == "-0." + std::string(44, '0') + "1");
}

TEST_CASE("Buffer - reuse")
{
    teju::Buffer<double> buffer;

    const std::string_view s1 = buffer.Format(123456.789);
    CHECK(s1 == "123456.789");

    const std::string_view s2 = buffer.Format(2.5);
    CHECK(s2 == "2.5");
    CHECK(s1.data() == s2.data());

    teju::Buffer<double> other;
    CHECK(other.Format(-7.0) == "-7");
    CHECK(buffer.Format(8.0) == "8");
}

//==================================================================================================
// ToChars
//==================================================================================================

TEST_CASE("Dtoa, Ftoa")
{
    char buf[teju::DtoaMinBufferLength];

    char* end = teju::Dtoa(buf, 1.234);
    CHECK(std::string(buf, end) == "1.234");

    end = teju::Dtoa(buf, -std::numeric_limits<double>::infinity());
    CHECK(std::string(buf, end) == "-inf");

    end = teju::Dtoa(buf, -1.2345678901234568e-300);
    CHECK(std::string(buf, end) == "-1.2345678901234568e-300");

    char fbuf[teju::FtoaMinBufferLength];

    end = teju::Ftoa(fbuf, 1.234f);
    CHECK(std::string(fbuf, end) == "1.234");

    end = teju::Ftoa(fbuf, -1.1754944e-38f);
    CHECK(std::string(fbuf, end) == "-1.1754944e-38");
}
