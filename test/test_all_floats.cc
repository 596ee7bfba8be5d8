#include <stdio.h>
#include <cstdint>
#include <cstring>
#include <string>

#include "double-conversion/double-conversion.h"

#include "teju.h"
#include "to_chars.h"

#include "scan_number.h"

static inline float FloatFromBits(uint32_t bits)
{
    float f;
    std::memcpy(&f, &bits, sizeof(uint32_t));
    return f;
}

static inline uint32_t BitsFromFloat(float f)
{
    uint32_t u;
    std::memcpy(&u, &f, sizeof(uint32_t));
    return u;
}

static bool CheckSpecial(uint32_t bits, const char* expected)
{
    char buf[teju::FtoaMinBufferLength];
    char* end = teju::Ftoa(buf, FloatFromBits(bits));

    if (std::string(buf, end) != expected)
    {
        printf("FAIL: 0x%08X [actual = %s] [expected = %s]\n", bits, std::string(buf, end).c_str(), expected);
        return false;
    }
    return true;
}

int main()
{
    constexpr int P = 24;
    constexpr uint32_t MaxF = (1u << (P - 1)) - 1;
    constexpr int MinExp = 0;
    constexpr int MaxExp = 255 - 1;

    const auto& conv = double_conversion::DoubleToStringConverter::EcmaScriptConverter();
    const double_conversion::StringToDoubleConverter s2f(0, 0.0, 0.0, "inf", "NaN");

    uint64_t num_checked = 0;
    uint64_t num_failed  = 0;

    for (int e = MinExp; e <= MaxExp; ++e)
    {
        uint32_t curr_num_checked = 0;

        printf("e = %3d ... ", e);
        fflush(stdout);

        bool fail = false;
        for (uint32_t f = 0; f <= MaxF; ++f)
        {
            ++curr_num_checked;

            const uint32_t bits = ((uint32_t)e << (P-1)) | f;
            const float value = FloatFromBits(bits);

            char buf[teju::FtoaMinBufferLength];
            char* end = teju::Ftoa(buf, value);
            const int len = static_cast<int>(end - buf);

            int unused;
            const float value_out = s2f.StringToFloat(buf, len, &unused);

            char tmp[64];
            double_conversion::StringBuilder builder(tmp, 64);
            conv.ToShortestSingle(value, &builder);
            const int tmp_len = builder.position();
            builder.Finalize();

            const uint32_t bits_out = BitsFromFloat(value_out);
            if (bits != bits_out)
            {
                printf("\nFAIL: 0x%08X [actual = %.*s] [expected = %s]\n", bits, len, buf, tmp);
                fail = true;
                break;
            }

            const auto num1 = ScanNumber(buf, end);
            const auto num2 = ScanNumber(tmp, tmp + tmp_len);
            if (num1.digits != num2.digits || num1.exponent != num2.exponent)
            {
                printf("\nFAIL: 0x%08X not optimal [actual = %.*s] [expected = %s]\n", bits, len, buf, tmp);
                fail = true;
                break;
            }

            // The digits generator and the formatted string must agree.
            const auto dec = teju::ToDecimal(value);
            const auto num3 = ScanNumber(std::to_string(dec.digits) + "e" + std::to_string(dec.exponent));
            if (num3.digits != num1.digits || num3.exponent != num1.exponent)
            {
                printf("\nFAIL: 0x%08X [ToDecimal = %ue%d] [string = %.*s]\n", bits, dec.digits, dec.exponent, len, buf);
                fail = true;
                break;
            }

            // Negative numbers only add a leading '-'.
            char neg[teju::FtoaMinBufferLength];
            char* neg_end = teju::Ftoa(neg, -value);
            if (neg_end - neg != len + 1 || neg[0] != '-' || std::memcmp(neg + 1, buf, static_cast<size_t>(len)) != 0)
            {
                printf("\nFAIL: 0x%08X [negative = %.*s] [positive = %.*s]\n", bits, static_cast<int>(neg_end - neg), neg, len, buf);
                fail = true;
                break;
            }
        }

        if (fail)
            ++num_failed;
        else
            printf("ok (%u)\n", curr_num_checked);

        num_checked += curr_num_checked;
    }

    // Infinities and NaNs
    {
        printf("e = 255 ... ");

        bool fail = false;
        fail |= !CheckSpecial(0x7F800000, "inf");
        fail |= !CheckSpecial(0xFF800000, "-inf");
        for (uint32_t f = 1; f <= MaxF; ++f)
        {
            if (!CheckSpecial(0x7F800000 | f, "NaN") || !CheckSpecial(0xFF800000 | f, "NaN"))
            {
                fail = true;
                break;
            }
        }

        if (fail)
            ++num_failed;
        else
            printf("ok\n");
    }

    printf("done.\n");
    printf("checked: %llu\n", static_cast<unsigned long long>(num_checked));
    printf("failed:  %llu\n", static_cast<unsigned long long>(num_failed));

    return num_failed == 0 ? 0 : 1;
}
