/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <bdldfp_decimal.h>
#include <bdldfp_decimalformatconfig.h>
#include <bdldfp_decimalutil.h>
#include <fmt/format.h>

#include <cstdint>
#include <optional>
#include <spanstream>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

#define DEC(lit) BDLDFP_DECIMAL_DD(lit)
#define WDEC(lit) BDLDFP_DECIMAL_DL(lit)

//-------------------------------------------------------------------------

namespace eurocheck
{

using decimal_t = BloombergLP::bdldfp::Decimal64;
using wide_decimal_t = BloombergLP::bdldfp::Decimal128;

}  // namespace eurocheck

//-------------------------------------------------------------------------

namespace eurocheck::util
{

inline constexpr uint32_t kCentDecimalPlaces = 2;
inline constexpr uint32_t kMaxSignificantDigits = 16;

[[nodiscard]] inline decimal_t truncate(decimal_t val, uint32_t decimalPlaces)
{
    return BloombergLP::bdldfp::DecimalUtil::trunc(val, decimalPlaces);
}

// Midpoints round away from zero.
[[nodiscard]] inline decimal_t roundHalfUp(decimal_t val, uint32_t decimalPlaces)
{
    return BloombergLP::bdldfp::DecimalUtil::round(val, decimalPlaces);
}

[[nodiscard]] inline wide_decimal_t roundHalfUp(wide_decimal_t val, uint32_t decimalPlaces)
{
    return BloombergLP::bdldfp::DecimalUtil::round(val, decimalPlaces);
}

[[nodiscard]] inline decimal_t narrow(wide_decimal_t val)
{
    return decimal_t{val};
}

[[nodiscard]] inline wide_decimal_t widen(decimal_t val) noexcept
{
    return wide_decimal_t{val};
}

[[nodiscard]] inline bool isFinite(decimal_t val) noexcept
{
    return BloombergLP::bdldfp::DecimalUtil::isFinite(val);
}

// Accepts "-12.50", "+.5", "1e3"; no grouping separators.
[[nodiscard]] bool isDecimalLiteral(std::string_view str);

// Counts mantissa digits between the first and last non-zero digit (trailing
// integer zeros included).
[[nodiscard]] uint32_t significantDigits(std::string_view literal) noexcept;

// std::nullopt unless `str` is a finite decimal literal that fits decimal_t exactly.
[[nodiscard]] std::optional<decimal_t> parseDecimal(std::string_view str);

// Digits after the point once trailing zeros are dropped; 0 for integral values.
[[nodiscard]] uint32_t fractionalDigits(decimal_t val) noexcept;

// Fixed notation with exactly `decimalPlaces` digits after the point.
[[nodiscard]] std::string formatFixed(decimal_t val, uint32_t decimalPlaces);

}  // namespace eurocheck::util

//-------------------------------------------------------------------------

namespace eurocheck::literals
{

[[nodiscard]] constexpr decimal_t operator"" _dec(unsigned long long int val)
{
    return decimal_t{val};
}

}  // namespace eurocheck::literals

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<eurocheck::decimal_t>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(eurocheck::decimal_t val, FormatContext& ctx) const
    {
        using namespace eurocheck::literals;
        char buf[32]{};
        std::ospanstream oss{buf};
        if (val == 0_dec) [[unlikely]] {
            oss << "0.0";
        } else {
            oss << val;
        }
        return fmt::format_to(ctx.out(), "{}", buf);
    }
};

//-------------------------------------------------------------------------
