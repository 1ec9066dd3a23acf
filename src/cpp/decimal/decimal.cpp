/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "eurocheck/decimal/decimal.hpp"

#include <bsls_types.h>

#include <algorithm>
#include <cctype>
#include <regex>

//-------------------------------------------------------------------------

namespace eurocheck::util
{

//-------------------------------------------------------------------------

bool isDecimalLiteral(std::string_view str)
{
    static const std::regex s_pattern{R"(^[+-]?(\d+(\.\d*)?|\.\d+)([eE][+-]?\d+)?$)"};
    return std::regex_match(str.begin(), str.end(), s_pattern);
}

//-------------------------------------------------------------------------

uint32_t significantDigits(std::string_view literal) noexcept
{
    const auto mantissa = literal.substr(0, literal.find_first_of("eE"));
    std::string digits;
    for (char c : mantissa) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits.push_back(c);
        }
    }
    const auto first = digits.find_first_not_of('0');
    if (first == std::string::npos) return 0;
    auto last = digits.size();
    if (const auto point = mantissa.find('.'); point != std::string_view::npos) {
        const auto integerDigits = static_cast<size_t>(std::count_if(
            mantissa.begin(), mantissa.begin() + point,
            [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }));
        last = std::max(digits.find_last_not_of('0') + 1, integerDigits);
    }
    return static_cast<uint32_t>(last - first);
}

//-------------------------------------------------------------------------

std::optional<decimal_t> parseDecimal(std::string_view str)
{
    if (!isDecimalLiteral(str) || significantDigits(str) > kMaxSignificantDigits) {
        return std::nullopt;
    }
    decimal_t parsed;
    const std::string literal{str};
    if (BloombergLP::bdldfp::DecimalUtil::parseDecimal64(&parsed, literal.c_str()) != 0
        || !isFinite(parsed)) {
        return std::nullopt;
    }
    return parsed;
}

//-------------------------------------------------------------------------

uint32_t fractionalDigits(decimal_t val) noexcept
{
    int sign{};
    BloombergLP::bsls::Types::Uint64 significand{};
    int exponent{};
    BloombergLP::bdldfp::DecimalUtil::decompose(&sign, &significand, &exponent, val);
    if (significand == 0) return 0;
    while (exponent < 0 && significand % 10 == 0) {
        significand /= 10;
        ++exponent;
    }
    return exponent < 0 ? static_cast<uint32_t>(-exponent) : 0;
}

//-------------------------------------------------------------------------

std::string formatFixed(decimal_t val, uint32_t decimalPlaces)
{
    using namespace BloombergLP::bdldfp;
    const DecimalFormatConfig config{
        static_cast<int>(decimalPlaces), DecimalFormatConfig::e_FIXED};
    std::string formatted(64, '\0');
    int len = DecimalUtil::format(formatted.data(), static_cast<int>(formatted.size()), val, config);
    if (static_cast<size_t>(len) > formatted.size()) {
        formatted.resize(static_cast<size_t>(len));
        len = DecimalUtil::format(
            formatted.data(), static_cast<int>(formatted.size()), val, config);
    }
    formatted.resize(static_cast<size_t>(len));
    return formatted;
}

//-------------------------------------------------------------------------

}  // namespace eurocheck::util

//-------------------------------------------------------------------------
