/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "eurocheck/decimal/decimal.hpp"
#include "eurocheck/grid/Cell.hpp"

#include <expected>
#include <ostream>
#include <string>

//-------------------------------------------------------------------------

namespace eurocheck::money
{

//-------------------------------------------------------------------------

enum class ConversionError : uint32_t
{
    NON_NUMERIC,
    PRECISION_EXCEEDED
};

//-------------------------------------------------------------------------

class MonetaryValue
{
public:
    MonetaryValue() noexcept = default;
    explicit MonetaryValue(decimal_t amount) noexcept : m_amount{amount} {}

    [[nodiscard]] decimal_t amount() const noexcept { return m_amount; }
    [[nodiscard]] bool isNegative() const noexcept { return m_amount < decimal_t{}; }

    [[nodiscard]] MonetaryValue operator-(const MonetaryValue& rhs) const noexcept
    {
        return MonetaryValue{m_amount - rhs.m_amount};
    }

    [[nodiscard]] bool operator==(const MonetaryValue& rhs) const noexcept
    {
        return m_amount == rhs.m_amount;
    }

    [[nodiscard]] std::string toString() const;

    friend std::ostream& operator<<(std::ostream& os, const MonetaryValue& value);

private:
    decimal_t m_amount{};
};

//-------------------------------------------------------------------------

using ExpectedMonetaryValue = std::expected<MonetaryValue, ConversionError>;

inline constexpr uint32_t kMaxIntegerDigits =
    util::kMaxSignificantDigits - util::kCentDecimalPlaces;

// True when the integral part fits in kMaxIntegerDigits, so that the amount and
// its cent rounding stay exact in decimal_t.
[[nodiscard]] bool isCentRepresentable(decimal_t amount) noexcept;

// PRECISION_EXCEEDED covers both too many significant digits and amounts that
// are not cent-representable.
[[nodiscard]] ExpectedMonetaryValue toMonetary(const grid::Cell& cell);

// Thousands separators (plain and non-breaking spaces) are dropped and ',' is
// read as the decimal point.
[[nodiscard]] std::string cleanNumericText(std::string_view text);

//-------------------------------------------------------------------------

}  // namespace eurocheck::money

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<eurocheck::money::MonetaryValue>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const eurocheck::money::MonetaryValue& value, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", value.toString());
    }
};

//-------------------------------------------------------------------------
