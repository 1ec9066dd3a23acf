/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "eurocheck/money/RateConverter.hpp"

#include <fmt/format.h>

#include <source_location>
#include <stdexcept>

//-------------------------------------------------------------------------

namespace eurocheck::money
{

//-------------------------------------------------------------------------

ExchangeRate fixedBgnEurRate()
{
    return ExchangeRate{.sourcePerTarget = DEC(1.95583)};
}

//-------------------------------------------------------------------------

RateConverter::RateConverter(ExchangeRate rate)
    : m_rate{rate}
{
    if (!util::isFinite(m_rate.sourcePerTarget) || !(m_rate.sourcePerTarget > decimal_t{})) {
        throw std::invalid_argument{fmt::format(
            "{}: exchange rate should be a positive number, was {}",
            std::source_location::current().function_name(),
            m_rate.sourcePerTarget)};
    }
}

//-------------------------------------------------------------------------

MonetaryValue RateConverter::convertBgnToEur(MonetaryValue bgn) const
{
    static const wide_decimal_t kHalfCent = WDEC(0.005);
    static const wide_decimal_t kCent = WDEC(0.01);
    static constexpr uint32_t kMaxCorrections = 2;

    if (!isCentRepresentable(bgn.amount())) {
        throw std::invalid_argument{fmt::format(
            "{}: amount {} has more than {} integer digits",
            std::source_location::current().function_name(),
            bgn.amount(),
            kMaxIntegerDigits)};
    }

    const wide_decimal_t amount = util::widen(bgn.amount());
    const wide_decimal_t rate = util::widen(m_rate.sourcePerTarget);

    // The quotient only seeds the result; the bracket uses exact products.
    wide_decimal_t cents = util::roundHalfUp(amount / rate, util::kCentDecimalPlaces);

    const bool nonNegative = amount >= wide_decimal_t{};
    auto belowBracket = [&] {
        return nonNegative ? amount < (cents - kHalfCent) * rate
                           : amount <= (cents - kHalfCent) * rate;
    };
    auto aboveBracket = [&] {
        return nonNegative ? amount >= (cents + kHalfCent) * rate
                           : amount > (cents + kHalfCent) * rate;
    };

    uint32_t corrections{};
    for (; belowBracket() && corrections < kMaxCorrections; ++corrections) cents -= kCent;
    for (; aboveBracket() && corrections < kMaxCorrections; ++corrections) cents += kCent;

    const decimal_t result = util::narrow(cents);
    if (belowBracket() || aboveBracket() || !isCentRepresentable(result)) {
        throw std::invalid_argument{fmt::format(
            "{}: {} / {} cannot be rounded exactly to cents",
            std::source_location::current().function_name(),
            bgn.amount(),
            m_rate.sourcePerTarget)};
    }

    return MonetaryValue{result};
}

//-------------------------------------------------------------------------

MonetaryValue RateConverter::roundToCents(MonetaryValue value)
{
    return MonetaryValue{util::roundHalfUp(value.amount(), util::kCentDecimalPlaces)};
}

//-------------------------------------------------------------------------

}  // namespace eurocheck::money

//-------------------------------------------------------------------------
