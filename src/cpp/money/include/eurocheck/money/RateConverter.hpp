/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "eurocheck/money/MonetaryValue.hpp"

//-------------------------------------------------------------------------

namespace eurocheck::money
{

//-------------------------------------------------------------------------

// Units of the source currency per one unit of the target currency.
struct ExchangeRate
{
    decimal_t sourcePerTarget;
};

// 1 EUR = 1.95583 BGN, fixed by law for the lifetime of the lev.
[[nodiscard]] ExchangeRate fixedBgnEurRate();

//-------------------------------------------------------------------------

class RateConverter
{
public:
    explicit RateConverter(ExchangeRate rate = fixedBgnEurRate());

    [[nodiscard]] ExchangeRate rate() const noexcept { return m_rate; }

    // Exact round-half-up of bgn / rate at cent precision. Throws
    // std::invalid_argument unless bgn and the result are cent-representable.
    [[nodiscard]] MonetaryValue convertBgnToEur(MonetaryValue bgn) const;

    [[nodiscard]] static MonetaryValue roundToCents(MonetaryValue value);

private:
    ExchangeRate m_rate;
};

//-------------------------------------------------------------------------

}  // namespace eurocheck::money

//-------------------------------------------------------------------------
