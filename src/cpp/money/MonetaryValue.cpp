/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "eurocheck/money/MonetaryValue.hpp"

#include <boost/algorithm/string.hpp>

#include <algorithm>

//-------------------------------------------------------------------------

namespace eurocheck::money
{

//-------------------------------------------------------------------------

std::string MonetaryValue::toString() const
{
    return util::formatFixed(
        m_amount, std::max(util::kCentDecimalPlaces, util::fractionalDigits(m_amount)));
}

//-------------------------------------------------------------------------

std::ostream& operator<<(std::ostream& os, const MonetaryValue& value)
{
    return os << value.toString();
}

//-------------------------------------------------------------------------

bool isCentRepresentable(decimal_t amount) noexcept
{
    static const decimal_t s_limit = BloombergLP::bdldfp::DecimalUtil::makeDecimal64(
        1, static_cast<int>(kMaxIntegerDigits));
    return util::isFinite(amount) && amount < s_limit && amount > -s_limit;
}

//-------------------------------------------------------------------------

std::string cleanNumericText(std::string_view text)
{
    std::string cleaned{text};
    boost::algorithm::erase_all(cleaned, "\xC2\xA0");
    boost::algorithm::erase_all(cleaned, "\xE2\x80\xAF");
    boost::algorithm::erase_all(cleaned, " ");
    boost::algorithm::erase_all(cleaned, "\t");
    boost::algorithm::replace_all(cleaned, ",", ".");
    return cleaned;
}

//-------------------------------------------------------------------------

ExpectedMonetaryValue toMonetary(const grid::Cell& cell)
{
    if (const auto* number = std::get_if<decimal_t>(&cell)) {
        if (!util::isFinite(*number)) {
            return std::unexpected{ConversionError::NON_NUMERIC};
        }
        if (!isCentRepresentable(*number)) {
            return std::unexpected{ConversionError::PRECISION_EXCEEDED};
        }
        return MonetaryValue{*number};
    }

    const auto* text = std::get_if<std::string>(&cell);
    if (text == nullptr) {
        return std::unexpected{ConversionError::NON_NUMERIC};
    }

    const std::string cleaned = cleanNumericText(*text);
    if (!util::isDecimalLiteral(cleaned)) {
        return std::unexpected{ConversionError::NON_NUMERIC};
    }
    if (util::significantDigits(cleaned) > util::kMaxSignificantDigits) {
        return std::unexpected{ConversionError::PRECISION_EXCEEDED};
    }

    const auto parsed = util::parseDecimal(cleaned);
    if (!parsed) {
        return std::unexpected{ConversionError::NON_NUMERIC};
    }
    if (!isCentRepresentable(*parsed)) {
        return std::unexpected{ConversionError::PRECISION_EXCEEDED};
    }
    return MonetaryValue{*parsed};
}

//-------------------------------------------------------------------------

}  // namespace eurocheck::money

//-------------------------------------------------------------------------
