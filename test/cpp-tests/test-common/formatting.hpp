/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "eurocheck/decimal/decimal.hpp"
#include "eurocheck/money/MonetaryValue.hpp"
#include "eurocheck/verification/Discrepancy.hpp"

#include <magic_enum.hpp>

//-------------------------------------------------------------------------

namespace eurocheck
{

inline void PrintTo(const decimal_t& val, std::ostream* os)
{
    *os << fmt::format("{}", val);
}

}  // namespace eurocheck

//-------------------------------------------------------------------------

namespace eurocheck::money
{

inline void PrintTo(const MonetaryValue& val, std::ostream* os)
{
    *os << val.toString();
}

}  // namespace eurocheck::money

//-------------------------------------------------------------------------

namespace eurocheck::verification
{

inline void PrintTo(const Discrepancy& discrepancy, std::ostream* os)
{
    auto opt = [](const std::optional<money::MonetaryValue>& value) {
        return value ? value->toString() : std::string{"-"};
    };
    *os << fmt::format(
        "{{.row = {}, .column = {}, .reason = {}, .source = {}, .expected = {}, "
        ".actual = {}, .delta = {}, .detail = '{}'}}",
        discrepancy.row,
        discrepancy.column,
        magic_enum::enum_name(discrepancy.reason),
        opt(discrepancy.source),
        opt(discrepancy.expected),
        opt(discrepancy.actual),
        opt(discrepancy.delta),
        discrepancy.detail);
}

}  // namespace eurocheck::verification

//-------------------------------------------------------------------------
