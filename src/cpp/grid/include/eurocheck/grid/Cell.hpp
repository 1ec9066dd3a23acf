/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "eurocheck/decimal/decimal.hpp"

#include <string>
#include <variant>

//-------------------------------------------------------------------------

namespace eurocheck::grid
{

//-------------------------------------------------------------------------

// A computed cell value as handed over by a tabular data source; never formula text.
using Cell = std::variant<std::monostate, bool, decimal_t, std::string>;

[[nodiscard]] inline bool isEmpty(const Cell& cell) noexcept
{
    if (std::holds_alternative<std::monostate>(cell)) return true;
    if (const auto* text = std::get_if<std::string>(&cell)) {
        return text->find_first_not_of(" \t\r\n") == std::string::npos;
    }
    return false;
}

[[nodiscard]] std::string cellToString(const Cell& cell);

//-------------------------------------------------------------------------

}  // namespace eurocheck::grid

//-------------------------------------------------------------------------
