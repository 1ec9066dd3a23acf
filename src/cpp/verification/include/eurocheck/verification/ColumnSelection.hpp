/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "eurocheck/grid/Grid.hpp"

#include <variant>
#include <vector>

//-------------------------------------------------------------------------

namespace eurocheck::verification
{

//-------------------------------------------------------------------------

// Check exactly these columns, in this order.
struct ExplicitColumns
{
    std::vector<grid::ColumnId> ids;

    bool operator==(const ExplicitColumns&) const = default;
};

// Check every source column holding a number in at least one row.
struct NumericColumns
{
    bool operator==(const NumericColumns&) const = default;
};

using ColumnSelection = std::variant<ExplicitColumns, NumericColumns>;

//-------------------------------------------------------------------------

}  // namespace eurocheck::verification

//-------------------------------------------------------------------------
