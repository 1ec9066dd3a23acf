/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "eurocheck/grid/Grid.hpp"
#include "eurocheck/money/MonetaryValue.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

namespace eurocheck::verification
{

//-------------------------------------------------------------------------

enum class DiscrepancyReason : uint32_t
{
    VALUE_MISMATCH,
    TARGET_EMPTY,
    NON_NUMERIC,
    ROW_COUNT_MISMATCH
};

[[nodiscard]] std::string_view describe(DiscrepancyReason reason) noexcept;

//-------------------------------------------------------------------------

// Row indices count data rows from 0; the header occupies sheet row 1.
inline constexpr size_t kFirstDataSheetRow = 2;

[[nodiscard]] constexpr size_t sheetRow(size_t rowIndex) noexcept
{
    return rowIndex + kFirstDataSheetRow;
}

//-------------------------------------------------------------------------

struct Discrepancy
{
    size_t row{};
    grid::ColumnId column;
    DiscrepancyReason reason{};
    std::optional<money::MonetaryValue> source;
    std::optional<money::MonetaryValue> expected;
    std::optional<money::MonetaryValue> actual;
    std::optional<money::MonetaryValue> delta;
    std::string detail;

    bool operator==(const Discrepancy&) const = default;
};

//-------------------------------------------------------------------------

}  // namespace eurocheck::verification

//-------------------------------------------------------------------------
