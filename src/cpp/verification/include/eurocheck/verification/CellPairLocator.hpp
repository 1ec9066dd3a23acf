/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "eurocheck/grid/Grid.hpp"
#include "eurocheck/verification/ColumnSelection.hpp"
#include "eurocheck/verification/Discrepancy.hpp"

#include <range/v3/view/all.hpp>
#include <range/v3/view/cartesian_product.hpp>
#include <range/v3/view/iota.hpp>
#include <range/v3/view/transform.hpp>

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string_view>
#include <tuple>
#include <vector>

//-------------------------------------------------------------------------

namespace eurocheck::verification
{

//-------------------------------------------------------------------------

struct ResolvedColumn
{
    grid::ColumnId id;
    size_t sourceIndex{};
    // Empty when the column was discovered in the source but the target lacks it.
    std::optional<size_t> targetIndex;

    bool operator==(const ResolvedColumn&) const = default;
};

//-------------------------------------------------------------------------

struct RowAlignment
{
    size_t sourceRowCount{};
    size_t targetRowCount{};
    std::optional<Discrepancy> rowCountMismatch;

    [[nodiscard]] size_t alignedRowCount() const noexcept
    {
        return std::min(sourceRowCount, targetRowCount);
    }

    [[nodiscard]] auto indices() const noexcept
    {
        return ranges::views::iota(size_t{0}, alignedRowCount());
    }
};

//-------------------------------------------------------------------------

struct CellPair
{
    size_t row;
    std::string_view column;
    const grid::Cell* source;
    const grid::Cell* target;
};

//-------------------------------------------------------------------------

class CellPairLocator
{
public:
    // Resolves the selection up front; throws ConfigurationError before any pair exists.
    CellPairLocator(
        const grid::Grid& source, const grid::Grid& target, const ColumnSelection& selection);

    [[nodiscard]] const std::vector<ResolvedColumn>& columns() const noexcept { return m_columns; }
    [[nodiscard]] const RowAlignment& rows() const noexcept { return m_rows; }

    // Row-major over the aligned rows, columns in resolved order. Lazy; the
    // locator and both grids must outlive the returned view.
    [[nodiscard]] auto producePairs() const
    {
        return ranges::views::cartesian_product(m_rows.indices(), ranges::views::all(m_columns))
            | ranges::views::transform([this](auto&& rowAndColumn) {
                  return makePair(std::get<0>(rowAndColumn), std::get<1>(rowAndColumn));
              });
    }

    [[nodiscard]] static std::vector<ResolvedColumn> resolveColumns(
        const grid::Grid& source, const grid::Grid& target, const ColumnSelection& selection);

    [[nodiscard]] static RowAlignment alignRows(
        const grid::Grid& source, const grid::Grid& target);

private:
    [[nodiscard]] CellPair makePair(size_t row, const ResolvedColumn& column) const;

    const grid::Grid& m_source;
    const grid::Grid& m_target;
    std::vector<ResolvedColumn> m_columns;
    RowAlignment m_rows;
};

//-------------------------------------------------------------------------

}  // namespace eurocheck::verification

//-------------------------------------------------------------------------
