/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "eurocheck/grid/Cell.hpp"

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

//-------------------------------------------------------------------------

namespace eurocheck::grid
{

//-------------------------------------------------------------------------

using ColumnId = std::string;

class Grid
{
public:
    using Row = std::vector<Cell>;

    Grid() noexcept = default;
    Grid(std::vector<ColumnId> columns, std::vector<Row> rows, std::string name = {});

    [[nodiscard]] const std::vector<ColumnId>& columns() const noexcept { return m_columns; }
    [[nodiscard]] const std::vector<Row>& rows() const noexcept { return m_rows; }
    [[nodiscard]] const std::string& name() const noexcept { return m_name; }
    [[nodiscard]] size_t rowCount() const noexcept { return m_rows.size(); }
    [[nodiscard]] size_t columnCount() const noexcept { return m_columns.size(); }

    // Every position whose header equals `id`; more than one means the identifier
    // is ambiguous in this grid.
    [[nodiscard]] std::vector<size_t> findColumn(std::string_view id) const;

    // Cells past the end of a short row read as empty.
    [[nodiscard]] const Cell& at(size_t row, size_t column) const;

private:
    std::vector<ColumnId> m_columns;
    std::vector<Row> m_rows;
    std::string m_name;
};

//-------------------------------------------------------------------------

// Header identifiers present in both grids, in `source` header order.
[[nodiscard]] std::vector<ColumnId> commonColumns(const Grid& source, const Grid& target);

//-------------------------------------------------------------------------

}  // namespace eurocheck::grid

//-------------------------------------------------------------------------
