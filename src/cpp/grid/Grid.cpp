/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "eurocheck/grid/Grid.hpp"

#include <boost/algorithm/string.hpp>
#include <fmt/format.h>
#include <range/v3/all.hpp>

#include <concepts>
#include <source_location>
#include <stdexcept>

//-------------------------------------------------------------------------

namespace eurocheck::grid
{

//-------------------------------------------------------------------------

std::string cellToString(const Cell& cell)
{
    return std::visit(
        [](auto&& value) -> std::string {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::same_as<T, std::monostate>) {
                return {};
            } else if constexpr (std::same_as<T, bool>) {
                return value ? "TRUE" : "FALSE";
            } else if constexpr (std::same_as<T, decimal_t>) {
                return fmt::format("{}", value);
            } else {
                return value;
            }
        },
        cell);
}

//-------------------------------------------------------------------------

Grid::Grid(std::vector<ColumnId> columns, std::vector<Row> rows, std::string name)
    : m_columns{std::move(columns)},
      m_rows{std::move(rows)},
      m_name{std::move(name)}
{
    for (auto& column : m_columns) {
        boost::algorithm::trim(column);
    }
}

//-------------------------------------------------------------------------

std::vector<size_t> Grid::findColumn(std::string_view id) const
{
    const std::string target = boost::algorithm::trim_copy(std::string{id});
    std::vector<size_t> positions;
    for (size_t i = 0; i < m_columns.size(); ++i) {
        if (!m_columns[i].empty() && m_columns[i] == target) {
            positions.push_back(i);
        }
    }
    return positions;
}

//-------------------------------------------------------------------------

const Cell& Grid::at(size_t row, size_t column) const
{
    static const Cell s_empty{};

    if (row >= m_rows.size()) {
        throw std::out_of_range{fmt::format(
            "{}: row {} out of range for grid '{}' with {} rows",
            std::source_location::current().function_name(),
            row,
            m_name,
            m_rows.size())};
    }
    const auto& cells = m_rows[row];
    return column < cells.size() ? cells[column] : s_empty;
}

//-------------------------------------------------------------------------

std::vector<ColumnId> commonColumns(const Grid& source, const Grid& target)
{
    return source.columns()
        | ranges::views::filter([&](const ColumnId& id) {
              return !id.empty() && !target.findColumn(id).empty();
          })
        | ranges::to<std::vector>();
}

//-------------------------------------------------------------------------

}  // namespace eurocheck::grid

//-------------------------------------------------------------------------
