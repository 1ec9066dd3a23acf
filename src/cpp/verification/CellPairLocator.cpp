/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "eurocheck/verification/CellPairLocator.hpp"

#include "eurocheck/money/MonetaryValue.hpp"
#include "VerificationException.hpp"

#include <boost/algorithm/string/trim.hpp>
#include <fmt/format.h>
#include <range/v3/all.hpp>

#include <set>
#include <source_location>

//-------------------------------------------------------------------------

namespace eurocheck::verification
{

//-------------------------------------------------------------------------

namespace
{

std::string gridLabel(const grid::Grid& grid, std::string_view role)
{
    if (grid.name().empty()) return fmt::format("{} grid", role);
    return fmt::format("{} grid '{}'", role, grid.name());
}

std::optional<size_t> locate(
    const grid::Grid& grid,
    std::string_view role,
    const grid::ColumnId& id,
    bool required,
    std::string_view ctx)
{
    const auto positions = grid.findColumn(id);
    if (positions.empty()) {
        if (!required) return std::nullopt;
        throw UnknownColumnError{
            fmt::format("{}: Column '{}' not found in {}", ctx, id, gridLabel(grid, role)),
            id,
            grid.name()};
    }
    if (positions.size() > 1) {
        throw AmbiguousColumnError{
            fmt::format(
                "{}: Column '{}' appears {} times in {}",
                ctx, id, positions.size(), gridLabel(grid, role)),
            id,
            grid.name()};
    }
    return positions.front();
}

bool holdsNumber(const grid::Grid& grid, size_t column)
{
    return ranges::any_of(
        ranges::views::iota(size_t{0}, grid.rowCount()),
        [&](size_t row) { return money::toMonetary(grid.at(row, column)).has_value(); });
}

}  // namespace

//-------------------------------------------------------------------------

CellPairLocator::CellPairLocator(
    const grid::Grid& source, const grid::Grid& target, const ColumnSelection& selection)
    : m_source{source},
      m_target{target},
      m_columns{resolveColumns(source, target, selection)},
      m_rows{alignRows(source, target)}
{}

//-------------------------------------------------------------------------

std::vector<ResolvedColumn> CellPairLocator::resolveColumns(
    const grid::Grid& source, const grid::Grid& target, const ColumnSelection& selection)
{
    const auto ctx = std::source_location::current().function_name();

    std::vector<ResolvedColumn> resolved;

    if (const auto* explicitColumns = std::get_if<ExplicitColumns>(&selection)) {
        if (explicitColumns->ids.empty()) {
            throw ConfigurationError{fmt::format("{}: No columns selected for verification", ctx)};
        }
        std::set<grid::ColumnId> seen;
        for (const auto& rawId : explicitColumns->ids) {
            const auto id = boost::algorithm::trim_copy(rawId);
            if (!seen.insert(id).second) {
                throw ConfigurationError{
                    fmt::format("{}: Column '{}' selected more than once", ctx, id)};
            }
            resolved.push_back(ResolvedColumn{
                .id = id,
                .sourceIndex = locate(source, "source", id, true, ctx).value(),
                .targetIndex = locate(target, "target", id, true, ctx)});
        }
        return resolved;
    }

    for (size_t column = 0; column < source.columnCount(); ++column) {
        const auto& id = source.columns()[column];
        if (id.empty() || !holdsNumber(source, column)) continue;
        locate(source, "source", id, true, ctx);
        resolved.push_back(ResolvedColumn{
            .id = id,
            .sourceIndex = column,
            .targetIndex = locate(target, "target", id, false, ctx)});
    }
    return resolved;
}

//-------------------------------------------------------------------------

RowAlignment CellPairLocator::alignRows(const grid::Grid& source, const grid::Grid& target)
{
    RowAlignment alignment{
        .sourceRowCount = source.rowCount(),
        .targetRowCount = target.rowCount()};

    if (alignment.sourceRowCount != alignment.targetRowCount) {
        alignment.rowCountMismatch = Discrepancy{
            .row = alignment.alignedRowCount(),
            .reason = DiscrepancyReason::ROW_COUNT_MISMATCH,
            .detail = fmt::format(
                "source has {} rows, target has {} rows; only the first {} rows were compared",
                alignment.sourceRowCount,
                alignment.targetRowCount,
                alignment.alignedRowCount())};
    }

    return alignment;
}

//-------------------------------------------------------------------------

CellPair CellPairLocator::makePair(size_t row, const ResolvedColumn& column) const
{
    static const grid::Cell s_missing{};

    return CellPair{
        .row = row,
        .column = column.id,
        .source = &m_source.at(row, column.sourceIndex),
        .target = column.targetIndex ? &m_target.at(row, *column.targetIndex) : &s_missing};
}

//-------------------------------------------------------------------------

}  // namespace eurocheck::verification

//-------------------------------------------------------------------------
