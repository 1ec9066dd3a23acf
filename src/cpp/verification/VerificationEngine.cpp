/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "eurocheck/verification/VerificationEngine.hpp"

#include <magic_enum.hpp>
#include <range/v3/view/transform.hpp>
#include <range/v3/range/conversion.hpp>

//-------------------------------------------------------------------------

namespace eurocheck::verification
{

//-------------------------------------------------------------------------

VerificationEngine::VerificationEngine(money::RateConverter converter, bool debug) noexcept
    : m_converter{converter},
      m_debug{debug}
{}

//-------------------------------------------------------------------------

Report VerificationEngine::verify(
    const grid::Grid& source,
    const grid::Grid& target,
    const ColumnSelection& selection) const
{
    const CellPairLocator locator{source, target, selection};

    std::vector<Discrepancy> discrepancies;
    if (const auto& mismatch = locator.rows().rowCountMismatch) {
        logDebug("ROW COUNT MISMATCH | {}", mismatch->detail);
        discrepancies.push_back(*mismatch);
    }

    Tally tally;
    for (const CellPair& pair : locator.producePairs()) {
        if (auto discrepancy = checkPair(pair, tally)) {
            discrepancies.push_back(std::move(*discrepancy));
        }
    }

    logDebug(
        "VERIFIED {} ROWS x {} COLUMNS | CHECKED {} | SKIPPED {} | DISCREPANCIES {}",
        locator.rows().alignedRowCount(),
        locator.columns().size(),
        tally.checked,
        tally.skipped,
        discrepancies.size());

    return Report{ReportDesc{
        .discrepancies = std::move(discrepancies),
        .columns = locator.columns()
            | ranges::views::transform(&ResolvedColumn::id)
            | ranges::to<std::vector>(),
        .rowCount = locator.rows().alignedRowCount(),
        .checkedCount = tally.checked,
        .skippedCount = tally.skipped}};
}

//-------------------------------------------------------------------------

std::optional<Discrepancy> VerificationEngine::checkPair(const CellPair& pair, Tally& tally) const
{
    // Non-numeric source cells are counted as skipped, never reported.
    const auto sourceValue = money::toMonetary(*pair.source);
    if (!sourceValue.has_value()) {
        ++tally.skipped;
        return std::nullopt;
    }

    const auto expected = m_converter.convertBgnToEur(*sourceValue);

    Discrepancy discrepancy{
        .row = pair.row,
        .column = grid::ColumnId{pair.column},
        .source = *sourceValue,
        .expected = expected};

    if (grid::isEmpty(*pair.target)) {
        discrepancy.reason = DiscrepancyReason::TARGET_EMPTY;
        logDebug(
            "ROW {} COLUMN '{}' | TARGET EMPTY | BGN {} -> EUR {}",
            pair.row, pair.column, *sourceValue, expected);
        return discrepancy;
    }

    const auto targetValue = money::toMonetary(*pair.target);
    if (!targetValue.has_value()) {
        discrepancy.reason = DiscrepancyReason::NON_NUMERIC;
        discrepancy.detail = targetValue.error() == money::ConversionError::PRECISION_EXCEEDED
            ? fmt::format(
                "target value '{}' exceeds {} significant digits or {} integer digits",
                grid::cellToString(*pair.target),
                util::kMaxSignificantDigits,
                money::kMaxIntegerDigits)
            : fmt::format("target cell holds '{}'", grid::cellToString(*pair.target));
        logDebug(
            "ROW {} COLUMN '{}' | {} | {}",
            pair.row, pair.column, magic_enum::enum_name(targetValue.error()), discrepancy.detail);
        return discrepancy;
    }

    ++tally.checked;
    const auto actual = money::RateConverter::roundToCents(*targetValue);
    if (actual == expected) {
        return std::nullopt;
    }

    discrepancy.reason = DiscrepancyReason::VALUE_MISMATCH;
    discrepancy.actual = actual;
    discrepancy.delta = actual - expected;
    logDebug(
        "ROW {} COLUMN '{}' | MISMATCH | BGN {} -> EUR {} BUT FILE HAS {} (DIFF {})",
        pair.row, pair.column, *sourceValue, expected, actual, *discrepancy.delta);
    return discrepancy;
}

//-------------------------------------------------------------------------

}  // namespace eurocheck::verification

//-------------------------------------------------------------------------
