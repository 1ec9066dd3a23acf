/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "eurocheck/verification/Report.hpp"

#include <fmt/format.h>
#include <magic_enum.hpp>
#include <range/v3/algorithm/count_if.hpp>

#include <iostream>

//-------------------------------------------------------------------------

namespace eurocheck::verification
{

//-------------------------------------------------------------------------

namespace
{

std::string orNone(const std::optional<money::MonetaryValue>& value)
{
    return value ? value->toString() : std::string{"-"};
}

std::string formatDiscrepancy(const Discrepancy& discrepancy)
{
    if (discrepancy.reason == DiscrepancyReason::ROW_COUNT_MISMATCH) {
        return fmt::format("  {}: {}", describe(discrepancy.reason), discrepancy.detail);
    }
    auto line = fmt::format(
        "  row {} | {} | {}: BGN {} -> expected EUR {}, file EUR {}, diff {}",
        sheetRow(discrepancy.row),
        discrepancy.column,
        describe(discrepancy.reason),
        orNone(discrepancy.source),
        orNone(discrepancy.expected),
        orNone(discrepancy.actual),
        orNone(discrepancy.delta));
    if (!discrepancy.detail.empty()) {
        line += fmt::format(" ({})", discrepancy.detail);
    }
    return line;
}

}  // namespace

//-------------------------------------------------------------------------

std::string_view describe(DiscrepancyReason reason) noexcept
{
    switch (reason) {
        case DiscrepancyReason::VALUE_MISMATCH: return "value mismatch";
        case DiscrepancyReason::TARGET_EMPTY: return "target empty";
        case DiscrepancyReason::NON_NUMERIC: return "non-numeric data";
        case DiscrepancyReason::ROW_COUNT_MISMATCH: return "row-count mismatch";
    }
    return "unknown";
}

//-------------------------------------------------------------------------

Report::Report(ReportDesc desc) noexcept
    : m_discrepancies{std::move(desc.discrepancies)},
      m_columns{std::move(desc.columns)},
      m_rowCount{desc.rowCount},
      m_checkedCount{desc.checkedCount},
      m_skippedCount{desc.skippedCount}
{}

//-------------------------------------------------------------------------

size_t Report::countOf(DiscrepancyReason reason) const noexcept
{
    return static_cast<size_t>(ranges::count_if(
        m_discrepancies, [reason](const Discrepancy& d) { return d.reason == reason; }));
}

//-------------------------------------------------------------------------

void Report::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("passed", rapidjson::Value{passed()}, allocator);
        json.AddMember("rows", rapidjson::Value{static_cast<uint64_t>(m_rowCount)}, allocator);
        json.AddMember(
            "checked", rapidjson::Value{static_cast<uint64_t>(m_checkedCount)}, allocator);
        json.AddMember(
            "skipped", rapidjson::Value{static_cast<uint64_t>(m_skippedCount)}, allocator);

        rapidjson::Value columnsJson{rapidjson::kArrayType};
        for (const auto& column : m_columns) {
            columnsJson.PushBack(rapidjson::Value{column.c_str(), allocator}, allocator);
        }
        json.AddMember("columns", columnsJson, allocator);

        rapidjson::Value discrepanciesJson{rapidjson::kArrayType};
        for (const auto& discrepancy : m_discrepancies) {
            rapidjson::Value entry{rapidjson::kObjectType};
            entry.AddMember(
                "row", rapidjson::Value{static_cast<uint64_t>(discrepancy.row)}, allocator);
            entry.AddMember(
                "sheetRow",
                rapidjson::Value{static_cast<uint64_t>(sheetRow(discrepancy.row))},
                allocator);
            entry.AddMember(
                "column", rapidjson::Value{discrepancy.column.c_str(), allocator}, allocator);
            entry.AddMember(
                "reason",
                rapidjson::Value{
                    std::string{magic_enum::enum_name(discrepancy.reason)}.c_str(), allocator},
                allocator);
            entry.AddMember("source", json::monetaryValue(discrepancy.source, allocator), allocator);
            entry.AddMember(
                "expected", json::monetaryValue(discrepancy.expected, allocator), allocator);
            entry.AddMember("actual", json::monetaryValue(discrepancy.actual, allocator), allocator);
            entry.AddMember("delta", json::monetaryValue(discrepancy.delta, allocator), allocator);
            entry.AddMember(
                "detail", rapidjson::Value{discrepancy.detail.c_str(), allocator}, allocator);
            discrepanciesJson.PushBack(entry, allocator);
        }
        json.AddMember("discrepancies", discrepanciesJson, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void Report::printHuman() const
{
    if (passed()) {
        std::cout << fmt::format(
            "Verification complete. No mismatches found in {} rows across {} columns "
            "({} cells checked, {} skipped).\n",
            m_rowCount,
            m_columns.size(),
            m_checkedCount,
            m_skippedCount);
        return;
    }

    std::cout << fmt::format(
        "Found {} mismatches ({} cells checked, {} skipped).\n",
        m_discrepancies.size(),
        m_checkedCount,
        m_skippedCount);
    for (const auto& discrepancy : m_discrepancies) {
        std::cout << formatDiscrepancy(discrepancy) << '\n';
    }
}

//-------------------------------------------------------------------------

bool Report::operator==(const Report& other) const noexcept
{
    return m_discrepancies == other.m_discrepancies
        && m_columns == other.m_columns
        && m_rowCount == other.m_rowCount
        && m_checkedCount == other.m_checkedCount
        && m_skippedCount == other.m_skippedCount;
}

//-------------------------------------------------------------------------

}  // namespace eurocheck::verification

//-------------------------------------------------------------------------
