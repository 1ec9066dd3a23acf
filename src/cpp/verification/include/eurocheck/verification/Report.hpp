/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "JsonSerializable.hpp"
#include "eurocheck/verification/Discrepancy.hpp"

#include <cstddef>
#include <vector>

//-------------------------------------------------------------------------

namespace eurocheck::verification
{

//-------------------------------------------------------------------------

struct ReportDesc
{
    std::vector<Discrepancy> discrepancies;
    std::vector<grid::ColumnId> columns;
    size_t rowCount{};
    size_t checkedCount{};
    size_t skippedCount{};
};

//-------------------------------------------------------------------------

class Report : public JsonSerializable
{
public:
    Report() noexcept = default;
    explicit Report(ReportDesc desc) noexcept;

    [[nodiscard]] bool passed() const noexcept { return m_discrepancies.empty(); }
    [[nodiscard]] const std::vector<Discrepancy>& discrepancies() const noexcept
    {
        return m_discrepancies;
    }
    [[nodiscard]] const std::vector<grid::ColumnId>& columns() const noexcept { return m_columns; }
    [[nodiscard]] size_t rowCount() const noexcept { return m_rowCount; }
    [[nodiscard]] size_t checkedCount() const noexcept { return m_checkedCount; }
    [[nodiscard]] size_t skippedCount() const noexcept { return m_skippedCount; }

    [[nodiscard]] size_t countOf(DiscrepancyReason reason) const noexcept;

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;
    // Summary for a terminal: one line on success, otherwise one line per discrepancy.
    void printHuman() const;

    [[nodiscard]] bool operator==(const Report& other) const noexcept;

private:
    std::vector<Discrepancy> m_discrepancies;
    std::vector<grid::ColumnId> m_columns;
    size_t m_rowCount{};
    size_t m_checkedCount{};
    size_t m_skippedCount{};
};

//-------------------------------------------------------------------------

}  // namespace eurocheck::verification

//-------------------------------------------------------------------------
