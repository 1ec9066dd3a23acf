/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "eurocheck/verification/VerificationManager.hpp"

#include "eurocheck/grid/CsvGridReader.hpp"
#include "eurocheck/verification/DiscrepancyLogger.hpp"
#include "json_util.hpp"

#include <fmt/ranges.h>

#include <fstream>
#include <source_location>
#include <stdexcept>

//-------------------------------------------------------------------------

namespace eurocheck::verification
{

//-------------------------------------------------------------------------

namespace
{

void prepareParentDirectory(const fs::path& path)
{
    if (const auto parent = path.parent_path(); !parent.empty()) {
        fs::create_directories(parent);
    }
}

}  // namespace

//-------------------------------------------------------------------------

VerificationManager::VerificationManager(VerificationConfig config)
    : m_config{std::move(config)},
      m_engine{money::RateConverter{}, m_config.debug}
{}

//-------------------------------------------------------------------------

Report VerificationManager::run() const
{
    const auto source = grid::CsvGridReader{m_config.source.csv}.readFile(m_config.source.path);
    logDebug(
        "SOURCE '{}' | {} ROWS x {} COLUMNS",
        source.name(), source.rowCount(), source.columnCount());
    const auto target = grid::CsvGridReader{m_config.target.csv}.readFile(m_config.target.path);
    logDebug(
        "TARGET '{}' | {} ROWS x {} COLUMNS",
        target.name(), target.rowCount(), target.columnCount());

    ColumnSelection selection = NumericColumns{};
    if (m_config.selection.has_value()) {
        selection = *m_config.selection;
    } else {
        selection = ExplicitColumns{grid::commonColumns(source, target)};
        logDebug(
            "NO COLUMNS GIVEN | USING COMMON COLUMNS [{}]",
            fmt::join(std::get<ExplicitColumns>(selection).ids, ", "));
    }

    auto report = m_engine.verify(source, target, selection);
    writeReports(report);
    return report;
}

//-------------------------------------------------------------------------

std::unique_ptr<VerificationManager> VerificationManager::fromConfig(const fs::path& path)
{
    return std::make_unique<VerificationManager>(VerificationConfig::fromFile(path));
}

//-------------------------------------------------------------------------

void VerificationManager::writeReports(const Report& report) const
{
    if (m_config.csvReport.has_value()) {
        prepareParentDirectory(*m_config.csvReport);
        DiscrepancyLogger{*m_config.csvReport}.log(report);
        logDebug("MISMATCH REPORT WRITTEN TO {}", m_config.csvReport->string());
    }

    if (m_config.jsonReport.has_value()) {
        prepareParentDirectory(*m_config.jsonReport);
        std::ofstream ofs{*m_config.jsonReport};
        if (!ofs) {
            throw std::runtime_error{fmt::format(
                "{}: Unable to open '{}' for writing",
                std::source_location::current().function_name(),
                m_config.jsonReport->string())};
        }
        rapidjson::Document json;
        report.jsonSerialize(json);
        json::dumpJson(json, ofs, {.indent = json::IndentOptions{}});
        logDebug("JSON REPORT WRITTEN TO {}", m_config.jsonReport->string());
    }
}

//-------------------------------------------------------------------------

}  // namespace eurocheck::verification

//-------------------------------------------------------------------------
