/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "eurocheck/verification/DiscrepancyLogger.hpp"

#include <fmt/format.h>
#include <magic_enum.hpp>
#include <spdlog/sinks/basic_file_sink.h>

#include <source_location>
#include <stdexcept>

//-------------------------------------------------------------------------

namespace eurocheck::verification
{

//-------------------------------------------------------------------------

namespace
{

std::string orEmpty(const std::optional<money::MonetaryValue>& value)
{
    return value ? value->toString() : std::string{};
}

}  // namespace

//-------------------------------------------------------------------------

DiscrepancyLogger::DiscrepancyLogger(const fs::path& filepath)
    : m_filepath{filepath}
{
    try {
        m_logger = std::make_unique<spdlog::logger>(
            "DiscrepancyLogger",
            std::make_unique<spdlog::sinks::basic_file_sink_st>(m_filepath.string(), true));
    }
    catch (const spdlog::spdlog_ex& e) {
        throw std::runtime_error{fmt::format(
            "{}: cannot open mismatch report '{}': {}",
            std::source_location::current().function_name(),
            m_filepath.string(),
            e.what())};
    }
    m_logger->set_level(spdlog::level::trace);
    m_logger->set_pattern("%v");
    m_logger->trace(s_header);
    m_logger->flush();
}

//-------------------------------------------------------------------------

void DiscrepancyLogger::log(const Report& report)
{
    for (const auto& discrepancy : report.discrepancies()) {
        log(discrepancy);
    }
}

//-------------------------------------------------------------------------

void DiscrepancyLogger::log(const Discrepancy& discrepancy)
{
    const auto row = discrepancy.reason == DiscrepancyReason::ROW_COUNT_MISMATCH
        ? std::string{}
        : fmt::format("{}", sheetRow(discrepancy.row));

    m_logger->trace(fmt::format(
        "{},{},{},{},{},{},{},{}",
        row,
        util::csvEscape(discrepancy.column),
        magic_enum::enum_name(discrepancy.reason),
        orEmpty(discrepancy.source),
        orEmpty(discrepancy.expected),
        orEmpty(discrepancy.actual),
        orEmpty(discrepancy.delta),
        util::csvEscape(discrepancy.detail)));
    m_logger->flush();
}

//-------------------------------------------------------------------------

}  // namespace eurocheck::verification

//-------------------------------------------------------------------------
