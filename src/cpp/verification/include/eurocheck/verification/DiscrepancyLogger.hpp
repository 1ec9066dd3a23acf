/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "eurocheck/verification/Report.hpp"

#include "util.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <string_view>

//-------------------------------------------------------------------------

namespace eurocheck::verification
{

//-------------------------------------------------------------------------

// Writes one CSV line per discrepancy, prefixed by s_header. The file is
// truncated on construction.
class DiscrepancyLogger
{
public:
    explicit DiscrepancyLogger(const fs::path& filepath);

    [[nodiscard]] const fs::path& filepath() const noexcept { return m_filepath; }

    void log(const Report& report);
    void log(const Discrepancy& discrepancy);

    static constexpr std::string_view s_header =
        "Row,Column,Reason,SourceBGN,CalculatedEUR,FileEUR,Diff,Detail";

private:
    std::unique_ptr<spdlog::logger> m_logger;
    fs::path m_filepath;
};

//-------------------------------------------------------------------------

}  // namespace eurocheck::verification

//-------------------------------------------------------------------------
