/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "eurocheck/verification/Report.hpp"
#include "eurocheck/verification/VerificationConfig.hpp"
#include "eurocheck/verification/VerificationEngine.hpp"

#include <fmt/format.h>

#include <memory>

//-------------------------------------------------------------------------

namespace eurocheck::verification
{

//-------------------------------------------------------------------------

class VerificationManager
{
public:
    explicit VerificationManager(VerificationConfig config);

    // Loads both grids, verifies them and writes the configured reports.
    [[nodiscard]] Report run() const;

    [[nodiscard]] const VerificationConfig& config() const noexcept { return m_config; }
    [[nodiscard]] const VerificationEngine& engine() const noexcept { return m_engine; }

    static std::unique_ptr<VerificationManager> fromConfig(const fs::path& path);

private:
    void writeReports(const Report& report) const;

    template<typename... Args>
    void logDebug(fmt::format_string<Args...> fmt, Args&&... args) const noexcept
    {
        if (m_config.debug) {
            fmt::println(fmt, std::forward<Args>(args)...);
        }
    }

    VerificationConfig m_config;
    VerificationEngine m_engine;
};

//-------------------------------------------------------------------------

}  // namespace eurocheck::verification

//-------------------------------------------------------------------------
