/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "eurocheck/grid/Grid.hpp"
#include "eurocheck/money/RateConverter.hpp"
#include "eurocheck/verification/CellPairLocator.hpp"
#include "eurocheck/verification/ColumnSelection.hpp"
#include "eurocheck/verification/Report.hpp"

#include <fmt/format.h>

#include <optional>

//-------------------------------------------------------------------------

namespace eurocheck::verification
{

//-------------------------------------------------------------------------

class VerificationEngine
{
public:
    explicit VerificationEngine(
        money::RateConverter converter = money::RateConverter{}, bool debug = false) noexcept;

    [[nodiscard]] const money::RateConverter& converter() const noexcept { return m_converter; }

    // Throws ConfigurationError when the selection does not resolve in both grids.
    // Data problems never throw; they end up in the report.
    [[nodiscard]] Report verify(
        const grid::Grid& source,
        const grid::Grid& target,
        const ColumnSelection& selection) const;

private:
    struct Tally
    {
        size_t checked{};
        size_t skipped{};
    };

    [[nodiscard]] std::optional<Discrepancy> checkPair(const CellPair& pair, Tally& tally) const;

    template<typename... Args>
    void logDebug(fmt::format_string<Args...> fmt, Args&&... args) const noexcept
    {
        if (m_debug) {
            fmt::println(fmt, std::forward<Args>(args)...);
        }
    }

    money::RateConverter m_converter;
    bool m_debug;
};

//-------------------------------------------------------------------------

}  // namespace eurocheck::verification

//-------------------------------------------------------------------------
