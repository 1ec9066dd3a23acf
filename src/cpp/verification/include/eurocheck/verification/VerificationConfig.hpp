/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "eurocheck/grid/CsvGridReader.hpp"
#include "eurocheck/verification/ColumnSelection.hpp"

#include "util.hpp"

#include <pugixml.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

//-------------------------------------------------------------------------

namespace eurocheck::verification
{

//-------------------------------------------------------------------------

enum class ColumnMode : uint32_t
{
    EXPLICIT,
    NUMERIC
};

//-------------------------------------------------------------------------

struct GridSource
{
    fs::path path;
    grid::CsvOptions csv;
};

//-------------------------------------------------------------------------

struct VerificationConfig
{
    GridSource source;
    GridSource target;
    // Unset means the columns common to both headers.
    std::optional<ColumnSelection> selection;
    std::optional<fs::path> csvReport;
    std::optional<fs::path> jsonReport;
    bool debug{};

    [[nodiscard]] static VerificationConfig fromXML(
        pugi::xml_node node, const fs::path& baseDir = {});
    [[nodiscard]] static VerificationConfig fromFile(const fs::path& path);
};

//-------------------------------------------------------------------------

// "," ";" "|" or any other single character; "tab" and "\t" select a tab.
[[nodiscard]] char parseDelimiter(std::string_view value);

[[nodiscard]] ColumnSelection parseColumnSelection(pugi::xml_node node);

//-------------------------------------------------------------------------

}  // namespace eurocheck::verification

//-------------------------------------------------------------------------
