/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "eurocheck/grid/Grid.hpp"

#include <filesystem>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

//-------------------------------------------------------------------------

namespace eurocheck::grid
{

//-------------------------------------------------------------------------

struct CsvOptions
{
    char delimiter = ',';
    char quote = '"';
};

//-------------------------------------------------------------------------

// Reads a delimited export of one sheet. The first record is the header row;
// every following record is a data row.
class CsvGridReader
{
public:
    explicit CsvGridReader(CsvOptions options = {}) noexcept : m_options{options} {}

    [[nodiscard]] Grid read(std::istream& is, std::string name = {}) const;
    [[nodiscard]] Grid readFile(const std::filesystem::path& path) const;

    [[nodiscard]] std::vector<std::vector<std::string>> parseRecords(std::istream& is) const;

    // Empty -> empty, TRUE/FALSE -> boolean, plain decimal literal -> number,
    // anything else stays text.
    [[nodiscard]] static Cell parseCell(std::string_view field);

private:
    CsvOptions m_options;
};

//-------------------------------------------------------------------------

}  // namespace eurocheck::grid

//-------------------------------------------------------------------------
