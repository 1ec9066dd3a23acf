/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "eurocheck/grid/CsvGridReader.hpp"

#include <boost/algorithm/string.hpp>
#include <fmt/format.h>
#include <range/v3/all.hpp>

#include <fstream>
#include <iterator>
#include <source_location>
#include <stdexcept>
#include <utility>

//-------------------------------------------------------------------------

namespace eurocheck::grid
{

//-------------------------------------------------------------------------

namespace
{

constexpr std::string_view kUtf8Bom{"\xEF\xBB\xBF"};

bool isBlankRecord(const std::vector<std::string>& record)
{
    return ranges::all_of(record, [](const std::string& field) {
        return boost::algorithm::trim_copy(field).empty();
    });
}

}  // namespace

//-------------------------------------------------------------------------

Grid CsvGridReader::read(std::istream& is, std::string name) const
{
    auto records = parseRecords(is);

    while (!records.empty() && isBlankRecord(records.back())) {
        records.pop_back();
    }
    if (records.empty()) {
        return Grid{{}, {}, std::move(name)};
    }

    std::vector<ColumnId> columns = std::move(records.front());

    std::vector<Grid::Row> rows;
    rows.reserve(records.size() - 1);
    for (const auto& record : records | ranges::views::drop(1)) {
        rows.push_back(record | ranges::views::transform(&CsvGridReader::parseCell)
            | ranges::to<std::vector>());
    }

    return Grid{std::move(columns), std::move(rows), std::move(name)};
}

//-------------------------------------------------------------------------

Grid CsvGridReader::readFile(const std::filesystem::path& path) const
{
    const auto ctx = std::source_location::current().function_name();
    if (!std::filesystem::exists(path)) {
        throw std::invalid_argument{fmt::format("{}: No such file '{}'", ctx, path.c_str())};
    }
    std::ifstream ifs{path, std::ios::binary};
    if (!ifs) {
        throw std::runtime_error{fmt::format("{}: Unable to open '{}'", ctx, path.c_str())};
    }
    return read(ifs, path.filename().string());
}

//-------------------------------------------------------------------------

std::vector<std::vector<std::string>> CsvGridReader::parseRecords(std::istream& is) const
{
    const auto ctx = std::source_location::current().function_name();

    std::string content{std::istreambuf_iterator<char>{is}, std::istreambuf_iterator<char>{}};
    if (content.starts_with(kUtf8Bom)) {
        content.erase(0, kUtf8Bom.size());
    }

    std::vector<std::vector<std::string>> records;
    std::vector<std::string> record;
    std::string field;
    bool inQuotes = false;
    size_t line = 1;
    size_t quoteOpenedAt = 0;

    auto endField = [&] { record.push_back(std::exchange(field, {})); };
    auto endRecord = [&] {
        endField();
        records.push_back(std::exchange(record, {}));
    };

    for (size_t i = 0; i < content.size(); ++i) {
        const char c = content[i];
        if (inQuotes) {
            if (c == m_options.quote) {
                if (i + 1 < content.size() && content[i + 1] == m_options.quote) {
                    field.push_back(c);
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                if (c == '\n') ++line;
                field.push_back(c);
            }
            continue;
        }
        if (c == m_options.quote) {
            inQuotes = true;
            quoteOpenedAt = line;
        } else if (c == m_options.delimiter) {
            endField();
        } else if (c == '\r') {
            if (i + 1 < content.size() && content[i + 1] == '\n') ++i;
            endRecord();
            ++line;
        } else if (c == '\n') {
            endRecord();
            ++line;
        } else {
            field.push_back(c);
        }
    }

    if (inQuotes) {
        throw std::invalid_argument{fmt::format(
            "{}: Unterminated quoted field opened on line {}", ctx, quoteOpenedAt)};
    }
    if (!field.empty() || !record.empty()) {
        endRecord();
    }

    return records;
}

//-------------------------------------------------------------------------

Cell CsvGridReader::parseCell(std::string_view field)
{
    const std::string trimmed = boost::algorithm::trim_copy(std::string{field});
    if (trimmed.empty()) {
        return std::monostate{};
    }
    if (boost::algorithm::iequals(trimmed, "TRUE")) {
        return true;
    }
    if (boost::algorithm::iequals(trimmed, "FALSE")) {
        return false;
    }
    if (const auto number = util::parseDecimal(trimmed)) {
        return *number;
    }
    return std::string{field};
}

//-------------------------------------------------------------------------

}  // namespace eurocheck::grid

//-------------------------------------------------------------------------
