/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "eurocheck/verification/VerificationConfig.hpp"

#include "VerificationException.hpp"

#include <boost/algorithm/string/trim.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <magic_enum.hpp>

#include <source_location>

//-------------------------------------------------------------------------

namespace eurocheck::verification
{

//-------------------------------------------------------------------------

namespace
{

GridSource parseGridSource(pugi::xml_node node, const char* name, const fs::path& baseDir)
{
    static constexpr auto sl = std::source_location::current();

    pugi::xml_node child = node.child(name);
    if (!child) {
        throw ConfigurationError{fmt::format(
            "{}: Missing element '{}' under '{}'", sl.function_name(), name, node.name())};
    }
    const std::string path = boost::algorithm::trim_copy(
        std::string{child.attribute("path").as_string()});
    if (path.empty()) {
        throw ConfigurationError{fmt::format(
            "{}: Element '{}' requires a non-empty 'path' attribute", sl.function_name(), name)};
    }
    return {
        .path = util::resolvePath(fs::path{path}, baseDir),
        .csv = {.delimiter = parseDelimiter(child.attribute("delimiter").as_string(","))}
    };
}

}  // namespace

//-------------------------------------------------------------------------

char parseDelimiter(std::string_view value)
{
    if (value == "tab" || value == "\\t" || value == "\t") {
        return '\t';
    }
    if (value.size() != 1 || value.front() == '"' || value.front() == '\n' || value.front() == '\r') {
        throw ConfigurationError{fmt::format(
            "{}: Invalid delimiter '{}', expected a single character other than a quote or line break",
            std::source_location::current().function_name(),
            value)};
    }
    return value.front();
}

//-------------------------------------------------------------------------

ColumnSelection parseColumnSelection(pugi::xml_node node)
{
    static constexpr auto sl = std::source_location::current();

    if (!node) {
        return NumericColumns{};
    }

    const auto mode = [&] {
        pugi::xml_attribute attr = node.attribute("mode");
        if (!attr) {
            return node.child("Column") ? ColumnMode::EXPLICIT : ColumnMode::NUMERIC;
        }
        const auto parsed = magic_enum::enum_cast<ColumnMode>(
            attr.as_string(), magic_enum::case_insensitive);
        if (!parsed.has_value()) {
            throw ConfigurationError{fmt::format(
                "{}: Unknown column mode '{}', expected one of {}",
                sl.function_name(),
                attr.as_string(),
                fmt::join(magic_enum::enum_names<ColumnMode>(), ", "))};
        }
        return *parsed;
    }();

    if (mode == ColumnMode::NUMERIC) {
        if (node.child("Column")) {
            throw ConfigurationError{fmt::format(
                "{}: 'Column' elements are not allowed in numeric mode", sl.function_name())};
        }
        return NumericColumns{};
    }

    ExplicitColumns selection;
    for (pugi::xml_node column : node.children("Column")) {
        auto name = boost::algorithm::trim_copy(std::string{column.attribute("name").as_string()});
        if (name.empty()) {
            throw ConfigurationError{fmt::format(
                "{}: 'Column' requires a non-empty 'name' attribute", sl.function_name())};
        }
        selection.ids.push_back(std::move(name));
    }
    return selection;
}

//-------------------------------------------------------------------------

VerificationConfig VerificationConfig::fromXML(pugi::xml_node node, const fs::path& baseDir)
{
    VerificationConfig config{
        .source = parseGridSource(node, "Source", baseDir),
        .target = parseGridSource(node, "Target", baseDir),
        .selection = parseColumnSelection(node.child("Columns")),
        .debug = node.attribute("debug").as_bool()
    };

    if (pugi::xml_node output = node.child("Output")) {
        const std::string_view dirAttr = output.attribute("dir").as_string();
        const auto dir = dirAttr.empty() ? baseDir : util::resolvePath(fs::path{dirAttr}, baseDir);
        auto outputPath = [&](const char* attrName) -> std::optional<fs::path> {
            const std::string_view file = output.attribute(attrName).as_string();
            if (file.empty()) return std::nullopt;
            return util::resolvePath(fs::path{file}, dir);
        };
        config.csvReport = outputPath("csv");
        config.jsonReport = outputPath("json");
    }

    return config;
}

//-------------------------------------------------------------------------

VerificationConfig VerificationConfig::fromFile(const fs::path& path)
{
    static constexpr auto sl = std::source_location::current();

    pugi::xml_document doc;
    const pugi::xml_parse_result result = doc.load_file(path.c_str());
    if (!result) {
        throw ConfigurationError{fmt::format(
            "{}: Error parsing '{}': {}", sl.function_name(), path.string(), result.description())};
    }
    pugi::xml_node node = doc.child("Verification");
    if (!node) {
        throw ConfigurationError{fmt::format(
            "{}: '{}' has no 'Verification' root element", sl.function_name(), path.string())};
    }
    return fromXML(node, path.parent_path());
}

//-------------------------------------------------------------------------

}  // namespace eurocheck::verification

//-------------------------------------------------------------------------
