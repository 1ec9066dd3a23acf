/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "eurocheck/verification/VerificationManager.hpp"
#include "VerificationException.hpp"

#include <CLI/CLI.hpp>
#include <fmt/format.h>

#include <cstdio>
#include <string>
#include <vector>

//-------------------------------------------------------------------------

namespace
{

constexpr int kExitPassed = 0;
constexpr int kExitDiscrepancies = 1;
constexpr int kExitError = 2;

}  // namespace

//-------------------------------------------------------------------------

int main(int argc, char* argv[])
{
    using namespace eurocheck;

    CLI::App app{"eurocheck: BGN -> EUR report conversion verifier (1 EUR = 1.95583 BGN)"};

    fs::path configFile;
    app.add_option("-f,--config-file", configFile, "Verification config file")
        ->check(CLI::ExistingFile);

    CLI::Option_group* inputGroup = app.add_option_group("Input");

    fs::path source;
    inputGroup->add_option("--source", source, "Report with amounts in BGN")
        ->check(CLI::ExistingFile);

    fs::path target;
    inputGroup->add_option("--target", target, "Converted report with amounts in EUR")
        ->check(CLI::ExistingFile);

    std::string delimiter;
    inputGroup->add_option("--delimiter", delimiter, "Field delimiter of both files");

    CLI::Option_group* columnGroup = app.add_option_group("Columns");

    std::vector<std::string> columns;
    auto optColumns = columnGroup->add_option(
        "--column",
        columns,
        "Column to verify; repeatable or comma-separated")
        ->delimiter(',');

    bool allColumns{};
    columnGroup->add_flag(
        "--all-columns", allColumns, "Verify every source column holding numbers")
        ->excludes(optColumns);

    CLI::Option_group* outputGroup = app.add_option_group("Output");

    fs::path csvReport;
    outputGroup->add_option("--csv-report", csvReport, "Write the mismatch report as CSV");

    fs::path jsonReport;
    outputGroup->add_option("--json-report", jsonReport, "Write the full report as JSON");

    bool debug{};
    app.add_flag("--debug", debug, "Trace every step of the verification");

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError& e) {
        return app.exit(e) == 0 ? kExitPassed : kExitError;
    }

    fmt::println("{}", app.get_description());

    try {
        auto config = configFile.empty()
            ? verification::VerificationConfig{}
            : verification::VerificationConfig::fromFile(configFile);

        if (!source.empty()) config.source.path = source;
        if (!target.empty()) config.target.path = target;
        if (!delimiter.empty()) {
            const char d = verification::parseDelimiter(delimiter);
            config.source.csv.delimiter = d;
            config.target.csv.delimiter = d;
        }
        if (!columns.empty()) {
            config.selection = verification::ExplicitColumns{columns};
        } else if (allColumns) {
            config.selection = verification::NumericColumns{};
        }
        if (!csvReport.empty()) config.csvReport = csvReport;
        if (!jsonReport.empty()) config.jsonReport = jsonReport;
        config.debug = config.debug || debug;

        if (config.source.path.empty() || config.target.path.empty()) {
            throw ConfigurationError{
                "Both --source and --target are required unless --config-file provides them"};
        }

        const auto report = verification::VerificationManager{std::move(config)}.run();
        report.printHuman();
        return report.passed() ? kExitPassed : kExitDiscrepancies;
    }
    catch (const std::invalid_argument& e) {
        fmt::println(stderr, "error: {}", e.what());
    }
    catch (const std::runtime_error& e) {
        fmt::println(stderr, "error: {}", e.what());
    }

    return kExitError;
}

//-------------------------------------------------------------------------
