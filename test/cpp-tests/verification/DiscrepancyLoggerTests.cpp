/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "eurocheck/verification/DiscrepancyLogger.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <fstream>

//-------------------------------------------------------------------------

using namespace eurocheck;
using namespace eurocheck::verification;

using namespace testing;

//-------------------------------------------------------------------------

namespace
{

std::vector<std::string> readLines(const fs::path& path)
{
    std::ifstream ifs{path};
    std::vector<std::string> lines;
    for (std::string line; std::getline(ifs, line);) {
        lines.push_back(line);
    }
    return lines;
}

}  // namespace

//-------------------------------------------------------------------------

class DiscrepancyLoggerTest : public Test
{
protected:
    void SetUp() override
    {
        filepath = fs::temp_directory_path()
            / fmt::format("eurocheck-{}.csv", UnitTest::GetInstance()->current_test_info()->name());
        fs::remove(filepath);
    }

    void TearDown() override { fs::remove(filepath); }

    fs::path filepath;
};

//-------------------------------------------------------------------------

TEST_F(DiscrepancyLoggerTest, WritesHeaderOnly)
{
    {
        DiscrepancyLogger logger{filepath};
        EXPECT_EQ(logger.filepath(), filepath);
        logger.log(Report{});
    }

    EXPECT_THAT(readLines(filepath), ElementsAre(std::string{DiscrepancyLogger::s_header}));
}

//-------------------------------------------------------------------------

TEST_F(DiscrepancyLoggerTest, WritesOneLinePerDiscrepancy)
{
    const Report report{ReportDesc{
        .discrepancies = {
            Discrepancy{
                .row = 8,
                .reason = DiscrepancyReason::ROW_COUNT_MISMATCH,
                .detail = "source has 10 rows, target has 8 rows; only the first 8 rows were compared"
            },
            Discrepancy{
                .row = 0,
                .column = "Total, net",
                .reason = DiscrepancyReason::VALUE_MISMATCH,
                .source = money::MonetaryValue{DEC(100.0)},
                .expected = money::MonetaryValue{DEC(51.13)},
                .actual = money::MonetaryValue{DEC(51.12)},
                .delta = money::MonetaryValue{DEC(-0.01)}
            },
            Discrepancy{
                .row = 4,
                .column = "Price",
                .reason = DiscrepancyReason::TARGET_EMPTY,
                .source = money::MonetaryValue{DEC(1.0)},
                .expected = money::MonetaryValue{DEC(0.51)}
            }
        },
        .columns = {"Total, net", "Price"},
        .rowCount = 8}};

    {
        DiscrepancyLogger logger{filepath};
        logger.log(report);
    }

    EXPECT_THAT(
        readLines(filepath),
        ElementsAre(
            std::string{DiscrepancyLogger::s_header},
            ",,ROW_COUNT_MISMATCH,,,,,"
            "\"source has 10 rows, target has 8 rows; only the first 8 rows were compared\"",
            "2,\"Total, net\",VALUE_MISMATCH,100.00,51.13,51.12,-0.01,",
            "6,Price,TARGET_EMPTY,1.00,0.51,,,"));
}

//-------------------------------------------------------------------------

TEST_F(DiscrepancyLoggerTest, TruncatesExistingFile)
{
    {
        std::ofstream ofs{filepath};
        ofs << "stale\nlines\n";
    }

    {
        DiscrepancyLogger logger{filepath};
    }

    EXPECT_THAT(readLines(filepath), ElementsAre(std::string{DiscrepancyLogger::s_header}));
}

//-------------------------------------------------------------------------

TEST_F(DiscrepancyLoggerTest, UnwritablePathThrowsRuntimeError)
{
    fs::create_directories(filepath);

    EXPECT_THROW(DiscrepancyLogger{filepath}, std::runtime_error);

    fs::remove_all(filepath);
}

//-------------------------------------------------------------------------
