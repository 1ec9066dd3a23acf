/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "eurocheck/verification/Report.hpp"
#include "formatting.hpp"
#include "util.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace eurocheck;
using namespace eurocheck::verification;

using namespace testing;

//-------------------------------------------------------------------------

namespace
{

money::MonetaryValue amount(decimal_t value)
{
    return money::MonetaryValue{value};
}

Report makeFailingReport()
{
    return Report{ReportDesc{
        .discrepancies = {
            Discrepancy{
                .row = 2,
                .reason = DiscrepancyReason::ROW_COUNT_MISMATCH,
                .detail = "source has 3 rows, target has 2 rows; only the first 2 rows were compared"
            },
            Discrepancy{
                .row = 0,
                .column = "Price",
                .reason = DiscrepancyReason::VALUE_MISMATCH,
                .source = amount(DEC(100.00)),
                .expected = amount(DEC(51.13)),
                .actual = amount(DEC(51.12)),
                .delta = amount(DEC(-0.01))
            },
            Discrepancy{
                .row = 1,
                .column = "Price",
                .reason = DiscrepancyReason::NON_NUMERIC,
                .source = amount(DEC(1.0)),
                .expected = amount(DEC(0.51)),
                .detail = "target cell holds 'n/a'"
            }
        },
        .columns = {"Price"},
        .rowCount = 2,
        .checkedCount = 1,
        .skippedCount = 0}};
}

}  // namespace

//-------------------------------------------------------------------------

TEST(ReportTest, EmptyReportPasses)
{
    const Report report{ReportDesc{.columns = {"Price", "Total"}, .rowCount = 4, .checkedCount = 8}};

    EXPECT_TRUE(report.passed());
    EXPECT_EQ(report.countOf(DiscrepancyReason::VALUE_MISMATCH), 0);
}

//-------------------------------------------------------------------------

TEST(ReportTest, CountOf)
{
    const auto report = makeFailingReport();

    EXPECT_FALSE(report.passed());
    EXPECT_EQ(report.countOf(DiscrepancyReason::ROW_COUNT_MISMATCH), 1);
    EXPECT_EQ(report.countOf(DiscrepancyReason::VALUE_MISMATCH), 1);
    EXPECT_EQ(report.countOf(DiscrepancyReason::NON_NUMERIC), 1);
    EXPECT_EQ(report.countOf(DiscrepancyReason::TARGET_EMPTY), 0);
}

//-------------------------------------------------------------------------

TEST(ReportTest, JsonSerialize)
{
    const auto json = json::str2json(json::jsonSerializable2str(makeFailingReport()));

    EXPECT_FALSE(json["passed"].GetBool());
    EXPECT_EQ(json["rows"].GetUint64(), 2);
    EXPECT_EQ(json["checked"].GetUint64(), 1);
    EXPECT_EQ(json["skipped"].GetUint64(), 0);
    ASSERT_EQ(json["columns"].Size(), 1);
    EXPECT_STREQ(json["columns"][0].GetString(), "Price");

    const auto& discrepancies = json["discrepancies"];
    ASSERT_EQ(discrepancies.Size(), 3);

    EXPECT_STREQ(discrepancies[0]["reason"].GetString(), "ROW_COUNT_MISMATCH");
    EXPECT_TRUE(discrepancies[0]["source"].IsNull());

    const auto& mismatch = discrepancies[1];
    EXPECT_EQ(mismatch["row"].GetUint64(), 0);
    EXPECT_EQ(mismatch["sheetRow"].GetUint64(), 2);
    EXPECT_STREQ(mismatch["column"].GetString(), "Price");
    EXPECT_STREQ(mismatch["reason"].GetString(), "VALUE_MISMATCH");
    EXPECT_STREQ(mismatch["source"].GetString(), "100.00");
    EXPECT_STREQ(mismatch["expected"].GetString(), "51.13");
    EXPECT_STREQ(mismatch["actual"].GetString(), "51.12");
    EXPECT_STREQ(mismatch["delta"].GetString(), "-0.01");

    EXPECT_TRUE(discrepancies[2]["actual"].IsNull());
    EXPECT_STREQ(discrepancies[2]["detail"].GetString(), "target cell holds 'n/a'");
}

//-------------------------------------------------------------------------

TEST(ReportTest, JsonSerializeUnderKey)
{
    rapidjson::Document json{rapidjson::kObjectType};
    makeFailingReport().jsonSerialize(json, "report");

    ASSERT_TRUE(json.HasMember("report"));
    EXPECT_FALSE(json["report"]["passed"].GetBool());
}

//-------------------------------------------------------------------------

TEST(ReportTest, PrintHumanSuccess)
{
    const Report report{ReportDesc{
        .columns = {"Price", "Total"}, .rowCount = 4, .checkedCount = 7, .skippedCount = 1}};

    EXPECT_THAT(
        util::captureOutput([&] { report.printHuman(); }),
        StrEq(
            "Verification complete. No mismatches found in 4 rows across 2 columns "
            "(7 cells checked, 1 skipped).\n"));
}

//-------------------------------------------------------------------------

TEST(ReportTest, PrintHumanFailure)
{
    const auto report = makeFailingReport();

    EXPECT_THAT(
        util::captureOutput([&] { report.printHuman(); }),
        StrEq(
            "Found 3 mismatches (1 cells checked, 0 skipped).\n"
            "  row-count mismatch: source has 3 rows, target has 2 rows; "
            "only the first 2 rows were compared\n"
            "  row 2 | Price | value mismatch: BGN 100.00 -> expected EUR 51.13, "
            "file EUR 51.12, diff -0.01\n"
            "  row 3 | Price | non-numeric data: BGN 1.00 -> expected EUR 0.51, "
            "file EUR -, diff - (target cell holds 'n/a')\n"));
}

//-------------------------------------------------------------------------

TEST(ReportTest, Describe)
{
    EXPECT_EQ(describe(DiscrepancyReason::VALUE_MISMATCH), "value mismatch");
    EXPECT_EQ(describe(DiscrepancyReason::TARGET_EMPTY), "target empty");
    EXPECT_EQ(describe(DiscrepancyReason::NON_NUMERIC), "non-numeric data");
    EXPECT_EQ(describe(DiscrepancyReason::ROW_COUNT_MISMATCH), "row-count mismatch");
    EXPECT_EQ(sheetRow(0), 2);
}

//-------------------------------------------------------------------------
