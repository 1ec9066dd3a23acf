/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "eurocheck/money/MonetaryValue.hpp"
#include "formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace eurocheck;
using namespace eurocheck::money;

using namespace testing;

//-------------------------------------------------------------------------

TEST(MonetaryValueTest, ToStringKeepsAtLeastCents)
{
    EXPECT_EQ(MonetaryValue{DEC(10.01)}.toString(), "10.01");
    EXPECT_EQ(MonetaryValue{DEC(100000.0)}.toString(), "100000.00");
    EXPECT_EQ(MonetaryValue{DEC(-0.5)}.toString(), "-0.50");
    EXPECT_EQ(MonetaryValue{}.toString(), "0.00");
    EXPECT_EQ(MonetaryValue{DEC(19.56807915)}.toString(), "19.56807915");
    EXPECT_EQ(fmt::format("{}", MonetaryValue{DEC(51.13)}), "51.13");
}

//-------------------------------------------------------------------------

TEST(MonetaryValueTest, ToStringKeepsEveryDigit)
{
    EXPECT_EQ(MonetaryValue{DEC(1e-20)}.toString(), "0.00000000000000000001");
    EXPECT_EQ(MonetaryValue{DEC(1e70)}.toString(), fmt::format("1{}.00", std::string(70, '0')));
    EXPECT_EQ(MonetaryValue{DEC(1.500)}.toString(), "1.50");
}

//-------------------------------------------------------------------------

TEST(MonetaryValueTest, Arithmetic)
{
    const MonetaryValue a{DEC(10.02)};
    const MonetaryValue b{DEC(10.01)};

    EXPECT_EQ(a - b, MonetaryValue{DEC(0.01)});
    EXPECT_TRUE((b - a).isNegative());
    EXPECT_EQ(MonetaryValue{DEC(1.0)}, MonetaryValue{DEC(1.00)});
}

//-------------------------------------------------------------------------

TEST(MonetaryValueTest, CleanNumericText)
{
    EXPECT_EQ(cleanNumericText("1 234,50"), "1234.50");
    EXPECT_EQ(cleanNumericText("1\xC2\xA0" "234,50"), "1234.50");
    EXPECT_EQ(cleanNumericText("\t-12.5 "), "-12.5");
    EXPECT_EQ(cleanNumericText("abc"), "abc");
}

//-------------------------------------------------------------------------

struct ToMonetaryTestParams
{
    grid::Cell cell;
    ExpectedMonetaryValue refValue;
};

void PrintTo(const ToMonetaryTestParams& params, std::ostream* os)
{
    *os << fmt::format(
        "{{.cell = '{}', .refValue = {}}}",
        grid::cellToString(params.cell),
        params.refValue.has_value()
            ? params.refValue->toString()
            : std::string{magic_enum::enum_name(params.refValue.error())});
}

struct ToMonetaryTest : TestWithParam<ToMonetaryTestParams> {};

TEST_P(ToMonetaryTest, WorksCorrectly)
{
    const auto& [cell, refValue] = GetParam();
    EXPECT_EQ(toMonetary(cell), refValue);
}

INSTANTIATE_TEST_SUITE_P(
    MonetaryValueTests,
    ToMonetaryTest,
    Values(
        ToMonetaryTestParams{
            .cell = grid::Cell{DEC(195583.0)},
            .refValue = MonetaryValue{DEC(195583.0)}
        },
        ToMonetaryTestParams{
            .cell = grid::Cell{std::string{"1 234,50"}},
            .refValue = MonetaryValue{DEC(1234.50)}
        },
        ToMonetaryTestParams{
            .cell = grid::Cell{std::string{"-0,01"}},
            .refValue = MonetaryValue{DEC(-0.01)}
        },
        ToMonetaryTestParams{
            .cell = grid::Cell{},
            .refValue = std::unexpected{ConversionError::NON_NUMERIC}
        },
        ToMonetaryTestParams{
            .cell = grid::Cell{true},
            .refValue = std::unexpected{ConversionError::NON_NUMERIC}
        },
        ToMonetaryTestParams{
            .cell = grid::Cell{std::string{"n/a"}},
            .refValue = std::unexpected{ConversionError::NON_NUMERIC}
        },
        ToMonetaryTestParams{
            .cell = grid::Cell{std::string{"1.234,50"}},
            .refValue = std::unexpected{ConversionError::NON_NUMERIC}
        },
        ToMonetaryTestParams{
            .cell = grid::Cell{std::string{"12345678901234567"}},
            .refValue = std::unexpected{ConversionError::PRECISION_EXCEEDED}
        },
        ToMonetaryTestParams{
            .cell = grid::Cell{std::string{"99999999999999.99"}},
            .refValue = MonetaryValue{DEC(99999999999999.99)}
        },
        ToMonetaryTestParams{
            .cell = grid::Cell{std::string{"100000000000000"}},
            .refValue = std::unexpected{ConversionError::PRECISION_EXCEEDED}
        },
        ToMonetaryTestParams{
            .cell = grid::Cell{DEC(1e33)},
            .refValue = std::unexpected{ConversionError::PRECISION_EXCEEDED}
        },
        ToMonetaryTestParams{
            .cell = grid::Cell{std::string{"1e40"}},
            .refValue = std::unexpected{ConversionError::PRECISION_EXCEEDED}
        },
        ToMonetaryTestParams{
            .cell = grid::Cell{std::string{"-1e300"}},
            .refValue = std::unexpected{ConversionError::PRECISION_EXCEEDED}
        }
    ));

//-------------------------------------------------------------------------
