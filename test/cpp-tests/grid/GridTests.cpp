/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "eurocheck/grid/Grid.hpp"
#include "formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace eurocheck;
using namespace eurocheck::grid;

using namespace testing;

//-------------------------------------------------------------------------

TEST(GridTest, HeadersAreTrimmed)
{
    const Grid grid{{" Price ", "\tQty", "Total"}, {}};

    EXPECT_THAT(grid.columns(), ElementsAre("Price", "Qty", "Total"));
    EXPECT_THAT(grid.findColumn("Price"), ElementsAre(0));
    EXPECT_THAT(grid.findColumn("  Qty "), ElementsAre(1));
    EXPECT_THAT(grid.findColumn("price"), IsEmpty());
}

//-------------------------------------------------------------------------

TEST(GridTest, FindColumnReportsEveryPosition)
{
    const Grid grid{{"Price", "", "Price", ""}, {}};

    EXPECT_THAT(grid.findColumn("Price"), ElementsAre(0, 2));
    EXPECT_THAT(grid.findColumn(""), IsEmpty());
}

//-------------------------------------------------------------------------

TEST(GridTest, ShortRowsReadAsEmpty)
{
    const Grid grid{
        {"A", "B", "C"},
        {
            {Cell{DEC(1.0)}, Cell{std::string{"x"}}},
            {Cell{DEC(2.0)}, Cell{}, Cell{true}}
        }};

    EXPECT_EQ(grid.rowCount(), 2);
    EXPECT_EQ(grid.columnCount(), 3);
    EXPECT_TRUE(isEmpty(grid.at(0, 2)));
    EXPECT_TRUE(isEmpty(grid.at(1, 1)));
    EXPECT_EQ(grid.at(1, 2), Cell{true});
    EXPECT_THROW((void) grid.at(2, 0), std::out_of_range);
}

//-------------------------------------------------------------------------

TEST(GridTest, WhitespaceTextIsEmpty)
{
    EXPECT_TRUE(isEmpty(Cell{}));
    EXPECT_TRUE(isEmpty(Cell{std::string{"  \t"}}));
    EXPECT_FALSE(isEmpty(Cell{std::string{"-"}}));
    EXPECT_FALSE(isEmpty(Cell{DEC(0.0)}));
    EXPECT_FALSE(isEmpty(Cell{false}));
}

//-------------------------------------------------------------------------

TEST(GridTest, CellToString)
{
    EXPECT_EQ(cellToString(Cell{}), "");
    EXPECT_EQ(cellToString(Cell{true}), "TRUE");
    EXPECT_EQ(cellToString(Cell{std::string{"n/a"}}), "n/a");
}

//-------------------------------------------------------------------------

TEST(GridTest, CommonColumnsFollowSourceOrder)
{
    const Grid source{{"Name", "Price", "", "Total", "Qty"}, {}};
    const Grid target{{"Qty", "Total", "", "Price", "Note"}, {}};

    EXPECT_THAT(commonColumns(source, target), ElementsAre("Price", "Total", "Qty"));
    EXPECT_THAT(commonColumns(source, Grid{}), IsEmpty());
}

//-------------------------------------------------------------------------
