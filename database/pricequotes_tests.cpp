/*
    GSP for the SERP-TES elastic supply protocol
    Copyright (C) 2026  Autonomous Worlds Ltd

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.
*/

#include "pricequotes.hpp"

#include "dbtest.hpp"

#include <gtest/gtest.h>

namespace tes
{
namespace
{

class PriceQuotesTableTests : public DBTestWithSchema
{

protected:

  PriceQuotesTable tbl;

  PriceQuotesTableTests ()
    : tbl(db)
  {}

};

TEST_F (PriceQuotesTableTests, Missing)
{
  Amount price;
  unsigned height;
  EXPECT_FALSE (tbl.Get ("SETT", price, height));
}

TEST_F (PriceQuotesTableTests, LatestQuoteWins)
{
  tbl.Set ("SETT", 10'100, 5);
  tbl.Set ("JUSD", 990, 6);
  tbl.Set ("SETT", 9'900, 7);

  Amount price;
  unsigned height;

  ASSERT_TRUE (tbl.Get ("SETT", price, height));
  EXPECT_EQ (price, 9'900);
  EXPECT_EQ (height, 7);

  ASSERT_TRUE (tbl.Get ("JUSD", price, height));
  EXPECT_EQ (price, 990);
  EXPECT_EQ (height, 6);
}

TEST_F (PriceQuotesTableTests, ZeroPriceIsStored)
{
  tbl.Set ("SETT", 0, 10);

  Amount price;
  unsigned height;
  ASSERT_TRUE (tbl.Get ("SETT", price, height));
  EXPECT_EQ (price, 0);
}

} // anonymous namespace
} // namespace tes
