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

#include "moveprocessor.hpp"

#include "testutils.hpp"

#include "database/dbtest.hpp"

#include <gtest/gtest.h>

#include <json/json.h>

#include <string>

namespace tes
{
namespace
{

class MoveProcessorTests : public DBTestWithSchema
{

protected:

  ContextForTesting ctx;

  PriceQuotesTable quotes;
  MarketPoolTable pools;

  MoveProcessorTests ()
    : quotes(db), pools(db)
  {
    ctx.SetHeight (100);
  }

  /**
   * Processes the given data (which is passed as string and converted to
   * JSON before processing it).
   */
  void
  Process (const std::string& str)
  {
    MoveProcessor mvProc(db, ctx);
    mvProc.ProcessAll (ParseJson (str));
  }

  /**
   * Expects that the latest quote of a currency is the given one.
   */
  void
  ExpectQuote (const std::string& currency, const Amount price,
               const unsigned height)
  {
    Amount actualPrice;
    unsigned actualHeight;
    ASSERT_TRUE (quotes.Get (currency, actualPrice, actualHeight));
    EXPECT_EQ (actualPrice, price);
    EXPECT_EQ (actualHeight, height);
  }

  bool
  HasQuote (const std::string& currency)
  {
    Amount price;
    unsigned height;
    return quotes.Get (currency, price, height);
  }

  Amount
  Liquidity (const std::string& currency)
  {
    MarketPoolData data;
    if (!pools.Get (currency, data))
      return -1;
    return data.liquidity;
  }

};

/* ************************************************************************** */

TEST_F (MoveProcessorTests, InvalidDataFromXaya)
{
  EXPECT_DEATH (Process ("{}"), "isArray");

  EXPECT_DEATH (Process (R"(
    [{"name": "oracle"}]
  )"), "isMember.*move");

  EXPECT_DEATH (Process (R"(
    [{"move": {}}]
  )"), "nameVal.isString");
  EXPECT_DEATH (Process (R"(
    [{"name": 5, "move": {}}]
  )"), "nameVal.isString");
}

TEST_F (MoveProcessorTests, NonObjectMoves)
{
  Process (R"([
    {"name": "oracle", "move": 42},
    {"name": "oracle", "move": [{"px": {"SETT": 10000}}]},
    {"name": "oracle", "move": "px"}
  ])");

  EXPECT_FALSE (HasQuote ("SETT"));
}

/* ************************************************************************** */

using PriceQuoteMoveTests = MoveProcessorTests;

TEST_F (PriceQuoteMoveTests, Valid)
{
  Process (R"([
    {"name": "oracle", "move": {"px": {"SETT": 11000, "JUSD": 990}}}
  ])");

  ExpectQuote ("SETT", 11'000, 100);
  ExpectQuote ("JUSD", 990, 100);
}

TEST_F (PriceQuoteMoveTests, LaterQuoteWins)
{
  Process (R"([
    {"name": "oracle", "move": {"px": {"SETT": 11000}}},
    {"name": "oracle", "move": {"px": {"SETT": 9000}}}
  ])");
  ExpectQuote ("SETT", 9'000, 100);

  ctx.SetHeight (101);
  Process (R"([
    {"name": "oracle", "move": {"px": {"SETT": 10000}}}
  ])");
  ExpectQuote ("SETT", 10'000, 101);
}

TEST_F (PriceQuoteMoveTests, ZeroPriceAccepted)
{
  Process (R"([
    {"name": "oracle", "move": {"px": {"SETT": 0}}}
  ])");
  ExpectQuote ("SETT", 0, 100);
}

TEST_F (PriceQuoteMoveTests, NotAFeeder)
{
  Process (R"([
    {"name": "market", "move": {"px": {"SETT": 11000}}},
    {"name": "domob", "move": {"px": {"SETT": 11000}}}
  ])");
  EXPECT_FALSE (HasQuote ("SETT"));
}

TEST_F (PriceQuoteMoveTests, InvalidParts)
{
  Process (R"([
    {"name": "oracle", "move": {"px": 42}},
    {"name": "oracle", "move": {"px": ["SETT", 10000]}},
    {"name": "oracle", "move": {"px":
      {
        "FOO": 100,
        "SETT": -1,
        "JUSD": 1000
      }}}
  ])");

  EXPECT_FALSE (HasQuote ("SETT"));
  EXPECT_FALSE (HasQuote ("FOO"));
  ExpectQuote ("JUSD", 1'000, 100);

  for (const std::string price : {"1.5", "\"100\"", "true", "null", "{}",
                                  "1e3", "1000000000000000001"})
    {
      Process (R"([
        {"name": "oracle", "move": {"px": {"SETT": )" + price + R"(}}}
      ])");
      EXPECT_FALSE (HasQuote ("SETT")) << price;
    }
}

/* ************************************************************************** */

using LiquidityMoveTests = MoveProcessorTests;

TEST_F (LiquidityMoveTests, OpensMarketAndAdds)
{
  EXPECT_EQ (Liquidity ("SETT"), -1);

  Process (R"([
    {"name": "market", "move": {"lq": {"SETT": 100}}},
    {"name": "market", "move": {"lq": {"SETT": 50, "JUSD": 10}}}
  ])");

  EXPECT_EQ (Liquidity ("SETT"), 150);
  EXPECT_EQ (Liquidity ("JUSD"), 10);
}

TEST_F (LiquidityMoveTests, NotAMarketMaker)
{
  Process (R"([
    {"name": "oracle", "move": {"lq": {"SETT": 100}}}
  ])");
  EXPECT_EQ (Liquidity ("SETT"), -1);
}

TEST_F (LiquidityMoveTests, InvalidAmounts)
{
  Process (R"([
    {"name": "market", "move": {"lq": {"SETT": 0}}},
    {"name": "market", "move": {"lq": {"SETT": -5}}},
    {"name": "market", "move": {"lq": {"SETT": 1.5}}},
    {"name": "market", "move": {"lq": {"FOO": 5}}},
    {"name": "market", "move": {"lq": 5}}
  ])");

  EXPECT_EQ (Liquidity ("SETT"), -1);
  EXPECT_EQ (Liquidity ("FOO"), -1);
}

TEST_F (LiquidityMoveTests, MaximumAmount)
{
  Process (R"([
    {"name": "market", "move": {"lq": {"SETT": 1000000000000000000}}}
  ])");
  EXPECT_EQ (Liquidity ("SETT"), MAX_AMOUNT);

  Process (R"([
    {"name": "market", "move": {"lq": {"SETT": 1}}}
  ])");
  EXPECT_EQ (Liquidity ("SETT"), MAX_AMOUNT);
}

TEST_F (LiquidityMoveTests, CombinedWithQuote)
{
  proto::ConfigData pb = *ctx.Registry ();
  pb.mutable_params ()->add_market_makers ("oracle");
  ctx.SetConfig (pb);

  Process (R"([
    {"name": "oracle", "move": {"px": {"SETT": 9000}, "lq": {"SETT": 20}}}
  ])");

  ExpectQuote ("SETT", 9'000, 100);
  EXPECT_EQ (Liquidity ("SETT"), 20);
}

/* ************************************************************************** */

} // anonymous namespace
} // namespace tes
