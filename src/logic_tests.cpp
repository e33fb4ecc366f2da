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

#include "logic.hpp"

#include "testutils.hpp"

#include "database/currencystate.hpp"
#include "database/dbtest.hpp"
#include "database/elasticitylog.hpp"
#include "database/marketpool.hpp"
#include "database/supply.hpp"

#include <gtest/gtest.h>

#include <json/json.h>

#include <string>

namespace tes
{

/* ************************************************************************** */

/**
 * Test fixture for testing TesLogic::UpdateState.  It sets up a test database
 * independent from SQLiteGame, so that we can more easily test custom
 * situations as needed.
 */
class TesLogicTests : public DBTestWithSchema
{

protected:

  ContextForTesting ctx;

  SupplyTable supply;
  MarketPoolTable pools;
  CurrencyStateTable states;

  TesLogicTests ()
    : supply(db), pools(db), states(db)
  {
    TesLogic::InitialiseState (db, ctx.Registry ());
  }

  /**
   * Builds a blockData JSON value from the given moves (JSON serialised
   * to a string).
   */
  Json::Value
  BuildBlockData (const std::string& movesStr)
  {
    Json::Value blockData(Json::objectValue);
    blockData["moves"] = ParseJson (movesStr);

    Json::Value meta(Json::objectValue);
    meta["height"] = ctx.Height ();
    meta["timestamp"] = 1500000000;
    blockData["block"] = meta;

    return blockData;
  }

  /**
   * Calls TesLogic::UpdateState for a block at the given height with
   * moves given as JSON string.
   */
  void
  UpdateState (const unsigned height, const std::string& movesStr)
  {
    ctx.SetHeight (height);
    TesLogic::UpdateState (db, ctx, BuildBlockData (movesStr));
    TesLogic::ValidateStateSlow (db, ctx);
  }

  /**
   * Processes empty blocks for all heights in [from, to).
   */
  void
  EmptyBlocks (const unsigned from, const unsigned to)
  {
    for (unsigned h = from; h < to; ++h)
      UpdateState (h, "[]");
  }

};

namespace
{

TEST_F (TesLogicTests, InitialState)
{
  EXPECT_EQ (supply.Get ("JUSD"), 400'000);
  EXPECT_EQ (supply.Get ("SETT"), 4'000'000);
  EXPECT_FALSE (states.GetByCurrency ("SETT")->HasLastPeriod ());
}

TEST_F (TesLogicTests, GenesisBlockEvaluates)
{
  UpdateState (0, "[]");

  const auto records = ElasticityLog (db).GetLatest (10);
  ASSERT_EQ (records.size (), 2);
  for (const auto& rec : records)
    {
      EXPECT_EQ (rec.period (), 0);
      EXPECT_EQ (rec.error (), proto::STALE_PRICE);
    }
}

TEST_F (TesLogicTests, ExpansionFromMoves)
{
  EmptyBlocks (0, 10);

  UpdateState (10, R"([
    {"name": "market", "move": {"lq": {"SETT": 1}}},
    {"name": "oracle", "move": {"px": {"SETT": 11000, "JUSD": 1000}}}
  ])");

  EXPECT_EQ (supply.Get ("SETT"), 4'200'000);
  EXPECT_EQ (supply.Get ("JUSD"), 400'000);

  MarketPoolData data;
  ASSERT_TRUE (pools.Get ("SETT", data));
  EXPECT_EQ (data.released, 200'000);

  auto state = states.GetByCurrency ("SETT");
  EXPECT_EQ (state->GetLastPeriod (), 1);
  EXPECT_EQ (state->GetPhase (), proto::APPLIED);
}

TEST_F (TesLogicTests, OnlyOncePerPeriod)
{
  UpdateState (10, R"([
    {"name": "market", "move": {"lq": {"SETT": 1}}},
    {"name": "oracle", "move": {"px": {"SETT": 11000}}}
  ])");
  EXPECT_EQ (supply.Get ("SETT"), 4'200'000);

  for (unsigned h = 11; h < 20; ++h)
    UpdateState (h, R"([
      {"name": "oracle", "move": {"px": {"SETT": 11000}}}
    ])");
  EXPECT_EQ (supply.Get ("SETT"), 4'200'000);

  UpdateState (20, "[]");
  EXPECT_EQ (supply.Get ("SETT"), 4'400'000);

  EXPECT_EQ (ElasticityLog (db).GetForCurrency ("SETT").size (), 2);
}

TEST_F (TesLogicTests, StaleQuoteIgnored)
{
  UpdateState (3, R"([
    {"name": "market", "move": {"lq": {"JUSD": 1000000}}},
    {"name": "oracle", "move": {"px": {"JUSD": 500}}}
  ])");
  EXPECT_EQ (supply.Get ("JUSD"), 380'000);

  EmptyBlocks (4, 20);
  EXPECT_EQ (supply.Get ("JUSD"), 380'000);

  const auto records = ElasticityLog (db).GetForCurrency ("JUSD");
  ASSERT_EQ (records.size (), 2);
  EXPECT_EQ (records[0].direction (), proto::CONTRACT);
  EXPECT_EQ (records[1].direction (), proto::NO_ACTION);
  EXPECT_EQ (records[1].error (), proto::STALE_PRICE);
}

TEST_F (TesLogicTests, UnauthorisedMovesIgnored)
{
  UpdateState (10, R"([
    {"name": "domob", "move": {"lq": {"SETT": 1000}}},
    {"name": "domob", "move": {"px": {"SETT": 11000}}}
  ])");

  EXPECT_EQ (supply.Get ("SETT"), 4'000'000);
  EXPECT_FALSE (pools.IsOpen ("SETT"));
}

TEST_F (TesLogicTests, FloorHoldsUnderPressure)
{
  UpdateState (0, R"([
    {"name": "market", "move": {"lq": {"JUSD": 1000000000}}}
  ])");

  for (unsigned h = 1; h < 500; ++h)
    UpdateState (h, R"([
      {"name": "oracle", "move": {"px": {"JUSD": 1}}}
    ])");

  EXPECT_EQ (supply.Get ("JUSD"), 100'000);
  EXPECT_EQ (states.GetByCurrency ("JUSD")->GetPhase (), proto::SKIPPED);
}

/* ************************************************************************** */

} // anonymous namespace
} // namespace tes
