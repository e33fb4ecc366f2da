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

#include "gamestatejson.hpp"

#include "testutils.hpp"

#include "database/currencystate.hpp"
#include "database/dbtest.hpp"
#include "database/elasticitylog.hpp"
#include "database/marketpool.hpp"
#include "database/pricequotes.hpp"
#include "database/supply.hpp"

#include <google/protobuf/text_format.h>

#include <gtest/gtest.h>

#include <glog/logging.h>

#include <json/json.h>

#include <string>

namespace tes
{
namespace
{

/* ************************************************************************** */

class GameStateJsonTests : public DBTestWithSchema
{

protected:

  ContextForTesting ctx;

  SupplyTable supply;

  GameStateJsonTests ()
    : supply(db)
  {
    supply.Initialise ("JUSD", 400'000);
    supply.Initialise ("SETT", 4'000'000);
    ctx.SetHeight (15);
  }

  /**
   * Expects that the current state matches the given one, after parsing
   * the expected state's string as JSON.  Furthermore, the expected value
   * is assumed to be *partial* -- keys that are not present in the expected
   * value may be present with any value in the actual object.  If a key is
   * present in expected but has value null, then it must not be present
   * in the actual data, though.
   */
  void
  ExpectStateJson (const std::string& expectedStr)
  {
    GameStateJson converter(db, ctx);
    const Json::Value actual = converter.FullState ();
    VLOG (1) << "Actual JSON for the game state:\n" << actual;
    ASSERT_TRUE (PartialJsonEqual (actual, ParseJson (expectedStr)));
  }

  /**
   * Parses a record from text format.
   */
  static proto::ElasticityRecord
  ParseRecord (const std::string& str)
  {
    proto::ElasticityRecord res;
    CHECK (google::protobuf::TextFormat::ParseFromString (str, &res));
    return res;
  }

};

/* ************************************************************************** */

using CurrencyJsonTests = GameStateJsonTests;

TEST_F (CurrencyJsonTests, Basic)
{
  ExpectStateJson (R"({
    "currencies":
      {
        "JUSD":
          {
            "config":
              {
                "baseunit": 1000,
                "peg": 1000,
                "tolerance": 20000000,
                "cap": 20000,
                "floor": 100000,
                "maximum": 1000000000,
                "frequency": 10
              },
            "supply": 400000,
            "quote": null,
            "market": null,
            "state": {"phase": "idle", "pending": 0, "lastperiod": null}
          },
        "SETT":
          {
            "config": {"baseunit": 10000, "peg": 10000},
            "supply": 4000000
          }
      },
    "recent": []
  })");
}

TEST_F (CurrencyJsonTests, QuoteAndMarket)
{
  PriceQuotesTable (db).Set ("SETT", 10'500, 12);

  MarketPoolTable pools(db);
  pools.AddLiquidity ("SETT", 100);
  pools.RecordRelease ("SETT", 30);
  pools.TakeLiquidity ("SETT", 40);

  ExpectStateJson (R"({
    "currencies":
      {
        "JUSD": {"quote": null, "market": null},
        "SETT":
          {
            "quote": {"price": 10500, "height": 12},
            "market": {"liquidity": 60, "released": 30, "acquired": 40}
          }
      }
  })");
}

TEST_F (CurrencyJsonTests, PhaseWithinPeriod)
{
  {
    auto state = CurrencyStateTable (db).GetByCurrency ("SETT");
    state->MarkEvaluated (1, proto::APPLIED);
    state->SetPendingRelease (42);
  }

  ExpectStateJson (R"({
    "currencies":
      {
        "JUSD": {"state": {"phase": "idle"}},
        "SETT": {"state": {"phase": "applied", "pending": 42, "lastperiod": 1}}
      }
  })");

  ctx.SetHeight (20);
  ExpectStateJson (R"({
    "currencies":
      {
        "SETT": {"state": {"phase": "idle", "pending": 42, "lastperiod": 1}}
      }
  })");

  ctx.SetHeight (Context::NO_HEIGHT);
  ExpectStateJson (R"({
    "currencies":
      {
        "SETT": {"state": {"phase": "applied"}}
      }
  })");
}

/* ************************************************************************** */

using RecordJsonTests = GameStateJsonTests;

TEST_F (RecordJsonTests, FullRecord)
{
  ElasticityLog (db).Append (ParseRecord (R"(
    currency: "SETT"
    period: 1
    height: 10
    supply_before: 1000000
    price: 11000
    price_height: 9
    direction: EXPAND
    deviation_ppb: 100000000
    raw_magnitude: 80000
    magnitude: 50000
    clamps: { kind: RATE_LIMIT before: 80000 after: 50000 }
    applied: true
    error: PENDING_RELEASE
    minted: 50000
    pending_release: 50000
    supply_after: 1050000
    phase: APPLIED
  )"));

  ExpectStateJson (R"({
    "recent":
      [
        {
          "currency": "SETT",
          "period": 1,
          "height": 10,
          "quote": {"price": 11000, "height": 9},
          "decision":
            {
              "direction": "expand",
              "deviation": 100000000,
              "raw": 80000,
              "magnitude": 50000,
              "clamps": [{"kind": "rate limit", "before": 80000, "after": 50000}]
            },
          "execution":
            {
              "applied": true,
              "minted": 50000,
              "released": 0,
              "acquired": 0,
              "burned": 0
            },
          "error": "pending_release",
          "supply": {"before": 1000000, "after": 1050000},
          "pending": {"released": 0, "remaining": 50000},
          "phase": "applied"
        }
      ]
  })");
}

TEST_F (RecordJsonTests, NoQuoteNoError)
{
  ElasticityLog (db).Append (ParseRecord (R"(
    currency: "JUSD"
    period: 0
    height: 0
    direction: NO_ACTION
    error: NONE
    phase: SKIPPED
  )"));

  ExpectStateJson (R"({
    "recent":
      [
        {
          "currency": "JUSD",
          "quote": null,
          "error": null,
          "decision": {"direction": "no_action", "clamps": []},
          "phase": "skipped"
        }
      ]
  })");
}

TEST_F (RecordJsonTests, RecentAndHistory)
{
  ElasticityLog log(db);
  for (unsigned i = 0; i < 30; ++i)
    {
      proto::ElasticityRecord rec;
      rec.set_currency (i % 2 == 0 ? "SETT" : "JUSD");
      rec.set_period (i / 2);
      rec.set_height (i / 2 * 10);
      log.Append (rec);
    }

  GameStateJson converter(db, ctx);

  const auto recent = converter.RecentRecords (GameStateJson::RECENT_RECORDS);
  ASSERT_EQ (recent.size (), GameStateJson::RECENT_RECORDS);
  EXPECT_EQ (recent[recent.size () - 1]["period"].asUInt64 (), 14);

  const auto history = converter.CurrencyHistory ("SETT");
  ASSERT_EQ (history.size (), 15);
  for (unsigned i = 0; i < history.size (); ++i)
    {
      EXPECT_EQ (history[i]["currency"].asString (), "SETT");
      EXPECT_EQ (history[i]["period"].asUInt64 (), i);
    }
}

/* ************************************************************************** */

} // anonymous namespace
} // namespace tes
