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

#include "executor.hpp"

#include "collaborators_tests.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace tes
{
namespace
{

using testing::_;
using testing::DoAll;
using testing::Return;
using testing::SetArgReferee;
using testing::StrictMock;

class SupplyExecutorTests : public testing::Test
{

protected:

  proto::CurrencyConfig cfg;

  StrictMock<MockSupplyLedger> ledger;
  StrictMock<MockMarket> market;

  SupplyExecutor exec;

  SupplyExecutorTests ()
    : exec(ledger, market)
  {
    cfg.set_max_change_cap (50'000);
    cfg.set_minimum_floor (80'000);

    ON_CALL (ledger, CurrentSupply ("SETT"))
        .WillByDefault (Return (1'000'000));
  }

  static ElasticityDecision
  MakeDecision (const proto::Direction dir, const Amount magnitude)
  {
    ElasticityDecision res;
    res.currency = "SETT";
    res.period = 5;
    res.direction = dir;
    res.rawMagnitude = magnitude;
    res.magnitude = magnitude;
    return res;
  }

};

TEST_F (SupplyExecutorTests, NoAction)
{
  auto d = MakeDecision (proto::NO_ACTION, 0);
  d.error = proto::STALE_PRICE;

  Amount pending = 10;
  const auto res = exec.Execute (cfg, d, pending);

  EXPECT_FALSE (res.applied);
  EXPECT_EQ (res.error, proto::STALE_PRICE);
  EXPECT_EQ (res.minted, 0);
  EXPECT_EQ (res.burned, 0);
  EXPECT_EQ (pending, 10);
}

TEST_F (SupplyExecutorTests, ExpansionSuccess)
{
  EXPECT_CALL (ledger, CurrentSupply ("SETT"));
  EXPECT_CALL (ledger, Mint ("SETT", 50'000));
  EXPECT_CALL (market, ReleaseToMarket ("SETT", 50'000));

  Amount pending = 0;
  const auto res
      = exec.Execute (cfg, MakeDecision (proto::EXPAND, 50'000), pending);

  EXPECT_TRUE (res.applied);
  EXPECT_EQ (res.error, proto::NONE);
  EXPECT_EQ (res.minted, 50'000);
  EXPECT_EQ (res.released, 50'000);
  EXPECT_EQ (pending, 0);
}

TEST_F (SupplyExecutorTests, ExpansionMintFails)
{
  EXPECT_CALL (ledger, CurrentSupply ("SETT"));
  EXPECT_CALL (ledger, Mint ("SETT", 100))
      .WillOnce (Return (LedgerError::MAXIMUM_EXCEEDED));

  Amount pending = 0;
  const auto res
      = exec.Execute (cfg, MakeDecision (proto::EXPAND, 100), pending);

  EXPECT_FALSE (res.applied);
  EXPECT_EQ (res.error, proto::LEDGER_ERROR);
  EXPECT_EQ (res.minted, 0);
  EXPECT_EQ (res.released, 0);
  EXPECT_EQ (pending, 0);
}

TEST_F (SupplyExecutorTests, ExpansionReleaseFails)
{
  EXPECT_CALL (ledger, CurrentSupply ("SETT"));
  EXPECT_CALL (ledger, Mint ("SETT", 50'000));
  EXPECT_CALL (market, ReleaseToMarket ("SETT", 50'000))
      .WillOnce (Return (MarketError::UNAVAILABLE));

  Amount pending = 7;
  const auto res
      = exec.Execute (cfg, MakeDecision (proto::EXPAND, 50'000), pending);

  EXPECT_TRUE (res.applied);
  EXPECT_EQ (res.error, proto::PENDING_RELEASE);
  EXPECT_EQ (res.minted, 50'000);
  EXPECT_EQ (res.released, 0);
  EXPECT_EQ (pending, 50'007);
}

TEST_F (SupplyExecutorTests, ContractionSuccess)
{
  EXPECT_CALL (ledger, CurrentSupply ("SETT"));
  EXPECT_CALL (market, AcquireFromMarket ("SETT", 20'000, _))
      .WillOnce (DoAll (SetArgReferee<2> (20'000), Return (MarketError::OK)));
  EXPECT_CALL (ledger, Burn ("SETT", 20'000));

  Amount pending = 0;
  const auto res
      = exec.Execute (cfg, MakeDecision (proto::CONTRACT, 20'000), pending);

  EXPECT_TRUE (res.applied);
  EXPECT_EQ (res.error, proto::NONE);
  EXPECT_EQ (res.acquired, 20'000);
  EXPECT_EQ (res.burned, 20'000);
}

TEST_F (SupplyExecutorTests, ContractionPartial)
{
  EXPECT_CALL (ledger, CurrentSupply ("SETT"));
  EXPECT_CALL (market, AcquireFromMarket ("SETT", 20'000, _))
      .WillOnce (DoAll (SetArgReferee<2> (300),
                        Return (MarketError::ILLIQUID)));
  EXPECT_CALL (ledger, Burn ("SETT", 300));

  Amount pending = 0;
  const auto res
      = exec.Execute (cfg, MakeDecision (proto::CONTRACT, 20'000), pending);

  EXPECT_TRUE (res.applied);
  EXPECT_EQ (res.error, proto::MARKET_ERROR);
  EXPECT_EQ (res.acquired, 300);
  EXPECT_EQ (res.burned, 300);
}

TEST_F (SupplyExecutorTests, ContractionNothingAcquired)
{
  EXPECT_CALL (ledger, CurrentSupply ("SETT"));
  EXPECT_CALL (market, AcquireFromMarket ("SETT", 20'000, _));

  Amount pending = 0;
  const auto res
      = exec.Execute (cfg, MakeDecision (proto::CONTRACT, 20'000), pending);

  EXPECT_FALSE (res.applied);
  EXPECT_EQ (res.error, proto::MARKET_ERROR);
  EXPECT_EQ (res.acquired, 0);
  EXPECT_EQ (res.burned, 0);
}

TEST_F (SupplyExecutorTests, ContractionOverAcquisitionCapped)
{
  EXPECT_CALL (ledger, CurrentSupply ("SETT"));
  EXPECT_CALL (market, AcquireFromMarket ("SETT", 20'000, _))
      .WillOnce (DoAll (SetArgReferee<2> (25'000), Return (MarketError::OK)));
  EXPECT_CALL (ledger, Burn ("SETT", 20'000));

  Amount pending = 0;
  const auto res
      = exec.Execute (cfg, MakeDecision (proto::CONTRACT, 20'000), pending);

  EXPECT_TRUE (res.applied);
  EXPECT_EQ (res.error, proto::NONE);
  EXPECT_EQ (res.acquired, 20'000);
  EXPECT_EQ (res.burned, 20'000);
}

TEST_F (SupplyExecutorTests, ContractionBurnFails)
{
  EXPECT_CALL (ledger, CurrentSupply ("SETT"));
  EXPECT_CALL (market, AcquireFromMarket ("SETT", 20'000, _))
      .WillOnce (DoAll (SetArgReferee<2> (20'000), Return (MarketError::OK)));
  EXPECT_CALL (ledger, Burn ("SETT", 20'000))
      .WillOnce (Return (LedgerError::INSUFFICIENT_SUPPLY));

  Amount pending = 0;
  const auto res
      = exec.Execute (cfg, MakeDecision (proto::CONTRACT, 20'000), pending);

  EXPECT_FALSE (res.applied);
  EXPECT_EQ (res.error, proto::LEDGER_ERROR);
  EXPECT_EQ (res.acquired, 20'000);
  EXPECT_EQ (res.burned, 0);
}

TEST_F (SupplyExecutorTests, ReleasePendingNothing)
{
  Amount pending = 0;
  EXPECT_EQ (exec.ReleasePending ("SETT", pending), 0);
  EXPECT_EQ (pending, 0);
}

TEST_F (SupplyExecutorTests, ReleasePendingSuccess)
{
  EXPECT_CALL (market, ReleaseToMarket ("SETT", 50'000));

  Amount pending = 50'000;
  EXPECT_EQ (exec.ReleasePending ("SETT", pending), 50'000);
  EXPECT_EQ (pending, 0);
}

TEST_F (SupplyExecutorTests, ReleasePendingFails)
{
  EXPECT_CALL (market, ReleaseToMarket ("SETT", 50'000))
      .WillOnce (Return (MarketError::UNAVAILABLE));

  Amount pending = 50'000;
  EXPECT_EQ (exec.ReleasePending ("SETT", pending), 0);
  EXPECT_EQ (pending, 50'000);
}

using SupplyExecutorDeathTest = SupplyExecutorTests;

TEST_F (SupplyExecutorDeathTest, UnsafeDecision)
{
  Amount pending = 0;
  EXPECT_DEATH (
    {
      EXPECT_CALL (ledger, CurrentSupply ("SETT"));
      exec.Execute (cfg, MakeDecision (proto::EXPAND, 50'001), pending);
    }, "Rate limit");
  EXPECT_DEATH (
    {
      EXPECT_CALL (ledger, CurrentSupply ("SETT"))
          .WillOnce (Return (100'000));
      exec.Execute (cfg, MakeDecision (proto::CONTRACT, 30'000), pending);
    }, "breaches the floor");
}

} // anonymous namespace
} // namespace tes
