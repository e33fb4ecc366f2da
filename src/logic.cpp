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

#include "dbcollaborators.hpp"
#include "moveprocessor.hpp"
#include "scheduler.hpp"

#include "database/currencystate.hpp"
#include "database/schema.hpp"
#include "database/supply.hpp"

#include <glog/logging.h>

namespace tes
{

SQLiteGameDatabase::SQLiteGameDatabase (xaya::SQLiteDatabase& d, TesLogic& g)
  : game(g)
{
  SetDatabase (d);
}

Database::IdT
SQLiteGameDatabase::GetLogId ()
{
  return game.Ids ("log").GetNext ();
}

void
TesLogic::InitialiseState (Database& db, const PegRegistry& registry)
{
  SupplyTable supply(db);
  for (const auto& id : registry.CurrencyIds ())
    {
      const Amount initial = registry.Currency (id).initial_supply ();
      LOG (INFO) << "Initial supply of " << id << ": " << initial;
      supply.Initialise (id, initial);
    }
}

void
TesLogic::UpdateState (Database& db, const Context& ctx,
                       const Json::Value& blockData)
{
  MoveProcessor mvProc(db, ctx);
  mvProc.ProcessAll (blockData["moves"]);

  /* The scheduler runs after the moves, so that quotes and liquidity
     submitted in this block are already taken into account.  */
  DatabaseOracle oracle(db);
  DatabaseLedger ledger(db, ctx.Registry ());
  DatabaseMarket market(db);
  PeriodScheduler scheduler(db, ctx.Registry (), oracle, ledger, market);
  scheduler.OnPeriodTick (ctx.Height ());

#ifdef ENABLE_SLOW_ASSERTS
  ValidateStateSlow (db, ctx);
#endif // ENABLE_SLOW_ASSERTS
}

void
TesLogic::ValidateStateSlow (Database& db, const Context& ctx)
{
  LOG (INFO) << "Performing slow validation of the game-state database...";

  SupplyTable supply(db);
  CurrencyStateTable states(db);
  for (const auto& id : ctx.Registry ().CurrencyIds ())
    {
      const auto& cfg = ctx.Registry ().Currency (id);
      const Amount cur = supply.Get (id);
      CHECK_GE (cur, cfg.minimum_floor ())
          << "Supply of " << id << " is below the floor";
      CHECK_LE (cur, cfg.maximum_supply ())
          << "Supply of " << id << " is above the maximum";

      auto state = states.GetByCurrency (id);
      CHECK_GE (state->GetPendingRelease (), 0);
      if (state->HasLastPeriod ())
        CHECK_LE (state->GetLastPeriod (), PeriodForHeight (cfg, ctx.Height ()))
            << "Currency " << id << " has been evaluated in the future";
    }
}

void
TesLogic::SetupSchema (xaya::SQLiteDatabase& db)
{
  SetupDatabaseSchema (*db);
}

void
TesLogic::GetInitialStateBlock (unsigned& height,
                                std::string& hashHex) const
{
  const xaya::Chain chain = GetChain ();
  switch (chain)
    {
    case xaya::Chain::MAIN:
      height = 2'128'750;
      hashHex
          = "f7b5247531e0b2aabafa1219d6bdaf695bef95cfc2409c18d5286c7896912961";
      break;

    case xaya::Chain::TEST:
      height = 112'000;
      hashHex
          = "9c5b83a5caaf7f4ce17cc1f38fdb1ed3e3e3e98e43d23d19a4810767d7df38b9";
      break;

    case xaya::Chain::REGTEST:
      height = 0;
      hashHex
          = "6f750b36d22f1dc3d0a6e483af45301022646dfc3b3ba2187865f5a7d6d83ab1";
      break;

    default:
      LOG (FATAL) << "Unexpected chain: " << xaya::ChainToString (chain);
    }
}

void
TesLogic::InitialiseState (xaya::SQLiteDatabase& db)
{
  SQLiteGameDatabase dbObj(db, *this);
  const PegRegistry registry(GetChain ());
  InitialiseState (dbObj, registry);
}

void
TesLogic::UpdateState (xaya::SQLiteDatabase& db, const Json::Value& blockData)
{
  const auto& blockMeta = blockData["block"];
  CHECK (blockMeta.isObject ());
  const auto& heightVal = blockMeta["height"];
  CHECK (heightVal.isUInt64 ());
  const unsigned height = heightVal.asUInt64 ();

  SQLiteGameDatabase dbObj(db, *this);
  const Context ctx(GetChain (), height);
  UpdateState (dbObj, ctx, blockData);
}

Json::Value
TesLogic::GetStateAsJson (const xaya::SQLiteDatabase& db)
{
  SQLiteGameDatabase dbObj(const_cast<xaya::SQLiteDatabase&> (db), *this);
  const Context ctx(GetChain (), Context::NO_HEIGHT);
  GameStateJson gsj(dbObj, ctx);

  return gsj.FullState ();
}

} // namespace tes
