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

#include "jsonutils.hpp"
#include "scheduler.hpp"

#include "database/currencystate.hpp"
#include "database/elasticitylog.hpp"
#include "database/marketpool.hpp"
#include "database/pricequotes.hpp"
#include "database/supply.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <cctype>

namespace tes
{

namespace
{

/**
 * Returns the lower-case JSON string for a proto enum name.
 */
std::string
EnumToJson (std::string name)
{
  std::transform (name.begin (), name.end (), name.begin (),
                  [] (const unsigned char c) { return std::tolower (c); });
  return name;
}

Json::Value
ClampToJson (const proto::Clamp& c)
{
  Json::Value res(Json::objectValue);

  switch (c.kind ())
    {
    case proto::Clamp::RATE_LIMIT:
      res["kind"] = "rate limit";
      break;
    case proto::Clamp::MINIMUM_FLOOR:
      res["kind"] = "floor";
      break;
    default:
      LOG (FATAL) << "Invalid clamp kind: " << c.kind ();
    }

  res["before"] = IntToJson (c.before ());
  res["after"] = IntToJson (c.after ());

  return res;
}

} // anonymous namespace

constexpr unsigned GameStateJson::RECENT_RECORDS;

Json::Value
GameStateJson::Convert (const proto::CurrencyConfig& cfg)
{
  Json::Value res(Json::objectValue);
  res["baseunit"] = IntToJson (cfg.base_unit ());
  res["peg"] = IntToJson (cfg.peg_price ());
  res["tolerance"] = IntToJson (cfg.tolerance_ppb ());
  res["cap"] = IntToJson (cfg.max_change_cap ());
  res["floor"] = IntToJson (cfg.minimum_floor ());
  res["maximum"] = IntToJson (cfg.maximum_supply ());
  res["frequency"] = IntToJson (cfg.frequency ());

  return res;
}

Json::Value
GameStateJson::Convert (const proto::ElasticityRecord& rec)
{
  Json::Value res(Json::objectValue);
  res["currency"] = rec.currency ();
  res["period"] = IntToJson (rec.period ());
  res["height"] = IntToJson (rec.height ());

  if (rec.has_price ())
    {
      Json::Value quote(Json::objectValue);
      quote["price"] = IntToJson (rec.price ());
      quote["height"] = IntToJson (rec.price_height ());
      res["quote"] = quote;
    }

  Json::Value decision(Json::objectValue);
  decision["direction"] = EnumToJson (proto::Direction_Name (rec.direction ()));
  decision["deviation"] = IntToJson (rec.deviation_ppb ());
  decision["raw"] = IntToJson (rec.raw_magnitude ());
  decision["magnitude"] = IntToJson (rec.magnitude ());
  Json::Value clamps(Json::arrayValue);
  for (const auto& c : rec.clamps ())
    clamps.append (ClampToJson (c));
  decision["clamps"] = clamps;
  res["decision"] = decision;

  Json::Value exec(Json::objectValue);
  exec["applied"] = rec.applied ();
  exec["minted"] = IntToJson (rec.minted ());
  exec["released"] = IntToJson (rec.released ());
  exec["acquired"] = IntToJson (rec.acquired ());
  exec["burned"] = IntToJson (rec.burned ());
  res["execution"] = exec;

  if (rec.error () != proto::NONE)
    res["error"] = EnumToJson (proto::ErrorKind_Name (rec.error ()));

  Json::Value supply(Json::objectValue);
  supply["before"] = IntToJson (rec.supply_before ());
  supply["after"] = IntToJson (rec.supply_after ());
  res["supply"] = supply;

  Json::Value pending(Json::objectValue);
  pending["released"] = IntToJson (rec.pending_released ());
  pending["remaining"] = IntToJson (rec.pending_release ());
  res["pending"] = pending;

  res["phase"] = EnumToJson (proto::Phase_Name (rec.phase ()));

  return res;
}

Json::Value
GameStateJson::Currency (const std::string& id)
{
  const auto& cfg = ctx.Registry ().Currency (id);

  Json::Value res(Json::objectValue);
  res["config"] = Convert (cfg);

  SupplyTable supply(db);
  res["supply"] = IntToJson (supply.Get (id));

  Amount price;
  unsigned priceHeight;
  if (PriceQuotesTable (db).Get (id, price, priceHeight))
    {
      Json::Value quote(Json::objectValue);
      quote["price"] = IntToJson (price);
      quote["height"] = IntToJson (priceHeight);
      res["quote"] = quote;
    }

  MarketPoolData pool;
  if (MarketPoolTable (db).Get (id, pool))
    {
      Json::Value market(Json::objectValue);
      market["liquidity"] = IntToJson (pool.liquidity);
      market["released"] = IntToJson (pool.released);
      market["acquired"] = IntToJson (pool.acquired);
      res["market"] = market;
    }

  /* The phase of the last evaluation is only reported until the next
     period starts, at which point the currency is idle again (until the
     next evaluation).  Without a block height (e.g. for the plain game
     state), we just report the last phase.  */
  auto state = CurrencyStateTable (db).GetByCurrency (id);
  Json::Value stateJson(Json::objectValue);
  proto::Phase phase = proto::IDLE;
  if (state->HasLastPeriod ())
    {
      stateJson["lastperiod"] = IntToJson (state->GetLastPeriod ());
      if (!ctx.HasHeight ()
            || !state->IsEligible (PeriodForHeight (cfg, ctx.Height ())))
        phase = state->GetPhase ();
    }
  stateJson["phase"] = EnumToJson (proto::Phase_Name (phase));
  stateJson["pending"] = IntToJson (state->GetPendingRelease ());
  res["state"] = stateJson;

  return res;
}

Json::Value
GameStateJson::Currencies ()
{
  Json::Value res(Json::objectValue);
  for (const auto& id : ctx.Registry ().CurrencyIds ())
    res[id] = Currency (id);

  return res;
}

Json::Value
GameStateJson::RecentRecords (const unsigned limit)
{
  Json::Value res(Json::arrayValue);
  for (const auto& rec : ElasticityLog (db).GetLatest (limit))
    res.append (Convert (rec));

  return res;
}

Json::Value
GameStateJson::CurrencyHistory (const std::string& id)
{
  Json::Value res(Json::arrayValue);
  for (const auto& rec : ElasticityLog (db).GetForCurrency (id))
    res.append (Convert (rec));

  return res;
}

Json::Value
GameStateJson::FullState ()
{
  Json::Value res(Json::objectValue);

  res["currencies"] = Currencies ();
  res["recent"] = RecentRecords (RECENT_RECORDS);

  return res;
}

} // namespace tes
