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

#include "jsonutils.hpp"

#include <glog/logging.h>

namespace tes
{

CurrencyAmountMap
MoveProcessor::ParseCurrencyAmounts (const Json::Value& obj,
                                     const bool positive) const
{
  CurrencyAmountMap res;

  if (!obj.isObject ())
    {
      LOG (WARNING) << "Expected object with amounts per currency: " << obj;
      return res;
    }

  for (auto it = obj.begin (); it != obj.end (); ++it)
    {
      const std::string currency = it.name ();
      if (ctx.Registry ().CurrencyOrNull (currency) == nullptr)
        {
          LOG (WARNING) << "Unknown currency in move: " << currency;
          continue;
        }

      Amount amount;
      if (!AmountFromJson (*it, amount))
        {
          LOG (WARNING)
              << "Invalid amount for " << currency << " in move: " << *it;
          continue;
        }
      if (positive && amount == 0)
        {
          LOG (WARNING) << "Zero amount for " << currency << " in move";
          continue;
        }

      res.emplace (currency, amount);
    }

  return res;
}

void
MoveProcessor::TryPriceQuotes (const std::string& name,
                               const Json::Value& upd)
{
  if (upd.isNull ())
    return;

  if (!ctx.Registry ().IsOracleFeeder (name))
    {
      LOG (WARNING) << name << " is not allowed to submit prices";
      return;
    }

  for (const auto& entry : ParseCurrencyAmounts (upd, false))
    {
      VLOG (1)
          << name << " quotes " << entry.first << " at " << entry.second
          << " in height " << ctx.Height ();
      quotes.Set (entry.first, entry.second, ctx.Height ());
    }
}

void
MoveProcessor::TryLiquidity (const std::string& name, const Json::Value& upd)
{
  if (upd.isNull ())
    return;

  if (!ctx.Registry ().IsMarketMaker (name))
    {
      LOG (WARNING) << name << " is not allowed to provide liquidity";
      return;
    }

  for (const auto& entry : ParseCurrencyAmounts (upd, true))
    {
      MarketPoolData data;
      if (pools.Get (entry.first, data)
            && entry.second > MAX_AMOUNT - data.liquidity)
        {
          LOG (WARNING)
              << "Liquidity for " << entry.first << " would exceed the"
              << " maximum amount, ignoring " << entry.second;
          continue;
        }

      VLOG (1)
          << name << " provides " << entry.second << " liquidity for "
          << entry.first;
      pools.AddLiquidity (entry.first, entry.second);
    }
}

void
MoveProcessor::ProcessOne (const Json::Value& moveObj)
{
  VLOG (1) << "Processing move:\n" << moveObj;
  CHECK (moveObj.isObject ());

  CHECK (moveObj.isMember ("move"));
  const auto& mv = moveObj["move"];
  if (!mv.isObject ())
    {
      LOG (WARNING) << "Move is not an object: " << mv;
      return;
    }

  const auto& nameVal = moveObj["name"];
  CHECK (nameVal.isString ());
  const std::string name = nameVal.asString ();

  TryPriceQuotes (name, mv["px"]);
  TryLiquidity (name, mv["lq"]);
}

void
MoveProcessor::ProcessAll (const Json::Value& moveArray)
{
  CHECK (moveArray.isArray ());
  LOG (INFO) << "Processing " << moveArray.size () << " moves...";

  for (const auto& m : moveArray)
    ProcessOne (m);
}

} // namespace tes
