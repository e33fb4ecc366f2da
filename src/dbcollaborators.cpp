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

#include "dbcollaborators.hpp"

#include "safemath.hpp"

#include <glog/logging.h>

namespace tes
{

/* ************************************************************************** */

Amount
DatabaseLedger::CurrentSupply (const std::string& currency)
{
  return supply.Get (currency);
}

LedgerError
DatabaseLedger::Mint (const std::string& currency, const Amount amount)
{
  CHECK_GT (amount, 0);
  const auto& cfg = registry.Currency (currency);

  Amount after;
  if (!CheckedAdd (supply.Get (currency), amount, after))
    return LedgerError::SUPPLY_OVERFLOW;
  if (after > cfg.maximum_supply ())
    {
      VLOG (1)
          << "Minting " << amount << " " << currency
          << " would exceed the maximum supply of " << cfg.maximum_supply ();
      return LedgerError::MAXIMUM_EXCEEDED;
    }

  supply.Increment (currency, amount);
  return LedgerError::OK;
}

LedgerError
DatabaseLedger::Burn (const std::string& currency, const Amount amount)
{
  CHECK_GT (amount, 0);

  if (amount > supply.Get (currency))
    return LedgerError::INSUFFICIENT_SUPPLY;

  supply.Decrement (currency, amount);
  return LedgerError::OK;
}

/* ************************************************************************** */

bool
DatabaseOracle::LatestPrice (const std::string& currency, PriceQuote& quote)
{
  if (!quotes.Get (currency, quote.price, quote.height))
    return false;

  quote.currency = currency;
  return true;
}

/* ************************************************************************** */

MarketError
DatabaseMarket::ReleaseToMarket (const std::string& currency,
                                 const Amount amount)
{
  if (!pools.IsOpen (currency))
    return MarketError::UNAVAILABLE;

  pools.RecordRelease (currency, amount);
  return MarketError::OK;
}

MarketError
DatabaseMarket::AcquireFromMarket (const std::string& currency,
                                   const Amount amount, Amount& acquired)
{
  acquired = 0;
  if (!pools.IsOpen (currency))
    return MarketError::UNAVAILABLE;

  acquired = pools.TakeLiquidity (currency, amount);
  if (acquired < amount)
    return MarketError::ILLIQUID;

  return MarketError::OK;
}

/* ************************************************************************** */

} // namespace tes
