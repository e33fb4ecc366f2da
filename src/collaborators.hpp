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

#ifndef TES_COLLABORATORS_HPP
#define TES_COLLABORATORS_HPP

#include "elasticity.hpp"

#include "database/amount.hpp"

#include <string>

namespace tes
{

/**
 * Source of price quotes for the currencies.
 */
class PriceOracle
{

public:

  virtual ~PriceOracle () = default;

  /**
   * Looks up the latest quote for a currency.  Returns false if the
   * oracle has none available.
   */
  virtual bool LatestPrice (const std::string& currency, PriceQuote& quote) = 0;

};

/** Results of operations on the supply ledger.  */
enum class LedgerError
{
  OK,
  SUPPLY_OVERFLOW,
  MAXIMUM_EXCEEDED,
  INSUFFICIENT_SUPPLY,
};

/**
 * The authoritative record of each currency's total supply.  This is the
 * only way in which the supply is ever changed.
 */
class SupplyLedger
{

public:

  virtual ~SupplyLedger () = default;

  virtual Amount CurrentSupply (const std::string& currency) = 0;

  /**
   * Creates new units of the currency.  On error, the supply is unchanged.
   */
  virtual LedgerError Mint (const std::string& currency, Amount amount) = 0;

  /**
   * Destroys units of the currency.  On error, the supply is unchanged.
   */
  virtual LedgerError Burn (const std::string& currency, Amount amount) = 0;

};

/** Results of market operations.  */
enum class MarketError
{
  OK,
  UNAVAILABLE,
  ILLIQUID,
};

/**
 * The settlement market, into which newly minted units are released and
 * from which units for contractions are bought back.
 */
class Market
{

public:

  virtual ~Market () = default;

  virtual MarketError ReleaseToMarket (const std::string& currency,
                                       Amount amount) = 0;

  /**
   * Tries to buy back the given amount.  The amount actually acquired
   * (which may be less, and is zero on failure) is returned in acquired.
   */
  virtual MarketError AcquireFromMarket (const std::string& currency,
                                         Amount amount, Amount& acquired) = 0;

};

} // namespace tes

#endif // TES_COLLABORATORS_HPP
