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

#ifndef DATABASE_MARKETPOOL_HPP
#define DATABASE_MARKETPOOL_HPP

#include "amount.hpp"
#include "database.hpp"

#include <string>

namespace tes
{

/**
 * Data of the settlement pool for one currency's market.
 */
struct MarketPoolData
{

  /** Units offered for buy-back.  */
  Amount liquidity = 0;

  /** Total units released into the market.  */
  Amount released = 0;

  /** Total units bought back from the market.  */
  Amount acquired = 0;

};

/**
 * Database table with the settlement pools of the per-currency markets.
 * The market of a currency is "open" once it has a row in the table.
 */
class MarketPoolTable
{

private:

  /** The underlying database handle.  */
  Database& db;

  /**
   * Updates the counters of an existing pool by the given deltas.
   */
  void Update (const std::string& currency, Amount dLiquidity,
               Amount dReleased, Amount dAcquired);

public:

  explicit MarketPoolTable (Database& d)
    : db(d)
  {}

  MarketPoolTable () = delete;
  MarketPoolTable (const MarketPoolTable&) = delete;
  void operator= (const MarketPoolTable&) = delete;

  /**
   * Retrieves the pool data for a currency.  Returns false if the
   * market is not open.
   */
  bool Get (const std::string& currency, MarketPoolData& data);

  /**
   * Returns true if the market for the currency is open.
   */
  bool
  IsOpen (const std::string& currency)
  {
    MarketPoolData data;
    return Get (currency, data);
  }

  /**
   * Adds buy-back liquidity, opening the market if necessary.
   */
  void AddLiquidity (const std::string& currency, Amount amount);

  /**
   * Records a release of units into the (open) market.
   */
  void RecordRelease (const std::string& currency, Amount amount);

  /**
   * Takes up to the given amount out of the liquidity of an open market.
   * Returns the amount actually taken.
   */
  Amount TakeLiquidity (const std::string& currency, Amount amount);

};

} // namespace tes

#endif // DATABASE_MARKETPOOL_HPP
