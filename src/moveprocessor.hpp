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

#ifndef TES_MOVEPROCESSOR_HPP
#define TES_MOVEPROCESSOR_HPP

#include "context.hpp"

#include "database/amount.hpp"
#include "database/database.hpp"
#include "database/marketpool.hpp"
#include "database/pricequotes.hpp"

#include <json/json.h>

#include <map>
#include <string>

namespace tes
{

/** Amounts (or prices) per currency, as given in a move.  */
using CurrencyAmountMap = std::map<std::string, Amount>;

/**
 * Class that handles processing of all moves made in a block.  Moves are
 * the way in which the authorised oracle feeders submit price quotes and
 * the authorised market makers provide buy-back liquidity.  Invalid moves
 * (or parts of them) are ignored.
 */
class MoveProcessor
{

private:

  /** Processing context data.  */
  const Context& ctx;

  /** The Database handle we use for making any changes.  */
  Database& db;

  /** Access handle for the price quotes.  */
  PriceQuotesTable quotes;

  /** Access handle for the market pools.  */
  MarketPoolTable pools;

  /**
   * Parses a JSON object mapping currency ids to amounts.  Entries for
   * unknown currencies or with invalid amounts are skipped (and logged).
   * If positive is true, zero amounts are also skipped.
   */
  CurrencyAmountMap ParseCurrencyAmounts (const Json::Value& obj,
                                          bool positive) const;

  /**
   * Handles a potential price submission in a move.
   */
  void TryPriceQuotes (const std::string& name, const Json::Value& upd);

  /**
   * Handles a potential liquidity offer in a move.
   */
  void TryLiquidity (const std::string& name, const Json::Value& upd);

  /**
   * Processes the move corresponding to one transaction.
   */
  void ProcessOne (const Json::Value& moveObj);

public:

  explicit MoveProcessor (Database& d, const Context& c)
    : ctx(c), db(d), quotes(db), pools(db)
  {}

  MoveProcessor () = delete;
  MoveProcessor (const MoveProcessor&) = delete;
  void operator= (const MoveProcessor&) = delete;

  /**
   * Processes all moves from the given JSON array.
   */
  void ProcessAll (const Json::Value& moveArray);

};

} // namespace tes

#endif // TES_MOVEPROCESSOR_HPP
