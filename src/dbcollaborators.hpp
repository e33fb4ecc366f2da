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

#ifndef TES_DBCOLLABORATORS_HPP
#define TES_DBCOLLABORATORS_HPP

#include "collaborators.hpp"

#include "database/database.hpp"
#include "database/marketpool.hpp"
#include "database/pricequotes.hpp"
#include "database/supply.hpp"
#include "proto/pegregistry.hpp"

#include <string>

namespace tes
{

/**
 * Supply ledger based on the currency_supply table.  It enforces the
 * configured maximum supply of each currency.
 */
class DatabaseLedger : public SupplyLedger
{

private:

  SupplyTable supply;

  const PegRegistry& registry;

public:

  explicit DatabaseLedger (Database& db, const PegRegistry& r)
    : supply(db), registry(r)
  {}

  Amount CurrentSupply (const std::string& currency) override;
  LedgerError Mint (const std::string& currency, Amount amount) override;
  LedgerError Burn (const std::string& currency, Amount amount) override;

};

/**
 * Price oracle that returns the latest quote submitted by an authorised
 * feeder through a move.
 */
class DatabaseOracle : public PriceOracle
{

private:

  PriceQuotesTable quotes;

public:

  explicit DatabaseOracle (Database& db)
    : quotes(db)
  {}

  bool LatestPrice (const std::string& currency, PriceQuote& quote) override;

};

/**
 * Market based on the settlement pools in the database.  Released units
 * are just accounted for, and buy-backs are limited by the liquidity
 * market makers have offered.
 */
class DatabaseMarket : public Market
{

private:

  MarketPoolTable pools;

public:

  explicit DatabaseMarket (Database& db)
    : pools(db)
  {}

  MarketError ReleaseToMarket (const std::string& currency,
                               Amount amount) override;
  MarketError AcquireFromMarket (const std::string& currency,
                                 Amount amount, Amount& acquired) override;

};

} // namespace tes

#endif // TES_DBCOLLABORATORS_HPP
