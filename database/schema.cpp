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

#include "schema.hpp"

#include <glog/logging.h>

namespace tes
{

namespace
{

constexpr const char* SCHEMA_SQL = R"(

-- The authoritative total supply of each currency.  This is what the
-- ledger collaborator mints into and burns from.
CREATE TABLE IF NOT EXISTS `currency_supply` (
  `currency` TEXT PRIMARY KEY,
  `amount` INTEGER NOT NULL
);

-- The latest price quote for each currency, as submitted by an
-- authorised oracle feeder.  Older quotes are simply overwritten.
CREATE TABLE IF NOT EXISTS `price_quotes` (
  `currency` TEXT PRIMARY KEY,
  `price` INTEGER NOT NULL,
  `height` INTEGER NOT NULL
);

-- Settlement pool of the market for each currency.  A row exists as soon
-- as the market for that currency has been opened by a market maker.
CREATE TABLE IF NOT EXISTS `market_pool` (
  `currency` TEXT PRIMARY KEY,

  -- Units currently offered for buy-back (contraction).
  `liquidity` INTEGER NOT NULL,

  -- Total units released into the market by expansions.
  `released` INTEGER NOT NULL,

  -- Total units bought back by contractions.
  `acquired` INTEGER NOT NULL
);

-- Scheduler state for each currency.  Rows are created the first time
-- a currency is evaluated.
CREATE TABLE IF NOT EXISTS `currency_state` (
  `currency` TEXT PRIMARY KEY,

  -- The last period that has been evaluated.
  `last_period` INTEGER NOT NULL,

  -- The phase (proto::Phase) the last evaluated period ended in.
  `phase` INTEGER NOT NULL,

  -- Minted units whose release to the market has not yet succeeded.
  `pending_release` INTEGER NOT NULL
);

-- Observability records of all evaluations.  This table is only written
-- during the state transition, never read.
CREATE TABLE IF NOT EXISTS `elasticity_log` (
  `id` INTEGER PRIMARY KEY,
  `currency` TEXT NOT NULL,
  `period` INTEGER NOT NULL,
  `height` INTEGER NOT NULL,
  `proto` BLOB NOT NULL
);
CREATE INDEX IF NOT EXISTS `elasticity_log_by_currency`
  ON `elasticity_log` (`currency`, `period`);

)";

/**
 * Callback for sqlite3_exec that expects not to be called.
 */
int
ExpectNoResult (void* data, int columns, char** strs, char** names)
{
  LOG (FATAL) << "Expected no result from DB query";
}

} // anonymous namespace

void
SetupDatabaseSchema (sqlite3* db)
{
  CHECK_EQ (sqlite3_exec (db, SCHEMA_SQL, &ExpectNoResult, nullptr, nullptr),
            SQLITE_OK);
}

} // namespace tes
