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

#include "marketpool.hpp"

#include <glog/logging.h>

#include <algorithm>

namespace tes
{

namespace
{

struct MarketPoolResult : public Database::ResultType
{
  RESULT_COLUMN (std::string, currency, 1);
  RESULT_COLUMN (int64_t, liquidity, 2);
  RESULT_COLUMN (int64_t, released, 3);
  RESULT_COLUMN (int64_t, acquired, 4);
};

} // anonymous namespace

bool
MarketPoolTable::Get (const std::string& currency, MarketPoolData& data)
{
  auto stmt = db.Prepare (R"(
    SELECT *
      FROM `market_pool`
      WHERE `currency` = ?1
  )");
  stmt.Bind (1, currency);

  auto res = stmt.Query<MarketPoolResult> ();
  if (!res.Step ())
    return false;

  data.liquidity = res.Get<MarketPoolResult::liquidity> ();
  data.released = res.Get<MarketPoolResult::released> ();
  data.acquired = res.Get<MarketPoolResult::acquired> ();
  CHECK (!res.Step ());

  return true;
}

void
MarketPoolTable::Update (const std::string& currency, const Amount dLiquidity,
                         const Amount dReleased, const Amount dAcquired)
{
  MarketPoolData data;
  CHECK (Get (currency, data)) << "Market for " << currency << " is not open";

  data.liquidity += dLiquidity;
  data.released += dReleased;
  data.acquired += dAcquired;
  CHECK_GE (data.liquidity, 0);
  CHECK_LE (data.liquidity, MAX_AMOUNT);
  CHECK_LE (data.released, MAX_AMOUNT);
  CHECK_LE (data.acquired, MAX_AMOUNT);

  auto stmt = db.Prepare (R"(
    UPDATE `market_pool`
      SET `liquidity` = ?2, `released` = ?3, `acquired` = ?4
      WHERE `currency` = ?1
  )");
  stmt.Bind (1, currency);
  stmt.Bind (2, data.liquidity);
  stmt.Bind (3, data.released);
  stmt.Bind (4, data.acquired);
  stmt.Execute ();
}

void
MarketPoolTable::AddLiquidity (const std::string& currency, const Amount amount)
{
  VLOG (1) << "Adding " << amount << " liquidity for " << currency;
  CHECK_GT (amount, 0);

  if (!IsOpen (currency))
    {
      LOG (INFO) << "Opening market for " << currency;
      auto stmt = db.Prepare (R"(
        INSERT INTO `market_pool`
          (`currency`, `liquidity`, `released`, `acquired`)
          VALUES (?1, 0, 0, 0)
      )");
      stmt.Bind (1, currency);
      stmt.Execute ();
    }

  Update (currency, amount, 0, 0);
}

void
MarketPoolTable::RecordRelease (const std::string& currency,
                                const Amount amount)
{
  CHECK_GT (amount, 0);
  Update (currency, 0, amount, 0);
}

Amount
MarketPoolTable::TakeLiquidity (const std::string& currency,
                                const Amount amount)
{
  CHECK_GT (amount, 0);

  MarketPoolData data;
  CHECK (Get (currency, data)) << "Market for " << currency << " is not open";

  const Amount taken = std::min (amount, data.liquidity);
  if (taken > 0)
    Update (currency, -taken, 0, taken);

  return taken;
}

} // namespace tes
