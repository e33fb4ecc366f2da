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

#include "pricequotes.hpp"

#include <glog/logging.h>

namespace tes
{

namespace
{

struct PriceQuoteResult : public Database::ResultType
{
  RESULT_COLUMN (std::string, currency, 1);
  RESULT_COLUMN (int64_t, price, 2);
  RESULT_COLUMN (int64_t, height, 3);
};

} // anonymous namespace

void
PriceQuotesTable::Set (const std::string& currency, const Amount price,
                       const unsigned height)
{
  VLOG (1)
      << "New quote for " << currency << " at height " << height
      << ": " << price;
  CHECK_GE (price, 0);

  auto stmt = db.Prepare (R"(
    INSERT OR REPLACE INTO `price_quotes`
      (`currency`, `price`, `height`) VALUES (?1, ?2, ?3)
  )");
  stmt.Bind (1, currency);
  stmt.Bind (2, price);
  stmt.Bind<int64_t> (3, height);
  stmt.Execute ();
}

bool
PriceQuotesTable::Get (const std::string& currency, Amount& price,
                       unsigned& height)
{
  auto stmt = db.Prepare (R"(
    SELECT *
      FROM `price_quotes`
      WHERE `currency` = ?1
  )");
  stmt.Bind (1, currency);

  auto res = stmt.Query<PriceQuoteResult> ();
  if (!res.Step ())
    return false;

  price = res.Get<PriceQuoteResult::price> ();
  height = res.Get<PriceQuoteResult::height> ();
  CHECK (!res.Step ());

  return true;
}

} // namespace tes
