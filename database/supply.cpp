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

#include "supply.hpp"

#include <glog/logging.h>

namespace tes
{

namespace
{

struct SupplyResult : public Database::ResultType
{
  RESULT_COLUMN (std::string, currency, 1);
  RESULT_COLUMN (int64_t, amount, 2);
};

} // anonymous namespace

bool
SupplyTable::Exists (const std::string& currency)
{
  auto stmt = db.Prepare (R"(
    SELECT `currency`
      FROM `currency_supply`
      WHERE `currency` = ?1
  )");
  stmt.Bind (1, currency);

  auto res = stmt.Query<SupplyResult> ();
  return res.Step ();
}

Amount
SupplyTable::Get (const std::string& currency)
{
  auto stmt = db.Prepare (R"(
    SELECT *
      FROM `currency_supply`
      WHERE `currency` = ?1
  )");
  stmt.Bind (1, currency);

  auto res = stmt.Query<SupplyResult> ();
  CHECK (res.Step ()) << "Invalid currency: " << currency;

  const Amount amount = res.Get<SupplyResult::amount> ();
  CHECK (!res.Step ());

  return amount;
}

void
SupplyTable::Initialise (const std::string& currency, const Amount amount)
{
  LOG (INFO) << "Initial supply of " << currency << ": " << amount;
  CHECK_GE (amount, 0);
  CHECK_LE (amount, MAX_AMOUNT);

  auto stmt = db.Prepare (R"(
    INSERT INTO `currency_supply`
      (`currency`, `amount`) VALUES (?1, ?2)
  )");
  stmt.Bind (1, currency);
  stmt.Bind (2, amount);
  stmt.Execute ();
}

void
SupplyTable::Increment (const std::string& currency, const Amount value)
{
  VLOG (1) << "Incrementing supply of " << currency << " by " << value;
  CHECK_GT (value, 0);

  const Amount before = Get (currency);
  CHECK_LE (value, MAX_AMOUNT - before);

  auto stmt = db.Prepare (R"(
    UPDATE `currency_supply`
      SET `amount` = `amount` + ?2
      WHERE `currency` = ?1
  )");
  stmt.Bind (1, currency);
  stmt.Bind (2, value);
  stmt.Execute ();
}

void
SupplyTable::Decrement (const std::string& currency, const Amount value)
{
  VLOG (1) << "Decrementing supply of " << currency << " by " << value;
  CHECK_GT (value, 0);
  CHECK_LE (value, Get (currency));

  auto stmt = db.Prepare (R"(
    UPDATE `currency_supply`
      SET `amount` = `amount` - ?2
      WHERE `currency` = ?1
  )");
  stmt.Bind (1, currency);
  stmt.Bind (2, value);
  stmt.Execute ();
}

} // namespace tes
