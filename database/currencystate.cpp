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

#include "currencystate.hpp"

#include <glog/logging.h>

namespace tes
{

CurrencyState::CurrencyState (Database& d, const std::string& c)
  : db(d), currency(c), evaluated(false), lastPeriod(0),
    phase(proto::IDLE), pendingRelease(0), dirty(false)
{
  VLOG (1) << "Created fresh state instance for currency " << currency;
}

CurrencyState::CurrencyState (Database& d,
                              const Database::Result<CurrencyStateResult>& res)
  : db(d), evaluated(true), dirty(false)
{
  currency = res.Get<CurrencyStateResult::currency> ();

  const int64_t period = res.Get<CurrencyStateResult::last_period> ();
  CHECK_GE (period, 0);
  lastPeriod = period;

  const int64_t phaseVal = res.Get<CurrencyStateResult::phase> ();
  CHECK (proto::Phase_IsValid (phaseVal))
      << "Invalid phase " << phaseVal << " for " << currency;
  phase = static_cast<proto::Phase> (phaseVal);

  pendingRelease = res.Get<CurrencyStateResult::pending_release> ();
  CHECK_GE (pendingRelease, 0);

  VLOG (1) << "Created state instance for " << currency << " from database";
}

CurrencyState::~CurrencyState ()
{
  if (!dirty)
    {
      VLOG (1) << "State of currency " << currency << " is not dirty";
      return;
    }

  VLOG (1) << "Updating state of currency " << currency << " in the database";
  CHECK (evaluated)
      << "Modified state of " << currency << " without any evaluation";

  auto stmt = db.Prepare (R"(
    INSERT OR REPLACE INTO `currency_state`
      (`currency`, `last_period`, `phase`, `pending_release`)
      VALUES (?1, ?2, ?3, ?4)
  )");

  stmt.Bind (1, currency);
  stmt.Bind<int64_t> (2, lastPeriod);
  stmt.Bind<int64_t> (3, static_cast<int64_t> (phase));
  stmt.Bind (4, pendingRelease);

  stmt.Execute ();
}

bool
CurrencyState::IsEligible (const unsigned period) const
{
  return !evaluated || period > lastPeriod;
}

unsigned
CurrencyState::GetLastPeriod () const
{
  CHECK (evaluated) << "Currency " << currency << " has not been evaluated";
  return lastPeriod;
}

void
CurrencyState::MarkEvaluated (const unsigned period, const proto::Phase p)
{
  CHECK (IsEligible (period))
      << "Period " << period << " of " << currency
      << " has already been evaluated";
  CHECK (p == proto::APPLIED || p == proto::SKIPPED)
      << "Evaluation of " << currency << " ended in invalid phase "
      << proto::Phase_Name (p);

  evaluated = true;
  lastPeriod = period;
  phase = p;
  dirty = true;
}

void
CurrencyState::SetPendingRelease (const Amount value)
{
  CHECK_GE (value, 0);
  CHECK_LE (value, MAX_AMOUNT);
  pendingRelease = value;
  dirty = true;
}

CurrencyStateTable::Handle
CurrencyStateTable::GetByCurrency (const std::string& currency)
{
  auto stmt = db.Prepare (R"(
    SELECT *
      FROM `currency_state`
      WHERE `currency` = ?1
  )");
  stmt.Bind (1, currency);
  auto res = stmt.Query<CurrencyStateResult> ();

  if (!res.Step ())
    return Handle (new CurrencyState (db, currency));

  auto r = GetFromResult (res);
  CHECK (!res.Step ());
  return r;
}

Database::Result<CurrencyStateResult>
CurrencyStateTable::QueryAll ()
{
  auto stmt = db.Prepare (R"(
    SELECT *
      FROM `currency_state`
      ORDER BY `currency`
  )");
  return stmt.Query<CurrencyStateResult> ();
}

CurrencyStateTable::Handle
CurrencyStateTable::GetFromResult (
    const Database::Result<CurrencyStateResult>& res)
{
  return Handle (new CurrencyState (db, res));
}

} // namespace tes
