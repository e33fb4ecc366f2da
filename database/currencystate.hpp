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

#ifndef DATABASE_CURRENCYSTATE_HPP
#define DATABASE_CURRENCYSTATE_HPP

#include "amount.hpp"
#include "database.hpp"

#include "proto/elasticity.pb.h"

#include <memory>
#include <string>

namespace tes
{

/**
 * Database result type for rows from the currency-state table.
 */
struct CurrencyStateResult : public Database::ResultType
{
  RESULT_COLUMN (std::string, currency, 1);
  RESULT_COLUMN (int64_t, last_period, 2);
  RESULT_COLUMN (int64_t, phase, 3);
  RESULT_COLUMN (int64_t, pending_release, 4);
};

/**
 * Wrapper class around the scheduler state of one currency in the database.
 * Instances should be obtained through the CurrencyStateTable.  Modifications
 * are written back to the database when the instance is destructed.
 */
class CurrencyState
{

private:

  /** Database reference this belongs to.  */
  Database& db;

  /** The currency this is for.  */
  std::string currency;

  /** Whether or not a period has been evaluated yet.  */
  bool evaluated;

  /** The last evaluated period (if evaluated is true).  */
  unsigned lastPeriod;

  /** The phase in which the last evaluated period ended.  */
  proto::Phase phase;

  /** Minted units that still need to be released to the market.  */
  Amount pendingRelease;

  /** Whether or not there are modifications to write.  */
  bool dirty;

  /**
   * Constructs an instance for a currency that has not yet been evaluated.
   */
  explicit CurrencyState (Database& d, const std::string& c);

  /**
   * Constructs an instance based on the given DB result set.
   */
  explicit CurrencyState (Database& d,
                          const Database::Result<CurrencyStateResult>& res);

  friend class CurrencyStateTable;

public:

  /**
   * In the destructor, the underlying database is updated if there are any
   * modifications to send.
   */
  ~CurrencyState ();

  CurrencyState () = delete;
  CurrencyState (const CurrencyState&) = delete;
  void operator= (const CurrencyState&) = delete;

  const std::string&
  GetCurrency () const
  {
    return currency;
  }

  /**
   * Returns true if the given period still has to be evaluated, i.e. it is
   * after the last evaluated one.
   */
  bool IsEligible (unsigned period) const;

  bool
  HasLastPeriod () const
  {
    return evaluated;
  }

  /**
   * Returns the last evaluated period.  Must only be called if there is one.
   */
  unsigned GetLastPeriod () const;

  proto::Phase
  GetPhase () const
  {
    return phase;
  }

  /**
   * Marks the given period as evaluated, ending in the given phase.
   * The period must be eligible.
   */
  void MarkEvaluated (unsigned period, proto::Phase p);

  Amount
  GetPendingRelease () const
  {
    return pendingRelease;
  }

  void SetPendingRelease (Amount value);

};

/**
 * Utility class that handles querying the currency-state table in the
 * database and should be used to obtain CurrencyState instances.
 */
class CurrencyStateTable
{

private:

  /** The Database reference for creating queries.  */
  Database& db;

public:

  /** Movable handle to a currency-state instance.  */
  using Handle = std::unique_ptr<CurrencyState>;

  explicit CurrencyStateTable (Database& d)
    : db(d)
  {}

  CurrencyStateTable () = delete;
  CurrencyStateTable (const CurrencyStateTable&) = delete;
  void operator= (const CurrencyStateTable&) = delete;

  /**
   * Returns the state for the given currency.  If the currency has never
   * been evaluated, a fresh state is returned (which will only be written
   * to the database once it is modified).
   */
  Handle GetByCurrency (const std::string& currency);

  /**
   * Queries for all currencies with state, ordered by currency id.
   */
  Database::Result<CurrencyStateResult> QueryAll ();

  /**
   * Returns a handle for the instance based on a Database::Result.
   */
  Handle GetFromResult (const Database::Result<CurrencyStateResult>& res);

};

} // namespace tes

#endif // DATABASE_CURRENCYSTATE_HPP
