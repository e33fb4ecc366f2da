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

#ifndef TES_EXECUTOR_HPP
#define TES_EXECUTOR_HPP

#include "collaborators.hpp"
#include "elasticity.hpp"

#include "database/amount.hpp"
#include "proto/config.pb.h"

#include <string>

namespace tes
{

/**
 * Carries out elasticity decisions by dispatching them to the ledger
 * and the market.  The executor itself holds no state; units that were
 * minted but could not be released are handed back to the caller as
 * "pending release" and must be passed in again on the next pass.
 */
class SupplyExecutor
{

private:

  SupplyLedger& ledger;
  Market& market;

public:

  explicit SupplyExecutor (SupplyLedger& l, Market& m)
    : ledger(l), market(m)
  {}

  SupplyExecutor () = delete;
  SupplyExecutor (const SupplyExecutor&) = delete;
  void operator= (const SupplyExecutor&) = delete;

  /**
   * Retries the release of pending units of a currency to the market.
   * On success, pending is set to zero.  Returns the number of units
   * released by this call.
   */
  Amount ReleasePending (const std::string& currency, Amount& pending);

  /**
   * Executes a decision for the currency with the given configuration.
   * Minted units that could not be released are added to pending.
   */
  ExecutionResult Execute (const proto::CurrencyConfig& cfg,
                           const ElasticityDecision& decision,
                           Amount& pending);

};

} // namespace tes

#endif // TES_EXECUTOR_HPP
