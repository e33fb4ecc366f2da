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

#ifndef TES_SCHEDULER_HPP
#define TES_SCHEDULER_HPP

#include "collaborators.hpp"
#include "executor.hpp"

#include "database/database.hpp"
#include "proto/elasticity.pb.h"
#include "proto/pegregistry.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace tes
{

/**
 * Returns the evaluation period of a currency that a given block height
 * falls into.
 */
uint64_t PeriodForHeight (const proto::CurrencyConfig& cfg, unsigned height);

/**
 * The driver of the elasticity mechanism.  On each block, it evaluates
 * every currency for which a new period has started (at most once per
 * period), runs the calculator and executes the resulting decision.
 *
 * The per-currency state (last evaluated period, phase and pending
 * release) is kept in the database, so that the scheduler itself is
 * stateless and can be constructed freshly for every block.
 */
class PeriodScheduler
{

private:

  Database& db;

  const PegRegistry& registry;

  PriceOracle& oracle;
  SupplyLedger& ledger;

  SupplyExecutor executor;

  /**
   * Evaluates one currency at the given height, if it is eligible.
   * Returns true and fills in the record if it was evaluated.
   */
  bool EvaluateCurrency (const std::string& currency, unsigned height,
                         proto::ElasticityRecord& rec);

public:

  explicit PeriodScheduler (Database& d, const PegRegistry& r,
                            PriceOracle& o, SupplyLedger& l, Market& m)
    : db(d), registry(r), oracle(o), ledger(l), executor(ledger, m)
  {}

  PeriodScheduler () = delete;
  PeriodScheduler (const PeriodScheduler&) = delete;
  void operator= (const PeriodScheduler&) = delete;

  /**
   * Processes the block at the given height.  This must be called exactly
   * once for each block, in order.  Returns the records of all evaluations
   * that were done (which are also written to the log table).
   */
  std::vector<proto::ElasticityRecord> OnPeriodTick (unsigned height);

};

} // namespace tes

#endif // TES_SCHEDULER_HPP
