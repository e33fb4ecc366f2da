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

#include "scheduler.hpp"

#include "calculator.hpp"

#include "database/currencystate.hpp"
#include "database/elasticitylog.hpp"

#include <glog/logging.h>

#include <utility>

namespace tes
{

uint64_t
PeriodForHeight (const proto::CurrencyConfig& cfg, const unsigned height)
{
  CHECK_GT (cfg.frequency (), 0);
  return height / cfg.frequency ();
}

bool
PeriodScheduler::EvaluateCurrency (const std::string& currency,
                                   const unsigned height,
                                   proto::ElasticityRecord& rec)
{
  const auto& cfg = registry.Currency (currency);
  const uint64_t period = PeriodForHeight (cfg, height);

  CurrencyStateTable states(db);
  auto state = states.GetByCurrency (currency);
  if (!state->IsEligible (period))
    {
      VLOG (1)
          << "Period " << period << " of " << currency
          << " has already been evaluated";
      return false;
    }

  VLOG (1)
      << "Evaluating " << currency << " for period " << period
      << " at height " << height;

  const SupplySnapshot snapshot = {currency, ledger.CurrentSupply (currency),
                                   height};

  rec.Clear ();
  rec.set_currency (currency);
  rec.set_height (height);
  rec.set_supply_before (snapshot.supply);

  Amount pending = state->GetPendingRelease ();
  rec.set_pending_released (executor.ReleasePending (currency, pending));

  PriceQuote quote;
  const bool hasQuote = oracle.LatestPrice (currency, quote);
  if (hasQuote)
    {
      rec.set_price (quote.price);
      rec.set_price_height (quote.height);
    }

  const auto decision
      = ComputeDecision (cfg, snapshot, hasQuote ? &quote : nullptr,
                         registry->params ().staleness_limit (), period);
  decision.ToProto (rec);

  const auto result = executor.Execute (cfg, decision, pending);
  result.ToProto (rec);

  const bool applied
      = decision.direction != proto::NO_ACTION && result.applied;
  const proto::Phase phase = applied ? proto::APPLIED : proto::SKIPPED;
  rec.set_phase (phase);

  const Amount supplyAfter = ledger.CurrentSupply (currency);
  rec.set_supply_after (supplyAfter);
  rec.set_pending_release (pending);

  /* The supply can only have moved by the clamped magnitude, and never
     across the floor.  */
  const Amount change = supplyAfter - snapshot.supply;
  CHECK_LE (change, decision.magnitude);
  CHECK_GE (change, -decision.magnitude);
  if (change < 0)
    CHECK_GE (supplyAfter, cfg.minimum_floor ());
  if (!applied)
    CHECK_EQ (change, 0) << "Supply of " << currency << " changed while "
                         << "the evaluation was skipped";

  state->MarkEvaluated (period, phase);
  state->SetPendingRelease (pending);

  return true;
}

std::vector<proto::ElasticityRecord>
PeriodScheduler::OnPeriodTick (const unsigned height)
{
  VLOG (1) << "Period tick at height " << height;

  ElasticityLog log(db);
  std::vector<proto::ElasticityRecord> res;

  for (const auto& currency : registry.CurrencyIds ())
    {
      proto::ElasticityRecord rec;
      if (!EvaluateCurrency (currency, height, rec))
        continue;

      LOG (INFO)
          << "Elasticity of " << rec.currency ()
          << " in period " << rec.period () << ": "
          << proto::Direction_Name (rec.direction ())
          << " by " << rec.magnitude ()
          << " (" << proto::ErrorKind_Name (rec.error ()) << "), "
          << proto::Phase_Name (rec.phase ())
          << ", supply " << rec.supply_before ()
          << " -> " << rec.supply_after ();

      log.Append (rec);
      res.push_back (std::move (rec));
    }

  return res;
}

} // namespace tes
