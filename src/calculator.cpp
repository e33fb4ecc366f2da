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

#include "calculator.hpp"

#include "guard.hpp"

#include <glog/logging.h>

namespace tes
{

bool
ComputeDeviation (const Amount price, const Amount peg, Ratio& deviation)
{
  CHECK_GT (peg, 0);

  int64_t diff, scaled;
  if (!CheckedSub (price, peg, diff) || !CheckedMul (diff, RATIO_ONE, scaled))
    return false;

  /* Integer division truncates towards zero, which is what we want for
     both signs.  */
  deviation = scaled / peg;
  return true;
}

ElasticityDecision
ComputeDecision (const proto::CurrencyConfig& cfg,
                 const SupplySnapshot& snapshot, const PriceQuote* quote,
                 const unsigned stalenessLimit, const uint64_t period)
{
  ElasticityDecision res;
  res.currency = snapshot.currency;
  res.period = period;

  if (quote == nullptr)
    {
      VLOG (1) << "No price quote for " << snapshot.currency;
      res.SetNoAction (proto::STALE_PRICE);
      return res;
    }
  CHECK_EQ (quote->currency, snapshot.currency);

  if (quote->price <= 0)
    {
      VLOG (1)
          << "Invalid price " << quote->price << " for " << snapshot.currency;
      res.SetNoAction (proto::INVALID_PRICE);
      return res;
    }

  if (quote->height > snapshot.height)
    {
      VLOG (1)
          << "Quote for " << snapshot.currency << " at height "
          << quote->height << " is from the future";
      res.SetNoAction (proto::INVALID_PRICE);
      return res;
    }

  if (snapshot.height - quote->height > stalenessLimit)
    {
      VLOG (1)
          << "Quote for " << snapshot.currency << " from height "
          << quote->height << " is stale at " << snapshot.height;
      res.SetNoAction (proto::STALE_PRICE);
      return res;
    }

  if (!ComputeDeviation (quote->price, cfg.peg_price (), res.deviation))
    {
      res.SetNoAction (proto::ARITHMETIC_OVERFLOW);
      return res;
    }

  const Ratio absDeviation = res.deviation < 0 ? -res.deviation : res.deviation;
  if (absDeviation <= cfg.tolerance_ppb ())
    {
      VLOG (1)
          << "Price of " << snapshot.currency << " is within the band"
          << " (deviation " << res.deviation << ")";
      res.SetNoAction (proto::NONE);
      return res;
    }

  const Ratio excess = absDeviation - cfg.tolerance_ppb ();
  if (!MulDivFloor (snapshot.supply, excess, RATIO_ONE, res.rawMagnitude))
    {
      res.SetNoAction (proto::ARITHMETIC_OVERFLOW);
      return res;
    }

  res.direction = res.deviation > 0 ? proto::EXPAND : proto::CONTRACT;

  const SafetyGuard guard(cfg);
  if (!guard.Clamp (snapshot.supply, res))
    {
      res.SetNoAction (proto::ARITHMETIC_OVERFLOW);
      return res;
    }

  if (res.magnitude == 0)
    {
      VLOG (1)
          << "Change of " << snapshot.currency << " rounds to zero";
      res.SetNoAction (proto::NONE);
      return res;
    }

  VLOG (1)
      << "Decision for " << snapshot.currency << ": "
      << proto::Direction_Name (res.direction) << " by " << res.magnitude
      << " (raw " << res.rawMagnitude << ", deviation " << res.deviation
      << ")";

  return res;
}

} // namespace tes
