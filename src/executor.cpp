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

#include "executor.hpp"

#include "guard.hpp"

#include <glog/logging.h>

namespace tes
{

namespace
{

/**
 * Expands the supply:  Mints the units and releases them to the market.
 */
void
ExecuteExpansion (SupplyLedger& ledger, Market& market,
                  const ElasticityDecision& decision, Amount& pending,
                  ExecutionResult& res)
{
  const auto ledgerErr = ledger.Mint (decision.currency, decision.magnitude);
  if (ledgerErr != LedgerError::OK)
    {
      LOG (WARNING)
          << "Minting " << decision.magnitude << " " << decision.currency
          << " failed with code " << static_cast<int> (ledgerErr);
      res.error = proto::LEDGER_ERROR;
      return;
    }

  res.applied = true;
  res.minted = decision.magnitude;

  const auto marketErr
      = market.ReleaseToMarket (decision.currency, decision.magnitude);
  if (marketErr != MarketError::OK)
    {
      LOG (WARNING)
          << "Releasing " << decision.magnitude << " " << decision.currency
          << " failed with code " << static_cast<int> (marketErr)
          << ", keeping them pending";
      CHECK_LE (decision.magnitude, MAX_AMOUNT - pending);
      pending += decision.magnitude;
      res.error = proto::PENDING_RELEASE;
      return;
    }

  res.released = decision.magnitude;
}

/**
 * Contracts the supply:  Buys units back from the market and burns
 * what was acquired.
 */
void
ExecuteContraction (SupplyLedger& ledger, Market& market,
                    const ElasticityDecision& decision, ExecutionResult& res)
{
  Amount acquired = 0;
  const auto marketErr
      = market.AcquireFromMarket (decision.currency, decision.magnitude,
                                  acquired);

  if (acquired > decision.magnitude)
    {
      LOG (ERROR)
          << "Market returned " << acquired << " " << decision.currency
          << " when asked for " << decision.magnitude;
      acquired = decision.magnitude;
    }
  if (acquired < 0)
    {
      LOG (ERROR)
          << "Market returned negative amount " << acquired
          << " of " << decision.currency;
      acquired = 0;
    }

  if (acquired == 0)
    {
      LOG (WARNING)
          << "Could not acquire any " << decision.currency
          << " from the market (code " << static_cast<int> (marketErr) << ")";
      res.error = proto::MARKET_ERROR;
      return;
    }
  res.acquired = acquired;

  const auto ledgerErr = ledger.Burn (decision.currency, acquired);
  if (ledgerErr != LedgerError::OK)
    {
      LOG (WARNING)
          << "Burning " << acquired << " " << decision.currency
          << " failed with code " << static_cast<int> (ledgerErr);
      res.error = proto::LEDGER_ERROR;
      return;
    }

  res.applied = true;
  res.burned = acquired;

  if (acquired < decision.magnitude)
    {
      LOG (WARNING)
          << "Only acquired " << acquired << " of " << decision.magnitude
          << " " << decision.currency << " for contraction";
      res.error = proto::MARKET_ERROR;
    }
}

} // anonymous namespace

Amount
SupplyExecutor::ReleasePending (const std::string& currency, Amount& pending)
{
  CHECK_GE (pending, 0);
  if (pending == 0)
    return 0;

  const auto err = market.ReleaseToMarket (currency, pending);
  if (err != MarketError::OK)
    {
      LOG (WARNING)
          << "Retrying release of " << pending << " " << currency
          << " failed with code " << static_cast<int> (err);
      return 0;
    }

  VLOG (1) << "Released " << pending << " pending " << currency;
  const Amount res = pending;
  pending = 0;

  return res;
}

ExecutionResult
SupplyExecutor::Execute (const proto::CurrencyConfig& cfg,
                         const ElasticityDecision& decision, Amount& pending)
{
  ExecutionResult res;

  if (decision.direction == proto::NO_ACTION)
    {
      res.error = decision.error;
      return res;
    }

  const SafetyGuard guard(cfg);
  guard.VerifyDispatch (ledger.CurrentSupply (decision.currency), decision);

  switch (decision.direction)
    {
    case proto::EXPAND:
      ExecuteExpansion (ledger, market, decision, pending, res);
      break;

    case proto::CONTRACT:
      ExecuteContraction (ledger, market, decision, res);
      break;

    default:
      LOG (FATAL) << "Unexpected direction: " << decision.direction;
    }

  return res;
}

} // namespace tes
