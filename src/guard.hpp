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

#ifndef TES_GUARD_HPP
#define TES_GUARD_HPP

#include "elasticity.hpp"

#include "database/amount.hpp"
#include "proto/config.pb.h"

namespace tes
{

/**
 * Bounds applied to every supply change of a currency.  The guard enforces
 * the rate limit (maximum change per period) and the minimum floor on
 * contractions, and verifies decisions again right before they are
 * dispatched to the ledger.
 */
class SafetyGuard
{

private:

  /** The currency's configuration.  */
  const proto::CurrencyConfig& cfg;

public:

  explicit SafetyGuard (const proto::CurrencyConfig& c)
    : cfg(c)
  {}

  SafetyGuard () = delete;
  SafetyGuard (const SafetyGuard&) = delete;
  void operator= (const SafetyGuard&) = delete;

  /**
   * Sets the decision's magnitude from its raw magnitude, applying the
   * rate limit and (for contractions) the floor.  Every bound that changes
   * the value is recorded as clamp in the decision.
   *
   * Returns false if the resulting supply would overflow, in which case the
   * decision must not be executed.
   */
  bool Clamp (Amount supply, ElasticityDecision& decision) const;

  /**
   * Verifies that a decision is safe to execute against the given supply.
   * Decisions from the calculator always pass this, so violations are
   * programming errors and CHECK-fail.
   */
  void VerifyDispatch (Amount supply, const ElasticityDecision& decision) const;

};

} // namespace tes

#endif // TES_GUARD_HPP
