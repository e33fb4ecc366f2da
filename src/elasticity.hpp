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

#ifndef TES_ELASTICITY_HPP
#define TES_ELASTICITY_HPP

#include "safemath.hpp"

#include "database/amount.hpp"
#include "proto/elasticity.pb.h"

#include <cstdint>
#include <string>
#include <vector>

namespace tes
{

/**
 * The supply of a currency as seen at the start of a period.  It is taken
 * once before the evaluation and never changed afterwards.
 */
struct SupplySnapshot
{
  std::string currency;
  Amount supply;
  unsigned height;
};

/**
 * A price observation for a currency as returned by the oracle.  The data
 * is untrusted and validated by the calculator.
 */
struct PriceQuote
{
  std::string currency;
  Amount price;
  unsigned height;
};

/**
 * The decision of what to do with the supply of a currency in one period.
 */
struct ElasticityDecision
{

  std::string currency;
  uint64_t period = 0;

  proto::Direction direction = proto::NO_ACTION;

  /** The final (clamped) magnitude of the change.  */
  Amount magnitude = 0;

  /** The magnitude as computed from the deviation, before any clamps.  */
  Amount rawMagnitude = 0;

  /** Deviation of the price from the peg.  */
  Ratio deviation = 0;

  /** Bounds that were applied to the raw magnitude, in order.  */
  std::vector<proto::Clamp> clamps;

  /** Condition that prevented an adjustment (if any).  */
  proto::ErrorKind error = proto::NONE;

  /**
   * Turns the decision into a no-op with the given condition.
   */
  void SetNoAction (proto::ErrorKind err);

  /**
   * Fills in the decision fields of an observability record.
   */
  void ToProto (proto::ElasticityRecord& rec) const;

};

/**
 * What the executor actually did with a decision.
 */
struct ExecutionResult
{

  /** Whether or not the supply was changed.  */
  bool applied = false;

  proto::ErrorKind error = proto::NONE;

  Amount minted = 0;
  Amount released = 0;
  Amount acquired = 0;
  Amount burned = 0;

  /**
   * Fills in the execution fields of an observability record.
   */
  void ToProto (proto::ElasticityRecord& rec) const;

};

} // namespace tes

#endif // TES_ELASTICITY_HPP
