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

#include "guard.hpp"

#include <glog/logging.h>

namespace tes
{

namespace
{

/**
 * Records a clamp of the given kind on the decision and updates its
 * magnitude.
 */
void
AddClamp (ElasticityDecision& decision, const proto::Clamp::Kind kind,
          const Amount after)
{
  VLOG (1)
      << "Clamping " << decision.currency << " change from "
      << decision.magnitude << " to " << after
      << " (" << proto::Clamp::Kind_Name (kind) << ")";

  proto::Clamp c;
  c.set_kind (kind);
  c.set_before (decision.magnitude);
  c.set_after (after);
  decision.clamps.push_back (c);

  decision.magnitude = after;
}

} // anonymous namespace

bool
SafetyGuard::Clamp (const Amount supply, ElasticityDecision& decision) const
{
  CHECK_NE (decision.direction, proto::NO_ACTION);
  CHECK_GE (decision.rawMagnitude, 0);
  CHECK_GE (supply, 0);

  decision.magnitude = decision.rawMagnitude;
  decision.clamps.clear ();

  if (decision.magnitude > cfg.max_change_cap ())
    AddClamp (decision, proto::Clamp::RATE_LIMIT, cfg.max_change_cap ());

  switch (decision.direction)
    {
    case proto::EXPAND:
      {
        Amount after;
        if (!CheckedAdd (supply, decision.magnitude, after))
          {
            LOG (WARNING)
                << "Expansion of " << decision.currency << " by "
                << decision.magnitude << " would overflow the supply";
            return false;
          }
        break;
      }

    case proto::CONTRACT:
      {
        const Amount headroom
            = supply > cfg.minimum_floor () ? supply - cfg.minimum_floor () : 0;
        if (decision.magnitude > headroom)
          AddClamp (decision, proto::Clamp::MINIMUM_FLOOR, headroom);
        break;
      }

    default:
      LOG (FATAL) << "Unexpected direction: " << decision.direction;
    }

  return true;
}

void
SafetyGuard::VerifyDispatch (const Amount supply,
                             const ElasticityDecision& decision) const
{
  CHECK_NE (decision.direction, proto::NO_ACTION)
      << "No-op decision for " << decision.currency << " dispatched";
  CHECK_EQ (decision.error, proto::NONE);
  CHECK_GT (decision.magnitude, 0);
  CHECK_LE (decision.magnitude, cfg.max_change_cap ())
      << "Rate limit violated for " << decision.currency;

  if (decision.direction == proto::CONTRACT)
    {
      CHECK_LE (decision.magnitude, supply);
      CHECK_GE (supply - decision.magnitude, cfg.minimum_floor ())
          << "Contraction of " << decision.currency << " breaches the floor";
    }
}

} // namespace tes
