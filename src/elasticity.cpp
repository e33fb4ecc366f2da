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

#include "elasticity.hpp"

namespace tes
{

void
ElasticityDecision::SetNoAction (const proto::ErrorKind err)
{
  direction = proto::NO_ACTION;
  magnitude = 0;
  error = err;
}

void
ElasticityDecision::ToProto (proto::ElasticityRecord& rec) const
{
  rec.set_currency (currency);
  rec.set_period (period);
  rec.set_direction (direction);
  rec.set_deviation_ppb (deviation);
  rec.set_raw_magnitude (rawMagnitude);
  rec.set_magnitude (magnitude);

  rec.clear_clamps ();
  for (const auto& c : clamps)
    *rec.add_clamps () = c;
}

void
ExecutionResult::ToProto (proto::ElasticityRecord& rec) const
{
  rec.set_applied (applied);
  rec.set_error (error);
  rec.set_minted (minted);
  rec.set_released (released);
  rec.set_acquired (acquired);
  rec.set_burned (burned);
}

} // namespace tes
