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

#include "safemath.hpp"

#include <glog/logging.h>

#include <limits>

namespace tes
{

namespace
{

using Limits = std::numeric_limits<int64_t>;

} // anonymous namespace

bool
CheckedAdd (const int64_t a, const int64_t b, int64_t& out)
{
  if (b > 0 && a > Limits::max () - b)
    return false;
  if (b < 0 && a < Limits::min () - b)
    return false;

  out = a + b;
  return true;
}

bool
CheckedSub (const int64_t a, const int64_t b, int64_t& out)
{
  if (b < 0 && a > Limits::max () + b)
    return false;
  if (b > 0 && a < Limits::min () + b)
    return false;

  out = a - b;
  return true;
}

bool
CheckedMul (const int64_t a, const int64_t b, int64_t& out)
{
  if (a == 0 || b == 0)
    {
      out = 0;
      return true;
    }

  /* The only product that overflows only in one sign combination is
     min * -1, which we handle here explicitly.  */
  if ((a == -1 && b == Limits::min ()) || (b == -1 && a == Limits::min ()))
    return false;

  if (a > 0)
    {
      if (b > 0 && a > Limits::max () / b)
        return false;
      if (b < 0 && b < Limits::min () / a)
        return false;
    }
  else
    {
      if (b > 0 && a < Limits::min () / b)
        return false;
      if (b < 0 && a < Limits::max () / b)
        return false;
    }

  out = a * b;
  return true;
}

bool
MulDivFloor (const int64_t a, const int64_t b, const int64_t d, int64_t& out)
{
  CHECK_GE (a, 0);
  CHECK_GE (b, 0);
  CHECK_GT (d, 0);

  /* Split a = q * d + r, so that a * b / d = q * b + r * b / d.  Since r < d,
     the second product is only as large as b * d, which is much smaller
     than a * b in the typical case of a large amount and a ratio.  */
  const int64_t q = a / d;
  const int64_t r = a % d;

  int64_t high, lowNum;
  if (!CheckedMul (q, b, high) || !CheckedMul (r, b, lowNum))
    return false;

  return CheckedAdd (high, lowNum / d, out);
}

} // namespace tes
