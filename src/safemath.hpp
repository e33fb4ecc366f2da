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

#ifndef TES_SAFEMATH_HPP
#define TES_SAFEMATH_HPP

#include "database/amount.hpp"

#include <cstdint>

namespace tes
{

/**
 * A signed fixed-point ratio, in parts per billion.
 */
using Ratio = int64_t;

/** The ratio representing 1.0.  */
constexpr Ratio RATIO_ONE = 1'000'000'000;

/*
 * Checked arithmetic on amounts and ratios.  All functions return false
 * if the result would overflow the 64-bit range (in which case the output
 * is not touched), and never saturate.
 */

bool CheckedAdd (int64_t a, int64_t b, int64_t& out);
bool CheckedSub (int64_t a, int64_t b, int64_t& out);
bool CheckedMul (int64_t a, int64_t b, int64_t& out);

/**
 * Computes floor (a * b / d) for non-negative a and b and positive d
 * without requiring that a * b itself fits into 64 bits.  Returns false
 * if an intermediate step or the result overflows.
 */
bool MulDivFloor (int64_t a, int64_t b, int64_t d, int64_t& out);

} // namespace tes

#endif // TES_SAFEMATH_HPP
