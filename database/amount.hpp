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

#ifndef DATABASE_AMOUNT_HPP
#define DATABASE_AMOUNT_HPP

#include <cstdint>

namespace tes
{

/** An amount of currency units (of whatever currency is in question).  */
using Amount = int64_t;

/**
 * Highest valid value for an amount.  This is used for sanity checks on
 * configuration and moves, and is well below the range of Amount so that
 * the sum of two valid amounts can never overflow.
 */
constexpr Amount MAX_AMOUNT = 1'000'000'000'000'000'000;

} // namespace tes

#endif // DATABASE_AMOUNT_HPP
