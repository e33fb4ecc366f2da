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

#ifndef TES_CALCULATOR_HPP
#define TES_CALCULATOR_HPP

#include "elasticity.hpp"
#include "safemath.hpp"

#include "database/amount.hpp"
#include "proto/config.pb.h"

#include <cstdint>

namespace tes
{

/**
 * Computes the relative deviation of a price from the peg, i.e.
 * (price - peg) / peg, as ratio truncated towards zero.  Returns false
 * if the computation overflows.
 */
bool ComputeDeviation (Amount price, Amount peg, Ratio& deviation);

/**
 * Decides on the supply change of a currency for one period.  The quote
 * may be null if the oracle has none.  This is a pure function of its
 * inputs; the safety bounds of the currency are already applied to
 * the returned decision.
 */
ElasticityDecision ComputeDecision (const proto::CurrencyConfig& cfg,
                                    const SupplySnapshot& snapshot,
                                    const PriceQuote* quote,
                                    unsigned stalenessLimit, uint64_t period);

} // namespace tes

#endif // TES_CALCULATOR_HPP
