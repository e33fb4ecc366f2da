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

#ifndef TES_TESTUTILS_HPP
#define TES_TESTUTILS_HPP

#include "context.hpp"

#include "proto/config.pb.h"

#include <xayagame/gamelogic.hpp>

#include <json/json.h>

#include <string>

namespace tes
{

/**
 * Context instance that can modify certain fields (like the block height).
 */
class ContextForTesting : public Context
{

public:

  ContextForTesting ()
    : Context(xaya::Chain::REGTEST)
  {
    SetChain (chain);
    SetHeight (0);
  }

  /**
   * Sets the chain, which also resets the peg registry to the chain's
   * hard-coded configuration.
   */
  void SetChain (xaya::Chain c);

  void SetHeight (unsigned h);

  /**
   * Replaces the peg registry with one for the given custom data.
   */
  void SetConfig (const proto::ConfigData& pb);

};

/**
 * Parses a string into JSON.
 */
Json::Value ParseJson (const std::string& str);

/**
 * Checks for "partial equality" of the given JSON values.  This means that
 * keys not present in the expected value (if it is an object) are not checked
 * in the actual value at all.  If keys have a value of null in expected,
 * then they must not be there in actual at all.
 */
bool PartialJsonEqual (const Json::Value& actual, const Json::Value& expected);

} // namespace tes

#endif // TES_TESTUTILS_HPP
