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

#ifndef TES_GAMESTATEJSON_HPP
#define TES_GAMESTATEJSON_HPP

#include "context.hpp"

#include "database/database.hpp"
#include "proto/config.pb.h"
#include "proto/elasticity.pb.h"

#include <json/json.h>

#include <string>

namespace tes
{

/**
 * Utility class that handles construction of game-state JSON.
 */
class GameStateJson
{

private:

  /** Database to read from.  */
  Database& db;

  /** Current parameter context.  */
  const Context& ctx;

  /**
   * Returns the JSON data for one currency.
   */
  Json::Value Currency (const std::string& id);

public:

  /** Number of recent elasticity records included in the full state.  */
  static constexpr unsigned RECENT_RECORDS = 20;

  explicit GameStateJson (Database& d, const Context& c)
    : db(d), ctx(c)
  {}

  GameStateJson () = delete;
  GameStateJson (const GameStateJson&) = delete;
  void operator= (const GameStateJson&) = delete;

  /**
   * Converts a currency configuration to JSON.
   */
  static Json::Value Convert (const proto::CurrencyConfig& cfg);

  /**
   * Converts an elasticity record to JSON.
   */
  static Json::Value Convert (const proto::ElasticityRecord& rec);

  /**
   * Returns the JSON data for all currencies, with their configuration,
   * supply, latest quote, market and scheduler state.
   */
  Json::Value Currencies ();

  /**
   * Returns the latest elasticity records, up to the given number.
   */
  Json::Value RecentRecords (unsigned limit);

  /**
   * Returns all elasticity records of one currency.
   */
  Json::Value CurrencyHistory (const std::string& id);

  /**
   * Returns the full game state JSON for the given Database handle.
   */
  Json::Value FullState ();

};

} // namespace tes

#endif // TES_GAMESTATEJSON_HPP
