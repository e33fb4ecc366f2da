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

#ifndef TES_LOGIC_HPP
#define TES_LOGIC_HPP

#include "context.hpp"
#include "gamestatejson.hpp"

#include "database/database.hpp"
#include "proto/pegregistry.hpp"

#include <xayagame/sqlitegame.hpp>
#include <xayagame/sqlitestorage.hpp>

#include <json/json.h>

#include <string>

namespace tes
{

class TesLogic;

/**
 * Database instance that uses an SQLiteGame instance for everything.
 */
class SQLiteGameDatabase : public Database
{

private:

  /** The underlying SQLiteGame instance.  */
  TesLogic& game;

public:

  explicit SQLiteGameDatabase (xaya::SQLiteDatabase& d, TesLogic& g);

  SQLiteGameDatabase () = delete;
  SQLiteGameDatabase (const SQLiteGameDatabase&) = delete;
  void operator= (const SQLiteGameDatabase&) = delete;

  Database::IdT GetLogId () override;

};

/**
 * The game-state processor for the elastic supply protocol.  This is the
 * main class that interacts with libxayagame and the Xaya daemon.  For each
 * block, it processes the moves (price quotes and liquidity) and then runs
 * the period scheduler on all currencies.
 */
class TesLogic : public xaya::SQLiteGame
{

private:

  /**
   * Writes the initial supply of all currencies.
   */
  static void InitialiseState (Database& db, const PegRegistry& registry);

  /**
   * Handles the actual logic for the game-state update.  This is extracted
   * here out of UpdateState, so that it can be accessed from unit tests
   * independently of SQLiteGame.
   */
  static void UpdateState (Database& db, const Context& ctx,
                           const Json::Value& blockData);

  /**
   * Performs validations on the current database state.  This is used
   * when compiled with ENABLE_SLOW_ASSERTS after each block update, and
   * CHECK-fails if an inconsistency is found.
   */
  static void ValidateStateSlow (Database& db, const Context& ctx);

  friend class TesLogicTests;
  friend class SQLiteGameDatabase;

protected:

  void SetupSchema (xaya::SQLiteDatabase& db) override;

  void GetInitialStateBlock (unsigned& height,
                             std::string& hashHex) const override;
  void InitialiseState (xaya::SQLiteDatabase& db) override;

  void UpdateState (xaya::SQLiteDatabase& db,
                    const Json::Value& blockData) override;

  Json::Value GetStateAsJson (const xaya::SQLiteDatabase& db) override;

public:

  TesLogic () = default;

  TesLogic (const TesLogic&) = delete;
  void operator= (const TesLogic&) = delete;

};

} // namespace tes

#endif // TES_LOGIC_HPP
