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

#ifndef DATABASE_SUPPLY_HPP
#define DATABASE_SUPPLY_HPP

#include "amount.hpp"
#include "database.hpp"

#include <string>

namespace tes
{

/**
 * Wrapper class around the database table holding the authoritative
 * total supply of each currency.
 */
class SupplyTable
{

private:

  /** The underlying database handle.  */
  Database& db;

public:

  explicit SupplyTable (Database& d)
    : db(d)
  {}

  SupplyTable () = delete;
  SupplyTable (const SupplyTable&) = delete;
  void operator= (const SupplyTable&) = delete;

  /**
   * Returns true if there is a supply entry for the given currency.
   */
  bool Exists (const std::string& currency);

  /**
   * Returns the current supply of a currency.  This CHECK-fails if the
   * currency has not been initialised.
   */
  Amount Get (const std::string& currency);

  /**
   * Inserts the initial supply of a currency.  It is an error to call this
   * for a currency that already has an entry.
   */
  void Initialise (const std::string& currency, Amount amount);

  /**
   * Increments the supply of a currency by the given (positive) value.
   */
  void Increment (const std::string& currency, Amount value);

  /**
   * Decrements the supply of a currency by the given (positive) value.
   * The result must not become negative.
   */
  void Decrement (const std::string& currency, Amount value);

};

} // namespace tes

#endif // DATABASE_SUPPLY_HPP
