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

#ifndef DATABASE_PRICEQUOTES_HPP
#define DATABASE_PRICEQUOTES_HPP

#include "amount.hpp"
#include "database.hpp"

#include <string>

namespace tes
{

/**
 * Database table holding the latest price quote of each currency.
 */
class PriceQuotesTable
{

private:

  /** The underlying database handle.  */
  Database& db;

public:

  explicit PriceQuotesTable (Database& d)
    : db(d)
  {}

  PriceQuotesTable () = delete;
  PriceQuotesTable (const PriceQuotesTable&) = delete;
  void operator= (const PriceQuotesTable&) = delete;

  /**
   * Stores a new quote for the currency, replacing the previous one
   * (if any).  Only the latest quote matters.
   */
  void Set (const std::string& currency, Amount price, unsigned height);

  /**
   * Looks up the latest quote of a currency.  Returns false if there
   * is none yet.
   */
  bool Get (const std::string& currency, Amount& price, unsigned& height);

};

} // namespace tes

#endif // DATABASE_PRICEQUOTES_HPP
