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

#ifndef DATABASE_ELASTICITYLOG_HPP
#define DATABASE_ELASTICITYLOG_HPP

#include "database.hpp"

#include "proto/elasticity.pb.h"

#include <string>
#include <vector>

namespace tes
{

/**
 * Database table holding the observability records of all evaluations.
 * The state transition only ever appends to it.
 */
class ElasticityLog
{

private:

  /** The underlying database handle.  */
  Database& db;

public:

  explicit ElasticityLog (Database& d)
    : db(d)
  {}

  ElasticityLog () = delete;
  ElasticityLog (const ElasticityLog&) = delete;
  void operator= (const ElasticityLog&) = delete;

  /**
   * Appends a new record.
   */
  void Append (const proto::ElasticityRecord& rec);

  /**
   * Returns all records for a given currency, ordered by period.
   */
  std::vector<proto::ElasticityRecord> GetForCurrency (
      const std::string& currency);

  /**
   * Returns the records of the latest evaluated blocks, up to the given
   * number of records, ordered from oldest to newest.
   */
  std::vector<proto::ElasticityRecord> GetLatest (unsigned limit);

};

} // namespace tes

#endif // DATABASE_ELASTICITYLOG_HPP
