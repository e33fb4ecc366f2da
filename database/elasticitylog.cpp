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

#include "elasticitylog.hpp"

#include <glog/logging.h>

#include <algorithm>

namespace tes
{

namespace
{

struct ElasticityLogResult : public Database::ResultType
{
  RESULT_COLUMN (int64_t, id, 1);
  RESULT_COLUMN (std::string, currency, 2);
  RESULT_COLUMN (int64_t, period, 3);
  RESULT_COLUMN (int64_t, height, 4);
  RESULT_COLUMN (proto::ElasticityRecord, proto, 5);
};

/**
 * Extracts all protos from a result set.
 */
std::vector<proto::ElasticityRecord>
ExtractAll (Database::Result<ElasticityLogResult>& res)
{
  std::vector<proto::ElasticityRecord> out;
  while (res.Step ())
    out.push_back (res.GetProto<ElasticityLogResult::proto> ());
  return out;
}

} // anonymous namespace

void
ElasticityLog::Append (const proto::ElasticityRecord& rec)
{
  CHECK (rec.has_currency ());
  CHECK (rec.has_period ());
  CHECK (rec.has_height ());

  auto stmt = db.Prepare (R"(
    INSERT INTO `elasticity_log`
      (`id`, `currency`, `period`, `height`, `proto`)
      VALUES (?1, ?2, ?3, ?4, ?5)
  )");
  stmt.Bind<int64_t> (1, db.GetLogId ());
  stmt.Bind (2, rec.currency ());
  stmt.Bind<int64_t> (3, rec.period ());
  stmt.Bind<int64_t> (4, rec.height ());
  stmt.BindProto (5, rec);
  stmt.Execute ();
}

std::vector<proto::ElasticityRecord>
ElasticityLog::GetForCurrency (const std::string& currency)
{
  auto stmt = db.Prepare (R"(
    SELECT *
      FROM `elasticity_log`
      WHERE `currency` = ?1
      ORDER BY `period`, `id`
  )");
  stmt.Bind (1, currency);

  auto res = stmt.Query<ElasticityLogResult> ();
  return ExtractAll (res);
}

std::vector<proto::ElasticityRecord>
ElasticityLog::GetLatest (const unsigned limit)
{
  auto stmt = db.Prepare (R"(
    SELECT *
      FROM `elasticity_log`
      ORDER BY `height` DESC, `id` DESC
      LIMIT ?1
  )");
  stmt.Bind<int64_t> (1, limit);

  auto res = stmt.Query<ElasticityLogResult> ();
  auto out = ExtractAll (res);
  std::reverse (out.begin (), out.end ());

  return out;
}

} // namespace tes
