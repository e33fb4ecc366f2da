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

#include "schema.hpp"

#include "dbtest.hpp"

#include <gtest/gtest.h>

namespace tes
{
namespace
{

using SchemaTests = DBTestFixture;

struct CountResult : public Database::ResultType
{
  RESULT_COLUMN (int64_t, cnt, 1);
};

TEST_F (SchemaTests, Works)
{
  SetupDatabaseSchema (db.GetHandle ());
}

TEST_F (SchemaTests, TwiceIsOk)
{
  SetupDatabaseSchema (db.GetHandle ());
  SetupDatabaseSchema (db.GetHandle ());
}

TEST_F (SchemaTests, AllTablesPresent)
{
  SetupDatabaseSchema (db.GetHandle ());

  for (const std::string tbl : {"currency_supply", "price_quotes",
                                "market_pool", "currency_state",
                                "elasticity_log"})
    {
      auto stmt = db.Prepare ("SELECT COUNT(*) AS `cnt` FROM `" + tbl + "`");
      auto res = stmt.Query<CountResult> ();
      ASSERT_TRUE (res.Step ()) << tbl;
      EXPECT_EQ (res.Get<CountResult::cnt> (), 0) << tbl;
    }
}

} // anonymous namespace
} // namespace tes
