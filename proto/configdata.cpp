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

/* Hard-coded configuration of the elastic currencies per chain.  */

namespace tes
{

extern const char* const CONFIG_PROTO_TEXT;
extern const char* const CONFIG_PROTO_TEXT_TESTNET;
extern const char* const CONFIG_PROTO_TEXT_REGTEST;

/* Prices are in the base unit of each currency (SETT uses four decimals,
   JUSD three), so a peg equal to the base unit is a peg of 1.00.  */

const char* const CONFIG_PROTO_TEXT = R"(
  currencies:
    {
      key: "JUSD"
      value:
        {
          base_unit: 1000
          peg_price: 1000
          tolerance_ppb: 20000000
          max_change_cap: 20000
          minimum_floor: 100000
          maximum_supply: 1000000000000000
          frequency: 60
          initial_supply: 400000
        }
    }
  currencies:
    {
      key: "SETT"
      value:
        {
          base_unit: 10000
          peg_price: 10000
          tolerance_ppb: 20000000
          max_change_cap: 200000
          minimum_floor: 1000000
          maximum_supply: 1000000000000000
          frequency: 60
          initial_supply: 4000000
        }
    }

  params:
    {
      staleness_limit: 30
      oracle_feeders: "serp-oracle"
      market_makers: "serp-market"
    }
)";

const char* const CONFIG_PROTO_TEXT_TESTNET = R"(
  params:
    {
      oracle_feeders: "serp-oracle"
      oracle_feeders: "serp-oracle-test"
      market_makers: "serp-market"
      market_makers: "serp-market-test"
    }
)";

const char* const CONFIG_PROTO_TEXT_REGTEST = R"(
  currencies:
    {
      key: "JUSD"
      value:
        {
          base_unit: 1000
          peg_price: 1000
          tolerance_ppb: 20000000
          max_change_cap: 20000
          minimum_floor: 100000
          maximum_supply: 1000000000
          frequency: 10
          initial_supply: 400000
        }
    }
  currencies:
    {
      key: "SETT"
      value:
        {
          base_unit: 10000
          peg_price: 10000
          tolerance_ppb: 20000000
          max_change_cap: 200000
          minimum_floor: 1000000
          maximum_supply: 10000000000
          frequency: 10
          initial_supply: 4000000
        }
    }

  params:
    {
      staleness_limit: 5
      oracle_feeders: "oracle"
      market_makers: "market"
    }
)";

} // namespace tes
