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

#ifndef PROTO_PEGREGISTRY_HPP
#define PROTO_PEGREGISTRY_HPP

#include "proto/config.pb.h"

#include <xayagame/gamelogic.hpp>

#include <memory>
#include <string>
#include <vector>

namespace tes
{

/**
 * A light wrapper class around the read-only ConfigData proto, which holds
 * the pegs and elasticity parameters of all currencies.  It allows access to
 * the proto data itself as well as provides helper methods for looking up
 * currencies in a well-defined order.
 */
class PegRegistry
{

private:

  class Data;

  /**
   * A reference to the instance that actually holds the data wrapped
   * by this registry.  For the chain configurations, this is a global
   * singleton that is never destructed.
   */
  const Data* data;

  /** Owned data, for instances constructed from a custom proto.  */
  std::unique_ptr<const Data> owned;

  /**
   * The global singleton data instance for mainnet or null when it is not yet
   * initialised.  This is never destructed.
   */
  static Data* mainnet;

  /** The singleton instance for testnet.  */
  static Data* testnet;

  /** The singleton instance for regtest.  */
  static Data* regtest;

public:

  /**
   * Constructs a fresh instance of the wrapper class for the hard-coded
   * configuration of the given chain.
   *
   * On the first call, this will also instantiate and set up the underlying
   * singleton instance with the real data.
   */
  explicit PegRegistry (xaya::Chain chain);

  /**
   * Constructs an instance wrapping a custom configuration.  This is mainly
   * useful for tests.  The data must be valid.
   */
  explicit PegRegistry (const proto::ConfigData& pb);

  ~PegRegistry ();

  PegRegistry (const PegRegistry&) = delete;
  void operator= (const PegRegistry&) = delete;

  /**
   * Exposes the actual protocol buffer.
   */
  const proto::ConfigData& operator* () const;

  /**
   * Exposes the actual protocol buffer's fields directly.
   */
  const proto::ConfigData* operator-> () const;

  /**
   * Returns the ids of all currencies in ascending order.  This is the
   * order in which they are evaluated.
   */
  const std::vector<std::string>& CurrencyIds () const;

  /**
   * Looks up a currency's configuration.  Returns null if there is no
   * such currency.
   */
  const proto::CurrencyConfig* CurrencyOrNull (const std::string& id) const;

  /**
   * Looks up a currency's configuration, asserting that it exists.
   */
  const proto::CurrencyConfig& Currency (const std::string& id) const;

  /**
   * Returns true if the given account may submit price quotes.
   */
  bool IsOracleFeeder (const std::string& name) const;

  /**
   * Returns true if the given account may offer buy-back liquidity.
   */
  bool IsMarketMaker (const std::string& name) const;

};

/**
 * Checks a currency configuration for consistency (positive peg and base
 * unit, non-negative tolerance and floor, floor <= initial <= maximum
 * supply, ...).  Problems are logged and false is returned.
 */
bool IsValidCurrencyConfig (const std::string& id,
                            const proto::CurrencyConfig& cfg);

/**
 * Checks a full configuration (all currencies and the params).
 */
bool IsValidConfigData (const proto::ConfigData& pb);

} // namespace tes

#endif // PROTO_PEGREGISTRY_HPP
