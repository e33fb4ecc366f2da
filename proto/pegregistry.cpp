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

#include "pegregistry.hpp"

#include "database/amount.hpp"

#include <google/protobuf/text_format.h>

#include <glog/logging.h>

#include <algorithm>
#include <mutex>

namespace tes
{

/* Hard-coded text protos with the chain configurations (in configdata.cpp).  */
extern const char* const CONFIG_PROTO_TEXT;
extern const char* const CONFIG_PROTO_TEXT_TESTNET;
extern const char* const CONFIG_PROTO_TEXT_REGTEST;

/* ************************************************************************** */

namespace
{

/** Lock for constructing and accessing the global singletons.  */
std::mutex mutInstances;

} // anonymous namespace

/**
 * Data for the instance of the proto with the sorted list of currencies.
 */
class PegRegistry::Data
{

public:

  /** The protocol buffer instance itself.  */
  proto::ConfigData proto;

  /** The currency ids in ascending order.  */
  std::vector<std::string> currencyIds;

  explicit Data (const proto::ConfigData& pb)
    : proto(pb)
  {
    CHECK (IsValidConfigData (proto)) << "Configuration data is invalid";

    for (const auto& entry : proto.currencies ())
      currencyIds.push_back (entry.first);
    std::sort (currencyIds.begin (), currencyIds.end ());
  }

  Data () = delete;
  Data (const Data&) = delete;
  void operator= (const Data&) = delete;

};

PegRegistry::Data* PegRegistry::mainnet = nullptr;
PegRegistry::Data* PegRegistry::testnet = nullptr;
PegRegistry::Data* PegRegistry::regtest = nullptr;

namespace
{

/**
 * Merges a chain-specific overlay onto the base configuration.  Repeated
 * params are replaced rather than appended if the overlay sets them.
 */
void
MergeOverlay (proto::ConfigData& pb, const proto::ConfigData& overlay)
{
  auto* params = pb.mutable_params ();
  if (overlay.params ().oracle_feeders_size () > 0)
    params->clear_oracle_feeders ();
  if (overlay.params ().market_makers_size () > 0)
    params->clear_market_makers ();

  pb.MergeFrom (overlay);
}

/**
 * Parses the hard-coded configuration for the given chain.
 */
proto::ConfigData
ParseChainConfig (const xaya::Chain chain)
{
  bool mergeTestnet, mergeRegtest;
  switch (chain)
    {
    case xaya::Chain::MAIN:
      mergeTestnet = false;
      mergeRegtest = false;
      break;
    case xaya::Chain::TEST:
      mergeTestnet = true;
      mergeRegtest = false;
      break;
    case xaya::Chain::REGTEST:
      mergeTestnet = true;
      mergeRegtest = true;
      break;
    default:
      LOG (FATAL) << "Unexpected chain: " << static_cast<int> (chain);
    }

  using google::protobuf::TextFormat;

  proto::ConfigData pb;
  CHECK (TextFormat::ParseFromString (CONFIG_PROTO_TEXT, &pb));

  proto::ConfigData testnetMerge;
  CHECK (TextFormat::ParseFromString (CONFIG_PROTO_TEXT_TESTNET,
                                      &testnetMerge));
  proto::ConfigData regtestMerge;
  CHECK (TextFormat::ParseFromString (CONFIG_PROTO_TEXT_REGTEST,
                                      &regtestMerge));

  if (mergeTestnet)
    MergeOverlay (pb, testnetMerge);
  if (mergeRegtest)
    MergeOverlay (pb, regtestMerge);

  return pb;
}

} // anonymous namespace

PegRegistry::PegRegistry (const xaya::Chain chain)
{
  std::lock_guard<std::mutex> lock(mutInstances);

  Data** instancePtr = nullptr;
  switch (chain)
    {
    case xaya::Chain::MAIN:
      instancePtr = &mainnet;
      break;
    case xaya::Chain::TEST:
      instancePtr = &testnet;
      break;
    case xaya::Chain::REGTEST:
      instancePtr = &regtest;
      break;
    default:
      LOG (FATAL) << "Unexpected chain: " << static_cast<int> (chain);
    }
  CHECK (instancePtr != nullptr);

  if (*instancePtr == nullptr)
    {
      LOG (INFO) << "Initialising hard-coded ConfigData proto instance...";
      *instancePtr = new Data (ParseChainConfig (chain));
    }

  data = *instancePtr;
  CHECK (data != nullptr);
}

PegRegistry::PegRegistry (const proto::ConfigData& pb)
  : owned(new Data (pb))
{
  data = owned.get ();
}

PegRegistry::~PegRegistry () = default;

const proto::ConfigData&
PegRegistry::operator* () const
{
  return data->proto;
}

const proto::ConfigData*
PegRegistry::operator-> () const
{
  return &(operator* ());
}

const std::vector<std::string>&
PegRegistry::CurrencyIds () const
{
  return data->currencyIds;
}

const proto::CurrencyConfig*
PegRegistry::CurrencyOrNull (const std::string& id) const
{
  const auto& currencies = data->proto.currencies ();
  const auto mit = currencies.find (id);
  if (mit == currencies.end ())
    return nullptr;

  return &mit->second;
}

const proto::CurrencyConfig&
PegRegistry::Currency (const std::string& id) const
{
  const auto* ptr = CurrencyOrNull (id);
  CHECK (ptr != nullptr) << "Unknown currency: " << id;
  return *ptr;
}

bool
PegRegistry::IsOracleFeeder (const std::string& name) const
{
  const auto& feeders = data->proto.params ().oracle_feeders ();
  return std::find (feeders.begin (), feeders.end (), name) != feeders.end ();
}

bool
PegRegistry::IsMarketMaker (const std::string& name) const
{
  const auto& makers = data->proto.params ().market_makers ();
  return std::find (makers.begin (), makers.end (), name) != makers.end ();
}

/* ************************************************************************** */

bool
IsValidCurrencyConfig (const std::string& id, const proto::CurrencyConfig& cfg)
{
  if (id.empty ())
    {
      LOG (WARNING) << "Empty currency id";
      return false;
    }

  if (cfg.base_unit () <= 0 || cfg.peg_price () <= 0)
    {
      LOG (WARNING)
          << "Currency " << id << " has non-positive base unit or peg:\n"
          << cfg.DebugString ();
      return false;
    }

  if (cfg.tolerance_ppb () < 0 || cfg.minimum_floor () < 0)
    {
      LOG (WARNING)
          << "Currency " << id << " has negative tolerance or floor:\n"
          << cfg.DebugString ();
      return false;
    }

  if (cfg.max_change_cap () <= 0 || cfg.frequency () == 0)
    {
      LOG (WARNING)
          << "Currency " << id << " has no change cap or frequency:\n"
          << cfg.DebugString ();
      return false;
    }

  if (cfg.minimum_floor () > cfg.initial_supply ()
        || cfg.initial_supply () > cfg.maximum_supply ()
        || cfg.maximum_supply () > MAX_AMOUNT)
    {
      LOG (WARNING)
          << "Currency " << id << " has inconsistent supply bounds:\n"
          << cfg.DebugString ();
      return false;
    }

  return true;
}

bool
IsValidConfigData (const proto::ConfigData& pb)
{
  for (const auto& entry : pb.currencies ())
    if (!IsValidCurrencyConfig (entry.first, entry.second))
      return false;

  return true;
}

/* ************************************************************************** */

} // namespace tes
