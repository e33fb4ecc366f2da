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

#ifndef TES_CONTEXT_HPP
#define TES_CONTEXT_HPP

#include "proto/pegregistry.hpp"

#include <xayagame/gamelogic.hpp>

#include <memory>

namespace tes
{

/**
 * Basic, read-only contextual data about the current block and the chain state
 * in general.  The data is immutable, except if using the ContextForTesting
 * subclass in unit tests.
 */
class Context
{

private:

  /** The chain we are on.  */
  xaya::Chain chain;

  /**
   * The peg registry dependant on the chain.  This is a pointer so that
   * we can replace it with custom data in tests.
   */
  std::unique_ptr<PegRegistry> registry;

  /** The current block's height.  */
  unsigned height;

  /**
   * Constructs an empty instance without setting any stuff yet.  This is
   * used with ContextForTesting.
   */
  explicit Context (xaya::Chain c);

  friend class ContextForTesting;

public:

  /** Value for height if there is no height set (and shouldn't be used).  */
  static constexpr unsigned NO_HEIGHT = static_cast<unsigned> (-1);

  /**
   * Constructs an instance based on the given data.
   */
  explicit Context (xaya::Chain c, unsigned h);

  Context () = delete;
  Context (const Context&) = delete;
  void operator= (const Context&) = delete;

  xaya::Chain
  Chain () const
  {
    return chain;
  }

  const PegRegistry&
  Registry () const
  {
    return *registry;
  }

  bool
  HasHeight () const
  {
    return height != NO_HEIGHT;
  }

  /**
   * Returns the context's block height.  Must not be used if NO_HEIGHT was
   * passed to the constructor.
   */
  unsigned Height () const;

};

} // namespace tes

#endif // TES_CONTEXT_HPP
