/*
    Barter - asset ledger with atomic trade offers
    Copyright (C) 2020-2021  Autonomous Worlds Ltd

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

#ifndef BARTER_REGISTRY_HPP
#define BARTER_REGISTRY_HPP

#include "observer.hpp"
#include "private/events.hpp"
#include "private/state.hpp"
#include "proto/ledger.pb.h"
#include "types.hpp"

#include <string>
#include <vector>

namespace barter
{

class TradeOffers;

/**
 * The registry of all assets and their owners.  Anyone can issue new
 * assets (and becomes their emitter), and only the emitter can retract
 * an asset again.  Ownership of assets changes only through settlement
 * of trade offers.
 */
class AssetRegistry
{

private:

  /** The global state holding the asset table.  */
  State& state;

  /** Observer that gets notified about changes.  */
  LedgerObserver& observer;

  /**
   * Moves ownership of an asset to a new owner, updating the per-principal
   * counts accordingly.  This does not check anything about the current
   * owner; that is up to the caller, which must also already hold the
   * state lock (hence it works on the raw proto).  The asset must exist.
   */
  static void Transfer (proto::LedgerState& s, AssetId id,
                        const Principal& newOwner, EventQueue& events);

  friend class TradeOffers;

public:

  explicit AssetRegistry (State& s, LedgerObserver& o)
    : state(s), observer(o)
  {}

  AssetRegistry () = delete;
  AssetRegistry (const AssetRegistry&) = delete;
  void operator= (const AssetRegistry&) = delete;

  /**
   * Issues a new asset with the given data to the owner.  The caller
   * becomes the emitter.  Returns the new asset's ID.
   */
  AssetId Issue (const Principal& caller, const Principal& owner,
                 const std::string& data);

  /**
   * Retracts (burns) an asset.  This is only allowed for the emitter,
   * and throws an UNAUTHORIZED error for everyone else (which includes
   * the case of non-existing assets).
   */
  void Retract (const Principal& caller, AssetId id);

  /**
   * Looks up an asset.  Returns false if it does not exist (never issued
   * or retracted), and otherwise fills in the output.
   */
  bool Get (AssetId id, proto::Asset& out) const;

  /**
   * Returns the IDs of all assets currently owned by the given principal,
   * in ascending order.
   */
  std::vector<AssetId> GetInventory (const Principal& owner) const;

  /**
   * Returns the number of assets owned by the given principal.
   */
  int64_t GetAssetCount (const Principal& owner) const;

};

} // namespace barter

#endif // BARTER_REGISTRY_HPP
