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

#ifndef BARTER_LEDGER_HPP
#define BARTER_LEDGER_HPP

#include "errors.hpp"
#include "observer.hpp"
#include "proto/ledger.pb.h"
#include "types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace barter
{

/**
 * The main class of a Barter ledger.  It holds the asset registry and the
 * trade offers together with their shared state, and exposes all
 * operations that callers can perform.
 *
 * The calling principal is passed explicitly to all operations that need
 * it.  It is up to the hosting environment to make sure it is authentic.
 * Rejected operations throw a LedgerError and have no effect.
 *
 * All methods are thread-safe.  Each operation is executed atomically with
 * respect to all others.
 */
class Ledger
{

private:

  class Impl;

  /**
   * The actual implementation, whose definition is hidden in the .cpp
   * file to decouple the public interface from internal stuff.
   */
  std::unique_ptr<Impl> impl;

public:

  /**
   * Constructs an empty ledger that just logs its events.
   */
  Ledger ();

  /**
   * Constructs an empty ledger that notifies the given observer about
   * all changes.
   */
  explicit Ledger (LedgerObserver& o);

  ~Ledger ();

  Ledger (const Ledger&) = delete;
  void operator= (const Ledger&) = delete;

  /**
   * Issues a new asset to the given owner, with the caller as emitter.
   */
  AssetId Issue (const Principal& caller, const Principal& owner,
                 const std::string& data);

  /**
   * Retracts an asset, which is only possible for its emitter.
   */
  void Retract (const Principal& caller, AssetId id);

  /**
   * Looks up an asset.  Returns false if it does not exist.
   */
  bool GetAsset (AssetId id, proto::Asset& out) const;

  /**
   * Returns all assets owned by a principal (in ascending order).
   */
  std::vector<AssetId> GetInventory (const Principal& owner) const;

  /**
   * Returns the number of assets owned by a principal.
   */
  int64_t GetAssetCount (const Principal& owner) const;

  /**
   * Creates a new trade offer from the caller.  The recipient can be
   * PUBLIC_RECIPIENT to make the offer available to everyone.
   */
  OfferId CreateOffer (const Principal& caller, const Principal& recipient,
                       const std::vector<AssetId>& mine,
                       const std::vector<AssetId>& theirs);

  void CancelOffer (const Principal& caller, OfferId id);
  void DeclineOffer (const Principal& caller, OfferId id);
  void AcceptOffer (const Principal& caller, OfferId id);

  /**
   * Looks up an offer.  Returns false if it does not exist.
   */
  bool GetOffer (OfferId id, proto::TradeOffer& out) const;

  std::vector<OfferId> GetSentOffers (const Principal& sender) const;
  std::vector<OfferId> GetReceivedOffers (const Principal& recipient) const;
  std::vector<OfferId> GetPublicOffers () const;

  /**
   * Writes the full ledger state to a file.  Returns false on failure.
   */
  bool SaveSnapshot (const std::string& path) const;

  /**
   * Replaces the ledger state with one from a snapshot file.  Returns false
   * (and keeps the current state) if the file cannot be used.
   */
  bool LoadSnapshot (const std::string& path);

};

} // namespace barter

#endif // BARTER_LEDGER_HPP
