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

#ifndef BARTER_OFFERS_HPP
#define BARTER_OFFERS_HPP

#include "observer.hpp"
#include "private/events.hpp"
#include "private/state.hpp"
#include "proto/ledger.pb.h"
#include "types.hpp"

#include <vector>

namespace barter
{

/**
 * The engine handling trade offers between principals.  Offers are created
 * without any checks on the assets they reference, and only on acceptance
 * is it verified that both sides actually hold what they give.  Then all
 * assets are swapped at once.
 *
 * Offers do not lock the assets they reference.  The same asset may be part
 * of many pending offers, and whichever is accepted first gets it; later
 * acceptances will then fail their ownership check.
 */
class TradeOffers
{

private:

  /** The global state holding the offer and asset tables.  */
  State& state;

  /** Observer that gets notified about changes.  */
  LedgerObserver& observer;

  /**
   * Looks up an offer for one of the state transitions out of PENDING.
   * This verifies that the offer exists, that the caller is allowed to
   * perform the action (the sender if forSender is true, and the recipient
   * or anyone for public offers otherwise) and that the offer is still
   * pending.  Throws an error if any of the checks fails.
   */
  static proto::TradeOffer& GetPendingOffer (proto::LedgerState& s,
                                             OfferId id,
                                             const Principal& caller,
                                             bool forSender);

  /**
   * Verifies that each of the given assets is currently owned by the
   * expected owner, and throws OWNERSHIP_MISMATCH if not.
   */
  static void CheckOwnership (
      const proto::LedgerState& s,
      const google::protobuf::RepeatedField<uint64_t>& ids,
      const Principal& expectedOwner);

  /**
   * Transfers all the given assets to a new owner.  Assets listed
   * multiple times are only moved once.
   */
  static void TransferAll (
      proto::LedgerState& s,
      const google::protobuf::RepeatedField<uint64_t>& ids,
      const Principal& newOwner, EventQueue& events);

  /**
   * Shared implementation of cancel and decline, which just update the
   * state of the offer after checking it is allowed.
   */
  void Close (const Principal& caller, OfferId id, bool bySender,
              proto::TradeOffer::State newState);

public:

  explicit TradeOffers (State& s, LedgerObserver& o)
    : state(s), observer(o)
  {}

  TradeOffers () = delete;
  TradeOffers (const TradeOffers&) = delete;
  void operator= (const TradeOffers&) = delete;

  /**
   * Creates a new offer from the caller to the recipient (or to anyone if
   * the recipient is PUBLIC_RECIPIENT).  The caller offers the assets in
   * "mine" in exchange for those in "theirs".  Returns the new offer's ID.
   */
  OfferId Create (const Principal& caller, const Principal& recipient,
                  const std::vector<AssetId>& mine,
                  const std::vector<AssetId>& theirs);

  /**
   * Cancels a pending offer.  Only the sender can do this.
   */
  void Cancel (const Principal& caller, OfferId id);

  /**
   * Declines a pending offer.  Only the recipient (or anyone for a public
   * offer) can do this.
   */
  void Decline (const Principal& caller, OfferId id);

  /**
   * Accepts a pending offer and executes the trade.  The caller must be the
   * recipient (or anyone for a public offer).  All assets the sender offers
   * must currently be owned by the sender, and all assets requested must
   * be owned by the caller.  If that is the case, all of them are swapped
   * and the offer is marked as accepted.  Otherwise an OWNERSHIP_MISMATCH
   * error is thrown, and nothing changes at all.
   */
  void Accept (const Principal& caller, OfferId id);

  /**
   * Looks up an offer by ID.  Returns false if it does not exist.
   */
  bool Get (OfferId id, proto::TradeOffer& out) const;

  /**
   * Returns the IDs of offers sent by a principal, in creation order.
   */
  std::vector<OfferId> GetSent (const Principal& sender) const;

  /**
   * Returns the IDs of offers addressed to a principal (not including
   * public offers), in creation order.
   */
  std::vector<OfferId> GetReceived (const Principal& recipient) const;

  /**
   * Returns the IDs of all public offers, in creation order.
   */
  std::vector<OfferId> GetPublic () const;

};

} // namespace barter

#endif // BARTER_OFFERS_HPP
