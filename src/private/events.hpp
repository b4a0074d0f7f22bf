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

#ifndef BARTER_EVENTS_HPP
#define BARTER_EVENTS_HPP

#include "observer.hpp"
#include "proto/ledger.pb.h"
#include "types.hpp"

#include <vector>

namespace barter
{

/**
 * Collects the events produced by a single ledger operation.  They are
 * queued up while the state is locked, and only passed on to the observer
 * once the operation has completed successfully.
 */
class EventQueue
{

private:

  /** The queued events.  */
  std::vector<proto::LedgerEvent> events;

public:

  EventQueue () = default;

  EventQueue (const EventQueue&) = delete;
  void operator= (const EventQueue&) = delete;

  void AddIssuance (AssetId id, const proto::Asset& a);
  void AddRetraction (AssetId id);
  void AddOwnershipMove (AssetId id, const Principal& from,
                         const Principal& to);
  void AddOfferCreated (OfferId id, const proto::TradeOffer& o);
  void AddOfferStateChanged (OfferId id, proto::TradeOffer::State s);

  /**
   * Passes all queued events to the observer and clears the queue.
   */
  void Dispatch (LedgerObserver& observer);

};

} // namespace barter

#endif // BARTER_EVENTS_HPP
