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

#include "private/events.hpp"

#include <glog/logging.h>

namespace barter
{

void
LoggingObserver::Notify (const proto::LedgerEvent& ev)
{
  VLOG (1) << "Ledger event:\n" << ev.DebugString ();
}

void
EventQueue::AddIssuance (const AssetId id, const proto::Asset& a)
{
  proto::LedgerEvent ev;
  auto& data = *ev.mutable_issuance ();
  data.set_asset_id (id);
  data.set_owner (a.owner ());
  data.set_emitter (a.emitter ());
  data.set_data (a.data ());
  events.push_back (std::move (ev));
}

void
EventQueue::AddRetraction (const AssetId id)
{
  proto::LedgerEvent ev;
  ev.mutable_retraction ()->set_asset_id (id);
  events.push_back (std::move (ev));
}

void
EventQueue::AddOwnershipMove (const AssetId id, const Principal& from,
                              const Principal& to)
{
  proto::LedgerEvent ev;
  auto& data = *ev.mutable_ownership_move ();
  data.set_asset_id (id);
  data.set_previous_owner (from);
  data.set_new_owner (to);
  events.push_back (std::move (ev));
}

void
EventQueue::AddOfferCreated (const OfferId id, const proto::TradeOffer& o)
{
  proto::LedgerEvent ev;
  auto& data = *ev.mutable_offer_created ();
  data.set_offer_id (id);
  data.set_sender (o.sender ());
  if (o.has_recipient ())
    data.set_recipient (o.recipient ());
  *data.mutable_my_assets () = o.my_assets ();
  *data.mutable_their_assets () = o.their_assets ();
  events.push_back (std::move (ev));
}

void
EventQueue::AddOfferStateChanged (const OfferId id,
                                  const proto::TradeOffer::State s)
{
  proto::LedgerEvent ev;
  auto& data = *ev.mutable_offer_state_changed ();
  data.set_offer_id (id);
  data.set_new_state (s);
  events.push_back (std::move (ev));
}

void
EventQueue::Dispatch (LedgerObserver& observer)
{
  std::vector<proto::LedgerEvent> toSend;
  toSend.swap (events);

  for (const auto& ev : toSend)
    observer.Notify (ev);
}

} // namespace barter
