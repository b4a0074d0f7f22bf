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

#include "private/offers.hpp"

#include "errors.hpp"
#include "private/registry.hpp"

#include <glog/logging.h>

#include <set>
#include <sstream>

namespace barter
{

const Principal PUBLIC_RECIPIENT = "";

namespace
{

/**
 * Converts a list of IDs to the repeated proto field.
 */
void
SetIds (const std::vector<uint64_t>& ids,
        google::protobuf::RepeatedField<uint64_t>& out)
{
  out.Clear ();
  for (const auto id : ids)
    out.Add (id);
}

/**
 * Converts a repeated proto field of IDs to a vector.
 */
std::vector<uint64_t>
GetIds (const google::protobuf::RepeatedField<uint64_t>& ids)
{
  return std::vector<uint64_t> (ids.begin (), ids.end ());
}

} // anonymous namespace

OfferId
TradeOffers::Create (const Principal& caller, const Principal& recipient,
                     const std::vector<AssetId>& mine,
                     const std::vector<AssetId>& theirs)
{
  if (!IsValidPrincipal (caller))
    throw LedgerError (LedgerError::Kind::UNAUTHORIZED,
                       "invalid caller for creating an offer");

  EventQueue events;
  OfferId id;
  state.AccessState ([&] (proto::LedgerState& s)
    {
      id = s.next_offer_id ();
      s.set_next_offer_id (id + 1);

      auto& o = (*s.mutable_offers ())[id];
      o.set_sender (caller);
      SetIds (mine, *o.mutable_my_assets ());
      SetIds (theirs, *o.mutable_their_assets ());
      o.set_state (proto::TradeOffer::PENDING);

      MutableIndex (s, caller).add_sent_offers (id);
      if (recipient == PUBLIC_RECIPIENT)
        s.add_public_offers (id);
      else
        {
          o.set_recipient (recipient);
          MutableIndex (s, recipient).add_received_offers (id);
        }

      VLOG (1) << "Created trade offer " << id << ":\n" << o.DebugString ();
      events.AddOfferCreated (id, o);
    }, events, observer);
  return id;
}

proto::TradeOffer&
TradeOffers::GetPendingOffer (proto::LedgerState& s, const OfferId id,
                              const Principal& caller, const bool forSender)
{
  auto mit = s.mutable_offers ()->find (id);
  if (mit == s.mutable_offers ()->end ())
    {
      std::ostringstream msg;
      msg << "offer " << id << " does not exist";
      throw LedgerError (LedgerError::Kind::NOT_FOUND, msg.str ());
    }
  auto& o = mit->second;

  bool authorised;
  if (!IsValidPrincipal (caller))
    authorised = false;
  else if (forSender)
    authorised = (o.sender () == caller);
  else
    authorised = (!o.has_recipient () || o.recipient () == caller);

  if (!authorised)
    {
      LOG (WARNING)
          << caller << " is not allowed to act on offer " << id
          << ":\n" << o.DebugString ();
      std::ostringstream msg;
      msg << "caller is not the " << (forSender ? "sender" : "recipient")
          << " of offer " << id;
      throw LedgerError (LedgerError::Kind::UNAUTHORIZED, msg.str ());
    }

  if (o.state () != proto::TradeOffer::PENDING)
    {
      LOG (WARNING)
          << "Offer " << id << " is not pending anymore:\n" << o.DebugString ();
      std::ostringstream msg;
      msg << "offer " << id << " is not pending";
      throw LedgerError (LedgerError::Kind::INVALID_STATE, msg.str ());
    }

  return o;
}

void
TradeOffers::Close (const Principal& caller, const OfferId id,
                    const bool bySender,
                    const proto::TradeOffer::State newState)
{
  EventQueue events;
  state.AccessState ([&] (proto::LedgerState& s)
    {
      auto& o = GetPendingOffer (s, id, caller, bySender);
      o.set_state (newState);

      VLOG (1)
          << "Offer " << id << " is now "
          << proto::TradeOffer::State_Name (newState);
      events.AddOfferStateChanged (id, newState);
    }, events, observer);
}

void
TradeOffers::Cancel (const Principal& caller, const OfferId id)
{
  Close (caller, id, true, proto::TradeOffer::CANCELLED);
}

void
TradeOffers::Decline (const Principal& caller, const OfferId id)
{
  Close (caller, id, false, proto::TradeOffer::DECLINED);
}

void
TradeOffers::CheckOwnership (
    const proto::LedgerState& s,
    const google::protobuf::RepeatedField<uint64_t>& ids,
    const Principal& expectedOwner)
{
  for (const auto id : ids)
    {
      const auto mit = s.assets ().find (id);
      if (mit != s.assets ().end () && mit->second.owner () == expectedOwner)
        continue;

      if (mit == s.assets ().end ())
        LOG (WARNING) << "Asset " << id << " in trade does not exist";
      else
        LOG (WARNING)
            << "Asset " << id << " is owned by " << mit->second.owner ()
            << " and not " << expectedOwner;

      std::ostringstream msg;
      msg << "asset " << id << " is not owned by " << expectedOwner;
      throw LedgerError (LedgerError::Kind::OWNERSHIP_MISMATCH, msg.str ());
    }
}

void
TradeOffers::TransferAll (
    proto::LedgerState& s,
    const google::protobuf::RepeatedField<uint64_t>& ids,
    const Principal& newOwner, EventQueue& events)
{
  std::set<AssetId> done;
  for (const auto id : ids)
    if (done.insert (id).second)
      AssetRegistry::Transfer (s, id, newOwner, events);
}

void
TradeOffers::Accept (const Principal& caller, const OfferId id)
{
  EventQueue events;
  state.AccessState ([&] (proto::LedgerState& s)
    {
      auto& o = GetPendingOffer (s, id, caller, false);
      const Principal sender = o.sender ();

      /* All checks are done before anything is changed.  If one of them
         throws, the state is left untouched.  */
      CheckOwnership (s, o.my_assets (), sender);
      CheckOwnership (s, o.their_assets (), caller);

      TransferAll (s, o.my_assets (), caller, events);
      TransferAll (s, o.their_assets (), sender, events);

      o.set_state (proto::TradeOffer::ACCEPTED);
      LOG (INFO)
          << "Offer " << id << " from " << sender
          << " accepted by " << caller;
      events.AddOfferStateChanged (id, proto::TradeOffer::ACCEPTED);
    }, events, observer);
}

bool
TradeOffers::Get (const OfferId id, proto::TradeOffer& out) const
{
  bool found = false;
  out.Clear ();

  state.ReadState ([id, &out, &found] (const proto::LedgerState& s)
    {
      const auto mit = s.offers ().find (id);
      if (mit == s.offers ().end ())
        return;

      out = mit->second;
      found = true;
    });

  return found;
}

std::vector<OfferId>
TradeOffers::GetSent (const Principal& sender) const
{
  std::vector<OfferId> res;
  state.ReadState ([&sender, &res] (const proto::LedgerState& s)
    {
      const auto* idx = FindIndex (s, sender);
      if (idx != nullptr)
        res = GetIds (idx->sent_offers ());
    });

  return res;
}

std::vector<OfferId>
TradeOffers::GetReceived (const Principal& recipient) const
{
  std::vector<OfferId> res;
  state.ReadState ([&recipient, &res] (const proto::LedgerState& s)
    {
      const auto* idx = FindIndex (s, recipient);
      if (idx != nullptr)
        res = GetIds (idx->received_offers ());
    });

  return res;
}

std::vector<OfferId>
TradeOffers::GetPublic () const
{
  std::vector<OfferId> res;
  state.ReadState ([&res] (const proto::LedgerState& s)
    {
      res = GetIds (s.public_offers ());
    });

  return res;
}

} // namespace barter
