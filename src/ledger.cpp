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

#include "ledger.hpp"

#include "private/offers.hpp"
#include "private/registry.hpp"
#include "private/state.hpp"

#include <glog/logging.h>

namespace barter
{

/**
 * Actual implementation of the Ledger, which just combines the
 * different pieces.
 */
class Ledger::Impl
{

private:

  /** Observer used if none is passed in.  */
  LoggingObserver defaultObserver;

  /** The internal "global" state with thread-safe access.  */
  State state;

  /** The registry of assets.  */
  AssetRegistry registry;

  /** The trade offers.  */
  TradeOffers offers;

  friend class Ledger;

public:

  Impl ()
    : registry(state, defaultObserver), offers(state, defaultObserver)
  {}

  explicit Impl (LedgerObserver& o)
    : registry(state, o), offers(state, o)
  {}

  Impl (const Impl&) = delete;
  void operator= (const Impl&) = delete;

};

Ledger::Ledger ()
  : impl(std::make_unique<Impl> ())
{}

Ledger::Ledger (LedgerObserver& o)
  : impl(std::make_unique<Impl> (o))
{}

Ledger::~Ledger () = default;

AssetId
Ledger::Issue (const Principal& caller, const Principal& owner,
               const std::string& data)
{
  return impl->registry.Issue (caller, owner, data);
}

void
Ledger::Retract (const Principal& caller, const AssetId id)
{
  impl->registry.Retract (caller, id);
}

bool
Ledger::GetAsset (const AssetId id, proto::Asset& out) const
{
  return impl->registry.Get (id, out);
}

std::vector<AssetId>
Ledger::GetInventory (const Principal& owner) const
{
  return impl->registry.GetInventory (owner);
}

int64_t
Ledger::GetAssetCount (const Principal& owner) const
{
  return impl->registry.GetAssetCount (owner);
}

OfferId
Ledger::CreateOffer (const Principal& caller, const Principal& recipient,
                     const std::vector<AssetId>& mine,
                     const std::vector<AssetId>& theirs)
{
  return impl->offers.Create (caller, recipient, mine, theirs);
}

void
Ledger::CancelOffer (const Principal& caller, const OfferId id)
{
  impl->offers.Cancel (caller, id);
}

void
Ledger::DeclineOffer (const Principal& caller, const OfferId id)
{
  impl->offers.Decline (caller, id);
}

void
Ledger::AcceptOffer (const Principal& caller, const OfferId id)
{
  impl->offers.Accept (caller, id);
}

bool
Ledger::GetOffer (const OfferId id, proto::TradeOffer& out) const
{
  return impl->offers.Get (id, out);
}

std::vector<OfferId>
Ledger::GetSentOffers (const Principal& sender) const
{
  return impl->offers.GetSent (sender);
}

std::vector<OfferId>
Ledger::GetReceivedOffers (const Principal& recipient) const
{
  return impl->offers.GetReceived (recipient);
}

std::vector<OfferId>
Ledger::GetPublicOffers () const
{
  return impl->offers.GetPublic ();
}

bool
Ledger::SaveSnapshot (const std::string& path) const
{
  return impl->state.SaveToFile (path);
}

bool
Ledger::LoadSnapshot (const std::string& path)
{
  return impl->state.LoadFromFile (path);
}

} // namespace barter
