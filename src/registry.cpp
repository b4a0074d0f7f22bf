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

#include "private/registry.hpp"

#include "errors.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <sstream>

namespace barter
{

AssetId
AssetRegistry::Issue (const Principal& caller, const Principal& owner,
                      const std::string& data)
{
  if (!IsValidPrincipal (caller))
    throw LedgerError (LedgerError::Kind::UNAUTHORIZED,
                       "invalid caller for issue");
  if (!IsValidPrincipal (owner))
    throw LedgerError (LedgerError::Kind::INVALID_ARGUMENT,
                       "invalid owner for issue");

  EventQueue events;
  AssetId id;
  state.AccessState ([&] (proto::LedgerState& s)
    {
      id = s.next_asset_id ();
      s.set_next_asset_id (id + 1);

      auto& a = (*s.mutable_assets ())[id];
      a.set_owner (owner);
      a.set_emitter (caller);
      a.set_data (data);

      auto& idx = MutableIndex (s, owner);
      idx.set_asset_count (idx.asset_count () + 1);

      VLOG (1)
          << "Issued asset " << id << " by " << caller << " to " << owner;
      events.AddIssuance (id, a);
    }, events, observer);
  return id;
}

void
AssetRegistry::Retract (const Principal& caller, const AssetId id)
{
  EventQueue events;
  state.AccessState ([&] (proto::LedgerState& s)
    {
      const auto mit = s.assets ().find (id);
      if (mit == s.assets ().end () || mit->second.emitter () != caller)
        {
          LOG (WARNING)
              << caller << " is not the emitter of asset " << id
              << ", cannot retract";
          std::ostringstream msg;
          msg << "only the emitter can retract asset " << id;
          throw LedgerError (LedgerError::Kind::UNAUTHORIZED, msg.str ());
        }

      auto& idx = MutableIndex (s, mit->second.owner ());
      CHECK_GT (idx.asset_count (), 0)
          << "Asset count underflow for " << mit->second.owner ();
      idx.set_asset_count (idx.asset_count () - 1);

      VLOG (1)
          << "Retracted asset " << id << " owned by " << mit->second.owner ();
      s.mutable_assets ()->erase (id);
      events.AddRetraction (id);
    }, events, observer);
}

void
AssetRegistry::Transfer (proto::LedgerState& s, const AssetId id,
                         const Principal& newOwner, EventQueue& events)
{
  CHECK (IsValidPrincipal (newOwner));

  auto mit = s.mutable_assets ()->find (id);
  CHECK (mit != s.mutable_assets ()->end ())
      << "Transferring non-existing asset " << id;

  const Principal oldOwner = mit->second.owner ();
  auto& oldIdx = MutableIndex (s, oldOwner);
  CHECK_GT (oldIdx.asset_count (), 0)
      << "Asset count underflow for " << oldOwner;
  oldIdx.set_asset_count (oldIdx.asset_count () - 1);

  auto& newIdx = MutableIndex (s, newOwner);
  newIdx.set_asset_count (newIdx.asset_count () + 1);

  VLOG (1)
      << "Moving asset " << id << " from " << oldOwner << " to " << newOwner;
  events.AddOwnershipMove (id, oldOwner, newOwner);
  mit->second.set_owner (newOwner);
}

bool
AssetRegistry::Get (const AssetId id, proto::Asset& out) const
{
  bool found = false;
  out.Clear ();

  state.ReadState ([id, &out, &found] (const proto::LedgerState& s)
    {
      const auto mit = s.assets ().find (id);
      if (mit == s.assets ().end ())
        return;

      out = mit->second;
      found = true;
    });

  return found;
}

std::vector<AssetId>
AssetRegistry::GetInventory (const Principal& owner) const
{
  std::vector<AssetId> res;
  state.ReadState ([&owner, &res] (const proto::LedgerState& s)
    {
      /* The proto map is not ordered, so we sort afterwards.  */
      for (const auto& entry : s.assets ())
        if (entry.second.owner () == owner)
          res.push_back (entry.first);
    });

  std::sort (res.begin (), res.end ());
  return res;
}

int64_t
AssetRegistry::GetAssetCount (const Principal& owner) const
{
  int64_t res = 0;
  state.ReadState ([&owner, &res] (const proto::LedgerState& s)
    {
      const auto* idx = FindIndex (s, owner);
      if (idx != nullptr)
        res = idx->asset_count ();
    });

  return res;
}

} // namespace barter
