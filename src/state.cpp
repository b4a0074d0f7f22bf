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

#include "private/state.hpp"

#include <glog/logging.h>

#include <cstdio>
#include <fstream>
#include <map>

namespace barter
{

State::State ()
{
  state.set_next_asset_id (1);
  state.set_next_offer_id (1);
}

void
State::DispatchInTurn (const uint64_t ticket, EventQueue& events,
                       LedgerObserver& observer)
{
  std::unique_lock<std::mutex> lock(mutDispatch);
  cvDispatch.wait (lock, [this, ticket] ()
    {
      return dispatchTurn == ticket;
    });
  lock.unlock ();

  const auto finishTurn = [this] ()
    {
      std::lock_guard<std::mutex> turnLock(mutDispatch);
      ++dispatchTurn;
      cvDispatch.notify_all ();
    };

  try
    {
      events.Dispatch (observer);
    }
  catch (...)
    {
      /* Later operations wait for this turn to finish.  */
      finishTurn ();
      throw;
    }

  finishTurn ();
}

bool
State::SaveToFile (const std::string& path) const
{
  /* The state is written to a temporary file first, which then replaces
     the previous snapshot only if it has been written completely.  */
  const std::string tmpPath = path + ".tmp";

  {
    std::ofstream out(tmpPath, std::ios::binary | std::ios::trunc);
    if (!out)
      {
        LOG (WARNING) << "Could not open " << tmpPath << " for writing";
        return false;
      }

    bool ok;
    {
      std::lock_guard<std::mutex> lock(mut);
      ok = state.SerializeToOstream (&out);
    }
    out.close ();

    if (!ok || out.fail ())
      {
        LOG (WARNING) << "Failed to write state to " << tmpPath;
        std::remove (tmpPath.c_str ());
        return false;
      }
  }

  if (std::rename (tmpPath.c_str (), path.c_str ()) != 0)
    {
      LOG (WARNING) << "Could not move " << tmpPath << " to " << path;
      std::remove (tmpPath.c_str ());
      return false;
    }

  VLOG (1) << "Saved ledger state to " << path;
  return true;
}

bool
State::LoadFromFile (const std::string& path)
{
  std::ifstream in(path, std::ios::binary);
  if (!in)
    {
      LOG (WARNING) << "Could not open " << path << " for reading";
      return false;
    }

  proto::LedgerState loaded;
  if (!loaded.ParseFromIstream (&in))
    {
      LOG (WARNING) << "Failed to parse ledger state from " << path;
      return false;
    }

  if (!IsConsistent (loaded))
    {
      LOG (WARNING) << "Ledger state in " << path << " is inconsistent";
      return false;
    }

  std::lock_guard<std::mutex> lock(mut);
  state.Swap (&loaded);

  LOG (INFO)
      << "Loaded ledger state from " << path << " with "
      << state.assets_size () << " assets and "
      << state.offers_size () << " offers";
  return true;
}

proto::PrincipalIndex&
MutableIndex (proto::LedgerState& s, const Principal& p)
{
  CHECK (IsValidPrincipal (p)) << "Invalid principal for index";
  return (*s.mutable_principals ())[p];
}

const proto::PrincipalIndex*
FindIndex (const proto::LedgerState& s, const Principal& p)
{
  const auto mit = s.principals ().find (p);
  if (mit == s.principals ().end ())
    return nullptr;
  return &mit->second;
}

namespace
{

/**
 * Checks the offers list of one index entry against the offer table.
 * The list must be strictly increasing, and each offer in it must
 * satisfy the given predicate.  The number of entries is returned
 * through the count argument.
 */
template <typename Pred>
  bool
  CheckOfferList (const proto::LedgerState& s,
                  const google::protobuf::RepeatedField<uint64_t>& ids,
                  const Pred& pred, size_t& count)
{
  OfferId last = 0;
  for (const auto id : ids)
    {
      if (id <= last)
        return false;
      last = id;

      const auto mit = s.offers ().find (id);
      if (mit == s.offers ().end () || !pred (mit->second))
        return false;
    }

  count = ids.size ();
  return true;
}

} // anonymous namespace

bool
IsConsistent (const proto::LedgerState& s)
{
  if (s.next_asset_id () < 1 || s.next_offer_id () < 1)
    return false;

  std::map<Principal, int64_t> counts;
  for (const auto& entry : s.assets ())
    {
      if (entry.first == 0 || entry.first >= s.next_asset_id ())
        return false;
      if (!IsValidPrincipal (entry.second.owner ())
            || !IsValidPrincipal (entry.second.emitter ()))
        return false;
      ++counts[entry.second.owner ()];
    }

  std::map<Principal, size_t> sent, received;
  size_t numPublic = 0;
  for (const auto& entry : s.offers ())
    {
      if (entry.first == 0 || entry.first >= s.next_offer_id ())
        return false;
      if (!entry.second.has_state ())
        return false;
      if (!IsValidPrincipal (entry.second.sender ()))
        return false;
      if (entry.second.has_recipient ()
            && !IsValidPrincipal (entry.second.recipient ()))
        return false;
      ++sent[entry.second.sender ()];
      if (entry.second.has_recipient ())
        ++received[entry.second.recipient ()];
      else
        ++numPublic;
    }

  for (const auto& entry : s.principals ())
    {
      const Principal& p = entry.first;
      const auto& idx = entry.second;

      if (!IsValidPrincipal (p))
        return false;

      if (idx.asset_count () != counts[p])
        return false;
      counts.erase (p);

      size_t n;
      if (!CheckOfferList (s, idx.sent_offers (),
                           [&p] (const proto::TradeOffer& o)
                             {
                               return o.sender () == p;
                             }, n)
            || n != sent[p])
        return false;
      sent.erase (p);

      if (!CheckOfferList (s, idx.received_offers (),
                           [&p] (const proto::TradeOffer& o)
                             {
                               return o.has_recipient ()
                                        && o.recipient () == p;
                             }, n)
            || n != received[p])
        return false;
      received.erase (p);
    }

  /* Everyone with assets or offers must have an index entry.  The maps
     may still contain zero entries created by the lookups above.  */
  for (const auto& entry : counts)
    if (entry.second != 0)
      return false;
  for (const auto& entry : sent)
    if (entry.second != 0)
      return false;
  for (const auto& entry : received)
    if (entry.second != 0)
      return false;

  size_t n;
  if (!CheckOfferList (s, s.public_offers (),
                       [] (const proto::TradeOffer& o)
                         {
                           return !o.has_recipient ();
                         }, n)
        || n != numPublic)
    return false;

  return true;
}

} // namespace barter
