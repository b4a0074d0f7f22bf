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
#include "private/state.hpp"
#include "testutils.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

namespace barter
{
namespace
{

using testing::ElementsAre;
using testing::IsEmpty;

class TradeOffersTests : public testing::Test
{

protected:

  State state;
  RecordingObserver observer;
  AssetRegistry registry;
  TradeOffers offers;

  TradeOffersTests ()
    : registry(state, observer), offers(state, observer)
  {}

  /**
   * Returns the current owner of an asset, or the empty string
   * if it does not exist.
   */
  Principal
  GetOwner (const AssetId id) const
  {
    proto::Asset a;
    if (!registry.Get (id, a))
      return "";
    return a.owner ();
  }

  /**
   * Returns the state of the given offer, which must exist.
   */
  proto::TradeOffer::State
  GetState (const OfferId id) const
  {
    proto::TradeOffer o;
    CHECK (offers.Get (id, o)) << "Offer " << id << " does not exist";
    return o.state ();
  }

  void
  ExpectConsistent () const
  {
    state.ReadState ([] (const proto::LedgerState& s)
      {
        EXPECT_TRUE (IsConsistent (s)) << s.DebugString ();
      });
  }

};

/* ************************************************************************** */

TEST_F (TradeOffersTests, CreateDoesNotCheckAssets)
{
  registry.Issue ("alice", "charlie", "");
  observer.Flush ();

  /* Asset 1 is owned by charlie, and asset 99 does not exist at all.  */
  const auto id = offers.Create ("alice", "bob", {1, 99}, {99, 99});
  EXPECT_EQ (id, 1);

  proto::TradeOffer o;
  ASSERT_TRUE (offers.Get (id, o));
  EXPECT_THAT (o, EqualsOffer (R"(
    sender: "alice"
    recipient: "bob"
    my_assets: 1
    my_assets: 99
    their_assets: 99
    their_assets: 99
    state: PENDING
  )"));

  EXPECT_THAT (observer.Flush (), ElementsAre (EqualsEvent (R"(
    offer_created:
      {
        offer_id: 1
        sender: "alice"
        recipient: "bob"
        my_assets: 1
        my_assets: 99
        their_assets: 99
        their_assets: 99
      }
  )")));
  ExpectConsistent ();
}

TEST_F (TradeOffersTests, GetNonExisting)
{
  proto::TradeOffer o;
  o.set_sender ("stale");
  EXPECT_FALSE (offers.Get (1, o));
  EXPECT_FALSE (o.has_sender ());
  EXPECT_FALSE (o.has_state ());
}

TEST_F (TradeOffersTests, InvalidCaller)
{
  EXPECT_THROW_KIND (offers.Create ("", "bob", {}, {}), UNAUTHORIZED);

  const auto id = offers.Create ("alice", PUBLIC_RECIPIENT, {}, {});
  EXPECT_THROW_KIND (offers.Accept ("", id), UNAUTHORIZED);
  EXPECT_THROW_KIND (offers.Decline ("", id), UNAUTHORIZED);
  EXPECT_THROW_KIND (offers.Cancel ("", id), UNAUTHORIZED);
  EXPECT_EQ (GetState (id), proto::TradeOffer::PENDING);
}

TEST_F (TradeOffersTests, Indices)
{
  EXPECT_EQ (offers.Create ("alice", "bob", {}, {}), 1);
  EXPECT_EQ (offers.Create ("bob", "alice", {}, {}), 2);
  EXPECT_EQ (offers.Create ("alice", PUBLIC_RECIPIENT, {}, {}), 3);
  EXPECT_EQ (offers.Create ("alice", "bob", {}, {}), 4);
  offers.Cancel ("alice", 4);

  EXPECT_THAT (offers.GetSent ("alice"), ElementsAre (1, 3, 4));
  EXPECT_THAT (offers.GetSent ("bob"), ElementsAre (2));
  EXPECT_THAT (offers.GetReceived ("bob"), ElementsAre (1, 4));
  EXPECT_THAT (offers.GetReceived ("alice"), ElementsAre (2));
  EXPECT_THAT (offers.GetPublic (), ElementsAre (3));

  EXPECT_THAT (offers.GetSent ("charlie"), IsEmpty ());
  EXPECT_THAT (offers.GetReceived ("charlie"), IsEmpty ());
  EXPECT_THAT (offers.GetReceived (PUBLIC_RECIPIENT), IsEmpty ());

  ExpectConsistent ();
}

TEST_F (TradeOffersTests, NotFound)
{
  EXPECT_THROW_KIND (offers.Accept ("bob", 42), NOT_FOUND);
  EXPECT_THROW_KIND (offers.Decline ("bob", 42), NOT_FOUND);
  EXPECT_THROW_KIND (offers.Cancel ("alice", 42), NOT_FOUND);
}

/* ************************************************************************** */

TEST_F (TradeOffersTests, Cancel)
{
  const auto id = offers.Create ("alice", "bob", {}, {});
  observer.Flush ();

  EXPECT_THROW_KIND (offers.Cancel ("bob", id), UNAUTHORIZED);
  EXPECT_THROW_KIND (offers.Cancel ("charlie", id), UNAUTHORIZED);
  EXPECT_EQ (GetState (id), proto::TradeOffer::PENDING);
  EXPECT_THAT (observer.Flush (), IsEmpty ());

  offers.Cancel ("alice", id);
  EXPECT_EQ (GetState (id), proto::TradeOffer::CANCELLED);
  EXPECT_THAT (observer.Flush (), ElementsAre (EqualsEvent (R"(
    offer_state_changed: { offer_id: 1 new_state: CANCELLED }
  )")));

  EXPECT_THROW_KIND (offers.Cancel ("alice", id), INVALID_STATE);
  EXPECT_THAT (observer.Flush (), IsEmpty ());
}

TEST_F (TradeOffersTests, Decline)
{
  const auto id = offers.Create ("alice", "bob", {}, {});
  observer.Flush ();

  EXPECT_THROW_KIND (offers.Decline ("alice", id), UNAUTHORIZED);
  EXPECT_THROW_KIND (offers.Decline ("charlie", id), UNAUTHORIZED);
  EXPECT_EQ (GetState (id), proto::TradeOffer::PENDING);

  offers.Decline ("bob", id);
  EXPECT_EQ (GetState (id), proto::TradeOffer::DECLINED);
  EXPECT_THAT (observer.Flush (), ElementsAre (EqualsEvent (R"(
    offer_state_changed: { offer_id: 1 new_state: DECLINED }
  )")));

  EXPECT_THROW_KIND (offers.Decline ("bob", id), INVALID_STATE);
}

TEST_F (TradeOffersTests, TerminalStates)
{
  const auto cancelled = offers.Create ("alice", "bob", {}, {});
  offers.Cancel ("alice", cancelled);
  const auto declined = offers.Create ("alice", "bob", {}, {});
  offers.Decline ("bob", declined);
  const auto accepted = offers.Create ("alice", "bob", {}, {});
  offers.Accept ("bob", accepted);
  observer.Flush ();

  for (const auto id : {cancelled, declined, accepted})
    {
      EXPECT_THROW_KIND (offers.Cancel ("alice", id), INVALID_STATE);
      EXPECT_THROW_KIND (offers.Decline ("bob", id), INVALID_STATE);
      EXPECT_THROW_KIND (offers.Accept ("bob", id), INVALID_STATE);
    }

  EXPECT_EQ (GetState (cancelled), proto::TradeOffer::CANCELLED);
  EXPECT_EQ (GetState (declined), proto::TradeOffer::DECLINED);
  EXPECT_EQ (GetState (accepted), proto::TradeOffer::ACCEPTED);
  EXPECT_THAT (observer.Flush (), IsEmpty ());
}

TEST_F (TradeOffersTests, AcceptAfterCancel)
{
  const auto id = offers.Create ("alice", "bob", {}, {});
  offers.Cancel ("alice", id);
  EXPECT_THROW_KIND (offers.Accept ("bob", id), INVALID_STATE);
  EXPECT_EQ (GetState (id), proto::TradeOffer::CANCELLED);
}

/* ************************************************************************** */

TEST_F (TradeOffersTests, AcceptSwapsAssets)
{
  EXPECT_EQ (registry.Issue ("alice", "alice", "a"), 1);
  EXPECT_EQ (registry.Issue ("bob", "bob", "b"), 2);
  const auto id = offers.Create ("alice", "bob", {1}, {2});
  observer.Flush ();

  EXPECT_THROW_KIND (offers.Accept ("alice", id), UNAUTHORIZED);
  EXPECT_THROW_KIND (offers.Accept ("charlie", id), UNAUTHORIZED);

  offers.Accept ("bob", id);
  EXPECT_EQ (GetOwner (1), "bob");
  EXPECT_EQ (GetOwner (2), "alice");
  EXPECT_EQ (GetState (id), proto::TradeOffer::ACCEPTED);

  EXPECT_THAT (observer.Flush (), ElementsAre (
    EqualsEvent (R"(
      ownership_move: { asset_id: 1 previous_owner: "alice" new_owner: "bob" }
    )"),
    EqualsEvent (R"(
      ownership_move: { asset_id: 2 previous_owner: "bob" new_owner: "alice" }
    )"),
    EqualsEvent (R"(
      offer_state_changed: { offer_id: 1 new_state: ACCEPTED }
    )")
  ));

  /* The emitter stays the same.  */
  proto::Asset a;
  ASSERT_TRUE (registry.Get (1, a));
  EXPECT_EQ (a.emitter (), "alice");

  EXPECT_THAT (registry.GetInventory ("alice"), ElementsAre (2));
  EXPECT_THAT (registry.GetInventory ("bob"), ElementsAre (1));
  ExpectConsistent ();
}

TEST_F (TradeOffersTests, OneSidedOffers)
{
  registry.Issue ("alice", "alice", "");
  registry.Issue ("bob", "bob", "");

  const auto gift = offers.Create ("alice", "bob", {1}, {});
  offers.Accept ("bob", gift);
  EXPECT_EQ (GetOwner (1), "bob");

  const auto request = offers.Create ("alice", "bob", {}, {2});
  offers.Accept ("bob", request);
  EXPECT_EQ (GetOwner (2), "alice");

  const auto empty = offers.Create ("alice", "bob", {}, {});
  observer.Flush ();
  offers.Accept ("bob", empty);
  EXPECT_THAT (observer.Flush (), ElementsAre (EqualsEvent (R"(
    offer_state_changed: { offer_id: 3 new_state: ACCEPTED }
  )")));
  ExpectConsistent ();
}

TEST_F (TradeOffersTests, AcceptFailsAfterRetraction)
{
  registry.Issue ("alice", "alice", "");
  registry.Issue ("bob", "bob", "");
  const auto id = offers.Create ("alice", "bob", {1}, {2});

  registry.Retract ("alice", 1);
  observer.Flush ();

  EXPECT_THROW_KIND (offers.Accept ("bob", id), OWNERSHIP_MISMATCH);
  EXPECT_EQ (GetOwner (2), "bob");
  EXPECT_EQ (GetState (id), proto::TradeOffer::PENDING);
  EXPECT_THAT (observer.Flush (), IsEmpty ());

  /* The offer can still be declined (or cancelled) afterwards.  */
  offers.Decline ("bob", id);
  EXPECT_EQ (GetState (id), proto::TradeOffer::DECLINED);
  ExpectConsistent ();
}

TEST_F (TradeOffersTests, RequestedAssetsMustBeOwnedByAcceptor)
{
  registry.Issue ("alice", "alice", "");
  registry.Issue ("charlie", "charlie", "");
  const auto id = offers.Create ("alice", "bob", {1}, {2});

  EXPECT_THROW_KIND (offers.Accept ("bob", id), OWNERSHIP_MISMATCH);
  EXPECT_EQ (GetOwner (1), "alice");
  EXPECT_EQ (GetOwner (2), "charlie");
  EXPECT_EQ (GetState (id), proto::TradeOffer::PENDING);
}

TEST_F (TradeOffersTests, NoPartialSettlement)
{
  for (unsigned i = 0; i < 5; ++i)
    registry.Issue ("alice", "alice", "");
  for (unsigned i = 0; i < 5; ++i)
    registry.Issue ("bob", "bob", "");
  /* The last requested asset is not owned by bob.  */
  registry.Issue ("charlie", "charlie", "");
  observer.Flush ();

  const auto id = offers.Create ("alice", "bob",
                                 {1, 2, 3, 4, 5}, {6, 7, 8, 9, 10, 11});
  EXPECT_THROW_KIND (offers.Accept ("bob", id), OWNERSHIP_MISMATCH);

  EXPECT_THAT (registry.GetInventory ("alice"), ElementsAre (1, 2, 3, 4, 5));
  EXPECT_THAT (registry.GetInventory ("bob"), ElementsAre (6, 7, 8, 9, 10));
  EXPECT_THAT (registry.GetInventory ("charlie"), ElementsAre (11));
  EXPECT_EQ (GetState (id), proto::TradeOffer::PENDING);
  EXPECT_EQ (observer.Flush ().size (), 1);
  ExpectConsistent ();
}

TEST_F (TradeOffersTests, DuplicateAssets)
{
  registry.Issue ("alice", "alice", "");
  registry.Issue ("bob", "bob", "");
  const auto id = offers.Create ("alice", "bob", {1, 1}, {2, 2, 2});
  observer.Flush ();

  offers.Accept ("bob", id);
  EXPECT_EQ (GetOwner (1), "bob");
  EXPECT_EQ (GetOwner (2), "alice");
  EXPECT_EQ (registry.GetAssetCount ("alice"), 1);
  EXPECT_EQ (registry.GetAssetCount ("bob"), 1);
  EXPECT_EQ (observer.Flush ().size (), 3);
  ExpectConsistent ();
}

TEST_F (TradeOffersTests, PublicOffer)
{
  registry.Issue ("alice", "alice", "");
  registry.Issue ("charlie", "charlie", "");
  registry.Issue ("dave", "dave", "");

  const auto id = offers.Create ("alice", PUBLIC_RECIPIENT, {1}, {3});
  proto::TradeOffer o;
  ASSERT_TRUE (offers.Get (id, o));
  EXPECT_FALSE (o.has_recipient ());

  /* Charlie does not have the requested asset, but Dave does.  */
  EXPECT_THROW_KIND (offers.Accept ("charlie", id), OWNERSHIP_MISMATCH);
  offers.Accept ("dave", id);
  EXPECT_EQ (GetOwner (1), "dave");
  EXPECT_EQ (GetOwner (3), "alice");

  const auto declined = offers.Create ("alice", PUBLIC_RECIPIENT, {}, {});
  offers.Decline ("charlie", declined);
  EXPECT_EQ (GetState (declined), proto::TradeOffer::DECLINED);
  ExpectConsistent ();
}

TEST_F (TradeOffersTests, SharedAssetDoubleSpend)
{
  registry.Issue ("alice", "alice", "");
  const auto toBob = offers.Create ("alice", "bob", {1}, {});
  const auto toCharlie = offers.Create ("alice", "charlie", {1}, {});

  offers.Accept ("bob", toBob);
  EXPECT_EQ (GetOwner (1), "bob");

  EXPECT_THROW_KIND (offers.Accept ("charlie", toCharlie),
                     OWNERSHIP_MISMATCH);
  EXPECT_EQ (GetOwner (1), "bob");
  EXPECT_EQ (GetState (toCharlie), proto::TradeOffer::PENDING);
  ExpectConsistent ();
}

TEST_F (TradeOffersTests, ConcurrentAcceptance)
{
  constexpr unsigned NUM_THREADS = 8;

  registry.Issue ("alice", "alice", "");

  std::vector<OfferId> ids;
  for (unsigned i = 0; i < NUM_THREADS; ++i)
    {
      const Principal p = "taker " + std::to_string (i);
      registry.Issue (p, p, "");
      ids.push_back (offers.Create ("alice", p, {1}, {i + 2}));
    }

  std::atomic<unsigned> successes(0);
  std::atomic<unsigned> mismatches(0);
  std::vector<std::thread> threads;
  for (unsigned i = 0; i < NUM_THREADS; ++i)
    threads.emplace_back ([&, i] ()
      {
        try
          {
            offers.Accept ("taker " + std::to_string (i), ids[i]);
            ++successes;
          }
        catch (const LedgerError& exc)
          {
            EXPECT_EQ (exc.GetKind (), LedgerError::Kind::OWNERSHIP_MISMATCH);
            ++mismatches;
          }
      });
  for (auto& t : threads)
    t.join ();

  EXPECT_EQ (successes.load (), 1);
  EXPECT_EQ (mismatches.load (), NUM_THREADS - 1);

  unsigned accepted = 0;
  for (unsigned i = 0; i < NUM_THREADS; ++i)
    if (GetState (ids[i]) == proto::TradeOffer::ACCEPTED)
      {
        ++accepted;
        EXPECT_EQ (GetOwner (1), "taker " + std::to_string (i));
        EXPECT_EQ (GetOwner (i + 2), "alice");
      }
    else
      {
        EXPECT_EQ (GetState (ids[i]), proto::TradeOffer::PENDING);
        EXPECT_EQ (GetOwner (i + 2), "taker " + std::to_string (i));
      }
  EXPECT_EQ (accepted, 1);
  EXPECT_EQ (registry.GetAssetCount ("alice"), 1);
  ExpectConsistent ();
}

TEST_F (TradeOffersTests, OfferIdsAreNeverReused)
{
  EXPECT_EQ (offers.Create ("alice", "bob", {}, {}), 1);
  offers.Cancel ("alice", 1);
  EXPECT_EQ (offers.Create ("alice", "bob", {}, {}), 2);
  offers.Decline ("bob", 2);
  EXPECT_EQ (offers.Create ("bob", "alice", {}, {}), 3);
}

} // anonymous namespace
} // namespace barter
