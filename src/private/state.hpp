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

#ifndef BARTER_STATE_HPP
#define BARTER_STATE_HPP

#include "observer.hpp"
#include "private/events.hpp"
#include "proto/ledger.pb.h"
#include "types.hpp"

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>

namespace barter
{

/**
 * Wrapper around the global ledger state, which is held in form of
 * a LedgerState proto.  It mostly handles synchronisation for accessing
 * the state:  Each ledger operation runs entirely inside one callback,
 * so that no other operation can interleave between its checks and its
 * updates.
 */
class State
{

private:

  /** The actual data instance.  */
  proto::LedgerState state;

  /**
   * Mutex for the state.  This could be a std::shared_mutex for read/write
   * locking, but for now should be sufficient with exlusive locks only
   * until we use C++17.
   */
  mutable std::mutex mut;

  /**
   * Sequence number given to the next committed change.  Only touched
   * while mut is held.
   */
  uint64_t nextTicket = 0;

  /** Sequence number of the change whose events are dispatched next.  */
  uint64_t dispatchTurn = 0;

  /** Mutex for dispatchTurn.  */
  std::mutex mutDispatch;

  /** Signalled whenever dispatchTurn advances.  */
  std::condition_variable cvDispatch;

  /**
   * Waits until all changes committed before the one with the given ticket
   * have had their events dispatched, and then dispatches the events.
   */
  void DispatchInTurn (uint64_t ticket, EventQueue& events,
                       LedgerObserver& observer);

public:

  State ();

  State (const State&) = delete;
  void operator= (const State&) = delete;

  /**
   * Exposes the state in a mutable form within the callback.
   */
  template <typename Fcn>
    void
    AccessState (const Fcn& f)
  {
    std::lock_guard<std::mutex> lock(mut);
    f (state);
  }

  /**
   * Runs a mutating operation and afterwards passes the events it queued
   * on to the observer.  The events are dispatched after the state lock
   * is released, but batches of different operations are delivered one
   * after the other and in the order the operations were committed.
   * If the callback throws, nothing is dispatched.
   */
  template <typename Fcn>
    void
    AccessState (const Fcn& f, EventQueue& events, LedgerObserver& observer)
  {
    uint64_t ticket;
    {
      std::lock_guard<std::mutex> lock(mut);
      f (state);
      ticket = nextTicket++;
    }

    DispatchInTurn (ticket, events, observer);
  }

  /**
   * Exposes the state in a read-only form within the callback.
   */
  template <typename Fcn>
    void
    ReadState (const Fcn& f) const
  {
    std::lock_guard<std::mutex> lock(mut);
    f (state);
  }

  /**
   * Writes the full state to a file in binary proto format.  Returns false
   * if that failed.
   */
  bool SaveToFile (const std::string& path) const;

  /**
   * Replaces the state with one read from a file written by SaveToFile.
   * Returns false (and leaves the current state as is) if the file
   * cannot be read or does not hold a consistent state.
   */
  bool LoadFromFile (const std::string& path);

};

/**
 * Returns the index entry for the given principal, creating it
 * if it does not exist yet.
 */
proto::PrincipalIndex& MutableIndex (proto::LedgerState& s,
                                     const Principal& p);

/**
 * Returns the index entry for the given principal, or null if there
 * is none yet.
 */
const proto::PrincipalIndex* FindIndex (const proto::LedgerState& s,
                                        const Principal& p);

/**
 * Verifies that the derived data (ID counters and principal indices) agree
 * with the asset and offer tables.
 */
bool IsConsistent (const proto::LedgerState& s);

} // namespace barter

#endif // BARTER_STATE_HPP
