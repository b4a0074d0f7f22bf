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

#ifndef BARTER_OBSERVER_HPP
#define BARTER_OBSERVER_HPP

#include "proto/ledger.pb.h"

namespace barter
{

/**
 * Interface for receiving notifications about committed changes to the
 * ledger.  Notifications are delivered after the change has been applied
 * and the state lock released, so implementations are free to query the
 * ledger again from within Notify.  They must not perform mutating ledger
 * operations from within Notify, though, since those wait until all earlier
 * notifications have been delivered.
 */
class LedgerObserver
{

public:

  LedgerObserver () = default;
  virtual ~LedgerObserver () = default;

  /**
   * Called once for every event, in the order the changes were made.
   * The events of one operation are never interleaved with those of
   * other operations, even if the ledger is used from many threads.
   */
  virtual void Notify (const proto::LedgerEvent& ev) = 0;

};

/**
 * Observer that just writes all events to the log.
 */
class LoggingObserver : public LedgerObserver
{

public:

  LoggingObserver () = default;

  void Notify (const proto::LedgerEvent& ev) override;

};

} // namespace barter

#endif // BARTER_OBSERVER_HPP
