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

#include "testutils.hpp"

#include <sstream>

namespace barter
{

Json::Value
ParseJson (const std::string& str)
{
  std::istringstream in(str);
  Json::Value res;
  in >> res;
  return res;
}

void
RecordingObserver::Notify (const proto::LedgerEvent& ev)
{
  std::lock_guard<std::mutex> lock(mut);
  events.push_back (ev);
}

std::vector<proto::LedgerEvent>
RecordingObserver::Flush ()
{
  std::lock_guard<std::mutex> lock(mut);
  std::vector<proto::LedgerEvent> res;
  res.swap (events);
  return res;
}

} // namespace barter
