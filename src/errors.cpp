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

#include "errors.hpp"

#include <glog/logging.h>

namespace barter
{

std::string
ErrorKindToString (const LedgerError::Kind k)
{
  switch (k)
    {
    case LedgerError::Kind::UNAUTHORIZED:
      return "unauthorized";
    case LedgerError::Kind::INVALID_STATE:
      return "invalid state";
    case LedgerError::Kind::OWNERSHIP_MISMATCH:
      return "ownership mismatch";
    case LedgerError::Kind::NOT_FOUND:
      return "not found";
    case LedgerError::Kind::INVALID_ARGUMENT:
      return "invalid argument";
    default:
      LOG (FATAL) << "Invalid error kind: " << static_cast<int> (k);
    }
}

} // namespace barter
