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

#ifndef BARTER_TYPES_HPP
#define BARTER_TYPES_HPP

#include <cstdint>
#include <string>

namespace barter
{

/**
 * Identifier of a principal (account) taking part in the ledger.  The
 * hosting environment authenticates principals, the ledger itself only
 * compares them for equality.  Valid principals are non-empty.
 */
using Principal = std::string;

/** ID of an asset in the registry.  */
using AssetId = uint64_t;

/** ID of a trade offer.  */
using OfferId = uint64_t;

/**
 * The recipient value used for public offers, which anyone can accept
 * or decline.  Since it is not a valid principal, no caller can ever
 * present it.
 */
extern const Principal PUBLIC_RECIPIENT;

/**
 * Returns true if the given string is a valid principal, i.e. one that
 * may act as caller or own assets.
 */
inline bool
IsValidPrincipal (const Principal& p)
{
  return !p.empty ();
}

} // namespace barter

#endif // BARTER_TYPES_HPP
