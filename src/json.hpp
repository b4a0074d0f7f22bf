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

#ifndef BARTER_JSON_HPP
#define BARTER_JSON_HPP

#include <json/json.h>

#include <cstdint>
#include <string>
#include <vector>

namespace barter
{

/**
 * Converts one of the Barter protocol buffers into a JSON form.
 * This is implemented for the protos that are part of the public interface
 * of Ledger, and is used to build the JSON-RPC interface.
 */
template <typename Proto>
  Json::Value ProtoToJson (const Proto& pb);

/**
 * Encodes opaque asset data as 0x-prefixed lower-case hex string.
 */
std::string EncodeHexData (const std::string& data);

/**
 * Decodes a hex string (with optional 0x prefix) into the raw bytes.
 * Returns false if the string is not valid hex.
 */
bool DecodeHexData (const std::string& hex, std::string& data);

/**
 * Converts a single asset or offer ID to JSON.  The full 64-bit range
 * is supported.
 */
Json::Value IdToJson (uint64_t id);

/**
 * Converts a list of asset or offer IDs to a JSON array.
 */
Json::Value IdsToJson (const std::vector<uint64_t>& ids);

/**
 * Parses a JSON array of IDs.  Returns false if the value is not
 * an array of unsigned integers.
 */
bool IdsFromJson (const Json::Value& val, std::vector<uint64_t>& ids);

} // namespace barter

#endif // BARTER_JSON_HPP
