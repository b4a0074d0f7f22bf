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

#include "json.hpp"

#include "proto/ledger.pb.h"

#include <glog/logging.h>

#include <google/protobuf/repeated_field.h>

namespace barter
{

namespace
{

using google::protobuf::RepeatedField;

/**
 * Converts an ID to JSON, making sure to do it with the proper
 * signed JSON int64 type.
 */
Json::Value
IntToJson (const uint64_t val)
{
  return static_cast<Json::Int64> (val);
}

/**
 * Converts a repeated field of IDs to a JSON array.
 */
Json::Value
IdFieldToJson (const RepeatedField<uint64_t>& ids)
{
  Json::Value res(Json::arrayValue);
  for (const auto id : ids)
    res.append (IntToJson (id));
  return res;
}

/**
 * Converts an offer state enum value to a JSON value (string).
 */
Json::Value
OfferStateToJson (const proto::TradeOffer::State s)
{
  switch (s)
    {
    case proto::TradeOffer::PENDING:
      return "pending";
    case proto::TradeOffer::CANCELLED:
      return "cancelled";
    case proto::TradeOffer::ACCEPTED:
      return "accepted";
    case proto::TradeOffer::DECLINED:
      return "declined";
    default:
      LOG (FATAL) << "Invalid offer state: " << s;
    }
}

/**
 * Returns the value of a hex digit, or -1 if the character is not one.
 */
int
HexDigitValue (const char c)
{
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

} // anonymous namespace

std::string
EncodeHexData (const std::string& data)
{
  static const char* const DIGITS = "0123456789abcdef";

  std::string res = "0x";
  res.reserve (2 + 2 * data.size ());
  for (const unsigned char c : data)
    {
      res.push_back (DIGITS[c >> 4]);
      res.push_back (DIGITS[c & 0x0F]);
    }

  return res;
}

bool
DecodeHexData (const std::string& hex, std::string& data)
{
  size_t start = 0;
  if (hex.size () >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X'))
    start = 2;

  if ((hex.size () - start) % 2 != 0)
    return false;

  data.clear ();
  data.reserve ((hex.size () - start) / 2);
  for (size_t i = start; i < hex.size (); i += 2)
    {
      const int hi = HexDigitValue (hex[i]);
      const int lo = HexDigitValue (hex[i + 1]);
      if (hi < 0 || lo < 0)
        return false;
      data.push_back (static_cast<char> ((hi << 4) | lo));
    }

  return true;
}

Json::Value
IdToJson (const uint64_t id)
{
  return IntToJson (id);
}

Json::Value
IdsToJson (const std::vector<uint64_t>& ids)
{
  Json::Value res(Json::arrayValue);
  for (const auto id : ids)
    res.append (IntToJson (id));
  return res;
}

bool
IdsFromJson (const Json::Value& val, std::vector<uint64_t>& ids)
{
  ids.clear ();
  if (!val.isArray ())
    return false;

  for (const auto& entry : val)
    {
      if (!entry.isUInt64 ())
        return false;
      ids.push_back (entry.asUInt64 ());
    }

  return true;
}

template <>
  Json::Value
  ProtoToJson<proto::Asset> (const proto::Asset& pb)
{
  Json::Value res(Json::objectValue);
  res["owner"] = pb.owner ();
  res["emitter"] = pb.emitter ();
  res["data"] = EncodeHexData (pb.data ());

  return res;
}

template <>
  Json::Value
  ProtoToJson<proto::TradeOffer> (const proto::TradeOffer& pb)
{
  Json::Value res(Json::objectValue);
  res["sender"] = pb.sender ();
  if (pb.has_recipient ())
    res["recipient"] = pb.recipient ();
  else
    res["recipient"] = Json::Value ();
  res["myassets"] = IdFieldToJson (pb.my_assets ());
  res["theirassets"] = IdFieldToJson (pb.their_assets ());
  res["state"] = OfferStateToJson (pb.state ());

  return res;
}

template <>
  Json::Value
  ProtoToJson<proto::LedgerEvent> (const proto::LedgerEvent& pb)
{
  Json::Value res(Json::objectValue);

  switch (pb.event_case ())
    {
    case proto::LedgerEvent::kIssuance:
      {
        const auto& data = pb.issuance ();
        res["type"] = "issuance";
        res["asset"] = IntToJson (data.asset_id ());
        res["owner"] = data.owner ();
        res["emitter"] = data.emitter ();
        res["data"] = EncodeHexData (data.data ());
        break;
      }

    case proto::LedgerEvent::kRetraction:
      res["type"] = "retraction";
      res["asset"] = IntToJson (pb.retraction ().asset_id ());
      break;

    case proto::LedgerEvent::kOwnershipMove:
      {
        const auto& data = pb.ownership_move ();
        res["type"] = "move";
        res["asset"] = IntToJson (data.asset_id ());
        res["from"] = data.previous_owner ();
        res["to"] = data.new_owner ();
        break;
      }

    case proto::LedgerEvent::kOfferCreated:
      {
        const auto& data = pb.offer_created ();
        res["type"] = "offercreated";
        res["offer"] = IntToJson (data.offer_id ());
        res["sender"] = data.sender ();
        if (data.has_recipient ())
          res["recipient"] = data.recipient ();
        else
          res["recipient"] = Json::Value ();
        res["myassets"] = IdFieldToJson (data.my_assets ());
        res["theirassets"] = IdFieldToJson (data.their_assets ());
        break;
      }

    case proto::LedgerEvent::kOfferStateChanged:
      res["type"] = "offerstate";
      res["offer"] = IntToJson (pb.offer_state_changed ().offer_id ());
      res["state"] = OfferStateToJson (pb.offer_state_changed ().new_state ());
      break;

    default:
      LOG (FATAL) << "Unexpected ledger event:\n" << pb.DebugString ();
    }

  return res;
}

} // namespace barter
