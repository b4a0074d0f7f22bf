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

#include "rpcserver.hpp"

#include "json.hpp"
#include "proto/ledger.pb.h"

#include <jsonrpccpp/common/errors.h>
#include <jsonrpccpp/common/exception.h>

#include <glog/logging.h>

namespace barter
{

RpcErrorCode
GetRpcErrorCode (const LedgerError::Kind k)
{
  switch (k)
    {
    case LedgerError::Kind::UNAUTHORIZED:
      return RpcErrorCode::UNAUTHORIZED;
    case LedgerError::Kind::INVALID_STATE:
      return RpcErrorCode::INVALID_STATE;
    case LedgerError::Kind::OWNERSHIP_MISMATCH:
      return RpcErrorCode::OWNERSHIP_MISMATCH;
    case LedgerError::Kind::NOT_FOUND:
      return RpcErrorCode::NOT_FOUND;
    case LedgerError::Kind::INVALID_ARGUMENT:
      return RpcErrorCode::INVALID_ARGUMENT;
    default:
      LOG (FATAL) << "Invalid error kind: " << static_cast<int> (k);
    }
}

namespace
{

/**
 * Runs a ledger operation and translates a LedgerError into the
 * corresponding JSON-RPC exception.
 */
template <typename Fcn>
  auto
  RunLedgerOperation (const Fcn& f) -> decltype (f ())
{
  try
    {
      return f ();
    }
  catch (const LedgerError& exc)
    {
      LOG (WARNING)
          << "Ledger operation failed (" << ErrorKindToString (exc.GetKind ())
          << "): " << exc.what ();
      throw jsonrpc::JsonRpcException (
          static_cast<int> (GetRpcErrorCode (exc.GetKind ())), exc.what ());
    }
}

/**
 * Converts an ID passed in over RPC, throwing if it is not valid.
 */
uint64_t
IdFromRpc (const int id)
{
  if (id <= 0)
    throw jsonrpc::JsonRpcException (jsonrpc::Errors::ERROR_RPC_INVALID_PARAMS,
                                     "invalid ID");
  return static_cast<uint64_t> (id);
}

} // anonymous namespace

void
RpcServer::Run ()
{
  std::unique_lock<std::mutex> lock(mutStop);
  shouldStop = false;

  StartListening ();

  while (!shouldStop)
    cvStop.wait (lock);

  StopListening ();
}

void
RpcServer::stop ()
{
  LOG (INFO) << "RPC method called: stop";

  std::lock_guard<std::mutex> lock(mutStop);
  shouldStop = true;
  cvStop.notify_all ();
}

Json::Value
RpcServer::issue (const std::string& caller, const std::string& data,
                  const std::string& owner)
{
  LOG (INFO)
      << "RPC method called: issue " << caller << " " << owner << " " << data;

  std::string rawData;
  if (!DecodeHexData (data, rawData))
    throw jsonrpc::JsonRpcException (jsonrpc::Errors::ERROR_RPC_INVALID_PARAMS,
                                     "data is not valid hex");

  return RunLedgerOperation ([&] ()
    {
      return IdToJson (ledger.Issue (caller, owner, rawData));
    });
}

Json::Value
RpcServer::retract (const int asset, const std::string& caller)
{
  LOG (INFO) << "RPC method called: retract " << caller << " " << asset;
  const auto id = IdFromRpc (asset);

  RunLedgerOperation ([&] ()
    {
      ledger.Retract (caller, id);
    });

  return Json::Value ();
}

Json::Value
RpcServer::getasset (const int asset)
{
  LOG (INFO) << "RPC method called: getasset " << asset;
  const auto id = IdFromRpc (asset);

  proto::Asset a;
  if (!ledger.GetAsset (id, a))
    return Json::Value ();

  Json::Value res = ProtoToJson (a);
  res["id"] = asset;
  return res;
}

Json::Value
RpcServer::getinventory (const std::string& owner)
{
  LOG (INFO) << "RPC method called: getinventory " << owner;
  return IdsToJson (ledger.GetInventory (owner));
}

Json::Value
RpcServer::createoffer (const std::string& caller, const Json::Value& myassets,
                        const std::string& recipient,
                        const Json::Value& theirassets)
{
  LOG (INFO)
      << "RPC method called: createoffer " << caller << " " << recipient
      << "\n" << myassets << "\n" << theirassets;

  std::vector<AssetId> mine, theirs;
  if (!IdsFromJson (myassets, mine) || !IdsFromJson (theirassets, theirs))
    throw jsonrpc::JsonRpcException (jsonrpc::Errors::ERROR_RPC_INVALID_PARAMS,
                                     "asset lists must be arrays of IDs");

  return RunLedgerOperation ([&] ()
    {
      return IdToJson (ledger.CreateOffer (caller, recipient, mine, theirs));
    });
}

Json::Value
RpcServer::canceloffer (const std::string& caller, const int offer)
{
  LOG (INFO) << "RPC method called: canceloffer " << caller << " " << offer;
  const auto id = IdFromRpc (offer);

  RunLedgerOperation ([&] ()
    {
      ledger.CancelOffer (caller, id);
    });

  return Json::Value ();
}

Json::Value
RpcServer::declineoffer (const std::string& caller, const int offer)
{
  LOG (INFO) << "RPC method called: declineoffer " << caller << " " << offer;
  const auto id = IdFromRpc (offer);

  RunLedgerOperation ([&] ()
    {
      ledger.DeclineOffer (caller, id);
    });

  return Json::Value ();
}

Json::Value
RpcServer::acceptoffer (const std::string& caller, const int offer)
{
  LOG (INFO) << "RPC method called: acceptoffer " << caller << " " << offer;
  const auto id = IdFromRpc (offer);

  RunLedgerOperation ([&] ()
    {
      ledger.AcceptOffer (caller, id);
    });

  return Json::Value ();
}

Json::Value
RpcServer::getoffer (const int offer)
{
  LOG (INFO) << "RPC method called: getoffer " << offer;
  const auto id = IdFromRpc (offer);

  proto::TradeOffer o;
  if (!ledger.GetOffer (id, o))
    return Json::Value ();

  Json::Value res = ProtoToJson (o);
  res["id"] = offer;
  return res;
}

Json::Value
RpcServer::getsentoffers (const std::string& sender)
{
  LOG (INFO) << "RPC method called: getsentoffers " << sender;
  return IdsToJson (ledger.GetSentOffers (sender));
}

Json::Value
RpcServer::getreceivedoffers (const std::string& recipient)
{
  LOG (INFO) << "RPC method called: getreceivedoffers " << recipient;
  return IdsToJson (ledger.GetReceivedOffers (recipient));
}

Json::Value
RpcServer::getpublicoffers ()
{
  LOG (INFO) << "RPC method called: getpublicoffers";
  return IdsToJson (ledger.GetPublicOffers ());
}

} // namespace barter
