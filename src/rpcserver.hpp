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

#ifndef BARTER_RPCSERVER_HPP
#define BARTER_RPCSERVER_HPP

#include "errors.hpp"
#include "ledger.hpp"
#include "rpc-stubs/barterrpcserverstub.h"

#include <json/json.h>
#include <jsonrpccpp/server.h>

#include <condition_variable>
#include <mutex>

namespace barter
{

/**
 * JSON-RPC error codes returned for rejected ledger operations.
 */
enum class RpcErrorCode
{
  UNAUTHORIZED = -1,
  INVALID_STATE = -2,
  OWNERSHIP_MISMATCH = -3,
  NOT_FOUND = -4,
  INVALID_ARGUMENT = -5,
};

/**
 * Returns the JSON-RPC error code for a given kind of ledger error.
 */
RpcErrorCode GetRpcErrorCode (LedgerError::Kind k);

/**
 * JSON-RPC server exposing a Ledger.  The "caller" arguments of the methods
 * are taken as authenticated principal; the server is meant to be bound
 * to localhost and used only by a trusted frontend that authenticates
 * its users.
 */
class RpcServer : public BarterRpcServerStub
{

private:

  /** The Ledger this is for.  */
  Ledger& ledger;

  /** Flag set to indicate the server should shut down.  */
  bool shouldStop;

  /** Mutex for the stop flag.  */
  std::mutex mutStop;

  /** Condition variable for signalling "should stop".  */
  std::condition_variable cvStop;

public:

  explicit RpcServer (Ledger& l, jsonrpc::AbstractServerConnector& conn)
    : BarterRpcServerStub(conn), ledger(l)
  {}

  RpcServer () = delete;
  RpcServer (const RpcServer&) = delete;
  void operator= (const RpcServer&) = delete;

  /**
   * Starts the server and blocks until it gets shut down again.
   */
  void Run ();

  void stop () override;

  Json::Value issue (const std::string& caller, const std::string& data,
                     const std::string& owner) override;
  Json::Value retract (int asset, const std::string& caller) override;
  Json::Value getasset (int asset) override;
  Json::Value getinventory (const std::string& owner) override;

  Json::Value createoffer (const std::string& caller,
                           const Json::Value& myassets,
                           const std::string& recipient,
                           const Json::Value& theirassets) override;
  Json::Value canceloffer (const std::string& caller, int offer) override;
  Json::Value declineoffer (const std::string& caller, int offer) override;
  Json::Value acceptoffer (const std::string& caller, int offer) override;
  Json::Value getoffer (int offer) override;

  Json::Value getsentoffers (const std::string& sender) override;
  Json::Value getreceivedoffers (const std::string& recipient) override;
  Json::Value getpublicoffers () override;

};

} // namespace barter

#endif // BARTER_RPCSERVER_HPP
