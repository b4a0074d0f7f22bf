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

#include "config.h"

#include "ledger.hpp"
#include "rpcserver.hpp"

#include <jsonrpccpp/server/connectors/httpserver.h>

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <fstream>
#include <iostream>
#include <stdexcept>

namespace
{

DEFINE_int32 (rpc_port, 0,
              "the port at which the ledger's JSON-RPC server will be started");

DEFINE_string (state_file, "",
               "if set, file from which the ledger state is loaded at startup"
               " (if it exists) and to which it is saved when stopping");

/**
 * Exception thrown for usage errors (won't be logged).
 */
class UsageError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/**
 * Returns true if the given file exists and can be opened.
 */
bool
FileExists (const std::string& path)
{
  std::ifstream in(path);
  return static_cast<bool> (in);
}

} // anonymous namespace

int
main (int argc, char** argv)
{
  google::InitGoogleLogging (argv[0]);

  gflags::SetUsageMessage ("Run a Barter ledger daemon");
  gflags::SetVersionString (PACKAGE_VERSION);
  gflags::ParseCommandLineFlags (&argc, &argv, true);

  try
    {
      if (FLAGS_rpc_port == 0)
        throw UsageError ("--rpc_port must be set");

      barter::Ledger ledger;

      if (!FLAGS_state_file.empty () && FileExists (FLAGS_state_file))
        {
          if (!ledger.LoadSnapshot (FLAGS_state_file))
            throw std::runtime_error ("failed to load the state file");
        }

      jsonrpc::HttpServer httpServer(FLAGS_rpc_port);
      httpServer.BindLocalhost ();
      barter::RpcServer server(ledger, httpServer);

      LOG (INFO) << "Starting JSON-RPC interface on port " << FLAGS_rpc_port;
      server.Run ();

      if (!FLAGS_state_file.empty ())
        {
          if (!ledger.SaveSnapshot (FLAGS_state_file))
            throw std::runtime_error ("failed to save the state file");
          LOG (INFO) << "Saved ledger state to " << FLAGS_state_file;
        }

      return EXIT_SUCCESS;
    }
  catch (const UsageError& exc)
    {
      std::cerr << "Error: " << exc.what () << std::endl;
      return EXIT_FAILURE;
    }
  catch (const std::exception& exc)
    {
      LOG (ERROR) << exc.what ();
      std::cerr << "Error: " << exc.what () << std::endl;
      return EXIT_FAILURE;
    }
}
