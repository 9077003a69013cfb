// Copyright (C) 2026 The Gamehub developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "registry.hpp"
#include "replay.hpp"

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <google/protobuf/stubs/common.h>

#include <cstdlib>
#include <fstream>
#include <iostream>

DEFINE_string (script, "-",
               "file with the room commands to replay, one JSON object per"
               " line; '-' reads from standard input");
DEFINE_string (seed, "",
               "seed for all randomness in the rooms; if empty, a random"
               " seed is used");
DEFINE_bool (tictactoe_random_starter, false,
             "whether the first mover in tic-tac-toe is chosen at random"
             " instead of the host");
DEFINE_int32 (blackjack_capacity, 4,
              "maximum number of players at a blackjack table");
DEFINE_bool (print_snapshots, false,
             "whether to print the room snapshot after each command");

int
main (int argc, char** argv)
{
  google::InitGoogleLogging (argv[0]);
  GOOGLE_PROTOBUF_VERIFY_VERSION;

  gflags::SetUsageMessage ("Replay a script of game room commands");
  gflags::ParseCommandLineFlags (&argc, &argv, true);

  if (FLAGS_blackjack_capacity < 1
        || FLAGS_blackjack_capacity > blackjack::BlackjackRoomState::SEATS)
    {
      std::cerr << "Error: --blackjack_capacity must be between 1 and "
                << blackjack::BlackjackRoomState::SEATS << std::endl;
      return EXIT_FAILURE;
    }

  gamehub::HubConfiguration config;
  config.Seed = FLAGS_seed;
  config.TicTacToeRandomStarter = FLAGS_tictactoe_random_starter;
  config.BlackjackCapacity = FLAGS_blackjack_capacity;

  gamehub::RoomRegistry registry(config);
  gamehub::ScriptReplayer replayer(registry);
  if (FLAGS_print_snapshots)
    replayer.SetSnapshotStream (std::cout);

  bool ok;
  if (FLAGS_script == "-")
    ok = replayer.ProcessStream (std::cin);
  else
    {
      std::ifstream in(FLAGS_script);
      if (!in)
        {
          std::cerr << "Error: cannot open " << FLAGS_script << std::endl;
          return EXIT_FAILURE;
        }
      ok = replayer.ProcessStream (in);
    }

  LOG (INFO)
      << "Commands accepted: " << replayer.GetAccepted ()
      << ", rejected: " << replayer.GetRejected ();

  google::protobuf::ShutdownProtobufLibrary ();
  return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
