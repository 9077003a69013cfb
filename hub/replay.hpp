// Copyright (C) 2026 The Gamehub developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GAMEHUB_HUB_REPLAY_HPP
#define GAMEHUB_HUB_REPLAY_HPP

#include "registry.hpp"

#include <json/json.h>

#include <istream>
#include <ostream>
#include <string>

namespace gamehub
{

/**
 * Drives a room registry from a script of commands, one JSON object per
 * line.  The commands are:
 *
 *  {"op": "create", "room": "A", "game": "checkers"}
 *  {"op": "join", "room": "A", "player": "alice"}
 *  {"op": "leave", "room": "A", "player": "alice"}
 *  {"op": "action", "room": "A", "player": "alice", "action": {...}}
 *  {"op": "remove", "room": "A"}
 *
 * Empty lines and lines starting with '#' are skipped.
 */
class ScriptReplayer
{

private:

  RoomRegistry& registry;

  /** If not null, room snapshots are printed here after each command.  */
  std::ostream* snapshots = nullptr;

  unsigned accepted = 0;
  unsigned rejected = 0;

  /**
   * Executes a single parsed command.  Returns false if the command itself
   * is malformed.  Otherwise sets ok to the registry's result.
   */
  bool Execute (const Json::Value& cmd, bool& ok);

public:

  explicit ScriptReplayer (RoomRegistry& r)
    : registry(r)
  {}

  ScriptReplayer (const ScriptReplayer&) = delete;
  void operator= (const ScriptReplayer&) = delete;

  void
  SetSnapshotStream (std::ostream& out)
  {
    snapshots = &out;
  }

  /**
   * Processes one line of the script.  Returns false if the line is not
   * a valid command.  Commands rejected by the registry are counted but
   * do not make this fail.
   */
  bool ProcessLine (const std::string& line);

  /**
   * Processes all lines from the stream.  Stops and returns false at the
   * first malformed line.
   */
  bool ProcessStream (std::istream& in);

  unsigned
  GetAccepted () const
  {
    return accepted;
  }

  unsigned
  GetRejected () const
  {
    return rejected;
  }

};

} // namespace gamehub

#endif // GAMEHUB_HUB_REPLAY_HPP
