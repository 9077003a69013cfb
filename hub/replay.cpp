// Copyright (C) 2026 The Gamehub developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "replay.hpp"

#include "actions.hpp"

#include <google/protobuf/text_format.h>

#include <glog/logging.h>

namespace gamehub
{

namespace
{

/**
 * Extracts a string-valued field from a command.
 */
bool
GetStringField (const Json::Value& cmd, const std::string& key,
                std::string& out)
{
  const Json::Value& val = cmd[key];
  if (!val.isString ())
    return false;

  out = val.asString ();
  return true;
}

} // anonymous namespace

bool
ScriptReplayer::Execute (const Json::Value& cmd, bool& ok)
{
  std::string op, room;
  if (!GetStringField (cmd, "op", op) || !GetStringField (cmd, "room", room))
    return false;

  if (op == "create")
    {
      std::string name;
      GameType type;
      if (cmd.size () != 3 || !GetStringField (cmd, "game", name)
            || !ParseGameType (name, type))
        return false;
      ok = registry.CreateRoom (type, room);
      return true;
    }

  if (op == "remove")
    {
      if (cmd.size () != 2)
        return false;
      ok = registry.RemoveRoom (room);
      return true;
    }

  std::string player;
  if (!GetStringField (cmd, "player", player))
    return false;

  if (op == "join" && cmd.size () == 3)
    {
      ok = registry.JoinRoom (room, player);
      return true;
    }

  if (op == "leave" && cmd.size () == 3)
    {
      ok = registry.LeaveRoom (room, player);
      return true;
    }

  if (op == "action" && cmd.size () == 4)
    {
      const Json::Value& action = cmd["action"];
      if (!action.isObject ())
        return false;

      Json::StreamWriterBuilder wbuilder;
      wbuilder["indentation"] = "";
      ok = registry.HandleAction (room, player,
                                  Json::writeString (wbuilder, action));
      return true;
    }

  return false;
}

bool
ScriptReplayer::ProcessLine (const std::string& line)
{
  if (line.empty () || line[0] == '#')
    return true;

  Json::Value cmd;
  if (!ParseActionJson (line, cmd))
    return false;

  bool ok;
  if (!Execute (cmd, ok))
    {
      LOG (WARNING) << "Invalid script command: " << line;
      return false;
    }

  if (ok)
    {
      ++accepted;
      VLOG (1) << "Accepted: " << line;
    }
  else
    {
      ++rejected;
      LOG (INFO) << "Rejected: " << line;
    }

  if (snapshots != nullptr)
    {
      const std::string room = cmd["room"].asString ();
      proto::RoomSnapshot pb;
      if (registry.GetSnapshot (room, pb))
        {
          std::string text;
          CHECK (google::protobuf::TextFormat::PrintToString (pb, &text));
          *snapshots << text << std::endl;
        }
      else
        *snapshots << "# room " << room << " is closed" << std::endl;
    }

  return true;
}

bool
ScriptReplayer::ProcessStream (std::istream& in)
{
  std::string line;
  unsigned lineNumber = 0;
  while (std::getline (in, line))
    {
      ++lineNumber;
      if (!ProcessLine (line))
        {
          LOG (ERROR) << "Script error in line " << lineNumber;
          return false;
        }
    }

  return true;
}

} // namespace gamehub
