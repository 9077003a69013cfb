// Copyright (C) 2026 The Gamehub developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "actions.hpp"

#include <tictactoe/state.hpp>

#include <glog/logging.h>

#include <sstream>

namespace gamehub
{

namespace
{

/** Maximum nesting depth accepted in action JSON.  */
constexpr unsigned MAX_JSON_DEPTH = 16;

/**
 * Returns true if the object is exactly {key: true}.
 */
bool
IsFlag (const Json::Value& obj, const std::string& key)
{
  if (obj.size () != 1 || !obj.isMember (key))
    return false;

  const Json::Value& val = obj[key];
  return val.isBool () && val.asBool ();
}

/**
 * Parses a [row, col] pair into a coordinate.
 */
bool
ParseCoord (const Json::Value& val, Coord& c)
{
  if (!val.isArray () || val.size () != 2)
    return false;

  const Json::Value& r = val[0];
  const Json::Value& col = val[1];
  if (!r.isInt () || !col.isInt ())
    return false;

  c = Coord (r.asInt (), col.asInt ());
  return true;
}

} // anonymous namespace

bool
ParseActionJson (const std::string& str, Json::Value& out)
{
  Json::CharReaderBuilder rbuilder;
  rbuilder["allowComments"] = false;
  rbuilder["strictRoot"] = true;
  rbuilder["allowDroppedNullPlaceholders"] = false;
  rbuilder["allowNumericKeys"] = false;
  rbuilder["allowSingleQuotes"] = false;
  rbuilder["stackLimit"] = MAX_JSON_DEPTH;
  rbuilder["failIfExtra"] = true;
  rbuilder["rejectDupKeys"] = true;
  rbuilder["allowSpecialFloats"] = false;

  std::string parseErrs;
  std::istringstream in(str);
  try
    {
      if (!Json::parseFromStream (rbuilder, in, &out, &parseErrs))
        {
          LOG (WARNING) << "Failed to parse action JSON: " << parseErrs;
          return false;
        }
    }
  catch (const Json::Exception& exc)
    {
      LOG (WARNING) << "JSON parser threw: " << exc.what ();
      return false;
    }

  if (!out.isObject ())
    {
      LOG (WARNING) << "Action is not a JSON object: " << str;
      return false;
    }

  return true;
}

bool
ParseTicTacToeAction (const Json::Value& obj, TicTacToeAction& action)
{
  if (!obj.isObject ())
    return false;

  if (IsFlag (obj, "restart"))
    {
      action.kind = TicTacToeAction::Kind::RESTART;
      return true;
    }

  action.kind = TicTacToeAction::Kind::MOVE;
  constexpr int cells = tictactoe::TicTacToeRoomState::CELLS;
  constexpr int side = 3;

  if (obj.size () == 1 && obj.isMember ("cell"))
    {
      const Json::Value& cell = obj["cell"];
      if (!cell.isInt ())
        return false;

      action.cell = cell.asInt ();
      return action.cell >= 0 && action.cell < cells;
    }

  if (obj.size () == 2 && obj.isMember ("row") && obj.isMember ("col"))
    {
      const Json::Value& row = obj["row"];
      const Json::Value& col = obj["col"];
      if (!row.isInt () || !col.isInt ())
        return false;

      const int r = row.asInt ();
      const int c = col.asInt ();
      if (r < 0 || r >= side || c < 0 || c >= side)
        return false;

      action.cell = r * side + c;
      return true;
    }

  return false;
}

bool
ParseCheckersAction (const Json::Value& obj, CheckersAction& action)
{
  if (!obj.isObject ())
    return false;

  if (IsFlag (obj, "resign"))
    {
      action.kind = CheckersAction::Kind::RESIGN;
      return true;
    }
  if (IsFlag (obj, "restart"))
    {
      action.kind = CheckersAction::Kind::RESTART;
      return true;
    }

  if (obj.size () != 2 || !obj.isMember ("from") || !obj.isMember ("to"))
    return false;

  action.kind = CheckersAction::Kind::MOVE;
  return ParseCoord (obj["from"], action.from)
            && ParseCoord (obj["to"], action.to);
}

bool
ParseBlackjackAction (const Json::Value& obj, BlackjackAction& action)
{
  if (!obj.isObject ())
    return false;

  if (IsFlag (obj, "start"))
    {
      action.kind = BlackjackAction::Kind::START;
      return true;
    }

  if (obj.size () != 1 || !obj.isMember ("action"))
    return false;

  const Json::Value& play = obj["action"];
  if (!play.isString ())
    return false;

  action.kind = BlackjackAction::Kind::PLAY;
  if (play.asString () == "hit")
    action.play = blackjack::Action::HIT;
  else if (play.asString () == "stand")
    action.play = blackjack::Action::STAND;
  else
    return false;

  return true;
}

} // namespace gamehub
