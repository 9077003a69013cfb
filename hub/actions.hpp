// Copyright (C) 2026 The Gamehub developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GAMEHUB_HUB_ACTIONS_HPP
#define GAMEHUB_HUB_ACTIONS_HPP

#include <blackjack/engine.hpp>
#include <board/coord.hpp>

#include <json/json.h>

#include <string>

namespace gamehub
{

/**
 * Parses a player action from its JSON text.  The parser is strict (no
 * comments, no duplicate keys, nothing after the value), and the result
 * must be an object.  Returns false if the text is invalid.
 */
bool ParseActionJson (const std::string& str, Json::Value& out);

/**
 * An action in a tic-tac-toe room.  It is sent as one of:
 *
 *  {"cell": 4}
 *  {"row": 1, "col": 1}
 *  {"restart": true}
 */
struct TicTacToeAction
{

  enum class Kind
  {
    MOVE,
    RESTART,
  };

  Kind kind = Kind::MOVE;

  /** For MOVE, the cell index in [0, 9).  */
  int cell = 0;

};

bool ParseTicTacToeAction (const Json::Value& obj, TicTacToeAction& action);

/**
 * An action in a checkers room:
 *
 *  {"from": [5, 2], "to": [4, 3]}
 *  {"resign": true}
 *  {"restart": true}
 *
 * Coordinates are only checked for their format here; the game state
 * decides whether they are on the board.
 */
struct CheckersAction
{

  enum class Kind
  {
    MOVE,
    RESIGN,
    RESTART,
  };

  Kind kind = Kind::MOVE;

  Coord from;
  Coord to;

};

bool ParseCheckersAction (const Json::Value& obj, CheckersAction& action);

/**
 * An action at a blackjack table:
 *
 *  {"start": true}
 *  {"action": "hit"}
 *  {"action": "stand"}
 */
struct BlackjackAction
{

  enum class Kind
  {
    START,
    PLAY,
  };

  Kind kind = Kind::START;

  /** For PLAY, whether to hit or stand.  */
  blackjack::Action play = blackjack::Action::STAND;

};

bool ParseBlackjackAction (const Json::Value& obj, BlackjackAction& action);

} // namespace gamehub

#endif // GAMEHUB_HUB_ACTIONS_HPP
