// Copyright (C) 2026 The Gamehub developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "roomstate.hpp"

#include <glog/logging.h>

namespace gamehub
{

RoomState::RoomState (const std::string& code)
  : roomCode(code)
{
  CHECK (!roomCode.empty ()) << "Room code must not be empty";
}

} // namespace gamehub
