// Copyright (C) 2026 The Gamehub developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GAMEHUB_BLACKJACK_ENGINE_HPP
#define GAMEHUB_BLACKJACK_ENGINE_HPP

#include <cards/card.hpp>
#include <cards/deck.hpp>
#include <hubutil/random.hpp>
#include <rooms/roomstate.hpp>

#include <vector>

namespace blackjack
{

using gamehub::Card;
using gamehub::PlayerId;

/** High-level phase of a blackjack table.  */
enum class Phase
{
  /** Waiting for players; no round has been dealt yet.  */
  LOBBY = 0,
  BETTING = 1,
  DEALING = 2,
  PLAYER_TURNS = 3,
  DEALER_TURN = 4,
  /** A round is finished and its results are visible.  */
  ROUND_RESULTS = 5,
};

/** Outcome of a round for one player.  */
enum class Result
{
  PENDING = 0,
  WIN = 1,
  LOSE = 2,
  PUSH = 3,
  BLACKJACK = 4,
};

/** Actions a player can take on their turn.  */
enum class Action
{
  HIT,
  STAND,
};

/** Total at which the dealer stops drawing.  */
constexpr int DEALER_STANDS_AT = 17;

/** The best total, above which a hand is bust.  */
constexpr int BLACKJACK_TOTAL = 21;

/**
 * Computes the value of a hand.  Court cards count ten, aces count eleven
 * unless that would bust the hand, in which case they count one.
 */
int ComputeHandValue (const std::vector<Card>& hand);

/**
 * Per-player data of the table.
 */
struct PlayerState
{

  PlayerId id;

  /** Whether the player was dealt into the current round.  */
  bool inRound = false;

  bool stood = false;
  bool bust = false;

  /** Net chips won or lost over all rounds.  */
  int chips = 0;

  /** The stake for the current round.  */
  int bet = 1;

  Result result = Result::PENDING;
  std::vector<Card> hand;

  explicit PlayerState (const PlayerId& i)
    : id(i)
  {}

  /**
   * Returns true if the player still has to act in the current round.
   */
  bool
  IsActive () const
  {
    return inRound && !stood && !bust;
  }

};

/**
 * The card engine behind a blackjack room.  The room itself only keeps
 * track of seats; dealing, turns and scoring are done by an instance of
 * this interface.
 */
class Engine
{

public:

  Engine () = default;
  virtual ~Engine () = default;

  Engine (const Engine&) = delete;
  void operator= (const Engine&) = delete;

  virtual Phase GetPhase () const = 0;

  /**
   * Adds the player to the table if not yet there.  New players take part
   * from the next round on.
   */
  virtual void EnsurePlayer (const PlayerId& id) = 0;

  /**
   * Removes the player from the table, also in the middle of a round.
   */
  virtual void RemovePlayer (const PlayerId& id) = 0;

  /**
   * Deals a new round.  Returns false if that is not possible right now.
   */
  virtual bool StartRound () = 0;

  /**
   * Applies a player action.  Returns false if the action is not valid
   * (wrong phase, not the player's turn).
   */
  virtual bool ApplyAction (const PlayerId& id, Action a) = 0;

  /**
   * Returns the player whose turn it is, or the empty string outside of
   * the player turns.
   */
  virtual PlayerId GetCurrentPlayer () const = 0;

  virtual const std::vector<PlayerState>& GetPlayers () const = 0;
  virtual const std::vector<Card>& GetDealerHand () const = 0;

  /**
   * Returns true if the dealer's hole card may be shown.
   */
  virtual bool IsDealerRevealed () const = 0;

};

/**
 * The standard engine:  one to four players against the dealer, a fixed
 * bet of one chip, dealer draws to 17.
 */
class BlackjackEngine : public Engine
{

private:

  Phase phase = Phase::LOBBY;

  gamehub::Deck deck;

  std::vector<PlayerState> players;
  std::vector<Card> dealerHand;

  /** Index into players of whose turn it is, or -1.  */
  int currentIndex = -1;

  /**
   * Finds the next player after the given index that still has to act.
   * Returns -1 if there is none.
   */
  int FindNextActive (int after) const;

  /**
   * Moves the turn on from the given index (exclusive), or to the dealer
   * if no player is left to act.
   */
  void AdvanceTurn (int after);

  /**
   * Plays out the dealer's hand and settles the round.
   */
  void PlayDealer ();

  /**
   * Settles the round:  sets the result of each player in the round and
   * updates their chips.
   */
  void ComputeResults ();

  friend class BlackjackEngineTests;

public:

  explicit BlackjackEngine (gamehub::Random&& rnd);

  Phase
  GetPhase () const override
  {
    return phase;
  }

  void EnsurePlayer (const PlayerId& id) override;
  void RemovePlayer (const PlayerId& id) override;
  bool StartRound () override;
  bool ApplyAction (const PlayerId& id, Action a) override;

  PlayerId GetCurrentPlayer () const override;

  const std::vector<PlayerState>&
  GetPlayers () const override
  {
    return players;
  }

  const std::vector<Card>&
  GetDealerHand () const override
  {
    return dealerHand;
  }

  bool IsDealerRevealed () const override;

  size_t
  GetDeckCount () const
  {
    return deck.GetCount ();
  }

};

} // namespace blackjack

#endif // GAMEHUB_BLACKJACK_ENGINE_HPP
