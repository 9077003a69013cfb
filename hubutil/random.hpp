// Copyright (C) 2026 The Gamehub developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef HUBUTIL_RANDOM_HPP
#define HUBUTIL_RANDOM_HPP

#include "digest.hpp"

#include <cstdint>
#include <string>

namespace gamehub
{

/**
 * Handle for generating deterministic "random" numbers based off an
 * initial seed.  Every room owns its own instance, so that shuffles and
 * side assignments are reproducible per room (given the seed) and
 * independent between rooms.
 */
class Random
{

private:

  /**
   * The current state.  Its bytes are given out one by one, and when they
   * run out, the next state is computed by hashing the previous one.
   */
  Digest seed;

  /** Index of the next byte to give out for the current seed.  */
  unsigned nextIndex = 0;

public:

  /**
   * Constructs an unseeded instance.  Seed() must be called before any
   * numbers are extracted.
   */
  Random ();

  /**
   * Random instances are movable (but not copyable).  Moving transfers
   * the future stream to the target and leaves the source unseeded.
   */
  Random (Random&&);
  Random& operator= (Random&&);

  Random (const Random&) = delete;
  void operator= (const Random&) = delete;

  /**
   * Sets / replaces the seed.
   */
  void Seed (const Digest& s);

  /**
   * Returns true if the instance has been seeded.
   */
  bool IsSeeded () const;

  /**
   * Branches off a new instance, seeded from this instance's state and the
   * given key.  The state of this instance is not changed.  This is how the
   * room registry derives one independent stream per room code.
   */
  Random BranchOff (const std::string& key) const;

  /**
   * Extracts the next byte or wider unsigned integer (or bool).
   */
  template <typename T>
    T Next ();

  /**
   * Returns a uniformly distributed integer i with 0 <= i < n.
   */
  uint32_t NextInt (uint32_t n);

  /**
   * Permutes the given range of random-access iterators in place with a
   * Fisher-Yates pass:  for each index i from the last down to 1, the
   * element is swapped with one at a uniform index in [0, i].
   */
  template <typename Iterator>
    void Shuffle (Iterator begin, Iterator end);

};

} // namespace gamehub

#include "random.tpp"

#endif // HUBUTIL_RANDOM_HPP
