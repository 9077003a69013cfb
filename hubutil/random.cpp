// Copyright (C) 2026 The Gamehub developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "random.hpp"

#include "hash.hpp"

#include <glog/logging.h>

#include <limits>

namespace gamehub
{

Random::Random ()
{
  seed.SetNull ();
}

Random::Random (Random&& other)
{
  *this = std::move (other);
}

Random&
Random::operator= (Random&& other)
{
  seed = other.seed;
  nextIndex = other.nextIndex;

  other.seed.SetNull ();
  other.nextIndex = 0;

  return *this;
}

void
Random::Seed (const Digest& s)
{
  CHECK (!s.IsNull ()) << "Cannot seed Random with the null value";
  seed = s;
  nextIndex = 0;
}

bool
Random::IsSeeded () const
{
  return !seed.IsNull ();
}

Random
Random::BranchOff (const std::string& key) const
{
  CHECK (IsSeeded ()) << "Random instance has not been seeded";

  SHA256 hasher;
  hasher << seed << key;

  Random res;
  res.Seed (hasher.Finalise ());

  return res;
}

template <>
  unsigned char
  Random::Next<unsigned char> ()
{
  CHECK (IsSeeded ()) << "Random instance has not been seeded";

  CHECK_LE (nextIndex, Digest::NUM_BYTES);
  if (nextIndex == Digest::NUM_BYTES)
    {
      SHA256 hasher;
      hasher << seed;
      seed = hasher.Finalise ();
      nextIndex = 0;
    }

  return seed.GetBlob ()[nextIndex++];
}

template <>
  bool
  Random::Next<bool> ()
{
  return Next<unsigned char> () & 1;
}

namespace
{

/**
 * Requests two "half width" integers and combines them big-endian into
 * one of double width.
 */
template <typename T, typename Half, unsigned HalfBits>
  T
  CombineHalves (Random& rnd)
{
  T res = rnd.Next<Half> ();
  res <<= HalfBits;
  res |= rnd.Next<Half> ();

  return res;
}

} // anonymous namespace

template <>
  uint16_t
  Random::Next<uint16_t> ()
{
  return CombineHalves<uint16_t, unsigned char, 8> (*this);
}

template <>
  uint32_t
  Random::Next<uint32_t> ()
{
  return CombineHalves<uint32_t, uint16_t, 16> (*this);
}

template <>
  uint64_t
  Random::Next<uint64_t> ()
{
  return CombineHalves<uint64_t, uint32_t, 32> (*this);
}

uint32_t
Random::NextInt (const uint32_t n)
{
  CHECK_GT (n, 0);

  /* Reroll values from the top partial block, so that "x % n" is exactly
     uniform over [0, n).  */
  const uint64_t factor = std::numeric_limits<uint64_t>::max () / n;
  const uint64_t m = factor * n;

  while (true)
    {
      const uint64_t x = Next<uint64_t> ();
      if (x < m)
        return x % n;
    }
}

} // namespace gamehub
