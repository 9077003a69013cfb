// Copyright (C) 2026 The Gamehub developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/* Template code for random.hpp.  */

#include <glog/logging.h>

#include <limits>
#include <utility>

namespace gamehub
{

template <typename Iterator>
  void
  Random::Shuffle (const Iterator begin, const Iterator end)
{
  const auto n = end - begin;
  CHECK_LE (n, std::numeric_limits<uint32_t>::max ());

  for (auto i = n - 1; i > 0; --i)
    {
      const auto j = NextInt (static_cast<uint32_t> (i + 1));
      if (j != static_cast<uint32_t> (i))
        std::swap (*(begin + i), *(begin + j));
    }
}

} // namespace gamehub
