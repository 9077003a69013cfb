// Copyright (C) 2026 The Gamehub developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "digest.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <cstdint>

namespace gamehub
{

std::string
Digest::ToHex () const
{
  static constexpr char DIGITS[] = "0123456789abcdef";

  std::string result(NUM_BYTES * 2, 'x');
  for (size_t i = 0; i < NUM_BYTES; ++i)
    {
      result[2 * i] = DIGITS[data[i] >> 4];
      result[2 * i + 1] = DIGITS[data[i] & 0x0F];
    }

  return result;
}

namespace
{

bool
HexDigitValue (const char digit, unsigned& value)
{
  if (digit >= '0' && digit <= '9')
    value = digit - '0';
  else if (digit >= 'a' && digit <= 'f')
    value = 10 + (digit - 'a');
  else if (digit >= 'A' && digit <= 'F')
    value = 10 + (digit - 'A');
  else
    {
      LOG (ERROR) << "Invalid hex digit: '" << digit << "'";
      return false;
    }

  return true;
}

} // anonymous namespace

bool
Digest::FromHex (const std::string& hex)
{
  if (hex.size () != NUM_BYTES * 2)
    {
      LOG (ERROR) << "Hex string for seed has wrong size: " << hex;
      return false;
    }

  Array parsed;
  for (size_t i = 0; i < NUM_BYTES; ++i)
    {
      unsigned hi, lo;
      if (!HexDigitValue (hex[2 * i], hi) || !HexDigitValue (hex[2 * i + 1], lo))
        return false;
      parsed[i] = static_cast<unsigned char> ((hi << 4) | lo);
    }

  data = parsed;
  return true;
}

void
Digest::FromBlob (const unsigned char* blob)
{
  std::copy (blob, blob + NUM_BYTES, data.begin ());
}

bool
Digest::IsNull () const
{
  return std::all_of (data.begin (), data.end (),
                      [] (const unsigned char b) { return b == 0; });
}

void
Digest::SetNull ()
{
  data.fill (0);
}

} // namespace gamehub
