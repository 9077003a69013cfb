// Copyright (C) 2026 The Gamehub developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef HUBUTIL_DIGEST_HPP
#define HUBUTIL_DIGEST_HPP

#include <array>
#include <cstddef>
#include <string>

namespace gamehub
{

/**
 * A 256-bit value used to seed deterministic random streams.  It is the
 * output type of SHA256 and can be converted to and from hex, but is
 * otherwise opaque.
 */
class Digest final
{

public:

  static constexpr size_t NUM_BYTES = 256 / 8;

private:

  using Array = std::array<unsigned char, NUM_BYTES>;

  /** The raw bytes.  */
  Array data;

public:

  Digest () = default;
  Digest (const Digest&) = default;
  Digest& operator= (const Digest&) = default;

  /**
   * Converts the value to a lower-case hex string.
   */
  std::string ToHex () const;

  /**
   * Parses a hex string into this object.  Returns false if the string
   * has the wrong size or contains invalid characters.
   */
  bool FromHex (const std::string& hex);

  /**
   * Returns a pointer to the raw bytes (of length NUM_BYTES).
   */
  const unsigned char*
  GetBlob () const
  {
    return data.data ();
  }

  /**
   * Sets the data from a raw blob of NUM_BYTES bytes.
   */
  void FromBlob (const unsigned char* blob);

  /**
   * Checks if this is all-zeros, which is used as "unseeded" marker.
   */
  bool IsNull () const;

  /**
   * Sets the value to all-zeros.
   */
  void SetNull ();

  friend bool
  operator== (const Digest& a, const Digest& b)
  {
    return a.data == b.data;
  }

  friend bool
  operator!= (const Digest& a, const Digest& b)
  {
    return !(a == b);
  }

};

} // namespace gamehub

#endif // HUBUTIL_DIGEST_HPP
