/* Ripple-Bridge: Core
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#include "ripple/util/util_fwd.hpp"

namespace ripple::util
{

// Implementations.

bool is_valid_utf8(String_view bytes)
{
  /* Straightforward validation per RFC 3629, table "Well-Formed UTF-8 Byte Sequences."  Each lead byte decides
   * the sequence length and the allowed range of the *first* continuation byte (which is how over-long forms,
   * surrogates, and > U+10FFFF are excluded); remaining continuation bytes are always 0x80..0xBF. */
  const auto n = bytes.size();
  size_t idx = 0;
  while (idx != n)
  {
    const auto lead = uint8_t(bytes[idx]);
    if (lead < 0x80)
    {
      ++idx;
      continue;
    }
    // else

    size_t n_cont;
    uint8_t first_lo = 0x80;
    uint8_t first_hi = 0xBF;
    if ((lead >= 0xC2) && (lead <= 0xDF))
    {
      n_cont = 1;
    }
    else if ((lead >= 0xE0) && (lead <= 0xEF))
    {
      n_cont = 2;
      if (lead == 0xE0)
      {
        first_lo = 0xA0; // Over-long otherwise.
      }
      else if (lead == 0xED)
      {
        first_hi = 0x9F; // Surrogates otherwise.
      }
    }
    else if ((lead >= 0xF0) && (lead <= 0xF4))
    {
      n_cont = 3;
      if (lead == 0xF0)
      {
        first_lo = 0x90; // Over-long otherwise.
      }
      else if (lead == 0xF4)
      {
        first_hi = 0x8F; // Beyond U+10FFFF otherwise.
      }
    }
    else
    {
      return false; // Stray continuation byte, C0/C1, or F5..FF.
    }

    if ((n - idx - 1) < n_cont)
    {
      return false; // Truncated.
    }
    // else

    const auto first = uint8_t(bytes[idx + 1]);
    if ((first < first_lo) || (first > first_hi))
    {
      return false;
    }
    // else
    for (size_t cont_idx = 2; cont_idx <= n_cont; ++cont_idx)
    {
      const auto cont = uint8_t(bytes[idx + cont_idx]);
      if ((cont < 0x80) || (cont > 0xBF))
      {
        return false;
      }
    }

    idx += 1 + n_cont;
  } // while (idx != n)

  return true;
} // is_valid_utf8()

const uint8_t* blob_data(const Blob_const& blob)
{
  return static_cast<const uint8_t*>(blob.data());
}

uint8_t* blob_data(const Blob_mutable& blob)
{
  return static_cast<uint8_t*>(blob.data());
}

} // namespace ripple::util
