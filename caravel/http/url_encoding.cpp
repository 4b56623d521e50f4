// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "url_encoding.hpp"
#include "http_error.hpp"
#include "../utils.hpp"
namespace caravel {
namespace {

inline
int
do_xdigit_value(char c) noexcept
  {
    switch(c)
      {
      case '0' ... '9':
        return c - '0';

      case 'A' ... 'F':
        return c - 'A' + 10;

      case 'a' ... 'f':
        return c - 'a' + 10;

      default:
        return -1;
      }
  }

}  // namespace

void
url_encode(cow_string& out, chars_view text)
  {
    char seq[4] = "%";
    int dval;

    for(size_t k = 0;  k != text.n;  ++k)
      switch(text.p[k])
        {
        case '0' ... '9':
        case 'A' ... 'Z':
        case 'a' ... 'z':
        case '-':
        case '_':
        case '.':
        case '~':
          // These characters are safe.
          out.push_back(text.p[k]);
          break;

        default:
          // Encode this unsafe character.
          dval = static_cast<unsigned char>(text.p[k]) >> 4 & 0x0F;
          seq[1] = static_cast<char>(dval + '0' + ((9 - dval) >> 15 & 7));
          dval = static_cast<unsigned char>(text.p[k]) & 0x0F;
          seq[2] = static_cast<char>(dval + '0' + ((9 - dval) >> 15 & 7));
          out.append(seq, 3);
          break;
        }
  }

cow_string
url_encode(chars_view text)
  {
    cow_string out;
    out.reserve(text.n);
    url_encode(out, text);
    return out;
  }

void
url_decode(cow_string& out, chars_view text)
  {
    size_t k = 0;
    while(k != text.n) {
      char c = text.p[k];
      if(c == '+') {
        out.push_back(' ');
        k ++;
        continue;
      }

      if(c != '%') {
        out.push_back(c);
        k ++;
        continue;
      }

      if(text.n - k < 3)
        CARAVEL_URI_THROW(uri_error_decode, (
            "Incomplete percent-encoded sequence at offset `$1`"),
            k);

      int dhi = do_xdigit_value(text.p[k+1]);
      int dlo = do_xdigit_value(text.p[k+2]);
      if((dhi < 0) || (dlo < 0))
        CARAVEL_URI_THROW(uri_error_decode, (
            "Invalid percent-encoded sequence `$1` at offset `$2`"),
            chars_view(text.p + k, 3), k);

      out.push_back(static_cast<char>(dhi << 4 | dlo));
      k += 3;
    }
  }

cow_string
url_decode(chars_view text)
  {
    cow_string out;
    out.reserve(text.n);
    url_decode(out, text);
    return out;
  }

}  // namespace caravel
