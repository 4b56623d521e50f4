// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "http_field_name.hpp"
#include "http_error.hpp"
#include "../utils.hpp"
namespace caravel {

bool
is_http_token(chars_view text)
  noexcept
  {
    if(text.n == 0)
      return false;

    // tchar = "!" / "#" / "$" / "%" / "&" / "'" / "*" / "+" / "-" / "." /
    //         "^" / "_" / "`" / "|" / "~" / DIGIT / ALPHA
    for(size_t k = 0;  k != text.n;  ++k)
      switch(text.p[k])
        {
        case 'A' ... 'Z':
        case 'a' ... 'z':
        case '0' ... '9':
        case '!':
        case '#':
        case '$':
        case '%':
        case '&':
        case '\'':
        case '*':
        case '+':
        case '-':
        case '.':
        case '^':
        case '_':
        case '`':
        case '|':
        case '~':
          break;

        default:
          return false;
        }

    return true;
  }

void
HTTP_Field_Name::
do_validate()
  {
    if(!is_http_token(this->m_str))
      CARAVEL_HTTP_THROW(http_error_invalid_header_name, (
          "Invalid HTTP field name `$1`"),
          this->m_str);
  }

HTTP_Field_Name::
~HTTP_Field_Name()
  {
  }

bool
HTTP_Field_Name::
equals(chars_view cmps)
  const noexcept
  {
    return ::rocket::ascii_ci_equal(this->m_str.data(), this->m_str.size(),
                                    cmps.p, cmps.n);
  }

int
HTTP_Field_Name::
compare(chars_view cmps)
  const noexcept
  {
    return ::rocket::ascii_ci_compare(this->m_str.data(), this->m_str.size(),
                                      cmps.p, cmps.n);
  }

size_t
HTTP_Field_Name::
rdhash()
  const noexcept
  {
    return ::rocket::ascii_ci_hash(this->m_str.data(), this->m_str.size());
  }

}  // namespace caravel
