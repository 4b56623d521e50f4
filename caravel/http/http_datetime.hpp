// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#ifndef CARAVEL_HTTP_HTTP_DATETIME_
#define CARAVEL_HTTP_HTTP_DATETIME_

#include "../fwd.hpp"
namespace caravel {

class HTTP_DateTime
  {
  private:
    unix_time m_tp;

  public:
    // Initializes a timestamp of `1970-01-01 00:00:00 Z`.
    constexpr
    HTTP_DateTime() noexcept
      :
        m_tp()
      { }

    constexpr
    HTTP_DateTime(unix_time tp) noexcept
      :
        m_tp(tp)
      { }

    // Parses a timestamp from an HTTP date/time string, like `parse()`. If
    // the string is not a valid date/time, an `HTTP_Error` with
    // `http_error_invalid_datetime` is thrown.
    explicit
    HTTP_DateTime(chars_view str);

    HTTP_DateTime&
    swap(HTTP_DateTime& other)
      noexcept
      {
        ::std::swap(this->m_tp, other.m_tp);
        return *this;
      }

  public:
    constexpr
    unix_time
    as_unix_time()
      const noexcept
      { return this->m_tp;  }

    constexpr
    seconds
    as_seconds()
      const noexcept
      { return this->m_tp.time_since_epoch();  }

    void
    set_unix_time(unix_time tp)
      noexcept
      { this->m_tp = tp;  }

    // Gets the current time, truncated to seconds.
    static
    HTTP_DateTime
    now()
      noexcept;

    // Tries parsing a date/time in the RFC 1123 format, such as
    // `Sun, 06 Nov 1994 08:49:37 GMT`. The return value is the number of
    // characters that have been accepted, which is 29 upon success, and 0
    // upon failure.
    size_t
    parse_rfc1123_partial(chars_view str)
      noexcept;

    // Tries parsing a date/time in the obsolete RFC 850 format, such as
    // `Sunday, 06-Nov-94 08:49:37 GMT`. The return value is the number of
    // characters that have been accepted, which is within [30,33] upon
    // success, and 0 upon failure.
    size_t
    parse_rfc850_partial(chars_view str)
      noexcept;

    // Tries parsing a date/time in the obsolete asctime format, such as
    // `Sun Nov  6 08:49:37 1994`. The return value is the number of
    // characters that have been accepted, which is 24 upon success, and 0
    // upon failure.
    size_t
    parse_asctime_partial(chars_view str)
      noexcept;

    // Tries parsing a date/time in any of the formats above. The return value
    // is the number of characters that have been accepted. If zero is
    // returned, the contents of this object are unspecified.
    size_t
    parse(chars_view str)
      noexcept;

    // Converts this timestamp to the RFC 1123 format. There shall be at least
    // 29 characters in the buffer. The return value is the number of
    // characters that have been written, which is always 29.
    size_t
    print_rfc1123_partial(char* str)
      const noexcept;

    // Converts this timestamp to the RFC 850 format. There shall be at least
    // 33 characters in the buffer. The return value is the number of
    // characters that have been written, which is within [30,33].
    size_t
    print_rfc850_partial(char* str)
      const noexcept;

    // Converts this timestamp to the asctime format. There shall be at least
    // 24 characters in the buffer. The return value is the number of
    // characters that have been written, which is always 24.
    size_t
    print_asctime_partial(char* str)
      const noexcept;

    // Converts this timestamp to its string form, in the RFC 1123 format.
    tinyfmt&
    print(tinyfmt& fmt)
      const;

    cow_string
    print_to_string()
      const;
  };

constexpr
bool
operator==(const HTTP_DateTime& lhs, const HTTP_DateTime& rhs)
  noexcept
  { return lhs.as_unix_time() == rhs.as_unix_time();  }

constexpr
bool
operator!=(const HTTP_DateTime& lhs, const HTTP_DateTime& rhs)
  noexcept
  { return lhs.as_unix_time() != rhs.as_unix_time();  }

constexpr
bool
operator<(const HTTP_DateTime& lhs, const HTTP_DateTime& rhs)
  noexcept
  { return lhs.as_unix_time() < rhs.as_unix_time();  }

inline
void
swap(HTTP_DateTime& lhs, HTTP_DateTime& rhs)
  noexcept
  { lhs.swap(rhs);  }

inline
tinyfmt&
operator<<(tinyfmt& fmt, const HTTP_DateTime& ts)
  { return ts.print(fmt);  }

}  // namespace caravel
#endif
