// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "http_datetime.hpp"
#include "http_error.hpp"
#include "../utils.hpp"
#include <time.h>
namespace caravel {
namespace {

/* https://www.rfc-editor.org/rfc/rfc9110#section-5.6.7

   HTTP-date    = IMF-fixdate / obs-date
   IMF-fixdate  = day-name "," SP date1 SP time-of-day SP GMT
   rfc850-date  = day-name-l "," SP date2 SP time-of-day SP GMT
   asctime-date = day-name SP date3 SP time-of-day SP year
   date1        = day SP month SP year
                ; e.g., 02 Jun 1982
   date2        = day "-" month "-" 2DIGIT
                ; e.g., 02-Jun-82
   date3        = month SP ( 2DIGIT / ( SP DIGIT ))
                ; e.g., Jun  2
*/

constexpr char s_2digit[100][2] =
  {
    '0','0','0','1','0','2','0','3','0','4','0','5','0','6','0','7','0','8','0','9',
    '1','0','1','1','1','2','1','3','1','4','1','5','1','6','1','7','1','8','1','9',
    '2','0','2','1','2','2','2','3','2','4','2','5','2','6','2','7','2','8','2','9',
    '3','0','3','1','3','2','3','3','3','4','3','5','3','6','3','7','3','8','3','9',
    '4','0','4','1','4','2','4','3','4','4','4','5','4','6','4','7','4','8','4','9',
    '5','0','5','1','5','2','5','3','5','4','5','5','5','6','5','7','5','8','5','9',
    '6','0','6','1','6','2','6','3','6','4','6','5','6','6','6','7','6','8','6','9',
    '7','0','7','1','7','2','7','3','7','4','7','5','7','6','7','7','7','8','7','9',
    '8','0','8','1','8','2','8','3','8','4','8','5','8','6','8','7','8','8','8','9',
    '9','0','9','1','9','2','9','3','9','4','9','5','9','6','9','7','9','8','9','9',
  };

constexpr char s_sp1digit[100][2] =
  {
    ' ','0',' ','1',' ','2',' ','3',' ','4',' ','5',' ','6',' ','7',' ','8',' ','9',
    '1','0','1','1','1','2','1','3','1','4','1','5','1','6','1','7','1','8','1','9',
    '2','0','2','1','2','2','2','3','2','4','2','5','2','6','2','7','2','8','2','9',
    '3','0','3','1','3','2','3','3','3','4','3','5','3','6','3','7','3','8','3','9',
    '4','0','4','1','4','2','4','3','4','4','4','5','4','6','4','7','4','8','4','9',
    '5','0','5','1','5','2','5','3','5','4','5','5','5','6','5','7','5','8','5','9',
    '6','0','6','1','6','2','6','3','6','4','6','5','6','6','6','7','6','8','6','9',
    '7','0','7','1','7','2','7','3','7','4','7','5','7','6','7','7','7','8','7','9',
    '8','0','8','1','8','2','8','3','8','4','8','5','8','6','8','7','8','8','8','9',
    '9','0','9','1','9','2','9','3','9','4','9','5','9','6','9','7','9','8','9','9',
  };

constexpr char s_weekday[7][12] =
  {
    "Sunday", "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday"
  };

constexpr char s_month[12][4] =
  {
    "Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"
  };

struct Scan_State
  {
    const char* rptr;
    const char* eptr;

    explicit
    Scan_State(chars_view str) noexcept
      :
        rptr(str.p), eptr(str.p + str.n)
      { }
  };

inline
bool
do_match(Scan_State& st, const char* cstr, size_t len)
  noexcept
  {
    // If a previous match has failed, don't do anything.
    if(st.rptr == nullptr)
      return false;

    if((static_cast<size_t>(st.eptr - st.rptr) >= len) && (::memcmp(st.rptr, cstr, len) == 0)) {
      // A match has been found, so move the read pointer past it.
      st.rptr += len;
      return true;
    }

    // No match has been found, so mark this as a failure.
    st.rptr = nullptr;
    return false;
  }

template<uint32_t N, uint32_t S>
inline
bool
do_match(Scan_State& st, int& add_to_value, const char (&cstrs)[N][S], int limit)
  noexcept
  {
    // If a previous match has failed, don't do anything.
    if(st.rptr == nullptr)
      return false;

    for(uint32_t k = 0;  k != N;  ++k) {
      size_t len = (limit >= 0) ? static_cast<uint32_t>(limit) : ::strnlen(cstrs[k], S);
      if((static_cast<size_t>(st.eptr - st.rptr) >= len) && (::memcmp(st.rptr, cstrs[k], len) == 0)) {
        // A match has been found, so move the read pointer past it.
        st.rptr += len;
        add_to_value += static_cast<int>(k);
        return true;
      }
    }

    // No match has been found, so mark this as a failure.
    st.rptr = nullptr;
    return false;
  }

size_t
do_finish(unix_time& tp, const Scan_State& st, chars_view str, ::tm& tm)
  noexcept
  {
    // Accept nothing if any of the operations above has failed.
    if(st.rptr == nullptr)
      return 0;

    if((tm.tm_mday < 1) || (tm.tm_hour > 23) || (tm.tm_min > 59) || (tm.tm_sec > 60))
      return 0;

    // Compose the timestamp and return the number of characters that have
    // been accepted.
    tp = unix_time(seconds(::timegm(&tm)));
    return static_cast<size_t>(st.rptr - str.p);
  }

inline
void
do_2digit(char*& wptr, int value)
  noexcept
  {
    xmemrpcpy(wptr, s_2digit[static_cast<uint32_t>(value) % 100], 2);
  }

}  // namespace

HTTP_DateTime::
HTTP_DateTime(chars_view str)
  {
    size_t r = this->parse(str);
    if(r != str.n)
      CARAVEL_HTTP_THROW(http_error_invalid_datetime, (
          "Could not parse HTTP date/time string `$1`"),
          str);
  }

HTTP_DateTime
HTTP_DateTime::
now()
  noexcept
  {
    return time_point_cast<seconds>(system_clock::now());
  }

size_t
HTTP_DateTime::
parse_rfc1123_partial(chars_view str)
  noexcept
  {
    Scan_State st(str);
    ::tm tm = { };

    // `Sun, 06 Nov 1994 08:49:37 GMT`
    do_match(st, tm.tm_wday, s_weekday, 3);
    do_match(st, ", ", 2);
    do_match(st, tm.tm_mday, s_2digit, 2);
    do_match(st, " ", 1);
    do_match(st, tm.tm_mon, s_month, 3);
    do_match(st, " ", 1);
    do_match(st, tm.tm_year, s_2digit, 2);
    tm.tm_year = tm.tm_year * 100 - 1900;
    do_match(st, tm.tm_year, s_2digit, 2);
    do_match(st, " ", 1);
    do_match(st, tm.tm_hour, s_2digit, 2);
    do_match(st, ":", 1);
    do_match(st, tm.tm_min, s_2digit, 2);
    do_match(st, ":", 1);
    do_match(st, tm.tm_sec, s_2digit, 2);
    do_match(st, " GMT", 4);

    return do_finish(this->m_tp, st, str, tm);
  }

size_t
HTTP_DateTime::
parse_rfc850_partial(chars_view str)
  noexcept
  {
    Scan_State st(str);
    ::tm tm = { };

    // `Sunday, 06-Nov-94 08:49:37 GMT`
    do_match(st, tm.tm_wday, s_weekday, -1);
    do_match(st, ", ", 2);
    do_match(st, tm.tm_mday, s_2digit, 2);
    do_match(st, "-", 1);
    do_match(st, tm.tm_mon, s_month, 3);
    do_match(st, "-", 1);
    do_match(st, tm.tm_year, s_2digit, 2);
    tm.tm_year += ((tm.tm_year - 70) >> 15) & 100;
    do_match(st, " ", 1);
    do_match(st, tm.tm_hour, s_2digit, 2);
    do_match(st, ":", 1);
    do_match(st, tm.tm_min, s_2digit, 2);
    do_match(st, ":", 1);
    do_match(st, tm.tm_sec, s_2digit, 2);
    do_match(st, " GMT", 4);

    return do_finish(this->m_tp, st, str, tm);
  }

size_t
HTTP_DateTime::
parse_asctime_partial(chars_view str)
  noexcept
  {
    Scan_State st(str);
    ::tm tm = { };

    // `Sun Nov  6 08:49:37 1994`
    do_match(st, tm.tm_wday, s_weekday, 3);
    do_match(st, " ", 1);
    do_match(st, tm.tm_mon, s_month, 3);
    do_match(st, " ", 1);
    do_match(st, tm.tm_mday, s_sp1digit, 2);
    do_match(st, " ", 1);
    do_match(st, tm.tm_hour, s_2digit, 2);
    do_match(st, ":", 1);
    do_match(st, tm.tm_min, s_2digit, 2);
    do_match(st, ":", 1);
    do_match(st, tm.tm_sec, s_2digit, 2);
    do_match(st, " ", 1);
    do_match(st, tm.tm_year, s_2digit, 2);
    tm.tm_year = tm.tm_year * 100 - 1900;
    do_match(st, tm.tm_year, s_2digit, 2);

    return do_finish(this->m_tp, st, str, tm);
  }

size_t
HTTP_DateTime::
parse(chars_view str)
  noexcept
  {
    // The RFC 850 format is tried first, as its weekday is a superstring of
    // that of the others.
    size_t acc_len = this->parse_rfc850_partial(str);

    if(acc_len == 0)
      acc_len = this->parse_rfc1123_partial(str);

    if(acc_len == 0)
      acc_len = this->parse_asctime_partial(str);

    return acc_len;
  }

size_t
HTTP_DateTime::
print_rfc1123_partial(char* str)
  const noexcept
  {
    char* wptr = str;
    ::time_t tp = static_cast<::time_t>(this->m_tp.time_since_epoch().count());
    ::tm tm;
    ::gmtime_r(&tp, &tm);

    // `Sun, 06 Nov 1994 08:49:37 GMT`
    xmemrpcpy(wptr, s_weekday[static_cast<uint32_t>(tm.tm_wday)], 3);
    xmemrpcpy(wptr, ", ", 2);
    do_2digit(wptr, tm.tm_mday);
    xmemrpcpy(wptr, " ", 1);
    xmemrpcpy(wptr, s_month[static_cast<uint32_t>(tm.tm_mon)], 3);
    xmemrpcpy(wptr, " ", 1);
    do_2digit(wptr, tm.tm_year / 100 + 19);
    do_2digit(wptr, tm.tm_year % 100);
    xmemrpcpy(wptr, " ", 1);
    do_2digit(wptr, tm.tm_hour);
    xmemrpcpy(wptr, ":", 1);
    do_2digit(wptr, tm.tm_min);
    xmemrpcpy(wptr, ":", 1);
    do_2digit(wptr, tm.tm_sec);
    xmemrpcpy(wptr, " GMT", 4);

    // Return the number of characters that have been written.
    return static_cast<size_t>(wptr - str);
  }

size_t
HTTP_DateTime::
print_rfc850_partial(char* str)
  const noexcept
  {
    char* wptr = str;
    ::time_t tp = static_cast<::time_t>(this->m_tp.time_since_epoch().count());
    ::tm tm;
    ::gmtime_r(&tp, &tm);

    // `Sunday, 06-Nov-94 08:49:37 GMT`
    const char* wday = s_weekday[static_cast<uint32_t>(tm.tm_wday)];
    xmemrpcpy(wptr, wday, ::strlen(wday));
    xmemrpcpy(wptr, ", ", 2);
    do_2digit(wptr, tm.tm_mday);
    xmemrpcpy(wptr, "-", 1);
    xmemrpcpy(wptr, s_month[static_cast<uint32_t>(tm.tm_mon)], 3);
    xmemrpcpy(wptr, "-", 1);
    do_2digit(wptr, tm.tm_year % 100);
    xmemrpcpy(wptr, " ", 1);
    do_2digit(wptr, tm.tm_hour);
    xmemrpcpy(wptr, ":", 1);
    do_2digit(wptr, tm.tm_min);
    xmemrpcpy(wptr, ":", 1);
    do_2digit(wptr, tm.tm_sec);
    xmemrpcpy(wptr, " GMT", 4);

    // Return the number of characters that have been written.
    return static_cast<size_t>(wptr - str);
  }

size_t
HTTP_DateTime::
print_asctime_partial(char* str)
  const noexcept
  {
    char* wptr = str;
    ::time_t tp = static_cast<::time_t>(this->m_tp.time_since_epoch().count());
    ::tm tm;
    ::gmtime_r(&tp, &tm);

    // `Sun Nov  6 08:49:37 1994`
    xmemrpcpy(wptr, s_weekday[static_cast<uint32_t>(tm.tm_wday)], 3);
    xmemrpcpy(wptr, " ", 1);
    xmemrpcpy(wptr, s_month[static_cast<uint32_t>(tm.tm_mon)], 3);
    xmemrpcpy(wptr, " ", 1);
    xmemrpcpy(wptr, s_sp1digit[static_cast<uint32_t>(tm.tm_mday)], 2);
    xmemrpcpy(wptr, " ", 1);
    do_2digit(wptr, tm.tm_hour);
    xmemrpcpy(wptr, ":", 1);
    do_2digit(wptr, tm.tm_min);
    xmemrpcpy(wptr, ":", 1);
    do_2digit(wptr, tm.tm_sec);
    xmemrpcpy(wptr, " ", 1);
    do_2digit(wptr, tm.tm_year / 100 + 19);
    do_2digit(wptr, tm.tm_year % 100);

    // Return the number of characters that have been written.
    return static_cast<size_t>(wptr - str);
  }

tinyfmt&
HTTP_DateTime::
print(tinyfmt& fmt)
  const
  {
    char str[64];
    size_t len = this->print_rfc1123_partial(str);
    return fmt.putn(str, len);
  }

cow_string
HTTP_DateTime::
print_to_string()
  const
  {
    char str[64];
    size_t len = this->print_rfc1123_partial(str);
    return cow_string(str, len);
  }

}  // namespace caravel
