// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#ifndef CARAVEL_UTILS_
#define CARAVEL_UTILS_

#include "fwd.hpp"
#include "details/error_handling.hpp"
namespace caravel {

// Compose a log message and enqueue it into the global logger. The `TEMPLATE`
// argument shall be a list of string literals in parentheses. Multiple strings
// are joined with line separators. `format()` is to be found via ADL.
#define CARAVEL_LOG_(LEVEL, TEMPLATE, ...)  \
  (::caravel::do_is_log_enabled(LEVEL)  \
   &&  \
   ([&](const char* func_ce7d) -> bool  \
      __attribute__((__nothrow__, __noinline__))  \
    {  \
      try {  \
        auto c_Ru6q = [&](::rocket::tinyfmt& fmt_Ko0i)  \
          {  \
            using ::asteria::format;  \
            format(fmt_Ko0i, (::asteria::make_string_template TEMPLATE),  \
                    ##__VA_ARGS__);  \
          };  \
        \
        ::caravel::do_push_log_message(\
            LEVEL, func_ce7d, __FILE__, __LINE__,  \
            &c_Ru6q,  \
            [](::rocket::tinyfmt& fmt_Ko0i, const void* p_5Gae)  \
              { (* static_cast<const decltype(c_Ru6q)*>(p_5Gae)) (fmt_Ko0i);  });  \
      }  \
      catch(::std::exception& ex_Wq2n) {  \
        ::fprintf(stderr, "WARNING: Could not compose log message: %s\n",  \
                  ex_Wq2n.what());  \
      }  \
      return true;  \
    } (__func__)))

#define CARAVEL_LOG_FATAL(...)   CARAVEL_LOG_(0, __VA_ARGS__)
#define CARAVEL_LOG_ERROR(...)   CARAVEL_LOG_(1, __VA_ARGS__)
#define CARAVEL_LOG_WARN(...)    CARAVEL_LOG_(2, __VA_ARGS__)
#define CARAVEL_LOG_INFO(...)    CARAVEL_LOG_(3, __VA_ARGS__)
#define CARAVEL_LOG_DEBUG(...)   CARAVEL_LOG_(4, __VA_ARGS__)
#define CARAVEL_LOG_TRACE(...)   CARAVEL_LOG_(5, __VA_ARGS__)

// Throws an `std::runtime_error` object. The `TEMPLATE` argument shall be a
// list of string literals in parentheses. Multiple strings are joined with
// line separators. `format()` is to be found via ADL.
#define CARAVEL_THROW(TEMPLATE, ...)  \
  (throw \
   ([&](const char* func_ce7d) -> ::std::runtime_error  \
      __attribute__((__noinline__))  \
    {  \
      auto c_Ru6q = [&](::rocket::tinyfmt& fmt_Ko0i)  \
        {  \
          using ::asteria::format;  \
          format(fmt_Ko0i, (::asteria::make_string_template TEMPLATE),  \
                  ##__VA_ARGS__);  \
        };  \
      \
      return ::caravel::do_create_runtime_error(\
          func_ce7d, __FILE__, __LINE__,  \
          &c_Ru6q,  \
          [](::rocket::tinyfmt& fmt_Ko0i, const void* p_5Gae)  \
            { (* static_cast<const decltype(c_Ru6q)*>(p_5Gae)) (fmt_Ko0i);  });  \
    } (__func__)))

#define CARAVEL_CHECK(...)  \
  (static_cast<bool>(__VA_ARGS__)  \
    ? void()  \
    : CARAVEL_THROW(("CARAVEL_CHECK failed: " #__VA_ARGS__)))

// Removes leading and trailing spaces and tabs.
chars_view
trim_blank(chars_view text)
  noexcept;

}  // namespace caravel
#endif
