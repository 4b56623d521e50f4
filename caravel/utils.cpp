// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#include "xprecompiled.hpp"
#include "utils.hpp"
#include "static/logger.hpp"
#define UNW_LOCAL_ONLY  1
#include <libunwind.h>
namespace caravel {

bool
do_is_log_enabled(uint8_t level)
  noexcept
  {
    return logger.enabled(level);
  }

bool
do_push_log_message(uint8_t level, const char* func, const char* file, uint32_t line,
                    const void* composer, message_composer_fn* composer_fn)
  {
    ::rocket::tinyfmt_str fmt;
    (* composer_fn) (fmt, composer);
    cow_string sbuf = fmt.extract_string();
    sbuf.erase(sbuf.rfind_not_of(" \t\r\n") + 1);

    // Enqueue the message.
    logger.enqueue(level, func, file, line, sbuf);
    return true;
  }

namespace {

void
do_append_backtrace(cow_string& sbuf)
  {
    ::unw_context_t unw_ctx;
    ::unw_cursor_t unw_top;
    if((::unw_getcontext(&unw_ctx) != 0) || (::unw_init_local(&unw_top, &unw_ctx) != 0))
      return;

    // Frame indices are right-aligned to the width of the largest one.
    size_t nframes = 0;
    ::unw_cursor_t unw_cur = unw_top;
    while(::unw_step(&unw_cur) > 0)
      nframes ++;

    ::rocket::ascii_numput nump;
    nump.put_DU(nframes);
    size_t index_width = nump.size();

    sbuf += "\n[stack backtrace:";
    size_t index = 0;
    unw_cur = unw_top;
    while(::unw_step(&unw_cur) > 0) {
      nump.put_DU(++ index);
      sbuf += "\n  ";
      sbuf.append(index_width - nump.size(), ' ');
      sbuf.append(nump.data(), nump.size());
      sbuf += ") ";

      ::unw_word_t unw_value;
      ::unw_get_reg(&unw_cur, UNW_REG_IP, &unw_value);
      nump.put_XU(unw_value);
      sbuf.append(nump.data(), nump.size());

      char proc_name[1024];
      if(::unw_get_proc_name(&unw_cur, proc_name, sizeof(proc_name), &unw_value) != 0) {
        sbuf += " (unknown)";
        continue;
      }

      sbuf += " `";
      sbuf += proc_name;
      sbuf += "`";
      if(unw_value != 0) {
        nump.put_XU(unw_value);
        sbuf += "+";
        sbuf.append(nump.data(), nump.size());
      }
    }
    sbuf += "\n  -- end of stack backtrace]";
  }

}  // namespace

cow_string
do_compose_error_message(const char* func, const char* file, uint32_t line,
                         const void* composer, message_composer_fn* composer_fn)
  {
    ::rocket::tinyfmt_str fmt;
    (* composer_fn) (fmt, composer);
    cow_string sbuf = fmt.extract_string();
    sbuf.erase(sbuf.rfind_not_of(" \t\r\n") + 1);

    // `[thrown from function `func` at 'file:line']`
    ::rocket::ascii_numput nump;
    nump.put_DU(line);
    sbuf += "\n[thrown from function `";
    sbuf += func;
    sbuf += "` at '";
    sbuf += file;
    sbuf += ":";
    sbuf.append(nump.data(), nump.size());
    sbuf += "']";

    do_append_backtrace(sbuf);
    return sbuf;
  }

::std::runtime_error
do_create_runtime_error(const char* func, const char* file, uint32_t line,
                        const void* composer, message_composer_fn* composer_fn)
  {
    cow_string sbuf = do_compose_error_message(func, file, line, composer, composer_fn);
    return ::std::runtime_error(sbuf.c_str());
  }

chars_view
trim_blank(chars_view text)
  noexcept
  {
    const char* bptr = text.p;
    const char* eptr = text.p + text.n;

    while((bptr != eptr) && ((bptr[0] == ' ') || (bptr[0] == '\t')))
      bptr ++;

    while((bptr != eptr) && ((eptr[-1] == ' ') || (eptr[-1] == '\t')))
      eptr --;

    return chars_view(bptr, static_cast<size_t>(eptr - bptr));
  }

}  // namespace caravel
