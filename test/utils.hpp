// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#ifndef CARAVEL_TEST_UTILS_
#define CARAVEL_TEST_UTILS_

#include "../caravel/xprecompiled.hpp"
#include "../caravel/fwd.hpp"
#include "../caravel/http/http_error.hpp"
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>

#define CARAVEL_TEST_CHECK(expr)  \
  ((static_cast<bool>(expr))  \
    ? void(::fprintf(stderr, "PASS  %s\n", #expr))  \
    : (::fprintf(stderr, "FAIL  %s\n  at '%s:%d'\n", #expr, __FILE__, __LINE__),  \
       ::abort()))

#define CARAVEL_TEST_CHECK_CATCH(expr)  \
  do {  \
    try {  \
      (void) (expr);  \
    }  \
    catch(::std::exception& ex_Xq3n) {  \
      ::fprintf(stderr, "PASS  %s\n  caught: %.200s\n", #expr, ex_Xq3n.what());  \
      break;  \
    }  \
    ::fprintf(stderr, "FAIL  %s\n  at '%s:%d': exception expected\n", #expr, __FILE__, __LINE__);  \
    ::abort();  \
  }  \
  while(false)

// Expects an `HTTP_Error` with the given error code.
#define CARAVEL_TEST_CHECK_HTTP_ERROR(CODE, expr)  \
  do {  \
    try {  \
      (void) (expr);  \
    }  \
    catch(::caravel::HTTP_Error& ex_Xq3n) {  \
      if(ex_Xq3n.code() == (CODE)) {  \
        ::fprintf(stderr, "PASS  %s\n  caught: %.200s\n", #expr, ex_Xq3n.what());  \
        break;  \
      }  \
      ::fprintf(stderr, "FAIL  %s\n  at '%s:%d': error code %d, expecting %s\n",  \
                #expr, __FILE__, __LINE__, static_cast<int>(ex_Xq3n.code()), #CODE);  \
      ::abort();  \
    }  \
    ::fprintf(stderr, "FAIL  %s\n  at '%s:%d': `HTTP_Error` expected\n", #expr, __FILE__, __LINE__);  \
    ::abort();  \
  }  \
  while(false)

#endif
