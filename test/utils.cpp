// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#include "utils.hpp"
#include "../caravel/utils.hpp"
using namespace ::caravel;

int
main()
  {
    try {
      CARAVEL_THROW((
          "test $1 $2 $$/end"),
          "exception:", 42);
    }
    catch(exception& e) {
      CARAVEL_TEST_CHECK(::std::strstr(e.what(),
          "test exception: 42 $/end") != nullptr);
      CARAVEL_TEST_CHECK(::std::strstr(e.what(),
          "\n[thrown from function `main` at '") != nullptr);
      CARAVEL_TEST_CHECK(::std::strstr(e.what(),
          "\n[stack backtrace:\n") != nullptr);
      CARAVEL_TEST_CHECK(::std::strstr(e.what(),
          "\n  -- end of stack backtrace]") != nullptr);
    }

    try {
      int value = 1;
      CARAVEL_CHECK(value == 2);
      CARAVEL_TEST_CHECK(false);
    }
    catch(exception& e) {
      CARAVEL_TEST_CHECK(::std::strstr(e.what(),
          "CARAVEL_CHECK failed: value == 2") != nullptr);
    }

    CARAVEL_CHECK(1 + 1 == 2);

    chars_view r = trim_blank(" \t hello world\t ");
    CARAVEL_TEST_CHECK(r.n == 11);
    CARAVEL_TEST_CHECK(::memcmp(r.p, "hello world", 11) == 0);

    r = trim_blank("hello");
    CARAVEL_TEST_CHECK(r.n == 5);

    r = trim_blank(" \t \t ");
    CARAVEL_TEST_CHECK(r.n == 0);

    r = trim_blank("");
    CARAVEL_TEST_CHECK(r.n == 0);
  }
