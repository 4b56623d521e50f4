// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#ifndef CARAVEL_XPRECOMPILED_
#define CARAVEL_XPRECOMPILED_

#include "version.h"

// Prevent use of standard streams.
#define _IOS_BASE_H  1
#define _STREAM_ITERATOR_H  1
#define _STREAMBUF_ITERATOR_H  1
#define _GLIBCXX_ISTREAM  1
#define _GLIBCXX_OSTREAM  1
#define _GLIBCXX_IOSTREAM  1

#include <rocket/cow_string.hpp>
#include <rocket/cow_vector.hpp>
#include <rocket/prehashed_string.hpp>
#include <rocket/unique_posix_fd.hpp>
#include <rocket/optional.hpp>
#include <rocket/tinyfmt.hpp>
#include <rocket/tinyfmt_str.hpp>
#include <rocket/ascii_numput.hpp>
#include <rocket/atomic.hpp>
#include <rocket/mutex.hpp>
#include <rocket/condition_variable.hpp>

#include <memory>
#include <utility>
#include <exception>
#include <typeinfo>
#include <type_traits>
#include <algorithm>
#include <string>
#include <chrono>
#include <vector>

#include <cstdio>
#include <cstring>
#include <cerrno>

#include <sys/types.h>
#include <unistd.h>
#include <fcntl.h>

#endif
