// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#ifndef CARAVEL_DETAILS_ERROR_HANDLING_
#define CARAVEL_DETAILS_ERROR_HANDLING_

#include "../fwd.hpp"
namespace caravel {

using message_composer_fn = void (tinyfmt&, const void*);

bool
do_is_log_enabled(uint8_t level) noexcept __attribute__((__pure__));

bool
do_push_log_message(uint8_t level, const char* func, const char* file, uint32_t line,
                    const void* composer, message_composer_fn* composer_fn);

// Composes an error message, then appends the source location and a stack
// backtrace to it.
cow_string
do_compose_error_message(const char* func, const char* file, uint32_t line,
                         const void* composer, message_composer_fn* composer_fn);

::std::runtime_error
do_create_runtime_error(const char* func, const char* file, uint32_t line,
                        const void* composer, message_composer_fn* composer_fn);

}  // namespace caravel
#endif
