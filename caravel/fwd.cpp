// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#include "xprecompiled.hpp"
#include "fwd.hpp"
#include "static/main_config.hpp"
#include "static/logger.hpp"
namespace caravel {

const cow_string empty_cow_string;

atomic_relaxed<int> exit_signal;
Main_Config& main_config = *new Main_Config;
Logger& logger = *new Logger;

}  // namespace caravel
