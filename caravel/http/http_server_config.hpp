// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#ifndef CARAVEL_HTTP_HTTP_SERVER_CONFIG_
#define CARAVEL_HTTP_HTTP_SERVER_CONFIG_

#include "../fwd.hpp"
namespace caravel {

// These are options of the `http` section in 'main.conf' that control the
// behavior of servers. Limits of parsers are not here; they are loaded by the
// parsers themselves.
struct HTTP_Server_Config
  {
    bool include_date_header = true;
    bool include_server_info = true;
    bool include_conn_info = false;
    bool keep_alive = true;

    // These are used by the example server only.
    cow_string listen_address = &"[::]:8080";
    uint32_t worker_threads = 4;

    // Loads options from a configuration file. Absent values are set to
    // their defaults. If a value has a wrong type, an exception is thrown.
    static
    HTTP_Server_Config
    load(const Config_File& conf);
  };

}  // namespace caravel
#endif
