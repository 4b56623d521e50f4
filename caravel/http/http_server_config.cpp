// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "http_server_config.hpp"
#include "../base/config_file.hpp"
#include "../utils.hpp"
namespace caravel {

HTTP_Server_Config
HTTP_Server_Config::
load(const Config_File& conf)
  {
    HTTP_Server_Config hconf;

    hconf.include_date_header = conf.get_boolean_opt(&"http.include_date_header").value_or(true);
    hconf.include_server_info = conf.get_boolean_opt(&"http.include_server_info").value_or(true);
    hconf.include_conn_info = conf.get_boolean_opt(&"http.include_conn_info").value_or(false);
    hconf.keep_alive = conf.get_boolean_opt(&"http.keep_alive").value_or(true);

    auto listen_address = conf.get_string_opt(&"http.listen_address");
    if(listen_address)
      hconf.listen_address = *listen_address;

    int64_t worker_threads = conf.get_integer_opt(&"http.worker_threads", INT64_MIN, INT64_MAX).value_or(4);
    hconf.worker_threads = static_cast<uint32_t>(clamp(worker_threads,
                                            static_cast<int64_t>(1), static_cast<int64_t>(256)));

    return hconf;
  }

}  // namespace caravel
