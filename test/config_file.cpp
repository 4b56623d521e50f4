// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#include "utils.hpp"
#include "../caravel/base/config_file.hpp"
#include "../caravel/static/main_config.hpp"
#include "../caravel/http/http_server_config.hpp"
#include <asteria/value.hpp>
#include <unistd.h>
using namespace ::caravel;

int
main()
  {
    static constexpr char text[] =
        R"(
          // comments are allowed
          http {
            keep_alive = false
            listen_address = "127.0.0.1:8888"
            worker_threads = 100000
            ratio = 0.5
            list = [ 1, "two", { three = 3 } ]
          }
          number = 42
        )";

    char path[] = "/tmp/caravel_test_conf_XXXXXX";
    int fd = ::mkstemp(path);
    CARAVEL_TEST_CHECK(fd >= 0);
    CARAVEL_TEST_CHECK(::write(fd, text, sizeof(text) - 1) == static_cast<ssize_t>(sizeof(text) - 1));
    ::close(fd);

    cow_string conf_path(path);
    Config_File conf(conf_path);
    ::unlink(path);
    CARAVEL_TEST_CHECK(!conf.path().empty());

    // Typed values
    CARAVEL_TEST_CHECK(*(conf.get_boolean_opt(&"http.keep_alive")) == false);
    CARAVEL_TEST_CHECK(!conf.get_boolean_opt(&"http.include_conn_info"));
    CARAVEL_TEST_CHECK_CATCH(conf.get_boolean_opt(&"number"));

    CARAVEL_TEST_CHECK(*(conf.get_integer_opt(&"number", 0, 100)) == 42);
    CARAVEL_TEST_CHECK_CATCH(conf.get_integer_opt(&"number", 0, 10));
    CARAVEL_TEST_CHECK_CATCH(conf.get_integer_opt(&"http.listen_address", 0, 10));
    CARAVEL_TEST_CHECK(!conf.get_integer_opt(&"nothing", 0, 10));

    CARAVEL_TEST_CHECK(*(conf.get_real_opt(&"http.ratio", 0, 1)) == 0.5);
    CARAVEL_TEST_CHECK_CATCH(conf.get_real_opt(&"http.ratio", 1, 2));

    CARAVEL_TEST_CHECK(conf.get_string(&"http.listen_address") == "127.0.0.1:8888");
    CARAVEL_TEST_CHECK_CATCH(conf.get_string(&"http.missing"));
    CARAVEL_TEST_CHECK(!conf.get_string_opt(&"http.missing"));

    // Paths
    CARAVEL_TEST_CHECK(*(conf.get_array_size_opt(&"http.list")) == 3);
    CARAVEL_TEST_CHECK(conf.query(&" http . list [ 1 ] ").as_string() == "two");
    CARAVEL_TEST_CHECK(conf.query(&"http.list[2].three").as_integer() == 3);
    CARAVEL_TEST_CHECK(conf.query(&"http.list[5]").is_null());
    CARAVEL_TEST_CHECK(conf.query(&"other.list[5]").is_null());
    CARAVEL_TEST_CHECK_CATCH(conf.query(&""));
    CARAVEL_TEST_CHECK_CATCH(conf.query(&"number.x"));
    CARAVEL_TEST_CHECK_CATCH(conf.query(&"number[0]"));
    CARAVEL_TEST_CHECK_CATCH(conf.query(&"http.list[x]"));
    CARAVEL_TEST_CHECK_CATCH(conf.query(&"http.list[1"));
    CARAVEL_TEST_CHECK_CATCH(conf.query(&"http..list"));
    CARAVEL_TEST_CHECK_CATCH(conf.query(&"http/list"));

    // Server options
    HTTP_Server_Config hconf = HTTP_Server_Config::load(conf);
    CARAVEL_TEST_CHECK(hconf.include_date_header);
    CARAVEL_TEST_CHECK(hconf.include_server_info);
    CARAVEL_TEST_CHECK(!hconf.include_conn_info);
    CARAVEL_TEST_CHECK(!hconf.keep_alive);
    CARAVEL_TEST_CHECK(hconf.listen_address == "127.0.0.1:8888");
    CARAVEL_TEST_CHECK(hconf.worker_threads == 256);

    hconf = HTTP_Server_Config::load(Config_File());
    CARAVEL_TEST_CHECK(hconf.keep_alive);
    CARAVEL_TEST_CHECK(hconf.listen_address == "[::]:8080");
    CARAVEL_TEST_CHECK(hconf.worker_threads == 4);

    // Global configuration
    Main_Config main_conf;
    CARAVEL_TEST_CHECK(main_conf.copy().root().size() == 0);
    main_conf.replace(conf);
    CARAVEL_TEST_CHECK(*(main_conf.copy().get_integer_opt(&"number", 0, 100)) == 42);

    Config_File empty;
    CARAVEL_TEST_CHECK(empty.path().empty());
    CARAVEL_TEST_CHECK(empty.query(&"http.keep_alive").is_null());
    CARAVEL_TEST_CHECK_CATCH(empty.reload(&"/nonexistent/caravel.conf"));
    CARAVEL_TEST_CHECK(empty.path().empty());
  }
