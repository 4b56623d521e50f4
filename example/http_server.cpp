// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#include "../caravel/xprecompiled.hpp"
#include "../caravel/base/config_file.hpp"
#include "../caravel/base/posix_fd_stream.hpp"
#include "../caravel/static/main_config.hpp"
#include "../caravel/static/logger.hpp"
#include "../caravel/http/uri.hpp"
#include "../caravel/http/http_server_connection.hpp"
#include "../caravel/http/abstract_http_body.hpp"
#include "../caravel/utils.hpp"
#include <locale.h>
#include <signal.h>
#include <stdarg.h>
#include <pthread.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <sys/socket.h>
namespace {
using namespace caravel;

[[noreturn]]
int
do_print_help_and_exit(const char* self)
  {
    ::printf(
//        1         2         3         4         5         6         7     |
// 3456789012345678901234567890123456789012345678901234567890123456789012345|
"""""""""""""""""""""""""""""""""""""""""""""""""""""""""" R"'''''''''''''''(
Usage: %s [OPTIONS] [[--] DIRECTORY]

  -h      show help message then exit
  -V      show version information then exit
  -v      enable verbose mode

If DIRECTORY is specified, it specifies where 'main.conf' is to be located.
The working directory is switched there before configuration is loaded.

The server listens on `http.listen_address` from 'main.conf', and responds
to each request with a description of it. A POST request to `/echo` gets
its body back.

Visit the homepage at <%s>.
)'''''''''''''''" """"""""""""""""""""""""""""""""""""""""""""""""""""""""+1,
// 3456789012345678901234567890123456789012345678901234567890123456789012345|
//        1         2         3         4         5         6         7     |
      self,
      PACKAGE_URL);

    ::fflush(nullptr);
    ::quick_exit(0);
  }

[[noreturn]]
int
do_print_version_and_exit()
  {
    ::printf(
//        1         2         3         4         5         6         7     |
// 3456789012345678901234567890123456789012345678901234567890123456789012345|
"""""""""""""""""""""""""""""""""""""""""""""""""""""""""" R"'''''''''''''''(
%s

Visit the homepage at <%s>.
)'''''''''''''''" """"""""""""""""""""""""""""""""""""""""""""""""""""""""+1,
// 3456789012345678901234567890123456789012345678901234567890123456789012345|
//        1         2         3         4         5         6         7     |
      PACKAGE_STRING,
      PACKAGE_URL);

    ::fflush(nullptr);
    ::quick_exit(0);
  }

// Define command-line options here.
struct Command_Line_Options
  {
    // options
    bool verbose = false;

    // non-options
    cow_string cd_here;
  };

Command_Line_Options cmdline;
unique_posix_fd listen_fd;

// These are process exit status codes.
enum
  {
    exit_success            = 0,
    exit_system_error       = 1,
    exit_invalid_argument   = 2,
  };

[[noreturn]] ROCKET_NEVER_INLINE
int
do_exit_printf(int code, const char* fmt = nullptr, ...) noexcept
  {
    // Wait for pending logs to be flushed.
    ::fflush(nullptr);
    logger.synchronize();

    if(fmt) {
      // Output the string to standard error.
      ::va_list ap;
      va_start(ap, fmt);
      ::vfprintf(stderr, fmt, ap);
      va_end(ap);
    }

    // Perform fast exit.
    ::fputc('\n', stderr);
    ::quick_exit(code);
  }

ROCKET_NEVER_INLINE
void
do_parse_command_line(int argc, char** argv)
  {
    bool help = false;
    bool version = false;
    ::rocket::unique_ptr<char, void (void*)> abs_path(nullptr, ::free);

    if(argc > 1) {
      // Check for common long options before calling `getopt()`.
      if(::strcmp(argv[1], "--help") == 0)
        do_print_help_and_exit(argv[0]);

      if(::strcmp(argv[1], "--version") == 0)
        do_print_version_and_exit();
    }

    // Parse command-line options.
    int ch;
    while((ch = ::getopt(argc, argv, "hVv")) != -1)
      switch(ch)
        {
        case 'h':
          help = true;
          break;

        case 'V':
          version = true;
          break;

        case 'v':
          cmdline.verbose = true;
          break;

        default:
          do_exit_printf(exit_invalid_argument,
              "%s: invalid argument -- '%c'\nTry `%s -h` for help.",
              argv[0], ::optopt, argv[0]);
        }

    // Check for early exit conditions.
    if(help)
      do_print_help_and_exit(argv[0]);

    if(version)
      do_print_version_and_exit();

    if(argc - ::optind > 1)
      do_exit_printf(exit_invalid_argument,
          "%s: too many arguments -- '%s'\nTry `%s -h` for help.",
          argv[0], argv[::optind + 1], argv[0]);

    if(::optind < argc) {
      if(!abs_path.reset(::realpath(argv[::optind], nullptr)))
        do_exit_printf(exit_system_error,
            "%s: invalid path -- '%s': %m",
            argv[0], argv[::optind]);

      cmdline.cd_here.assign(abs_path.get());
    }
  }

ROCKET_NEVER_INLINE
void
do_set_working_directory()
  {
    if(cmdline.cd_here.empty())
      return;

    if(::chdir(cmdline.cd_here.safe_c_str()) != 0)
      do_exit_printf(exit_system_error,
          "Could not set working directory to '%s': %m",
          cmdline.cd_here.c_str());
  }

ROCKET_NEVER_INLINE
void
do_init_signal_handlers()
  {
    // Ignore certain signals for good.
    struct sigaction sigact = { };
    sigact.sa_handler = SIG_IGN;
    ::sigaction(SIGPIPE, &sigact, nullptr);
    ::sigaction(SIGCHLD, &sigact, nullptr);

    // Install termination handlers. Errors are ignored.
    sigact.sa_flags = 0;
    sigact.sa_handler = +[](int n) { exit_signal.store(n);  };

    ::sigaction(SIGINT, &sigact, nullptr);
    ::sigaction(SIGTERM, &sigact, nullptr);
    ::sigaction(SIGHUP, &sigact, nullptr);
    ::sigaction(SIGALRM, &sigact, nullptr);
  }

void
do_handle_request(HTTP_Request& req, HTTP_Response& resp)
  {
    CARAVEL_LOG_INFO(("HTTP request --> $1 $2"), req.parts.method, req.parts.uri);

    if(req.parts.uri.path() == "/echo") {
      if(req.parts.method != http_POST) {
        resp.set_bytes(http_status_method_not_allowed, &"Use POST\n", &"text/plain");
        resp.parts.headers.insert(&"Allow", &"POST");
        return;
      }

      cow_string content_type = &"application/octet-stream";
      auto req_type = req.parts.headers.get("Content-Type");
      if(req_type)
        content_type = req_type->str();

      resp.set_bytes(http_status_ok, req.body->read_all_bytes(), content_type);
      return;
    }

    // Describe the request.
    tinyfmt_str fmt;
    fmt << "method = " << req.parts.method << "\n";
    fmt << "path = " << req.parts.uri.path() << "\n";

    for(const auto& r : req.parts.uri.path_query().query_values())
      fmt << "query `" << r.first << "` = " << r.second << "\n";

    fmt << "version = " << req.parts.version << "\n";
    fmt << req.parts.headers;

    auto conn = req.parts.extensions.get<HTTP_Connection_Info>();
    if(conn)
      fmt << "peer = " << conn->peer_address << "\n";

    fmt << "body length = " << req.body->read_all_bytes().size() << "\n";
    resp.set_bytes(http_status_ok, fmt.extract_string(), &"text/plain; charset=utf-8");
  }

cow_string
do_format_peer_address(const ::sockaddr_in6& addr)
  {
    char text[INET6_ADDRSTRLEN];
    if(!::inet_ntop(AF_INET6, &(addr.sin6_addr), text, sizeof(text)))
      return &"(unknown)";

    return sformat("[$1]:$2", text, ntohs(addr.sin6_port));
  }

ROCKET_NEVER_INLINE
void
do_create_listener(const cow_string& address)
  {
    // IPv4 addresses are mapped into IPv6, so a single dual-stack socket is
    // sufficient.
    URI_Authority auth(address);
    ::sockaddr_in6 addr = { };
    addr.sin6_family = AF_INET6;
    addr.sin6_port = htons(auth.port().value_or(8080));

    cow_string host = auth.host();
    if(!auth.is_ipv6())
      host.insert(0, "::ffff:");

    if(::inet_pton(AF_INET6, host.safe_c_str(), &(addr.sin6_addr)) != 1)
      CARAVEL_THROW((
          "Invalid listen address `$1`: host must be an IP address"),
          address);

    if(!listen_fd.reset(::socket(AF_INET6, SOCK_STREAM | SOCK_CLOEXEC, IPPROTO_TCP)))
      CARAVEL_THROW((
          "Could not create socket",
          "[`socket()` failed: ${errno:full}]"));

    static constexpr int one = 1;
    static constexpr int zero = 0;
    ::setsockopt(listen_fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    ::setsockopt(listen_fd, IPPROTO_IPV6, IPV6_V6ONLY, &zero, sizeof(zero));

    if(::bind(listen_fd, reinterpret_cast<::sockaddr*>(&addr), sizeof(addr)) != 0)
      CARAVEL_THROW((
          "Could not bind socket to `$1`",
          "[`bind()` failed: ${errno:full}]"),
          address);

    if(::listen(listen_fd, SOMAXCONN) != 0)
      CARAVEL_THROW((
          "Could not listen on `$1`",
          "[`listen()` failed: ${errno:full}]"),
          address);

    CARAVEL_LOG_INFO(("Listening on `$1`"), address);
  }

// Each worker accepts and serves one connection at a time.
struct HTTP_Worker
  {
    Config_File conf;
    HTTP_Handler handler;

    void
    thread_loop()
      {
        ::sockaddr_in6 addr;
        ::socklen_t addrlen = sizeof(addr);
        unique_posix_fd fd(CARAVEL_SYSCALL_LOOP(::accept4(listen_fd,
                                   reinterpret_cast<::sockaddr*>(&addr), &addrlen, SOCK_CLOEXEC)));
        if(!fd)
          CARAVEL_THROW((
              "Could not accept connection",
              "[`accept4()` failed: ${errno:full}]"));

        cow_string peer = do_format_peer_address(addr);
        CARAVEL_LOG_DEBUG(("Accepted connection from `$1`"), peer);

        POSIX_FD_Stream stream(move(fd));
        HTTP_Server_Connection conn(stream, stream, this->handler, this->conf);
        conn.set_peer_address(peer);

        try {
          conn.serve();
        }
        catch(exception& stdex) {
          CARAVEL_LOG_WARN((
              "Connection from `$1` aborted: $2"),
              peer, stdex);
        }

        stream.shut_down_write();
        CARAVEL_LOG_DEBUG((
            "Closing connection from `$1` after $2 requests"),
            peer, conn.requests_served());
      }
  };

template<class xObject>
void
do_create_resident_thread(xObject& obj, const char* name)
  {
    static ::sigset_t s_blocked_signals[1];

    // Initialize the list of signals to block. This is done only once.
    if(::sigismember(s_blocked_signals, SIGINT) == 0)
      for(int sig : { SIGINT, SIGTERM, SIGHUP, SIGALRM, SIGQUIT })
        ::sigaddset(s_blocked_signals, sig);

    // Create the thread now.
    ::pthread_t thrd;
    int err = ::pthread_create(
      &thrd,
      nullptr,
      +[](void* thread_param) -> void*
      {
        auto& xobj = *(xObject*) thread_param;

        ::pthread_setcancelstate(PTHREAD_CANCEL_DISABLE, nullptr);
        ::pthread_sigmask(SIG_BLOCK, s_blocked_signals, nullptr);

        for(;;)
          try {
            xobj.thread_loop();
          }
          catch(exception& stdex) {
            ::fprintf(stderr,
                "WARNING: Caught an exception from thread loop: %s\n"
                "[static class `%s`]\n"
                "[exception class `%s`]\n",
                stdex.what(), typeid(xobj).name(), typeid(stdex).name());
          }
      },
      ::std::addressof(obj)
    );

    if(err != 0)
      do_exit_printf(exit_system_error, "Could not spawn thread '%s': %m", name);

    // Name the thread and detach it. Errors are ignored.
    ::pthread_setname_np(thrd, name);
    ::pthread_detach(thrd);
  }

}  // namespace

int
main(int argc, char** argv)
  try {
    // Select the C locale.
    // UTF-8 is required for wide-oriented standard streams.
    ::setlocale(LC_ALL, "C.UTF-8");
    ::tzset();
    ::pthread_setname_np(::pthread_self(), "caravel");
    ::pthread_setcancelstate(PTHREAD_CANCEL_DISABLE, nullptr);

    // Note that this function shall not return in case of errors.
    do_parse_command_line(argc, argv);
    do_set_working_directory();
    main_config.reload(&"main.conf");
    logger.reload(main_config.copy(), cmdline.verbose);
    do_create_resident_thread(logger, "logger");
    CARAVEL_LOG_INFO(("Starting up: $1"), PACKAGE_STRING);

    do_init_signal_handlers();

    static HTTP_Worker worker;
    worker.conf = main_config.copy();
    worker.handler = HTTP_Handler(&do_handle_request);

    HTTP_Server_Config hconf = HTTP_Server_Config::load(worker.conf);
    do_create_listener(hconf.listen_address);

    for(uint32_t k = 0;  k != hconf.worker_threads;  ++k) {
      char name[16];
      ::sprintf(name, "worker_%u", k % 1000U);
      do_create_resident_thread(worker, name);
    }

    CARAVEL_LOG_INFO(("Startup complete: $1"), PACKAGE_STRING);
    logger.synchronize();

    // Wait until a stop signal has been received. Signals are blocked in
    // other threads, so they are delivered here.
    int s1;
    while((s1 = exit_signal.load()) == 0)
      ::pause();

    CARAVEL_LOG_INFO(("Shutting down (signal $1: $2)"), s1, ::strsignal(s1));
    do_exit_printf(exit_success);
  }
  catch(exception& stdex) {
    // Print the message in `stdex`. There isn't much we can do.
    CARAVEL_LOG_FATAL(("$1"), stdex);
    do_exit_printf(exit_system_error, "%s", stdex.what());
  }
