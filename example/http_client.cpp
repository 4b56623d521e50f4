// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#include "../caravel/xprecompiled.hpp"
#include "../caravel/base/config_file.hpp"
#include "../caravel/base/posix_fd_stream.hpp"
#include "../caravel/http/uri.hpp"
#include "../caravel/http/http_message_writer.hpp"
#include "../caravel/http/http_response_parser.hpp"
#include "../caravel/http/http_stream_reader.hpp"
#include "../caravel/http/abstract_http_body.hpp"
#include "../caravel/utils.hpp"
#include <netdb.h>
#include <sys/socket.h>
using namespace ::caravel;

namespace {

unique_posix_fd
do_connect(const URI_Authority& auth, uint16_t default_port)
  {
    ::addrinfo hints = { };
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    ::addrinfo* res;
    cow_string port = sformat("$1", auth.port().value_or(default_port));
    int err = ::getaddrinfo(auth.host().safe_c_str(), port.c_str(), &hints, &res);
    if(err != 0)
      CARAVEL_THROW((
          "Could not resolve host `$1`: $2"),
          auth.host(), ::gai_strerror(err));

    unique_posix_fd fd;
    for(auto ai = res;  ai;  ai = ai->ai_next) {
      fd.reset(::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol));
      if(fd && (CARAVEL_SYSCALL_LOOP(::connect(fd, ai->ai_addr, ai->ai_addrlen)) == 0))
        break;

      fd.reset();
    }

    ::freeaddrinfo(res);
    if(!fd)
      CARAVEL_THROW((
          "Could not connect to `$1`",
          "[`connect()` failed: ${errno:full}]"),
          auth);

    return fd;
  }

}  // namespace

int
main(int argc, char** argv)
  try {
    if(argc != 2) {
      ::fprintf(stderr, "Usage: %s URL\n", argv[0]);
      return 2;
    }

    cow_string url = argv[1];
    URI uri(url);
    if(!uri.authority())
      CARAVEL_THROW(("URL `$1` has no host"), uri);

    if(uri.scheme() && !uri.scheme()->is_http())
      CARAVEL_THROW(("URL scheme `$1` not supported"), *(uri.scheme()));

    POSIX_FD_Stream stream(do_connect(*(uri.authority()), 80));

    HTTP_Request_Parts req;
    req.uri = uri;
    req.headers.insert(&"Connection", &"close");
    req.headers.insert(&"User-Agent", &"caravel/" CARAVEL_VERSION_STRING);

    HTTP_Message_Writer writer;
    writer.write_request(stream, req, nullptr);

    HTTP_Stream_Reader reader(stream);
    HTTP_Response_Parser parser((Config_File()));
    HTTP_Response resp = parser.parse_response(reader, req.method);

    ::fprintf(stderr, "%s\n", sformat("$1 $2 $3", resp.parts.version,
                                      static_cast<uint32_t>(resp.parts.status),
                                      resp.parts.reason).c_str());
    for(const auto& entry : resp.parts.headers)
      for(size_t k = 0;  k != entry.count();  ++k)
        ::fprintf(stderr, "%s\n", sformat("$1: $2", entry.name(), entry.at(k)).c_str());

    cow_string chunk;
    while(resp.body->read_next(chunk))
      ::fwrite(chunk.data(), 1, chunk.size(), stdout);

    ::fflush(stdout);
    return 0;
  }
  catch(exception& stdex) {
    ::fprintf(stderr, "%s\n", stdex.what());
    return 1;
  }
