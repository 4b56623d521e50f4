// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#include "utils.hpp"
#include "../caravel/http/http_server_connection.hpp"
#include "../caravel/http/http_response_parser.hpp"
#include "../caravel/http/abstract_http_body.hpp"
#include "../caravel/base/memory_byte_stream.hpp"
#include "../caravel/base/config_file.hpp"
#include <unistd.h>
using namespace ::caravel;

namespace {

Config_File
do_load_conf(const char* text)
  {
    char path[] = "/tmp/caravel_test_conf_XXXXXX";
    int fd = ::mkstemp(path);
    CARAVEL_TEST_CHECK(fd >= 0);
    size_t len = ::strlen(text);
    CARAVEL_TEST_CHECK(::write(fd, text, len) == static_cast<ssize_t>(len));
    ::close(fd);

    cow_string conf_path(path);
    Config_File conf(conf_path);
    ::unlink(path);
    return conf;
  }

// Responds with the method, the path and the body of each request. Paths
// starting with `/throw` make it throw an exception, and paths starting with
// `/skip` make it ignore the request body.
void
do_echo(HTTP_Request& req, HTTP_Response& resp)
  {
    const cow_string& path = req.parts.uri.path();
    if(path.starts_with("/throw"))
      CARAVEL_THROW(("handler failure"));

    cow_string data;
    if(!path.starts_with("/skip"))
      data = req.body->read_all_bytes();

    auto conn = req.parts.extensions.get<HTTP_Connection_Info>();
    if(conn)
      data += sformat("<$1>", conn->peer_address);

    resp.set_bytes(http_status_ok, sformat("$1 $2 [$3]", req.parts.method, path, data));
  }

cow_string
do_serve(const Config_File& conf, const cow_string& text, uint64_t* served = nullptr)
  {
    Memory_Byte_Source src(text, 11);
    Memory_Byte_Sink sink;
    HTTP_Handler handler(&do_echo);
    HTTP_Server_Connection conn(src, sink, handler, conf);
    conn.set_peer_address(&"192.0.2.1:4321");
    conn.serve();

    if(served)
      *served = conn.requests_served();
    return sink.data();
  }

}  // namespace

int
main()
  {
    Config_File conf = do_load_conf(
        "http {\n"
        "  include_date_header = false\n"
        "  include_server_info = false\n"
        "  max_header_bytes = 1024\n"
        "  max_request_content_length = 256\n"
        "}\n");

    Config_File empty_conf;
    HTTP_Response_Parser resp_parser(empty_conf);
    uint64_t served;

    // Pipelined requests
    cow_string out = do_serve(conf,
        &"GET /a HTTP/1.1\r\nHost: x\r\n\r\n"
         "POST /b HTTP/1.1\r\nContent-Length: 3\r\n\r\nxyz"
         "GET /c HTTP/1.1\r\nConnection: close\r\n\r\n"
         "GET /never HTTP/1.1\r\n\r\n",
        &served);

    CARAVEL_TEST_CHECK(served == 3);
    CARAVEL_TEST_CHECK(out ==
        "HTTP/1.1 200 OK\r\nContent-Length: 9\r\n\r\nGET /a []"
        "HTTP/1.1 200 OK\r\nContent-Length: 13\r\n\r\nPOST /b [xyz]"
        "HTTP/1.1 200 OK\r\nConnection: close\r\nContent-Length: 9\r\n\r\nGET /c []");

    // Unread bodies are discarded.
    out = do_serve(conf,
        &"POST /skip HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n3\r\nabc\r\n0\r\n\r\n"
         "PUT /skip HTTP/1.1\r\nContent-Length: 4\r\n\r\nwxyz"
         "GET /d HTTP/1.1\r\n\r\n",
        &served);

    CARAVEL_TEST_CHECK(served == 3);

    Memory_Byte_Source src1(out);
    HTTP_Stream_Reader reader1(src1);
    HTTP_Response resp = resp_parser.parse_response(reader1, http_POST);
    CARAVEL_TEST_CHECK(resp.body->read_all_bytes() == "POST /skip []");
    resp = resp_parser.parse_response(reader1, http_PUT);
    CARAVEL_TEST_CHECK(resp.body->read_all_bytes() == "PUT /skip []");
    resp = resp_parser.parse_response(reader1, http_GET);
    CARAVEL_TEST_CHECK(resp.body->read_all_bytes() == "GET /d []");
    CARAVEL_TEST_CHECK(reader1.at_eof());

    // Malformed requests are rejected, and connections are closed.
    struct error_case
      {
        const char* text;
        HTTP_Status status;
      }
    constexpr error_cases[] =
      {
        { "GET / HTTP/1.1\r\nBad Header\r\n\r\n",                 http_status_bad_request },
        { "POST / HTTP/1.1\r\nContent-Length: abc\r\n\r\n",       http_status_bad_request },
        { "POST / HTTP/1.1\r\nContent-Length: 5000\r\n\r\n",      http_status_payload_too_large },
        { "GET / HTTP/1.2\r\n\r\n",                               http_status_http_version_not_supported },
        { "POST / HTTP/1.1\r\nTransfer-Encoding: gzip\r\n\r\n",   http_status_bad_request },
      };

    for(const auto& r : error_cases) {
      cow_string text = cow_string(r.text);
      text += &"GET /next HTTP/1.1\r\n\r\n";
      out = do_serve(conf, text, &served);
      CARAVEL_TEST_CHECK(served == 0);

      Memory_Byte_Source src(out);
      HTTP_Stream_Reader reader(src);
      resp = resp_parser.parse_response(reader, http_GET);
      CARAVEL_TEST_CHECK(resp.parts.status == r.status);
      CARAVEL_TEST_CHECK(*(resp.parts.headers.get("Connection")) == "close");
      CARAVEL_TEST_CHECK(resp.body->read_all_bytes().size() != 0);
      CARAVEL_TEST_CHECK(reader.at_eof());
    }

    cow_string big_header = &"GET / HTTP/1.1\r\nX-Big: ";
    big_header.append(2000, 'x');
    big_header += &"\r\n\r\n";
    out = do_serve(conf, big_header, &served);
    CARAVEL_TEST_CHECK(served == 0);
    CARAVEL_TEST_CHECK(out.starts_with("HTTP/1.1 431 "));

    // A malformed body that the handler reads
    out = do_serve(conf,
        &"POST /b HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\n"
         "GET /next HTTP/1.1\r\n\r\n",
        &served);
    CARAVEL_TEST_CHECK(served == 0);
    CARAVEL_TEST_CHECK(out.starts_with("HTTP/1.1 400 "));
    CARAVEL_TEST_CHECK(::strstr(out.c_str(), "\r\nConnection: close\r\n") != nullptr);

    // A malformed body that the handler ignores
    out = do_serve(conf,
        &"POST /skip HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\n"
         "GET /next HTTP/1.1\r\n\r\n",
        &served);
    CARAVEL_TEST_CHECK(served == 1);
    CARAVEL_TEST_CHECK(out == "HTTP/1.1 200 OK\r\nContent-Length: 13\r\n\r\nPOST /skip []");

    // Handlers that throw exceptions
    out = do_serve(conf,
        &"GET /throw HTTP/1.1\r\n\r\n"
         "GET /e HTTP/1.1\r\n\r\n",
        &served);
    CARAVEL_TEST_CHECK(served == 2);
    CARAVEL_TEST_CHECK(out.starts_with("HTTP/1.1 500 Internal Server Error\r\n"));
    CARAVEL_TEST_CHECK(out.ends_with("\r\n\r\nGET /e []"));

    // HTTP/1.0 connections are closed by default.
    out = do_serve(conf,
        &"GET /f HTTP/1.0\r\nConnection: keep-alive\r\n\r\n"
         "GET /g HTTP/1.0\r\n\r\n"
         "GET /never HTTP/1.0\r\n\r\n",
        &served);
    CARAVEL_TEST_CHECK(served == 2);
    CARAVEL_TEST_CHECK(out ==
        "HTTP/1.1 200 OK\r\nConnection: keep-alive\r\nContent-Length: 9\r\n\r\nGET /f []"
        "HTTP/1.1 200 OK\r\nConnection: close\r\nContent-Length: 9\r\n\r\nGET /g []");

    // A body without framing extends to the end of stream.
    out = do_serve(conf,
        &"POST /h HTTP/1.1\r\n\r\n"
         "GET /i HTTP/1.1\r\n\r\n",
        &served);
    CARAVEL_TEST_CHECK(served == 1);
    CARAVEL_TEST_CHECK(out ==
        "HTTP/1.1 200 OK\r\nConnection: close\r\nContent-Length: 29\r\n\r\n"
        "POST /h [GET /i HTTP/1.1\r\n\r\n]");

    // Responses to HEAD requests have no bodies.
    out = do_serve(conf, &"HEAD /j HTTP/1.1\r\n\r\nGET /k HTTP/1.1\r\n\r\n", &served);
    CARAVEL_TEST_CHECK(served == 2);
    CARAVEL_TEST_CHECK(out ==
        "HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\n"
        "HTTP/1.1 200 OK\r\nContent-Length: 9\r\n\r\nGET /k []");

    // Connection options
    Config_File conf2 = do_load_conf(
        "http {\n"
        "  include_date_header = false\n"
        "  include_server_info = false\n"
        "  include_conn_info = true\n"
        "  keep_alive = false\n"
        "}\n");

    out = do_serve(conf2, &"GET /l HTTP/1.1\r\n\r\nGET /m HTTP/1.1\r\n\r\n", &served);
    CARAVEL_TEST_CHECK(served == 1);
    CARAVEL_TEST_CHECK(out ==
        "HTTP/1.1 200 OK\r\nConnection: close\r\nContent-Length: 25\r\n\r\n"
        "GET /l [<192.0.2.1:4321>]");

    // Date and server information
    out = do_serve(empty_conf, &"GET / HTTP/1.1\r\n\r\n", &served);
    CARAVEL_TEST_CHECK(served == 1);
    Memory_Byte_Source src2(out);
    HTTP_Stream_Reader reader2(src2);
    resp = resp_parser.parse_response(reader2, http_GET);
    CARAVEL_TEST_CHECK(resp.parts.headers.contains("Date"));
    CARAVEL_TEST_CHECK(resp.parts.headers.get("Server")->str().starts_with("caravel/"));
    CARAVEL_TEST_CHECK(resp.body->read_all_bytes() == "GET / []");

    // Connections that are closed without requests
    out = do_serve(conf, &"", &served);
    CARAVEL_TEST_CHECK(served == 0);
    CARAVEL_TEST_CHECK(out.empty());
  }
