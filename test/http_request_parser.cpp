// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#include "utils.hpp"
#include "../caravel/http/http_request_parser.hpp"
#include "../caravel/http/http_stream_reader.hpp"
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

HTTP_Request
do_parse(const HTTP_Request_Parser& parser, const cow_string& text, cow_string* rest = nullptr)
  {
    Memory_Byte_Source src(text, 7);
    HTTP_Stream_Reader reader(src);
    HTTP_Request req = parser.parse_request(reader);

    // The body refers to the reader, so it must be consumed here.
    cow_string data = req.body->read_all_bytes();
    data += '|';
    data += reader.read_to_end();
    if(rest)
      rest->swap(data);
    return req;
  }

}  // namespace

int
main()
  {
    // Methods
    CARAVEL_TEST_CHECK(parse_http_method("GET") == http_GET);
    CARAVEL_TEST_CHECK(parse_http_method("get") == http_GET);
    CARAVEL_TEST_CHECK(parse_http_method("Options") == http_OPTIONS);
    CARAVEL_TEST_CHECK(parse_http_method("PATCH") == http_PATCH);
    CARAVEL_TEST_CHECK(parse_http_method("") == http_NULL);
    CARAVEL_TEST_CHECK(parse_http_method("G@T") == http_NULL);
    CARAVEL_TEST_CHECK(parse_http_method("TOOLONGNAME") == http_NULL);

    tinyfmt_str fmt;
    fmt << parse_http_method("PURGE");
    CARAVEL_TEST_CHECK(fmt.get_string() == "PURGE");

    Config_File empty_conf;
    HTTP_Request_Parser parser(empty_conf);
    CARAVEL_TEST_CHECK(parser.max_header_bytes() == 65536);
    CARAVEL_TEST_CHECK(parser.max_content_length() == 1048576);

    // A simple GET request is followed by another request.
    cow_string rest;
    HTTP_Request req = do_parse(parser,
        &"GET /docs/index.html?lang=en&q=a%20b HTTP/1.1\r\n"
         "Host: example.com\r\n"
         "Accept: text/html, application/json\r\n"
         "Cookie: a=1; b=2\r\n"
         "If-Modified-Since: Sun, 06 Nov 1994 08:49:37 GMT\r\n"
         "\r\n"
         "NEXT", &rest);
    CARAVEL_TEST_CHECK(req.parts.method == http_GET);
    CARAVEL_TEST_CHECK(req.parts.version == http_version_1_1);
    CARAVEL_TEST_CHECK(req.parts.uri.path() == "/docs/index.html");
    CARAVEL_TEST_CHECK(*(req.parts.uri.path_query().query_map().get("q")) == "a b");
    CARAVEL_TEST_CHECK(*(req.parts.headers.get("host")) == "example.com");
    CARAVEL_TEST_CHECK(req.parts.headers.get_all("Accept").size() == 2);
    CARAVEL_TEST_CHECK(req.parts.headers.get_all("Cookie").size() == 2);
    CARAVEL_TEST_CHECK(req.parts.headers.get_all("If-Modified-Since").size() == 1);
    CARAVEL_TEST_CHECK(*(req.parts.headers.get("If-Modified-Since")) == "Sun, 06 Nov 1994 08:49:37 GMT");
    CARAVEL_TEST_CHECK(!req.parts.should_close());
    CARAVEL_TEST_CHECK(*(req.body->size_hint()) == 0);
    CARAVEL_TEST_CHECK(rest == "|NEXT");

    // Bare LF line terminators are tolerated.
    req = do_parse(parser, &"HEAD / HTTP/1.0\nConnection: keep-alive\n\n");
    CARAVEL_TEST_CHECK(req.parts.method == http_HEAD);
    CARAVEL_TEST_CHECK(req.parts.version == http_version_1_0);
    CARAVEL_TEST_CHECK(!req.parts.should_close());

    req = do_parse(parser, &"GET / HTTP/1.0\r\n\r\n");
    CARAVEL_TEST_CHECK(req.parts.should_close());
    req = do_parse(parser, &"GET / HTTP/1.1\r\nConnection: Upgrade, CLOSE\r\n\r\n");
    CARAVEL_TEST_CHECK(req.parts.should_close());

    // A percent-encoded URL in the query stays in the query.
    req = do_parse(parser, &"GET /login?next=https%3A%2F%2Fexample.com%2Fhome HTTP/1.1\r\n\r\n");
    CARAVEL_TEST_CHECK(req.parts.method == http_GET);
    CARAVEL_TEST_CHECK(!req.parts.uri.scheme());
    CARAVEL_TEST_CHECK(!req.parts.uri.authority());
    CARAVEL_TEST_CHECK(req.parts.uri.path() == "/login");
    CARAVEL_TEST_CHECK(*(req.parts.uri.path_query().query_map().get("next")) == "https://example.com/home");

    // Absolute form
    req = do_parse(parser, &"OPTIONS http://example.com:8080/x HTTP/1.1\r\n\r\n");
    CARAVEL_TEST_CHECK(req.parts.method == http_OPTIONS);
    CARAVEL_TEST_CHECK(req.parts.uri.authority()->host() == "example.com");
    CARAVEL_TEST_CHECK(req.parts.uri.path() == "/x");

    // Bodies with a length
    req = do_parse(parser, &"POST /form HTTP/1.1\r\nContent-Length: 5\r\n\r\nhelloNEXT", &rest);
    CARAVEL_TEST_CHECK(req.parts.method == http_POST);
    CARAVEL_TEST_CHECK(*(req.body->size_hint()) == 5);
    CARAVEL_TEST_CHECK(rest == "hello|NEXT");

    req = do_parse(parser, &"PUT /x HTTP/1.1\r\nContent-Length: 3\r\nContent-Length: 3\r\n\r\nabc", &rest);
    CARAVEL_TEST_CHECK(rest == "abc|");

    req = do_parse(parser, &"POST /x HTTP/1.1\r\nContent-Length: 0\r\n\r\nNEXT", &rest);
    CARAVEL_TEST_CHECK(rest == "|NEXT");

    // Chunked bodies take precedence over lengths.
    req = do_parse(parser,
        &"POST /upload HTTP/1.1\r\n"
         "Transfer-Encoding: gzip, chunked\r\n"
         "Content-Length: 100\r\n"
         "\r\n"
         "5\r\nhello\r\n6\r\n world\r\n0\r\n\r\nNEXT", &rest);
    CARAVEL_TEST_CHECK(!req.body->size_hint());
    CARAVEL_TEST_CHECK(rest == "hello world|NEXT");

    // A POST request without framing extends to end of stream.
    req = do_parse(parser, &"POST /x HTTP/1.1\r\n\r\nall the rest", &rest);
    CARAVEL_TEST_CHECK(!req.body->size_hint());
    CARAVEL_TEST_CHECK(rest == "all the rest|");

    // Extension methods
    req = do_parse(parser, &"PURGE /cache HTTP/1.1\r\n\r\n", &rest);
    CARAVEL_TEST_CHECK(req.parts.method == parse_http_method("PURGE"));
    CARAVEL_TEST_CHECK(rest == "|");

    // Malformed requests
    CARAVEL_TEST_CHECK_HTTP_ERROR(http_error_invalid_request, do_parse(parser, &"GET /\r\n\r\n"));
    CARAVEL_TEST_CHECK_HTTP_ERROR(http_error_invalid_request, do_parse(parser, &"GET  / HTTP/1.1\r\n\r\n"));
    CARAVEL_TEST_CHECK_HTTP_ERROR(http_error_invalid_request, do_parse(parser, &"GET / HTTP/1.1 x\r\n\r\n"));
    CARAVEL_TEST_CHECK_HTTP_ERROR(http_error_invalid_request, do_parse(parser, &"G@T / HTTP/1.1\r\n\r\n"));
    CARAVEL_TEST_CHECK_HTTP_ERROR(http_error_invalid_request, do_parse(parser, &"GET / FOO/1.1\r\n\r\n"));
    CARAVEL_TEST_CHECK_HTTP_ERROR(http_error_version_not_supported, do_parse(parser, &"GET / HTTP/2.0\r\n\r\n"));
    CARAVEL_TEST_CHECK_HTTP_ERROR(http_error_version_not_supported, do_parse(parser, &"GET / HTTP/1.2\r\n\r\n"));
    CARAVEL_TEST_CHECK_HTTP_ERROR(http_error_invalid_uri, do_parse(parser, &"GET /%zz HTTP/1.1\r\n\r\n"));
    CARAVEL_TEST_CHECK_HTTP_ERROR(http_error_invalid_header_name, do_parse(parser, &"GET / HTTP/1.1\r\nBad Name: 1\r\n\r\n"));
    CARAVEL_TEST_CHECK_HTTP_ERROR(http_error_invalid_header_value, do_parse(parser, &"GET / HTTP/1.1\r\nX: a\x01\r\n\r\n"));
    CARAVEL_TEST_CHECK_HTTP_ERROR(http_error_invalid_request, do_parse(parser, &"GET / HTTP/1.1\r\nNoColon\r\n\r\n"));
    CARAVEL_TEST_CHECK_HTTP_ERROR(http_error_invalid_request, do_parse(parser, &"GET / HTTP/1.1\r\nX: 1\r\n folded\r\n\r\n"));
    CARAVEL_TEST_CHECK_HTTP_ERROR(http_error_invalid_request, do_parse(parser, &"POST / HTTP/1.1\r\nContent-Length: abc\r\n\r\n"));
    CARAVEL_TEST_CHECK_HTTP_ERROR(http_error_invalid_request, do_parse(parser, &"POST / HTTP/1.1\r\nContent-Length: 1, 2\r\n\r\n"));
    CARAVEL_TEST_CHECK_HTTP_ERROR(http_error_invalid_request, do_parse(parser, &"POST / HTTP/1.1\r\nTransfer-Encoding: gzip\r\n\r\n"));
    CARAVEL_TEST_CHECK_HTTP_ERROR(http_error_unexpected_eof, do_parse(parser, &"GET / HTTP/1.1\r\nHost: exam"));
    CARAVEL_TEST_CHECK_HTTP_ERROR(http_error_unexpected_eof, do_parse(parser, &""));

    // Limits from configuration
    Config_File conf = do_load_conf(
        "http {\n"
        "  max_header_bytes = 1024\n"
        "  max_request_content_length = 256\n"
        "}\n");
    HTTP_Request_Parser small_parser(conf);
    CARAVEL_TEST_CHECK(small_parser.max_header_bytes() == 1024);
    CARAVEL_TEST_CHECK(small_parser.max_content_length() == 256);

    cow_string big_head = &"GET / HTTP/1.1\r\nX-Big: ";
    big_head.append(2000, 'b');
    big_head += "\r\n\r\n";
    req = do_parse(parser, big_head);
    CARAVEL_TEST_CHECK(req.parts.headers.get("X-Big")->size() == 2000);
    CARAVEL_TEST_CHECK_HTTP_ERROR(http_error_headers_too_large, do_parse(small_parser, big_head));

    CARAVEL_TEST_CHECK_HTTP_ERROR(http_error_payload_too_large,
        do_parse(small_parser, &"POST / HTTP/1.1\r\nContent-Length: 257\r\n\r\n"));

    cow_string big_chunked = &"POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n200\r\n";
    big_chunked.append(0x200, 'c');
    big_chunked += "\r\n0\r\n\r\n";
    req = do_parse(parser, big_chunked, &rest);
    CARAVEL_TEST_CHECK(rest.size() == 0x201);
    CARAVEL_TEST_CHECK_HTTP_ERROR(http_error_payload_too_large, do_parse(small_parser, big_chunked));

    // Values out of range are clamped.
    conf = do_load_conf(
        "http {\n"
        "  max_header_bytes = 10\n"
        "  max_request_content_length = 99999999999\n"
        "}\n");
    small_parser.reload(conf);
    CARAVEL_TEST_CHECK(small_parser.max_header_bytes() == 1024);
    CARAVEL_TEST_CHECK(small_parser.max_content_length() == 0x40000000);
  }
