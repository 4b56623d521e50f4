// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#include "utils.hpp"
#include "../caravel/http/http_message_writer.hpp"
#include "../caravel/http/http_response_parser.hpp"
#include "../caravel/http/http_server_config.hpp"
#include "../caravel/http/http_message.hpp"
#include "../caravel/http/http_bytes_body.hpp"
#include "../caravel/http/http_reader_body.hpp"
#include "../caravel/http/http_stream_reader.hpp"
#include "../caravel/http/http_datetime.hpp"
#include "../caravel/base/memory_byte_stream.hpp"
#include "../caravel/base/config_file.hpp"
using namespace ::caravel;

namespace {

// A body whose size hint is wrong
class Lying_Body
  : public Abstract_HTTP_Body
  {
  private:
    bool m_sent = false;

  protected:
    virtual
    bool
    do_abstract_http_body_read(cow_string& chunk)
      override
      {
        if(this->m_sent)
          return false;
        this->m_sent = true;
        chunk = &"short";
        return true;
      }

    virtual
    opt<uint64_t>
    do_abstract_http_body_size_hint()
      const noexcept override
      { return 10U;  }
  };

}  // namespace

int
main()
  {
    HTTP_Server_Config hconf;
    hconf.include_date_header = false;
    hconf.include_server_info = false;
    HTTP_Message_Writer writer(hconf);
    Memory_Byte_Sink sink;

    // Bodies with known sizes
    HTTP_Response resp;
    resp.set_bytes(http_status_ok, &"hello", &"text/plain");
    CARAVEL_TEST_CHECK(writer.write_response(sink, resp.parts, resp.body.get()) == 5);
    CARAVEL_TEST_CHECK(sink.data() ==
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: text/plain\r\n"
        "Content-Length: 5\r\n"
        "\r\n"
        "hello");

    // Responses to HEAD requests have headers but no body.
    sink.clear();
    resp.set_bytes(http_status_ok, &"hello");
    CARAVEL_TEST_CHECK(writer.write_response(sink, resp.parts, resp.body.get(), http_HEAD) == 0);
    CARAVEL_TEST_CHECK(sink.data() ==
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: text/plain\r\n"
        "Content-Length: 5\r\n"
        "\r\n");

    // Bodies with unknown sizes are chunked.
    sink.clear();
    HTTP_Response_Parts parts;
    parts.status = http_status_not_found;
    parts.reason = &"Nothing Here";
    parts.headers.insert(&"Content-Length", &"999");
    HTTP_Reader_Body rbody(new_sh<Memory_Byte_Source>(&"0123456789", 4));
    CARAVEL_TEST_CHECK(writer.write_response(sink, parts, &rbody) == 10);
    CARAVEL_TEST_CHECK(sink.data() ==
        "HTTP/1.1 404 Nothing Here\r\n"
        "Transfer-Encoding: chunked\r\n"
        "\r\n"
        "4\r\n0123\r\n"
        "4\r\n4567\r\n"
        "2\r\n89\r\n"
        "0\r\n\r\n");

    // Some statuses never have bodies.
    sink.clear();
    parts = HTTP_Response_Parts();
    parts.status = http_status_no_content;
    HTTP_Bytes_Body ignored(&"ignored");
    CARAVEL_TEST_CHECK(writer.write_response(sink, parts, &ignored) == 0);
    CARAVEL_TEST_CHECK(sink.data() == "HTTP/1.1 204 No Content\r\n\r\n");

    // A null body is empty.
    sink.clear();
    parts.status = http_status_created;
    CARAVEL_TEST_CHECK(writer.write_response(sink, parts, nullptr) == 0);
    CARAVEL_TEST_CHECK(sink.data() == "HTTP/1.1 201 Created\r\nContent-Length: 0\r\n\r\n");

    // Bodies must match their size hints.
    sink.clear();
    Lying_Body liar;
    CARAVEL_TEST_CHECK_CATCH(writer.write_response(sink, parts, &liar));

    // Default headers
    sink.clear();
    HTTP_Message_Writer default_writer;
    parts = HTTP_Response_Parts();
    parts.headers.insert(&"Server", &"custom");
    default_writer.write_response(sink, parts, nullptr);

    Memory_Byte_Source src1(sink.data());
    HTTP_Stream_Reader reader1(src1);
    Config_File empty_conf;
    HTTP_Response_Parser parser(empty_conf);
    HTTP_Response_Parts rparts = parser.parse_status_line_and_headers(reader1);
    CARAVEL_TEST_CHECK(rparts.status == http_status_ok);
    CARAVEL_TEST_CHECK(rparts.reason == "OK");
    CARAVEL_TEST_CHECK(*(rparts.headers.get("Server")) == "custom");
    CARAVEL_TEST_CHECK(rparts.headers.contains("Date"));
    HTTP_DateTime date(chars_view(rparts.headers.get("Date")->str()));
    CARAVEL_TEST_CHECK(date.as_seconds().count() > 1577836800);

    sink.clear();
    parts.headers.clear();
    default_writer.write_response(sink, parts, nullptr);
    CARAVEL_TEST_CHECK(::strstr(sink.data().c_str(), "\r\nServer: caravel/") != nullptr);

    // Requests
    sink.clear();
    HTTP_Request_Parts qparts;
    qparts.method = http_POST;
    qparts.uri = URI(&"http://user@[::1]:8080/sub mit?x=a b&y=1+1#frag");
    HTTP_Bytes_Body qbody(&"abc");
    CARAVEL_TEST_CHECK(writer.write_request(sink, qparts, &qbody) == 3);
    CARAVEL_TEST_CHECK(sink.data() ==
        "POST /sub%20mit?x=a%20b&y=1%2B1 HTTP/1.1\r\n"
        "Host: [::1]:8080\r\n"
        "Content-Length: 3\r\n"
        "\r\n"
        "abc");

    sink.clear();
    qparts = HTTP_Request_Parts();
    qparts.uri = URI(&"example.com/");
    writer.write_request(sink, qparts, nullptr);
    CARAVEL_TEST_CHECK(sink.data() == "GET / HTTP/1.1\r\nHost: example.com\r\n\r\n");

    sink.clear();
    qparts.method = http_DELETE;
    qparts.headers.insert(&"Host", &"other");
    writer.write_request(sink, qparts, nullptr);
    CARAVEL_TEST_CHECK(sink.data() == "DELETE / HTTP/1.1\r\nHost: other\r\nContent-Length: 0\r\n\r\n");

    // Responses can be parsed back.
    sink.clear();
    parts = HTTP_Response_Parts();
    parts.headers.insert(&"Set-Cookie", &"a=1");
    parts.headers.append(&"Set-Cookie", &"b=2, c=3");
    HTTP_Reader_Body rbody2(new_sh<Memory_Byte_Source>(&"chunked payload", 6));
    writer.write_response(sink, parts, &rbody2);
    sink.write_all("HTTP/1.1 304 Not Modified\r\nContent-Length: 100\r\n\r\n");
    sink.write_all("HTTP/1.0 200 OK\r\n\r\nuntil the end");

    Memory_Byte_Source src2(sink.data(), 5);
    HTTP_Stream_Reader reader2(src2);
    HTTP_Response r1 = parser.parse_response(reader2, http_GET);
    CARAVEL_TEST_CHECK(r1.parts.status == http_status_ok);
    CARAVEL_TEST_CHECK(r1.parts.version == http_version_1_1);
    CARAVEL_TEST_CHECK(r1.parts.headers.get_all("Set-Cookie").size() == 2);
    CARAVEL_TEST_CHECK(r1.body->read_all_bytes() == "chunked payload");

    HTTP_Response r2 = parser.parse_response(reader2, http_GET);
    CARAVEL_TEST_CHECK(r2.parts.status == http_status_not_modified);
    CARAVEL_TEST_CHECK(r2.body->read_all_bytes() == "");

    HTTP_Response r3 = parser.parse_response(reader2, http_GET);
    CARAVEL_TEST_CHECK(r3.parts.version == http_version_1_0);
    CARAVEL_TEST_CHECK(r3.parts.should_close());
    CARAVEL_TEST_CHECK(r3.body->read_all_bytes() == "until the end");
    CARAVEL_TEST_CHECK(reader2.at_eof());

    // Responses to HEAD requests have no bodies.
    Memory_Byte_Source src3(&"HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\nHTTP/1.1 200\r\n\r\n");
    HTTP_Stream_Reader reader3(src3);
    HTTP_Response r4 = parser.parse_response(reader3, http_HEAD);
    CARAVEL_TEST_CHECK(r4.body->read_all_bytes() == "");
    HTTP_Response r5 = parser.parse_response(reader3, http_HEAD);
    CARAVEL_TEST_CHECK(r5.parts.reason == "");

    CARAVEL_TEST_CHECK(http_response_has_no_body(http_GET, http_status_continue));
    CARAVEL_TEST_CHECK(http_response_has_no_body(http_GET, http_status_no_content));
    CARAVEL_TEST_CHECK(http_response_has_no_body(http_HEAD, http_status_ok));
    CARAVEL_TEST_CHECK(!http_response_has_no_body(http_POST, http_status_ok));
    CARAVEL_TEST_CHECK(::strcmp(http_status_get_reason(http_status_not_found), "Not Found") == 0);

    // Malformed status lines
    for(const char* text : { "HTTP/1.1 20 OK\r\n\r\n", "HTTP/1.1 099 X\r\n\r\n", "HTTP/1.1 200OK\r\n\r\n",
                             "HTTQ/1.1 200 OK\r\n\r\n", "HTTP/1.1 200 O\x01K\r\n\r\n" }) {
      cow_string data = cow_string(text);
      Memory_Byte_Source src(data);
      HTTP_Stream_Reader reader(src);
      CARAVEL_TEST_CHECK_HTTP_ERROR(http_error_invalid_request, parser.parse_status_line_and_headers(reader));
    }

    Memory_Byte_Source src4(&"HTTP/2.0 200 OK\r\n\r\n");
    HTTP_Stream_Reader reader4(src4);
    CARAVEL_TEST_CHECK_HTTP_ERROR(http_error_version_not_supported, parser.parse_status_line_and_headers(reader4));
  }
