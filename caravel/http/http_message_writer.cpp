// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "http_message_writer.hpp"
#include "http_server_config.hpp"
#include "http_response_parser.hpp"
#include "http_datetime.hpp"
#include "http_chunked_encoder.hpp"
#include "abstract_http_body.hpp"
#include "../base/abstract_byte_sink.hpp"
#include "../utils.hpp"
#include <http_parser.h>
namespace caravel {
namespace {

// Writes the body, according to the framing headers that have been written.
uint64_t
do_write_body(Abstract_Byte_Sink& sink, Abstract_HTTP_Body& body, bool chunked,
              opt<uint64_t> length)
  {
    cow_string chunk;

    if(chunked) {
      HTTP_Chunked_Encoder encoder(sink);
      while(body.read_next(chunk))
        encoder.write(chunk);

      encoder.close();
      return encoder.total();
    }

    uint64_t total = 0;
    while(body.read_next(chunk)) {
      total += chunk.size();
      if(length && (total > *length))
        CARAVEL_THROW((
            "Body exceeded its size hint `$1`"),
            *length);

      sink.write_all(chunk);
    }

    if(length && (total != *length))
      CARAVEL_THROW((
          "Body ended after `$1` bytes, but its size hint was `$2`"),
          total, *length);

    return total;
  }

// Writes a decoded path or query. Bytes that are not allowed in a request
// target are percent-encoded. `extra` denotes more bytes to keep.
void
do_encode_target(tinyfmt& fmt, chars_view text, const char* extra)
  {
    static constexpr char s_keep[] = "-._~!$&'()*,;=:@/";
    char seq[4] = "%";
    for(size_t k = 0;  k != text.n;  ++k) {
      char c = text.p[k];
      if(((c >= '0') && (c <= '9')) || ((c >= 'A') && (c <= 'Z')) || ((c >= 'a') && (c <= 'z'))
         || ((c != 0) && (::strchr(s_keep, c) || ::strchr(extra, c)))) {
        fmt << c;
        continue;
      }
      uint32_t uch = static_cast<uint8_t>(c);
      seq[1] = "0123456789ABCDEF"[uch >> 4];
      seq[2] = "0123456789ABCDEF"[uch & 15];
      fmt.putn(seq, 3);
    }
  }

// Sets framing headers. The return value indicates whether the body shall be
// chunked.
bool
do_set_framing(HTTP_Headers& headers, opt<uint64_t> length)
  {
    if(length) {
      headers.remove("Transfer-Encoding");
      if(!headers.contains("Content-Length"))
        headers.insert(&"Content-Length", HTTP_Header_Value(sformat("$1", *length)));
      return false;
    }

    headers.remove("Content-Length");
    headers.insert(&"Transfer-Encoding", &"chunked");
    return true;
  }

}  // namespace

const char*
http_status_get_reason(HTTP_Status status)
  noexcept
  {
    return ::http_status_str(static_cast<::http_status>(status));
  }

HTTP_Message_Writer::
HTTP_Message_Writer() noexcept
  {
  }

HTTP_Message_Writer::
HTTP_Message_Writer(const HTTP_Server_Config& conf) noexcept
  :
    m_include_date_header(conf.include_date_header),
    m_include_server_info(conf.include_server_info)
  {
  }

HTTP_Message_Writer::
~HTTP_Message_Writer()
  {
  }

uint64_t
HTTP_Message_Writer::
write_response(Abstract_Byte_Sink& sink, const HTTP_Response_Parts& parts,
               Abstract_HTTP_Body* body, HTTP_Method req_method)
  const
  {
    HTTP_Headers headers = parts.headers;

    if(this->m_include_date_header && !headers.contains("Date"))
      headers.insert(&"Date", HTTP_Header_Value(HTTP_DateTime::now().print_to_string()));

    if(this->m_include_server_info && !headers.contains("Server"))
      headers.insert(&"Server", &"caravel/" CARAVEL_VERSION_STRING);

    // Responses with these status codes never have bodies, so they have no
    // framing headers.
    bool status_bodyless = http_response_has_no_body(http_GET, parts.status);
    bool chunked = false;
    opt<uint64_t> length = 0U;
    if(body)
      length = body->size_hint();

    if(!status_bodyless)
      chunked = do_set_framing(headers, length);

    // Compose the status line and headers.
    tinyfmt_str fmt;
    fmt << (parts.version ? parts.version : http_version_1_1) << ' ';
    fmt << static_cast<uint32_t>(parts.status) << ' ';
    if(!parts.reason.empty())
      fmt << parts.reason;
    else
      fmt << http_status_get_reason(parts.status);
    fmt << "\r\n";
    headers.encode(fmt);
    fmt << "\r\n";
    sink.write_all(fmt);

    uint64_t total = 0;
    if(body && !status_bodyless && (req_method != http_HEAD))
      total = do_write_body(sink, *body, chunked, length);

    sink.flush();
    CARAVEL_LOG_TRACE(("Wrote response: $1, $2 body bytes"), static_cast<uint32_t>(parts.status), total);
    return total;
  }

uint64_t
HTTP_Message_Writer::
write_request(Abstract_Byte_Sink& sink, const HTTP_Request_Parts& parts,
              Abstract_HTTP_Body* body)
  const
  {
    HTTP_Headers headers = parts.headers;

    const auto& authority = parts.uri.authority();
    if(authority && !headers.contains("Host")) {
      // `Host` contains no user information.
      tinyfmt_str host;
      if(authority->is_ipv6())
        host << '[' << authority->host() << ']';
      else
        host << authority->host();

      if(authority->port())
        host << ':' << *(authority->port());

      headers.insert(&"Host", HTTP_Header_Value(host.extract_string()));
    }

    // A GET or HEAD request without a body has no framing headers.
    bool chunked = false;
    opt<uint64_t> length = 0U;
    if(body)
      length = body->size_hint();

    if(body || is_none_of(parts.method, { http_GET, http_HEAD }))
      chunked = do_set_framing(headers, length);

    // Compose the request line in origin form. The fragment is never sent.
    tinyfmt_str fmt;
    fmt << parts.method << ' ';
    do_encode_target(fmt, parts.uri.path(), "");
    if(parts.uri.query()) {
      fmt << '?';
      do_encode_target(fmt, *(parts.uri.query()), "?");
    }
    fmt << ' ' << (parts.version ? parts.version : http_version_1_1) << "\r\n";
    headers.encode(fmt);
    fmt << "\r\n";
    sink.write_all(fmt);

    uint64_t total = 0;
    if(body)
      total = do_write_body(sink, *body, chunked, length);

    sink.flush();
    CARAVEL_LOG_TRACE(("Wrote request: $1 $2, $3 body bytes"), parts.method, parts.uri, total);
    return total;
  }

}  // namespace caravel
