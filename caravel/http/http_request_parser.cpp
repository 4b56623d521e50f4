// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "http_request_parser.hpp"
#include "http_stream_reader.hpp"
#include "http_framing.hpp"
#include "http_error.hpp"
#include "url_encoding.hpp"
#include "abstract_http_body.hpp"
#include "../base/config_file.hpp"
#include "../static/main_config.hpp"
#include "../utils.hpp"
namespace caravel {
namespace {

constexpr HTTP_Method s_known_methods[] =
  {
    http_GET, http_HEAD, http_POST, http_PUT, http_DELETE,
    http_CONNECT, http_OPTIONS, http_TRACE, http_PATCH,
  };

}  // namespace

HTTP_Method
parse_http_method(chars_view text)
  noexcept
  {
    if((text.n == 0) || (text.n > 7) || !is_http_token(text))
      return http_NULL;

    // Try standard methods, case-insensitively.
    char upper[8] = { };
    for(size_t k = 0;  k != text.n;  ++k)
      upper[k] = ((text[k] >= 'a') && (text[k] <= 'z')) ? static_cast<char>(text[k] - 0x20) : text[k];

    uint64_t value;
    ::memcpy(&value, upper, 8);
    for(HTTP_Method method : s_known_methods)
      if(value == method)
        return method;

    // Keep extension methods as written.
    char str[8] = { };
    ::memcpy(str, text.p, text.n);
    ::memcpy(&value, str, 8);
    return static_cast<HTTP_Method>(value);
  }

HTTP_Request_Parser::
HTTP_Request_Parser()
  {
    this->reload(main_config.copy());
  }

HTTP_Request_Parser::
HTTP_Request_Parser(const Config_File& conf)
  {
    this->reload(conf);
  }

HTTP_Request_Parser::
~HTTP_Request_Parser()
  {
  }

void
HTTP_Request_Parser::
reload(const Config_File& conf)
  {
    // Read limits from the configuration, clamping them into their valid
    // ranges.
    int64_t max_header_bytes = conf.get_integer_opt(
                  &"http.max_header_bytes", INT64_MIN, INT64_MAX).value_or(65536);
    this->m_max_header_bytes = static_cast<uint32_t>(clamp(max_header_bytes,
                                            static_cast<int64_t>(0x400), static_cast<int64_t>(0x1000000)));

    int64_t max_content_length = conf.get_integer_opt(
                  &"http.max_request_content_length", INT64_MIN, INT64_MAX).value_or(1048576);
    this->m_max_content_length = static_cast<uint64_t>(clamp(max_content_length,
                                            static_cast<int64_t>(0x100), static_cast<int64_t>(0x40000000)));
  }

HTTP_Request_Parts
HTTP_Request_Parser::
parse_request_line_and_headers(HTTP_Stream_Reader& reader)
  const
  {
    HTTP_Request_Parts parts;
    size_t budget = this->m_max_header_bytes;

    // `METHOD SP request-target SP HTTP-VERSION`
    cow_string line = read_http_head_line(reader, budget);
    chars_view rest = line;

    auto sp1 = static_cast<const char*>(::memchr(rest.p, ' ', rest.n));
    if(!sp1)
      CARAVEL_HTTP_THROW(http_error_invalid_request, (
          "Invalid request line `$1`"),
          line);

    chars_view method_str(rest.p, static_cast<size_t>(sp1 - rest.p));
    rest >>= method_str.n + 1;

    auto sp2 = static_cast<const char*>(::memchr(rest.p, ' ', rest.n));
    if(!sp2)
      CARAVEL_HTTP_THROW(http_error_invalid_request, (
          "Invalid request line `$1`"),
          line);

    chars_view target_str(rest.p, static_cast<size_t>(sp2 - rest.p));
    chars_view version_str = rest >> (target_str.n + 1);

    if((target_str.n == 0) || ::memchr(version_str.p, ' ', version_str.n))
      CARAVEL_HTTP_THROW(http_error_invalid_request, (
          "Invalid request line `$1`"),
          line);

    parts.method = parse_http_method(method_str);
    if(parts.method == http_NULL)
      CARAVEL_HTTP_THROW(http_error_invalid_request, (
          "Invalid request method `$1`"),
          method_str);

    parts.version = parse_http_version(version_str);
    if(parts.version == http_version_null)
      CARAVEL_HTTP_THROW(http_error_invalid_request, (
          "Invalid HTTP version `$1`"),
          version_str);

    // The target is decoded before it is parsed.
    parts.uri = URI(url_decode(target_str));

    read_http_header_block(reader, parts.headers, budget);

    CARAVEL_LOG_TRACE((
        "Parsed request: $1 $2 $3 ($4 header entries)"),
        parts.method, parts.uri, parts.version, parts.headers.size());
    return parts;
  }

uniptr<Abstract_HTTP_Body>
HTTP_Request_Parser::
make_body(HTTP_Stream_Reader& reader, const HTTP_Request_Parts& parts)
  const
  {
    bool unframed_empty = is_any_of(parts.method, { http_GET, http_HEAD });
    return make_http_body(reader, parts.headers, unframed_empty, this->m_max_content_length);
  }

HTTP_Request
HTTP_Request_Parser::
parse_request(HTTP_Stream_Reader& reader)
  const
  {
    HTTP_Request req;
    req.parts = this->parse_request_line_and_headers(reader);
    req.body = this->make_body(reader, req.parts);
    return req;
  }

}  // namespace caravel
