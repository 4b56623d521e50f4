// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "http_response_parser.hpp"
#include "http_stream_reader.hpp"
#include "http_framing.hpp"
#include "http_error.hpp"
#include "abstract_http_body.hpp"
#include "http_bytes_body.hpp"
#include "../base/config_file.hpp"
#include "../static/main_config.hpp"
#include "../utils.hpp"
namespace caravel {

bool
http_response_has_no_body(HTTP_Method req_method, HTTP_Status status)
  noexcept
  {
    return (req_method == http_HEAD) || (status / 100 == 1)
           || (status == http_status_no_content) || (status == http_status_not_modified);
  }

HTTP_Response_Parser::
HTTP_Response_Parser()
  {
    this->reload(main_config.copy());
  }

HTTP_Response_Parser::
HTTP_Response_Parser(const Config_File& conf)
  {
    this->reload(conf);
  }

HTTP_Response_Parser::
~HTTP_Response_Parser()
  {
  }

void
HTTP_Response_Parser::
reload(const Config_File& conf)
  {
    int64_t max_header_bytes = conf.get_integer_opt(
                  &"http.max_header_bytes", INT64_MIN, INT64_MAX).value_or(65536);
    this->m_max_header_bytes = static_cast<uint32_t>(clamp(max_header_bytes,
                                            static_cast<int64_t>(0x400), static_cast<int64_t>(0x1000000)));

    // Responses share the limit of requests.
    int64_t max_content_length = conf.get_integer_opt(
                  &"http.max_request_content_length", INT64_MIN, INT64_MAX).value_or(1048576);
    this->m_max_content_length = static_cast<uint64_t>(clamp(max_content_length,
                                            static_cast<int64_t>(0x100), static_cast<int64_t>(0x40000000)));
  }

HTTP_Response_Parts
HTTP_Response_Parser::
parse_status_line_and_headers(HTTP_Stream_Reader& reader)
  const
  {
    HTTP_Response_Parts parts;
    size_t budget = this->m_max_header_bytes;

    // `HTTP-VERSION SP 3DIGIT SP reason`
    cow_string line = read_http_head_line(reader, budget);
    if((line.size() < 12) || (line[8] != ' ')
       || (line[9] < '1') || (line[9] > '9')
       || (line[10] < '0') || (line[10] > '9')
       || (line[11] < '0') || (line[11] > '9')
       || ((line.size() > 12) && (line[12] != ' ')))
      CARAVEL_HTTP_THROW(http_error_invalid_request, (
          "Invalid status line `$1`"),
          line);

    parts.version = parse_http_version(chars_view(line.data(), 8));
    if(parts.version == http_version_null)
      CARAVEL_HTTP_THROW(http_error_invalid_request, (
          "Invalid HTTP version in status line `$1`"),
          line);

    parts.status = static_cast<HTTP_Status>((line[9] - '0') * 100 + (line[10] - '0') * 10 + (line[11] - '0'));

    if(line.size() > 12)
      parts.reason.assign(line.data() + 13, line.size() - 13);

    if(!is_http_header_value(parts.reason))
      CARAVEL_HTTP_THROW(http_error_invalid_request, (
          "Invalid reason phrase in status line `$1`"),
          line);

    read_http_header_block(reader, parts.headers, budget);

    CARAVEL_LOG_TRACE((
        "Parsed response: $1 $2 ($3 header entries)"),
        parts.version, static_cast<uint32_t>(parts.status), parts.headers.size());
    return parts;
  }

uniptr<Abstract_HTTP_Body>
HTTP_Response_Parser::
make_body(HTTP_Stream_Reader& reader, const HTTP_Response_Parts& parts, HTTP_Method req_method)
  const
  {
    if(http_response_has_no_body(req_method, parts.status))
      return new_uni<HTTP_Empty_Body>();

    return make_http_body(reader, parts.headers, false, this->m_max_content_length);
  }

HTTP_Response
HTTP_Response_Parser::
parse_response(HTTP_Stream_Reader& reader, HTTP_Method req_method)
  const
  {
    HTTP_Response resp;
    resp.parts = this->parse_status_line_and_headers(reader);
    resp.body = this->make_body(reader, resp.parts, req_method);
    return resp;
  }

}  // namespace caravel
