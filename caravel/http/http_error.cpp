// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "http_error.hpp"
#include "../utils.hpp"
namespace caravel {

HTTP_Error::
HTTP_Error(HTTP_Error_Code code, URI_Error_Kind uri_kind, const cow_string& msg)
  :
    ::std::runtime_error(msg.c_str()),
    m_code(code), m_uri_kind(uri_kind)
  {
  }

HTTP_Error::
~HTTP_Error()
  {
  }

HTTP_Status
http_status_from_error(HTTP_Error_Code code)
  noexcept
  {
    switch(code)
      {
      case http_error_invalid_uri:
      case http_error_invalid_request:
      case http_error_invalid_header_name:
      case http_error_invalid_header_value:
      case http_error_invalid_chunk:
      case http_error_invalid_datetime:
      case http_error_unexpected_eof:
        return http_status_bad_request;

      case http_error_limit_reached:
      case http_error_payload_too_large:
        return http_status_payload_too_large;

      case http_error_headers_too_large:
        return http_status_request_header_fields_too_large;

      case http_error_version_not_supported:
        return http_status_http_version_not_supported;

      default:
        return http_status_internal_server_error;
      }
  }

const char*
describe_http_error_code(HTTP_Error_Code code)
  noexcept
  {
    switch(code)
      {
      case http_error_none:
        return "no error";

      case http_error_invalid_uri:
        return "invalid URI";

      case http_error_invalid_request:
        return "invalid request";

      case http_error_invalid_header_name:
        return "invalid header name";

      case http_error_invalid_header_value:
        return "invalid header value";

      case http_error_invalid_chunk:
        return "invalid chunk";

      case http_error_invalid_datetime:
        return "invalid date/time";

      case http_error_limit_reached:
        return "reader bytes limit reached";

      case http_error_payload_too_large:
        return "payload too large";

      case http_error_headers_too_large:
        return "headers too large";

      case http_error_version_not_supported:
        return "HTTP version not supported";

      case http_error_unexpected_eof:
        return "unexpected end of stream";

      default:
        return "unknown error";
      }
  }

HTTP_Error
do_create_http_error(HTTP_Error_Code code, URI_Error_Kind uri_kind,
                     const char* func, const char* file, uint32_t line,
                     const void* composer, message_composer_fn* composer_fn)
  {
    ::rocket::tinyfmt_str fmt;
    (* composer_fn) (fmt, composer);
    cow_string sbuf = fmt.extract_string();
    sbuf.erase(sbuf.rfind_not_of(" \t\r\n") + 1);

    // Append the source location and function name.
    ::rocket::ascii_numput nump;
    nump.put_DU(line);
    sbuf += "\n[thrown from function `";
    sbuf += func;
    sbuf += "` at '";
    sbuf += file;
    sbuf += ":";
    sbuf.append(nump.data(), nump.size());
    sbuf += "']";

    return HTTP_Error(code, uri_kind, sbuf);
  }

}  // namespace caravel
