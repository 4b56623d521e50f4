// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#ifndef CARAVEL_HTTP_ENUMS_
#define CARAVEL_HTTP_ENUMS_

#include "../fwd.hpp"
#include <cstring>
namespace caravel {

// Methods are packed into 64-bit integers, so they can be compared in a
// single instruction. A method has at most seven characters, and unused bytes
// are filled with zeroes.
enum HTTP_Method : uint64_t
  {
    http_NULL      = ROCKET_BETOH64(0x0000000000000000),
    http_OPTIONS   = ROCKET_BETOH64(0x4F5054494F4E5300),
    http_GET       = ROCKET_BETOH64(0x4745540000000000),
    http_HEAD      = ROCKET_BETOH64(0x4845414400000000),
    http_POST      = ROCKET_BETOH64(0x504F535400000000),
    http_PUT       = ROCKET_BETOH64(0x5055540000000000),
    http_DELETE    = ROCKET_BETOH64(0x44454C4554450000),
    http_TRACE     = ROCKET_BETOH64(0x5452414345000000),
    http_CONNECT   = ROCKET_BETOH64(0x434F4E4E45435400),
    http_PATCH     = ROCKET_BETOH64(0x5041544348000000),
  };

enum HTTP_Version : uint16_t
  {
    http_version_null  = 0x0000,
    http_version_1_0   = 0x0100,
    http_version_1_1   = 0x0101,
  };

enum HTTP_Status : uint16_t
  {
    http_status_null                             =   0,
    http_status_continue                         = 100,
    http_status_switching_protocols              = 101,
    http_status_ok                               = 200,
    http_status_created                          = 201,
    http_status_accepted                         = 202,
    http_status_nonauthoritative_information     = 203,
    http_status_no_content                       = 204,
    http_status_reset_content                    = 205,
    http_status_partial_content                  = 206,
    http_status_multiple_choices                 = 300,
    http_status_moved_permanently                = 301,
    http_status_found                            = 302,
    http_status_see_other                        = 303,
    http_status_not_modified                     = 304,
    http_status_temporary_redirect               = 307,
    http_status_permanent_redirect               = 308,
    http_status_bad_request                      = 400,
    http_status_unauthorized                     = 401,
    http_status_forbidden                        = 403,
    http_status_not_found                        = 404,
    http_status_method_not_allowed               = 405,
    http_status_not_acceptable                   = 406,
    http_status_request_timeout                  = 408,
    http_status_conflict                         = 409,
    http_status_gone                             = 410,
    http_status_length_required                  = 411,
    http_status_precondition_failed              = 412,
    http_status_payload_too_large                = 413,
    http_status_uri_too_long                     = 414,
    http_status_unsupported_media_type           = 415,
    http_status_range_not_satisfiable            = 416,
    http_status_expectation_failed               = 417,
    http_status_upgrade_required                 = 426,
    http_status_too_many_requests                = 429,
    http_status_request_header_fields_too_large  = 431,
    http_status_internal_server_error            = 500,
    http_status_not_implemented                  = 501,
    http_status_bad_gateway                      = 502,
    http_status_service_unavailable              = 503,
    http_status_gateway_timeout                  = 504,
    http_status_http_version_not_supported       = 505,
  };

enum HTTP_Error_Code : uint8_t
  {
    http_error_none                   =  0,
    http_error_invalid_uri            =  1,
    http_error_invalid_request        =  2,
    http_error_invalid_header_name    =  3,
    http_error_invalid_header_value   =  4,
    http_error_invalid_chunk          =  5,
    http_error_invalid_datetime       =  6,
    http_error_limit_reached          =  7,
    http_error_payload_too_large      =  8,
    http_error_headers_too_large      =  9,
    http_error_version_not_supported  = 10,
    http_error_unexpected_eof         = 11,
  };

enum URI_Error_Kind : uint8_t
  {
    uri_error_none            = 0,
    uri_error_decode          = 1,
    uri_error_invalid_scheme  = 2,
    uri_error_invalid_host    = 3,
    uri_error_invalid_path    = 4,
    uri_error_invalid_query   = 5,
    uri_error_empty_host      = 6,
    uri_error_invalid_port    = 7,
    uri_error_empty_uri       = 8,
  };

inline
tinyfmt&
operator<<(tinyfmt& fmt, HTTP_Method method)
  {
    char str[16] = { };
    ::std::memcpy(str, &method, 8);
    return fmt << str;
  }

inline
tinyfmt&
operator<<(tinyfmt& fmt, HTTP_Version version)
  {
    char str[16] = "HTTP/?.?";
    str[5] = static_cast<char>('0' + (version >> 8) % 10);
    str[7] = static_cast<char>('0' + (version & 0xFF) % 10);
    return fmt << str;
  }

}  // namespace caravel
#endif
