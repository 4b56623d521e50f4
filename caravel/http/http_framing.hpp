// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#ifndef CARAVEL_HTTP_HTTP_FRAMING_
#define CARAVEL_HTTP_HTTP_FRAMING_

#include "../fwd.hpp"
#include "enums.hpp"
namespace caravel {

// These functions are shared by request and response parsers.

// Reads a line of a message head and strips its line terminator, which is
// either CR LF or a bare LF. `budget` is the number of bytes that may still
// be consumed; it is decreased by the length of the line. If the line would
// exceed the budget, an `HTTP_Error` with `http_error_headers_too_large` is
// thrown. If the stream ends before the line is complete, an `HTTP_Error`
// with `http_error_unexpected_eof` is thrown.
cow_string
read_http_head_line(HTTP_Stream_Reader& reader, size_t& budget);

// Reads header lines until an empty line, and appends them to `headers`.
// The reader is left at the first byte after the empty line.
void
read_http_header_block(HTTP_Stream_Reader& reader, HTTP_Headers& headers, size_t& budget);

// Parses a line such as `Accept: text/html, text/plain` and appends its
// values to `headers`. `Cookie` values are split on semicolons; date values
// and `Set-Cookie` values are never split; other values are split on commas.
// Empty values are skipped.
void
parse_http_header_line(HTTP_Headers& headers, chars_view line);

// Parses a version string such as `HTTP/1.1`, case-insensitively. If the
// string is a valid version other than 1.0 and 1.1, an `HTTP_Error` with
// `http_error_version_not_supported` is thrown. If the string is not a
// version at all, `http_version_null` is returned.
HTTP_Version
parse_http_version(chars_view text);

// Gets the value of `Content-Length`. If the header is absent, `nullopt` is
// returned. If it is not a decimal integer, or if it has multiple distinct
// values, an `HTTP_Error` with `http_error_invalid_request` is thrown.
opt<uint64_t>
get_http_content_length(const HTTP_Headers& headers);

// Checks whether `Transfer-Encoding` is present and ends with `chunked`. If
// `Transfer-Encoding` is present but does not end with `chunked`, an
// `HTTP_Error` with `http_error_invalid_request` is thrown.
bool
is_http_chunked(const HTTP_Headers& headers);

// Creates a body according to `Content-Length` and `Transfer-Encoding`. If
// both are absent, and `unframed_empty` is set, the body is empty; otherwise
// it extends to end of stream. `Transfer-Encoding` takes precedence over
// `Content-Length`. If a length exceeds `max_length`, an `HTTP_Error` with
// `http_error_payload_too_large` is thrown.
uniptr<Abstract_HTTP_Body>
make_http_body(HTTP_Stream_Reader& reader, const HTTP_Headers& headers,
               bool unframed_empty, uint64_t max_length);

}  // namespace caravel
#endif
