// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "http_framing.hpp"
#include "http_stream_reader.hpp"
#include "http_headers.hpp"
#include "http_error.hpp"
#include "http_bytes_body.hpp"
#include "http_stream_body.hpp"
#include "http_chunked_body.hpp"
#include "../utils.hpp"
namespace caravel {
namespace {

inline
bool
do_ci_equal(chars_view lhs, chars_view rhs)
  noexcept
  {
    return ::rocket::ascii_ci_equal(lhs.p, lhs.n, rhs.p, rhs.n);
  }

// These headers contain commas, but are not lists.
constexpr const char* s_unsplittable_names[] =
  {
    "Date", "Expires", "Last-Modified", "If-Modified-Since",
    "If-Unmodified-Since", "Retry-After", "Set-Cookie",
  };

bool
do_is_unsplittable(chars_view name)
  noexcept
  {
    for(const char* str : s_unsplittable_names)
      if(do_ci_equal(name, str))
        return true;

    return false;
  }

// Gets the last element of a comma-separated list.
chars_view
do_last_list_element(chars_view text)
  noexcept
  {
    auto comma = static_cast<const char*>(::memrchr(text.p, ',', text.n));
    if(comma)
      text >>= static_cast<size_t>(comma - text.p + 1);
    return trim_blank(text);
  }

}  // namespace

cow_string
read_http_head_line(HTTP_Stream_Reader& reader, size_t& budget)
  {
    cow_string line;
    try {
      line = reader.read_until_with_limit('\n', budget);
    }
    catch(HTTP_Error& err) {
      if(err.code() != http_error_limit_reached)
        throw;

      CARAVEL_HTTP_THROW(http_error_headers_too_large, (
          "Message head too large"));
    }

    if(line.empty() || (line.back() != '\n'))
      CARAVEL_HTTP_THROW(http_error_unexpected_eof, (
          "Connection closed inside message head"));

    budget -= line.size();

    // Strip the line terminator. A bare LF is tolerated.
    line.pop_back();
    if(!line.empty() && (line.back() == '\r'))
      line.pop_back();

    return line;
  }

void
read_http_header_block(HTTP_Stream_Reader& reader, HTTP_Headers& headers, size_t& budget)
  {
    for(;;) {
      cow_string line = read_http_head_line(reader, budget);
      if(line.empty())
        return;

      parse_http_header_line(headers, line);
    }
  }

void
parse_http_header_line(HTTP_Headers& headers, chars_view line)
  {
    if((line.n != 0) && ((line[0] == ' ') || (line[0] == '\t')))
      CARAVEL_HTTP_THROW(http_error_invalid_request, (
          "Obsolete line folding not allowed"));

    auto colon = static_cast<const char*>(::memchr(line.p, ':', line.n));
    if(!colon)
      CARAVEL_HTTP_THROW(http_error_invalid_request, (
          "Header line `$1` has no colon"),
          line);

    // The name is validated by its constructor.
    HTTP_Field_Name name(cow_string(line.p, static_cast<size_t>(colon - line.p)));
    chars_view value = trim_blank(line >> static_cast<size_t>(colon - line.p + 1));

    if(do_is_unsplittable(name.str())) {
      if(value.n != 0)
        headers.append(name, HTTP_Header_Value(cow_string(value)));
      return;
    }

    char delim = name.equals("Cookie") ? ';' : ',';
    while(value.n != 0) {
      auto pos = static_cast<const char*>(::memchr(value.p, delim, value.n));
      size_t len = pos ? static_cast<size_t>(pos - value.p) : value.n;
      chars_view piece = trim_blank(chars_view(value.p, len));
      if(piece.n != 0)
        headers.append(name, HTTP_Header_Value(cow_string(piece)));

      value >>= pos ? len + 1 : len;
    }
  }

HTTP_Version
parse_http_version(chars_view text)
  {
    // `HTTP/x.y`
    if((text.n != 8) || !do_ci_equal(chars_view(text.p, 5), "HTTP/")
       || (text[5] < '0') || (text[5] > '9') || (text[6] != '.')
       || (text[7] < '0') || (text[7] > '9'))
      return http_version_null;

    uint32_t major = static_cast<uint32_t>(text[5] - '0');
    uint32_t minor = static_cast<uint32_t>(text[7] - '0');
    if((major != 1) || (minor > 1))
      CARAVEL_HTTP_THROW(http_error_version_not_supported, (
          "HTTP version `$1` not supported"),
          text);

    return static_cast<HTTP_Version>(major << 8 | minor);
  }

opt<uint64_t>
get_http_content_length(const HTTP_Headers& headers)
  {
    opt<uint64_t> length;

    for(const auto& value : headers.get_all("Content-Length")) {
      auto r = value.as_uint64();
      if(!r)
        CARAVEL_HTTP_THROW(http_error_invalid_request, (
            "Invalid `Content-Length` value `$1`"),
            value);

      if(length && (*length != *r))
        CARAVEL_HTTP_THROW(http_error_invalid_request, (
            "Conflicting `Content-Length` values `$1` and `$2`"),
            *length, *r);

      length = r;
    }

    return length;
  }

bool
is_http_chunked(const HTTP_Headers& headers)
  {
    auto values = headers.get_all("Transfer-Encoding");
    if(values.empty())
      return false;

    // Get the last transfer coding, which must be `chunked`.
    const HTTP_Header_Value* last = nullptr;
    for(const auto& value : values)
      last = &value;

    chars_view coding = do_last_list_element(last->str());
    if(!do_ci_equal(coding, "chunked"))
      CARAVEL_HTTP_THROW(http_error_invalid_request, (
          "Transfer encoding `$1` not supported"),
          *last);

    return true;
  }

uniptr<Abstract_HTTP_Body>
make_http_body(HTTP_Stream_Reader& reader, const HTTP_Headers& headers,
               bool unframed_empty, uint64_t max_length)
  {
    if(is_http_chunked(headers)) {
      CARAVEL_LOG_TRACE(("Creating chunked body"));
      return new_uni<HTTP_Chunked_Body>(reader, max_length);
    }

    auto length = get_http_content_length(headers);
    if(length) {
      if(*length > max_length)
        CARAVEL_HTTP_THROW(http_error_payload_too_large, (
            "Content length `$1` exceeds limit `$2`"),
            *length, max_length);

      if(*length == 0)
        return new_uni<HTTP_Empty_Body>();

      return new_uni<HTTP_Stream_Body>(reader, length, max_length);
    }

    if(unframed_empty)
      return new_uni<HTTP_Empty_Body>();

    CARAVEL_LOG_TRACE(("Creating body until end of stream"));
    return new_uni<HTTP_Stream_Body>(reader, nullopt, max_length);
  }

}  // namespace caravel
