// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "http_chunked_body.hpp"
#include "http_stream_reader.hpp"
#include "http_error.hpp"
#include "../utils.hpp"
namespace caravel {
namespace {

// Length lines and trailers are short. Anything longer is rejected.
constexpr size_t s_max_line_length = 4096;

inline
int
do_hex_digit(char c)
  noexcept
  {
    if((c >= '0') && (c <= '9'))
      return c - '0';
    else if((c >= 'A') && (c <= 'F'))
      return c - 'A' + 10;
    else if((c >= 'a') && (c <= 'f'))
      return c - 'a' + 10;
    else
      return -1;
  }

}  // namespace

HTTP_Chunked_Body::
HTTP_Chunked_Body(HTTP_Stream_Reader& reader, uint64_t max_length) noexcept
  :
    m_reader(&reader), m_max_length(max_length)
  {
  }

HTTP_Chunked_Body::
~HTTP_Chunked_Body()
  {
  }

cow_string
HTTP_Chunked_Body::
do_read_line(const char* what)
  {
    cow_string line = this->m_reader->read_until_with_limit('\n', s_max_line_length);

    if((line.size() < 2) || (line.back() != '\n') || (line[line.size() - 2] != '\r'))
      CARAVEL_HTTP_THROW(http_error_invalid_chunk, (
          "Chunk $1 not terminated by CR LF"),
          what);

    line.pop_back(2);
    return line;
  }

bool
HTTP_Chunked_Body::
do_abstract_http_body_read(cow_string& chunk)
  {
    if(this->m_state == decoder_done)
      return false;

    if(this->m_state == decoder_read_length) {
      cow_string line = this->do_read_line("length");

      // Parse the length, which is a non-empty sequence of hexadecimal
      // digits, optionally followed by extensions.
      size_t offset = 0;
      uint64_t length = 0;
      int dvalue;
      while((offset != line.size()) && ((dvalue = do_hex_digit(line[offset])) >= 0)) {
        if(length >> 60 != 0)
          CARAVEL_HTTP_THROW(http_error_invalid_chunk, (
              "Chunk length `$1` too large"),
              line);

        length = length << 4 | static_cast<uint32_t>(dvalue);
        offset ++;
      }

      if(offset == 0)
        CARAVEL_HTTP_THROW(http_error_invalid_chunk, (
            "Invalid chunk length `$1`"),
            line);

      chars_view rest = trim_blank(chars_view(line.data() + offset, line.size() - offset));
      if((rest.n != 0) && (rest[0] != ';'))
        CARAVEL_HTTP_THROW(http_error_invalid_chunk, (
            "Invalid chunk length `$1`"),
            line);

      if(length == 0) {
        // Skip trailers until an empty line.
        while(!this->do_read_line("trailer").empty());

        CARAVEL_LOG_TRACE(("Chunked body complete: `$1` bytes"), this->m_total);
        this->m_state = decoder_done;
        return false;
      }

      if(length > this->m_max_length - this->m_total)
        CARAVEL_HTTP_THROW(http_error_payload_too_large, (
            "Chunked body exceeded `$1` bytes"),
            this->m_max_length);

      this->m_chunk_remaining = length;
      this->m_state = decoder_read_data;
    }

    // Read chunk data in pieces, so a huge chunk need not be buffered.
    size_t step = static_cast<size_t>(min(this->m_chunk_remaining, static_cast<uint64_t>(65536)));
    chunk = this->m_reader->read_exact(step);
    if(chunk.size() != step)
      CARAVEL_HTTP_THROW(http_error_invalid_chunk, (
          "Connection closed inside chunk data"));

    this->m_total += step;
    this->m_chunk_remaining -= step;

    if(this->m_chunk_remaining == 0) {
      // Each chunk is followed by a CR LF pair.
      cow_string crlf = this->m_reader->read_exact(2);
      if(crlf != "\r\n")
        CARAVEL_HTTP_THROW(http_error_invalid_chunk, (
            "Chunk data not terminated by CR LF"));

      this->m_state = decoder_read_length;
    }

    return true;
  }

}  // namespace caravel
