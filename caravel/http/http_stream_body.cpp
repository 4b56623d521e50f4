// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "http_stream_body.hpp"
#include "http_stream_reader.hpp"
#include "http_error.hpp"
#include "../utils.hpp"
namespace caravel {

HTTP_Stream_Body::
HTTP_Stream_Body(HTTP_Stream_Reader& reader, opt<uint64_t> length, uint64_t max_length) noexcept
  :
    m_reader(&reader), m_length(length), m_max_length(max_length)
  {
  }

HTTP_Stream_Body::
~HTTP_Stream_Body()
  {
  }

bool
HTTP_Stream_Body::
do_abstract_http_body_read(cow_string& chunk)
  {
    if(this->m_length) {
      // The body has a fixed length, so a short read is an error.
      uint64_t remaining = *(this->m_length) - this->m_offset;
      if(remaining == 0)
        return false;

      size_t step = static_cast<size_t>(min(remaining, static_cast<uint64_t>(4096)));
      chunk = this->m_reader->read_exact(step);
      this->m_offset += chunk.size();

      if(chunk.size() != step)
        CARAVEL_HTTP_THROW(http_error_unexpected_eof, (
            "Connection closed after `$1` of `$2` bytes of body"),
            this->m_offset, *(this->m_length));

      return true;
    }

    // The body extends to end of stream.
    chunk = this->m_reader->read_exact(4096);
    if(chunk.empty())
      return false;

    this->m_offset += chunk.size();
    if(this->m_offset > this->m_max_length)
      CARAVEL_HTTP_THROW(http_error_payload_too_large, (
          "Body exceeded `$1` bytes"),
          this->m_max_length);

    return true;
  }

opt<uint64_t>
HTTP_Stream_Body::
do_abstract_http_body_size_hint()
  const noexcept
  {
    return this->m_length;
  }

}  // namespace caravel
