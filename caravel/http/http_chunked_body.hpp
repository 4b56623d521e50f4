// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#ifndef CARAVEL_HTTP_HTTP_CHUNKED_BODY_
#define CARAVEL_HTTP_HTTP_CHUNKED_BODY_

#include "../fwd.hpp"
#include "abstract_http_body.hpp"
namespace caravel {

// This body decodes a payload in chunked transfer encoding. Each chunk has
// the form `{hex-length}[;extensions]\r\n{data}\r\n`, and the payload is
// terminated by a zero-length chunk, optional trailers and an empty line.
// Chunk extensions and trailers are discarded. The reader is borrowed and
// shall outlive this body.
class HTTP_Chunked_Body
  : public Abstract_HTTP_Body
  {
  private:
    enum Decoder_State : uint8_t
      {
        decoder_read_length  = 0,
        decoder_read_data    = 1,
        decoder_done         = 2,
      };

    HTTP_Stream_Reader* m_reader;
    uint64_t m_max_length;
    uint64_t m_total = 0;
    uint64_t m_chunk_remaining = 0;
    Decoder_State m_state = decoder_read_length;

  private:
    cow_string
    do_read_line(const char* what);

  protected:
    virtual
    bool
    do_abstract_http_body_read(cow_string& chunk)
      override;

  public:
    // Creates a decoder. If the decoded payload exceeds `max_length` bytes, an
    // `HTTP_Error` with `http_error_payload_too_large` is thrown.
    HTTP_Chunked_Body(HTTP_Stream_Reader& reader, uint64_t max_length) noexcept;

  public:
    HTTP_Chunked_Body(const HTTP_Chunked_Body&) = delete;
    HTTP_Chunked_Body& operator=(const HTTP_Chunked_Body&) & = delete;
    virtual ~HTTP_Chunked_Body();

    // Gets the number of payload bytes that have been decoded.
    uint64_t
    total()
      const noexcept
      { return this->m_total;  }
  };

}  // namespace caravel
#endif
