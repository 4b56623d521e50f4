// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#ifndef CARAVEL_HTTP_HTTP_STREAM_BODY_
#define CARAVEL_HTTP_HTTP_STREAM_BODY_

#include "../fwd.hpp"
#include "abstract_http_body.hpp"
namespace caravel {

// This body reads the payload of a message from the reader that has parsed
// its headers. The reader is borrowed and shall outlive this body.
class HTTP_Stream_Body
  : public Abstract_HTTP_Body
  {
  private:
    HTTP_Stream_Reader* m_reader;
    opt<uint64_t> m_length;
    uint64_t m_max_length;
    uint64_t m_offset = 0;

  protected:
    virtual
    bool
    do_abstract_http_body_read(cow_string& chunk)
      override;

    virtual
    opt<uint64_t>
    do_abstract_http_body_size_hint()
      const noexcept
      override;

  public:
    // Creates a body of `length` bytes. If `length` is `nullopt`, the body
    // extends to end of stream, but at most `max_length` bytes are accepted;
    // otherwise, `max_length` is ignored.
    HTTP_Stream_Body(HTTP_Stream_Reader& reader, opt<uint64_t> length, uint64_t max_length) noexcept;

  public:
    HTTP_Stream_Body(const HTTP_Stream_Body&) = delete;
    HTTP_Stream_Body& operator=(const HTTP_Stream_Body&) & = delete;
    virtual ~HTTP_Stream_Body();

    // Gets the number of bytes that have been read.
    uint64_t
    offset()
      const noexcept
      { return this->m_offset;  }
  };

}  // namespace caravel
#endif
