// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#ifndef CARAVEL_HTTP_HTTP_STREAM_READER_
#define CARAVEL_HTTP_HTTP_STREAM_READER_

#include "../fwd.hpp"
namespace caravel {

// This is a buffered reader over a byte source. Bytes that have been fetched
// from the source but not consumed stay in the buffer, so a body reader can
// resume exactly where a header parser stopped. The source is borrowed and
// shall outlive this reader.
class HTTP_Stream_Reader
  {
  private:
    Abstract_Byte_Source* m_source;
    linear_buffer m_buf;
    bool m_eof = false;

    uint64_t m_bytes_limit = UINT64_MAX;
    uint64_t m_bytes_read = 0;

  private:
    bool
    do_fill();

    void
    do_consume(cow_string& out, size_t count);

  public:
    explicit
    HTTP_Stream_Reader(Abstract_Byte_Source& source) noexcept;

  public:
    HTTP_Stream_Reader(const HTTP_Stream_Reader&) = delete;
    HTTP_Stream_Reader& operator=(const HTTP_Stream_Reader&) & = delete;
    ~HTTP_Stream_Reader();

    // Sets the maximum number of bytes that may be consumed, in total. When a
    // read would consume beyond this limit, an `HTTP_Error` with
    // `http_error_limit_reached` is thrown.
    void
    set_bytes_limit(uint64_t limit)
      noexcept
      { this->m_bytes_limit = limit;  }

    uint64_t
    bytes_limit()
      const noexcept
      { return this->m_bytes_limit;  }

    // Gets the number of bytes that have been consumed so far.
    uint64_t
    total_bytes_read()
      const noexcept
      { return this->m_bytes_read;  }

    // Restarts the byte counter, usually between messages.
    void
    reset_bytes_read()
      noexcept
      { this->m_bytes_read = 0;  }

    // Gets the number of bytes that have been fetched but not consumed.
    size_t
    buffered()
      const noexcept
      { return this->m_buf.size();  }

    // Checks whether the source has been exhausted and no byte remains. This
    // function may block.
    bool
    at_eof();

    // Gets up to `count` bytes without consuming them. Fewer bytes are
    // returned only if the source has ended. The view is invalidated by the
    // next call to any non-const function.
    chars_view
    peek(size_t count);

    // Consumes all bytes up to and including the first occurrence of `delim`.
    // If the source ends first, all remaining bytes are returned.
    cow_string
    read_until(char delim);

    // Does the same as `read_until()`, but if more than `limit` bytes would be
    // consumed before the delimiter is found, an `HTTP_Error` with
    // `http_error_limit_reached` is thrown.
    cow_string
    read_until_with_limit(char delim, size_t limit);

    // Consumes all bytes up to and including the first occurrence of `seq`.
    // The boolean indicates whether `seq` has been found; if not, all
    // remaining bytes are returned. An empty sequence is always found at the
    // current position.
    pair<bool, cow_string>
    read_until_sequence(chars_view seq);

    // Consumes `count` bytes. Fewer bytes are returned only if the source has
    // ended, which is not an error.
    cow_string
    read_exact(size_t count);

    // Consumes all remaining bytes.
    cow_string
    read_to_end();

    // Discards up to `count` bytes and returns the number of bytes that have
    // been discarded.
    uint64_t
    discard(uint64_t count);
  };

}  // namespace caravel
#endif
