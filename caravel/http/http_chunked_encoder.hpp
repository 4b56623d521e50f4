// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#ifndef CARAVEL_HTTP_HTTP_CHUNKED_ENCODER_
#define CARAVEL_HTTP_HTTP_CHUNKED_ENCODER_

#include "../fwd.hpp"
namespace caravel {

// This class writes data in chunked transfer encoding. Each call to `write()`
// produces exactly one chunk. The sink is borrowed and shall outlive this
// encoder.
class HTTP_Chunked_Encoder
  {
  private:
    Abstract_Byte_Sink* m_sink;
    uint64_t m_total = 0;
    bool m_closed = false;

  public:
    explicit
    HTTP_Chunked_Encoder(Abstract_Byte_Sink& sink) noexcept;

  public:
    HTTP_Chunked_Encoder(const HTTP_Chunked_Encoder&) = delete;
    HTTP_Chunked_Encoder& operator=(const HTTP_Chunked_Encoder&) & = delete;
    ~HTTP_Chunked_Encoder();

    bool
    closed()
      const noexcept
      { return this->m_closed;  }

    // Gets the number of payload bytes that have been written.
    uint64_t
    total()
      const noexcept
      { return this->m_total;  }

    // Writes `data` as a chunk. If `data` is empty, nothing is written and
    // `false` is returned, as an empty chunk would terminate the payload. If
    // the encoder has been closed, an exception is thrown.
    bool
    write(chars_view data);

    // Writes the terminating chunk. After this function returns, no more
    // data can be written. Subsequent calls have no effect.
    void
    close();
  };

}  // namespace caravel
#endif
