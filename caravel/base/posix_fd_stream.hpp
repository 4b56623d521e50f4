// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#ifndef CARAVEL_BASE_POSIX_FD_STREAM_
#define CARAVEL_BASE_POSIX_FD_STREAM_

#include "../fwd.hpp"
#include "abstract_byte_source.hpp"
#include "abstract_byte_sink.hpp"
namespace caravel {

class POSIX_FD_Stream
  : public Abstract_Byte_Source,
    public Abstract_Byte_Sink
  {
  private:
    unique_posix_fd m_fd;

  protected:
    virtual
    size_t
    do_abstract_byte_source_read(char* data, size_t size)
      override;

    virtual
    void
    do_abstract_byte_sink_write(const char* data, size_t size)
      override;

  public:
    // Takes ownership of a blocking file descriptor, which may refer to a
    // file, a pipe or a stream socket.
    explicit
    POSIX_FD_Stream(unique_posix_fd&& fd);

  public:
    POSIX_FD_Stream(const POSIX_FD_Stream&) = delete;
    POSIX_FD_Stream& operator=(const POSIX_FD_Stream&) & = delete;
    virtual ~POSIX_FD_Stream();

    int
    fd()
      const noexcept
      { return this->m_fd.get();  }

    // Shuts the write side of a socket down, so the peer sees end of stream.
    // If the file descriptor is not a socket, `false` is returned.
    bool
    shut_down_write()
      noexcept;
  };

}  // namespace caravel
#endif
