// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "posix_fd_stream.hpp"
#include "../utils.hpp"
#include <sys/socket.h>
namespace caravel {

POSIX_FD_Stream::
POSIX_FD_Stream(unique_posix_fd&& fd)
  {
    CARAVEL_CHECK(fd.get() >= 0);
    this->m_fd = move(fd);
  }

POSIX_FD_Stream::
~POSIX_FD_Stream()
  {
  }

size_t
POSIX_FD_Stream::
do_abstract_byte_source_read(char* data, size_t size)
  {
    size_t nmax = min(size, static_cast<size_t>(SSIZE_MAX));
    ::ssize_t ior = CARAVEL_SYSCALL_LOOP(::read(this->m_fd, data, nmax));
    if(ior < 0)
      CARAVEL_THROW((
          "Could not read from file descriptor `$1`",
          "[`read()` failed: ${errno:full}]"),
          this->m_fd.get());

    return static_cast<size_t>(ior);
  }

void
POSIX_FD_Stream::
do_abstract_byte_sink_write(const char* data, size_t size)
  {
    size_t offset = 0;
    while(offset != size) {
      // Writing to a closed socket shall not raise `SIGPIPE`.
      size_t nmax = min(size - offset, static_cast<size_t>(SSIZE_MAX));
      ::ssize_t ior = CARAVEL_SYSCALL_LOOP(::send(this->m_fd, data + offset, nmax, MSG_NOSIGNAL));
      if((ior < 0) && (errno == ENOTSOCK))
        ior = CARAVEL_SYSCALL_LOOP(::write(this->m_fd, data + offset, nmax));

      if(ior < 0)
        CARAVEL_THROW((
            "Could not write to file descriptor `$1`",
            "[`write()` failed: ${errno:full}]"),
            this->m_fd.get());

      offset += static_cast<size_t>(ior);
    }
  }

bool
POSIX_FD_Stream::
shut_down_write()
  noexcept
  {
    return ::shutdown(this->m_fd, SHUT_WR) == 0;
  }

}  // namespace caravel
