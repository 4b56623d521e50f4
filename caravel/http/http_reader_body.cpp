// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "http_reader_body.hpp"
#include "../base/abstract_byte_source.hpp"
#include "../utils.hpp"
#include <sys/stat.h>
#include <fcntl.h>
namespace caravel {
namespace {

constexpr size_t s_read_step = 4096;

bool
do_read_step(Abstract_Byte_Source& source, cow_string& chunk)
  {
    chunk.append(s_read_step, '\0');
    size_t nread = source.read_some(chunk.mut_data(), s_read_step);
    chunk.erase(nread);
    return nread != 0;
  }

}  // namespace

HTTP_Reader_Body::
HTTP_Reader_Body(const shptr<Abstract_Byte_Source>& source)
  :
    m_source(source)
  {
    if(!this->m_source)
      CARAVEL_THROW(("Null byte source pointer not valid"));
  }

HTTP_Reader_Body::
~HTTP_Reader_Body()
  {
  }

bool
HTTP_Reader_Body::
do_abstract_http_body_read(cow_string& chunk)
  {
    return do_read_step(*(this->m_source), chunk);
  }

HTTP_File_Body::
HTTP_File_Body(const cow_string& path)
  :
    m_path(path)
  {
    unique_posix_fd fd(::open(path.safe_c_str(), O_RDONLY | O_CLOEXEC));
    if(!fd)
      CARAVEL_THROW((
          "Could not open file '$1'",
          "[`open()` failed: ${errno:full}]"),
          path);

    struct ::stat st;
    if(::fstat(fd, &st) != 0)
      CARAVEL_THROW((
          "Could not get information about file '$1'",
          "[`fstat()` failed: ${errno:full}]"),
          path);

    // Only regular files have meaningful sizes.
    if(S_ISREG(st.st_mode))
      this->m_size = static_cast<uint64_t>(st.st_size);

    this->m_stream = new_uni<POSIX_FD_Stream>(move(fd));
  }

HTTP_File_Body::
~HTTP_File_Body()
  {
  }

bool
HTTP_File_Body::
do_abstract_http_body_read(cow_string& chunk)
  {
    return do_read_step(*(this->m_stream), chunk);
  }

opt<uint64_t>
HTTP_File_Body::
do_abstract_http_body_size_hint()
  const noexcept
  {
    return this->m_size;
  }

}  // namespace caravel
