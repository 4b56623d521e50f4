// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#ifndef CARAVEL_HTTP_HTTP_READER_BODY_
#define CARAVEL_HTTP_HTTP_READER_BODY_

#include "../fwd.hpp"
#include "abstract_http_body.hpp"
#include "../base/posix_fd_stream.hpp"
namespace caravel {

// This body reads a byte source in chunks of 4 KiB, until end of stream. The
// size is unknown.
class HTTP_Reader_Body
  : public Abstract_HTTP_Body
  {
  private:
    shptr<Abstract_Byte_Source> m_source;

  protected:
    virtual
    bool
    do_abstract_http_body_read(cow_string& chunk)
      override;

  public:
    explicit
    HTTP_Reader_Body(const shptr<Abstract_Byte_Source>& source);

  public:
    HTTP_Reader_Body(const HTTP_Reader_Body&) = delete;
    HTTP_Reader_Body& operator=(const HTTP_Reader_Body&) & = delete;
    virtual ~HTTP_Reader_Body();
  };

// This body reads a file in chunks of 4 KiB. The size is obtained with
// `fstat()` when the file is opened.
class HTTP_File_Body
  : public Abstract_HTTP_Body
  {
  private:
    cow_string m_path;
    uniptr<POSIX_FD_Stream> m_stream;
    opt<uint64_t> m_size;

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
    // Opens a file for reading. If the file cannot be opened, an exception
    // is thrown.
    explicit
    HTTP_File_Body(const cow_string& path);

  public:
    HTTP_File_Body(const HTTP_File_Body&) = delete;
    HTTP_File_Body& operator=(const HTTP_File_Body&) & = delete;
    virtual ~HTTP_File_Body();

    const cow_string&
    path()
      const noexcept
      { return this->m_path;  }
  };

}  // namespace caravel
#endif
