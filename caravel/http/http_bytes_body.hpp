// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#ifndef CARAVEL_HTTP_HTTP_BYTES_BODY_
#define CARAVEL_HTTP_HTTP_BYTES_BODY_

#include "../fwd.hpp"
#include "abstract_http_body.hpp"
namespace caravel {

class HTTP_Empty_Body
  : public Abstract_HTTP_Body
  {
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
    HTTP_Empty_Body() noexcept;

  public:
    HTTP_Empty_Body(const HTTP_Empty_Body&) = delete;
    HTTP_Empty_Body& operator=(const HTTP_Empty_Body&) & = delete;
    virtual ~HTTP_Empty_Body();
  };

// This body yields a string as a single chunk.
class HTTP_Bytes_Body
  : public Abstract_HTTP_Body
  {
  private:
    cow_string m_data;
    bool m_sent = false;

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
    explicit
    HTTP_Bytes_Body(const cow_string& data) noexcept;

  public:
    HTTP_Bytes_Body(const HTTP_Bytes_Body&) = delete;
    HTTP_Bytes_Body& operator=(const HTTP_Bytes_Body&) & = delete;
    virtual ~HTTP_Bytes_Body();

    const cow_string&
    data()
      const noexcept
      { return this->m_data;  }
  };

}  // namespace caravel
#endif
