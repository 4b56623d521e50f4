// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "http_bytes_body.hpp"
#include "../utils.hpp"
namespace caravel {

HTTP_Empty_Body::
HTTP_Empty_Body() noexcept
  {
  }

HTTP_Empty_Body::
~HTTP_Empty_Body()
  {
  }

bool
HTTP_Empty_Body::
do_abstract_http_body_read(cow_string& /*chunk*/)
  {
    return false;
  }

opt<uint64_t>
HTTP_Empty_Body::
do_abstract_http_body_size_hint()
  const noexcept
  {
    return 0U;
  }

HTTP_Bytes_Body::
HTTP_Bytes_Body(const cow_string& data) noexcept
  :
    m_data(data)
  {
  }

HTTP_Bytes_Body::
~HTTP_Bytes_Body()
  {
  }

bool
HTTP_Bytes_Body::
do_abstract_http_body_read(cow_string& chunk)
  {
    if(this->m_sent)
      return false;

    chunk = this->m_data;
    this->m_sent = true;
    return true;
  }

opt<uint64_t>
HTTP_Bytes_Body::
do_abstract_http_body_size_hint()
  const noexcept
  {
    return this->m_data.size();
  }

}  // namespace caravel
