// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "abstract_http_body.hpp"
#include "../utils.hpp"
namespace caravel {

Abstract_HTTP_Body::
~Abstract_HTTP_Body()
  {
  }

opt<uint64_t>
Abstract_HTTP_Body::
do_abstract_http_body_size_hint()
  const noexcept
  {
    return nullopt;
  }

bool
Abstract_HTTP_Body::
read_next(cow_string& chunk)
  {
    chunk.clear();

    while(!this->m_done) {
      if(!this->do_abstract_http_body_read(chunk)) {
        this->m_done = true;
        chunk.clear();
        return false;
      }

      // Empty chunks carry no data, so skip them.
      if(!chunk.empty())
        return true;
    }

    return false;
  }

cow_string
Abstract_HTTP_Body::
read_all_bytes()
  {
    cow_string data, chunk;

    // Don't trust huge hints.
    auto hint = this->size_hint();
    if(hint)
      data.reserve(static_cast<size_t>(min(*hint, static_cast<uint64_t>(0x1000000))));

    while(this->read_next(chunk))
      data.append(chunk);

    return data;
  }

}  // namespace caravel
