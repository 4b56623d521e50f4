// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "http_header_value.hpp"
#include "http_error.hpp"
#include "../utils.hpp"
namespace caravel {

bool
is_http_header_value(chars_view text)
  noexcept
  {
    for(size_t k = 0;  k != text.n;  ++k) {
      uint32_t uch = static_cast<uint8_t>(text.p[k]);
      if((uch < 0x20) && (uch != '\t'))
        return false;

      if(uch >= 0x7F)
        return false;
    }

    return true;
  }

void
HTTP_Header_Value::
do_validate()
  {
    if(!is_http_header_value(this->m_str))
      CARAVEL_HTTP_THROW(http_error_invalid_header_value, (
          "Invalid HTTP header value `$1`"),
          this->m_str);
  }

HTTP_Header_Value::
~HTTP_Header_Value()
  {
  }

opt<uint64_t>
HTTP_Header_Value::
as_uint64()
  const noexcept
  {
    if(this->m_str.empty() || (this->m_str.size() > 19))
      return nullopt;

    uint64_t value = 0;
    for(char c : this->m_str) {
      if((c < '0') || (c > '9'))
        return nullopt;

      value = value * 10 + static_cast<uint64_t>(c - '0');
    }

    return value;
  }

}  // namespace caravel
