// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "http_chunked_encoder.hpp"
#include "../base/abstract_byte_sink.hpp"
#include "../utils.hpp"
namespace caravel {

HTTP_Chunked_Encoder::
HTTP_Chunked_Encoder(Abstract_Byte_Sink& sink) noexcept
  :
    m_sink(&sink)
  {
  }

HTTP_Chunked_Encoder::
~HTTP_Chunked_Encoder()
  {
  }

bool
HTTP_Chunked_Encoder::
write(chars_view data)
  {
    if(this->m_closed)
      CARAVEL_THROW(("Chunked encoder already closed"));

    if(data.n == 0)
      return false;

    // Compose the length line in lowercase hexadecimal, right to left.
    char line[24];
    char* wptr = line + sizeof(line);
    *--wptr = '\n';
    *--wptr = '\r';

    uint64_t value = data.n;
    do {
      *--wptr = "0123456789abcdef"[value & 15];
      value >>= 4;
    }
    while(value != 0);

    this->m_sink->write_all(wptr, static_cast<size_t>(line + sizeof(line) - wptr));
    this->m_sink->write_all(data);
    this->m_sink->write_all("\r\n", 2);
    this->m_total += data.n;
    return true;
  }

void
HTTP_Chunked_Encoder::
close()
  {
    if(this->m_closed)
      return;

    this->m_closed = true;
    this->m_sink->write_all("0\r\n\r\n", 5);
    this->m_sink->flush();
  }

}  // namespace caravel
