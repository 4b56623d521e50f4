// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "memory_byte_stream.hpp"
#include "../utils.hpp"
namespace caravel {

Memory_Byte_Source::
Memory_Byte_Source(const cow_string& data, size_t max_step)
  {
    CARAVEL_CHECK(max_step != 0);
    this->m_data = data;
    this->m_max_step = max_step;
  }

Memory_Byte_Source::
~Memory_Byte_Source()
  {
  }

size_t
Memory_Byte_Source::
do_abstract_byte_source_read(char* data, size_t size)
  {
    size_t nread = min(size, this->m_max_step, this->m_data.size() - this->m_offset);
    ::memcpy(data, this->m_data.data() + this->m_offset, nread);
    this->m_offset += nread;
    return nread;
  }

Memory_Byte_Sink::
Memory_Byte_Sink() noexcept
  {
  }

Memory_Byte_Sink::
~Memory_Byte_Sink()
  {
  }

void
Memory_Byte_Sink::
do_abstract_byte_sink_write(const char* data, size_t size)
  {
    this->m_data.append(data, size);
  }

}  // namespace caravel
