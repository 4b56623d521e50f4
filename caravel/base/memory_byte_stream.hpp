// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#ifndef CARAVEL_BASE_MEMORY_BYTE_STREAM_
#define CARAVEL_BASE_MEMORY_BYTE_STREAM_

#include "../fwd.hpp"
#include "abstract_byte_source.hpp"
#include "abstract_byte_sink.hpp"
namespace caravel {

class Memory_Byte_Source
  : public Abstract_Byte_Source
  {
  private:
    cow_string m_data;
    size_t m_offset = 0;
    size_t m_max_step;

  protected:
    virtual
    size_t
    do_abstract_byte_source_read(char* data, size_t size)
      override;

  public:
    // Creates a source that yields `data`. Each read returns at most
    // `max_step` bytes, which allows simulation of fragmented input.
    explicit
    Memory_Byte_Source(const cow_string& data, size_t max_step = SIZE_MAX);

  public:
    Memory_Byte_Source(const Memory_Byte_Source&) = delete;
    Memory_Byte_Source& operator=(const Memory_Byte_Source&) & = delete;
    virtual ~Memory_Byte_Source();

    // Gets the number of bytes that have not been read.
    size_t
    remaining()
      const noexcept
      { return this->m_data.size() - this->m_offset;  }
  };

class Memory_Byte_Sink
  : public Abstract_Byte_Sink
  {
  private:
    cow_string m_data;

  protected:
    virtual
    void
    do_abstract_byte_sink_write(const char* data, size_t size)
      override;

  public:
    Memory_Byte_Sink() noexcept;

  public:
    Memory_Byte_Sink(const Memory_Byte_Sink&) = delete;
    Memory_Byte_Sink& operator=(const Memory_Byte_Sink&) & = delete;
    virtual ~Memory_Byte_Sink();

    // Gets all bytes that have been written so far.
    const cow_string&
    data()
      const noexcept
      { return this->m_data;  }

    void
    clear()
      noexcept
      { this->m_data.clear();  }
  };

}  // namespace caravel
#endif
