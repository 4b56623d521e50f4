// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#ifndef CARAVEL_BASE_ABSTRACT_BYTE_SOURCE_
#define CARAVEL_BASE_ABSTRACT_BYTE_SOURCE_

#include "../fwd.hpp"
namespace caravel {

class Abstract_Byte_Source
  {
  protected:
    Abstract_Byte_Source() noexcept = default;

  protected:
    // This callback is invoked by `read_some()` and is intended to be
    // overriden by derived classes. It shall block until at least one byte is
    // available, then store at most `size` bytes into `data`. A return value
    // of zero denotes end of stream. I/O errors shall be reported by throwing
    // exceptions.
    virtual
    size_t
    do_abstract_byte_source_read(char* data, size_t size)
      = 0;

  public:
    Abstract_Byte_Source(const Abstract_Byte_Source&) = delete;
    Abstract_Byte_Source& operator=(const Abstract_Byte_Source&) & = delete;
    virtual ~Abstract_Byte_Source();

    // Reads some bytes. If `size` is zero, no data are read and zero is
    // returned. Otherwise, zero is returned only at end of stream.
    size_t
    read_some(char* data, size_t size);
  };

}  // namespace caravel
#endif
