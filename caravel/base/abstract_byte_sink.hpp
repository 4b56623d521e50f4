// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#ifndef CARAVEL_BASE_ABSTRACT_BYTE_SINK_
#define CARAVEL_BASE_ABSTRACT_BYTE_SINK_

#include "../fwd.hpp"
namespace caravel {

class Abstract_Byte_Sink
  {
  protected:
    Abstract_Byte_Sink() noexcept = default;

  protected:
    // This callback is invoked by `write_all()` and is intended to be
    // overriden by derived classes. It shall block until all bytes have been
    // written. I/O errors shall be reported by throwing exceptions.
    virtual
    void
    do_abstract_byte_sink_write(const char* data, size_t size)
      = 0;

    // This callback is invoked by `flush()`. The default implementation does
    // nothing.
    virtual
    void
    do_abstract_byte_sink_flush();

  public:
    Abstract_Byte_Sink(const Abstract_Byte_Sink&) = delete;
    Abstract_Byte_Sink& operator=(const Abstract_Byte_Sink&) & = delete;
    virtual ~Abstract_Byte_Sink();

    // Writes all bytes.
    void
    write_all(const char* data, size_t size);

    void
    write_all(chars_view data)
      { this->write_all(data.p, data.n);  }

    // Flushes buffered data, if any.
    void
    flush();
  };

}  // namespace caravel
#endif
