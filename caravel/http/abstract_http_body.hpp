// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#ifndef CARAVEL_HTTP_ABSTRACT_HTTP_BODY_
#define CARAVEL_HTTP_ABSTRACT_HTTP_BODY_

#include "../fwd.hpp"
namespace caravel {

// This is the interface of message bodies. Bodies are pulled chunk by chunk,
// so large payloads need not be buffered in memory.
class Abstract_HTTP_Body
  {
  private:
    bool m_done = false;

  protected:
    Abstract_HTTP_Body() noexcept = default;

  protected:
    // This callback is invoked by `read_next()` and is intended to be
    // overriden by derived classes. It shall store the next chunk into
    // `chunk`, which is initially empty, and return `true`; or return `false`
    // at end of body. I/O errors and malformed data shall be reported by
    // throwing exceptions.
    virtual
    bool
    do_abstract_http_body_read(cow_string& chunk)
      = 0;

    // This callback is invoked by `size_hint()`. The default implementation
    // returns `nullopt`, which denotes an unknown size.
    virtual
    opt<uint64_t>
    do_abstract_http_body_size_hint()
      const noexcept;

  public:
    Abstract_HTTP_Body(const Abstract_HTTP_Body&) = delete;
    Abstract_HTTP_Body& operator=(const Abstract_HTTP_Body&) & = delete;
    virtual ~Abstract_HTTP_Body();

    // Gets the next chunk, which is never empty. `false` is returned at end
    // of body, after which all further calls return `false`.
    bool
    read_next(cow_string& chunk);

    // Gets the total number of bytes of this body, if known in advance.
    opt<uint64_t>
    size_hint()
      const noexcept
      { return this->do_abstract_http_body_size_hint();  }

    // Checks whether end of body has been reached.
    bool
    done()
      const noexcept
      { return this->m_done;  }

    // Reads all remaining chunks and concatenates them.
    cow_string
    read_all_bytes();
  };

}  // namespace caravel
#endif
