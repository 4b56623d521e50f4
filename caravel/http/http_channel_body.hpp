// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#ifndef CARAVEL_HTTP_HTTP_CHANNEL_BODY_
#define CARAVEL_HTTP_HTTP_CHANNEL_BODY_

#include "../fwd.hpp"
#include "abstract_http_body.hpp"
namespace caravel {

// This body is fed by other threads through `HTTP_Chunk_Sender` objects.
// `read_next()` blocks until a chunk is available, or until all senders have
// been closed or destroyed. The size is unknown, so the body is always sent
// in chunked transfer encoding.
class HTTP_Channel_Body
  : public Abstract_HTTP_Body
  {
    friend class HTTP_Chunk_Sender;

  private:
    struct X_Queue;
    shptr<X_Queue> m_queue;

  protected:
    virtual
    bool
    do_abstract_http_body_read(cow_string& chunk)
      override;

  public:
    HTTP_Channel_Body();

  public:
    HTTP_Channel_Body(const HTTP_Channel_Body&) = delete;
    HTTP_Channel_Body& operator=(const HTTP_Channel_Body&) & = delete;
    virtual ~HTTP_Channel_Body();

    // Creates a new sender for this body.
    HTTP_Chunk_Sender
    make_sender()
      const;
  };

class HTTP_Chunk_Sender
  {
    friend class HTTP_Channel_Body;

  private:
    shptr<HTTP_Channel_Body::X_Queue> m_queue;

  private:
    explicit
    HTTP_Chunk_Sender(const shptr<HTTP_Channel_Body::X_Queue>& queue) noexcept;

  public:
    HTTP_Chunk_Sender(const HTTP_Chunk_Sender& other) noexcept;
    HTTP_Chunk_Sender& operator=(const HTTP_Chunk_Sender& other) & = delete;
    ~HTTP_Chunk_Sender();

    // Enqueues a chunk. Empty chunks are ignored. If the body has been closed,
    // or the body has been destroyed, `false` is returned.
    bool
    send(const cow_string& data);

    // Marks the end of the body. The body ends when all its senders have
    // been closed or destroyed.
    void
    close()
      noexcept;
  };

}  // namespace caravel
#endif
