// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "http_channel_body.hpp"
#include "../utils.hpp"
#include <deque>
namespace caravel {

struct HTTP_Channel_Body::X_Queue
  {
    plain_mutex mutex;
    condition_variable avail;
    ::std::deque<cow_string> chunks;
    size_t open_senders = 0;
    bool receiver_gone = false;
  };

HTTP_Channel_Body::
HTTP_Channel_Body()
  {
    this->m_queue = new_sh<X_Queue>();
  }

HTTP_Channel_Body::
~HTTP_Channel_Body()
  {
    plain_mutex::unique_lock lock(this->m_queue->mutex);
    this->m_queue->receiver_gone = true;
    this->m_queue->chunks.clear();
  }

bool
HTTP_Channel_Body::
do_abstract_http_body_read(cow_string& chunk)
  {
    plain_mutex::unique_lock lock(this->m_queue->mutex);
    while(this->m_queue->chunks.empty()) {
      if(this->m_queue->open_senders == 0)
        return false;

      this->m_queue->avail.wait(lock);
    }

    chunk.swap(this->m_queue->chunks.front());
    this->m_queue->chunks.pop_front();
    return true;
  }

HTTP_Chunk_Sender
HTTP_Channel_Body::
make_sender()
  const
  {
    plain_mutex::unique_lock lock(this->m_queue->mutex);
    this->m_queue->open_senders ++;
    return HTTP_Chunk_Sender(this->m_queue);
  }

HTTP_Chunk_Sender::
HTTP_Chunk_Sender(const shptr<HTTP_Channel_Body::X_Queue>& queue) noexcept
  :
    m_queue(queue)
  {
  }

HTTP_Chunk_Sender::
HTTP_Chunk_Sender(const HTTP_Chunk_Sender& other) noexcept
  {
    if(!other.m_queue)
      return;

    // Copying a closed sender yields a closed sender.
    plain_mutex::unique_lock lock(other.m_queue->mutex);
    this->m_queue = other.m_queue;
    this->m_queue->open_senders ++;
  }

HTTP_Chunk_Sender::
~HTTP_Chunk_Sender()
  {
    this->close();
  }

bool
HTTP_Chunk_Sender::
send(const cow_string& data)
  {
    if(!this->m_queue)
      return false;

    plain_mutex::unique_lock lock(this->m_queue->mutex);
    if(this->m_queue->receiver_gone)
      return false;

    if(data.empty())
      return true;

    this->m_queue->chunks.push_back(data);
    this->m_queue->avail.notify_one();
    return true;
  }

void
HTTP_Chunk_Sender::
close()
  noexcept
  {
    if(!this->m_queue)
      return;

    plain_mutex::unique_lock lock(this->m_queue->mutex);
    ROCKET_ASSERT(this->m_queue->open_senders != 0);
    this->m_queue->open_senders --;
    this->m_queue->avail.notify_all();
    lock.unlock();

    this->m_queue.reset();
  }

}  // namespace caravel
