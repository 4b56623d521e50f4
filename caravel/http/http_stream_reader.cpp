// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "http_stream_reader.hpp"
#include "http_error.hpp"
#include "../base/abstract_byte_source.hpp"
#include "../utils.hpp"
namespace caravel {

HTTP_Stream_Reader::
HTTP_Stream_Reader(Abstract_Byte_Source& source) noexcept
  :
    m_source(&source)
  {
  }

HTTP_Stream_Reader::
~HTTP_Stream_Reader()
  {
  }

bool
HTTP_Stream_Reader::
do_fill()
  {
    if(this->m_eof)
      return false;

    this->m_buf.reserve_after_end(4096);
    size_t avail = this->m_buf.capacity_after_end();
    size_t nread = this->m_source->read_some(this->m_buf.mut_end(), avail);
    if(nread == 0) {
      this->m_eof = true;
      return false;
    }

    this->m_buf.accept(nread);
    return true;
  }

void
HTTP_Stream_Reader::
do_consume(cow_string& out, size_t count)
  {
    ROCKET_ASSERT(count <= this->m_buf.size());

    if(count > this->m_bytes_limit - min(this->m_bytes_read, this->m_bytes_limit))
      CARAVEL_HTTP_THROW(http_error_limit_reached, (
          "Reader bytes limit reached (limit `$1`, consumed `$2`, requested `$3`)"),
          this->m_bytes_limit, this->m_bytes_read, count);

    out.append(this->m_buf.begin(), count);
    this->m_buf.discard(count);
    this->m_bytes_read += count;
  }

bool
HTTP_Stream_Reader::
at_eof()
  {
    while(this->m_buf.empty())
      if(!this->do_fill())
        return true;

    return false;
  }

chars_view
HTTP_Stream_Reader::
peek(size_t count)
  {
    while(this->m_buf.size() < count)
      if(!this->do_fill())
        break;

    return chars_view(this->m_buf.data(), min(this->m_buf.size(), count));
  }

cow_string
HTTP_Stream_Reader::
read_until(char delim)
  {
    return this->read_until_with_limit(delim, SIZE_MAX);
  }

cow_string
HTTP_Stream_Reader::
read_until_with_limit(char delim, size_t limit)
  {
    cow_string out;

    for(;;) {
      // Search for the delimiter in buffered data. Bytes before it are
      // consumed in each pass, so the limit is checked incrementally.
      auto pos = static_cast<const char*>(::memchr(this->m_buf.data(), delim, this->m_buf.size()));
      size_t count = pos ? static_cast<size_t>(pos - this->m_buf.data() + 1) : this->m_buf.size();

      if(count > limit - out.size())
        CARAVEL_HTTP_THROW(http_error_limit_reached, (
            "Delimiter not found within `$1` bytes"),
            limit);

      this->do_consume(out, count);

      if(pos)
        return out;

      if(!this->do_fill())
        return out;
    }
  }

pair<bool, cow_string>
HTTP_Stream_Reader::
read_until_sequence(chars_view seq)
  {
    pair<bool, cow_string> result;

    if(seq.n == 0) {
      result.first = true;
      return result;
    }

    for(;;) {
      const char* bptr = this->m_buf.data();
      size_t blen = this->m_buf.size();

      // Look for a full match in buffered data.
      auto pos = static_cast<const char*>(::memmem(bptr, blen, seq.p, seq.n));
      if(pos) {
        this->do_consume(result.second, static_cast<size_t>(pos - bptr) + seq.n);
        result.first = true;
        return result;
      }

      // Look for the longest suffix of buffered data that is also a proper
      // prefix of `seq`. It may be completed by the next fill, so it must be
      // kept. Everything before it can be consumed safely.
      size_t keep = min(blen, seq.n - 1);
      while((keep != 0) && (::memcmp(bptr + blen - keep, seq.p, keep) != 0))
        keep --;

      this->do_consume(result.second, blen - keep);

      if(!this->do_fill()) {
        // The sequence will never be found.
        this->do_consume(result.second, this->m_buf.size());
        result.first = false;
        return result;
      }
    }
  }

cow_string
HTTP_Stream_Reader::
read_exact(size_t count)
  {
    cow_string out;

    while(out.size() < count) {
      if(this->m_buf.empty() && !this->do_fill())
        break;

      size_t step = min(this->m_buf.size(), count - out.size());
      this->do_consume(out, step);
    }

    return out;
  }

cow_string
HTTP_Stream_Reader::
read_to_end()
  {
    cow_string out;

    do
      this->do_consume(out, this->m_buf.size());
    while(this->do_fill());

    return out;
  }

uint64_t
HTTP_Stream_Reader::
discard(uint64_t count)
  {
    uint64_t ndiscarded = 0;
    cow_string temp;

    while(ndiscarded < count) {
      if(this->m_buf.empty() && !this->do_fill())
        break;

      size_t step = static_cast<size_t>(min(static_cast<uint64_t>(this->m_buf.size()), count - ndiscarded));
      temp.clear();
      this->do_consume(temp, step);
      ndiscarded += step;
    }

    return ndiscarded;
  }

}  // namespace caravel
