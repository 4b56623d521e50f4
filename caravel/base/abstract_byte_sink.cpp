// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "abstract_byte_sink.hpp"
#include "../utils.hpp"
namespace caravel {

Abstract_Byte_Sink::
~Abstract_Byte_Sink()
  {
  }

void
Abstract_Byte_Sink::
do_abstract_byte_sink_flush()
  {
  }

void
Abstract_Byte_Sink::
write_all(const char* data, size_t size)
  {
    if(size == 0)
      return;

    this->do_abstract_byte_sink_write(data, size);
  }

void
Abstract_Byte_Sink::
flush()
  {
    this->do_abstract_byte_sink_flush();
  }

}  // namespace caravel
