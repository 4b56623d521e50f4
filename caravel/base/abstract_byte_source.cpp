// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "abstract_byte_source.hpp"
#include "../utils.hpp"
namespace caravel {

Abstract_Byte_Source::
~Abstract_Byte_Source()
  {
  }

size_t
Abstract_Byte_Source::
read_some(char* data, size_t size)
  {
    if(size == 0)
      return 0;

    size_t nread = this->do_abstract_byte_source_read(data, size);
    CARAVEL_CHECK(nread <= size);
    return nread;
  }

}  // namespace caravel
