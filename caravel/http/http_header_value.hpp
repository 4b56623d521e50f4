// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#ifndef CARAVEL_HTTP_HTTP_HEADER_VALUE_
#define CARAVEL_HTTP_HTTP_HEADER_VALUE_

#include "../fwd.hpp"
namespace caravel {

// A header value consists of visible ASCII characters, spaces and horizontal
// tabs. Invalid bytes are never stripped; they cause exceptions.
class HTTP_Header_Value
  {
  private:
    cow_string m_str;

  private:
    void
    do_validate();

  public:
    // Creates a value from a string. If the string contains an invalid byte,
    // an `HTTP_Error` with `http_error_invalid_header_value` is thrown.
    template<typename xstringT,
    ROCKET_ENABLE_IF(::std::is_constructible<cow_string, xstringT&&>::value)>
    HTTP_Header_Value(xstringT&& xstr)
      :
        m_str(forward<xstringT>(xstr))
      { this->do_validate();  }

    HTTP_Header_Value&
    swap(HTTP_Header_Value& other)
      noexcept
      {
        this->m_str.swap(other.m_str);
        return *this;
      }

  public:
    HTTP_Header_Value(const HTTP_Header_Value&) = default;
    HTTP_Header_Value(HTTP_Header_Value&&) = default;
    HTTP_Header_Value& operator=(const HTTP_Header_Value&) & = default;
    HTTP_Header_Value& operator=(HTTP_Header_Value&&) & = default;
    ~HTTP_Header_Value();

    const cow_string&
    str()
      const noexcept
      { return this->m_str;  }

    const char*
    c_str()
      const noexcept
      { return this->m_str.c_str();  }

    size_t
    size()
      const noexcept
      { return this->m_str.size();  }

    bool
    empty()
      const noexcept
      { return this->m_str.empty();  }

    // Parses the value as a non-negative decimal integer. If the value is not
    // a valid number, `nullopt` is returned.
    opt<uint64_t>
    as_uint64()
      const noexcept;
  };

// Checks whether `text` is a valid header value.
ROCKET_PURE
bool
is_http_header_value(chars_view text)
  noexcept;

inline
void
swap(HTTP_Header_Value& lhs, HTTP_Header_Value& rhs)
  noexcept
  { lhs.swap(rhs);  }

inline
bool
operator==(const HTTP_Header_Value& lhs, const HTTP_Header_Value& rhs)
  noexcept
  { return lhs.str() == rhs.str();  }

inline
bool
operator==(const HTTP_Header_Value& lhs, const cow_string& rhs)
  noexcept
  { return lhs.str() == rhs;  }

inline
bool
operator==(const HTTP_Header_Value& lhs, const char* rhs)
  noexcept
  { return lhs.str() == rhs;  }

inline
bool
operator!=(const HTTP_Header_Value& lhs, const HTTP_Header_Value& rhs)
  noexcept
  { return lhs.str() != rhs.str();  }

inline
bool
operator!=(const HTTP_Header_Value& lhs, const cow_string& rhs)
  noexcept
  { return lhs.str() != rhs;  }

inline
bool
operator!=(const HTTP_Header_Value& lhs, const char* rhs)
  noexcept
  { return lhs.str() != rhs;  }

inline
tinyfmt&
operator<<(tinyfmt& fmt, const HTTP_Header_Value& value)
  { return fmt << value.str();  }

}  // namespace caravel
#endif
