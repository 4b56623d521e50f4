// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#ifndef CARAVEL_HTTP_HTTP_FIELD_NAME_
#define CARAVEL_HTTP_HTTP_FIELD_NAME_

#include "../fwd.hpp"
namespace caravel {

// A field name is an HTTP token. Names are compared and hashed in a
// case-insensitive way, but the original spelling is preserved.
class HTTP_Field_Name
  {
  public:
    struct hash;

  private:
    cow_string m_str;

  private:
    void
    do_validate();

  public:
    // Creates a name from a string. If the string is not a valid HTTP token,
    // an `HTTP_Error` with `http_error_invalid_header_name` is thrown.
    template<typename xstringT,
    ROCKET_ENABLE_IF(::std::is_constructible<cow_string, xstringT&&>::value)>
    HTTP_Field_Name(xstringT&& xstr)
      :
        m_str(forward<xstringT>(xstr))
      { this->do_validate();  }

    HTTP_Field_Name&
    swap(HTTP_Field_Name& other)
      noexcept
      {
        this->m_str.swap(other.m_str);
        return *this;
      }

  public:
    HTTP_Field_Name(const HTTP_Field_Name&) = default;
    HTTP_Field_Name(HTTP_Field_Name&&) = default;
    HTTP_Field_Name& operator=(const HTTP_Field_Name&) & = default;
    HTTP_Field_Name& operator=(HTTP_Field_Name&&) & = default;
    ~HTTP_Field_Name();

    // accessors
    const cow_string&
    str()
      const noexcept
      { return this->m_str;  }

    const char*
    c_str()
      const noexcept
      { return this->m_str.c_str();  }

    const char*
    data()
      const noexcept
      { return this->m_str.data();  }

    size_t
    size()
      const noexcept
      { return this->m_str.size();  }

    // Compare names in a case-insensitive way. These functions do not
    // allocate memory.
    ROCKET_PURE
    bool
    equals(chars_view cmps)
      const noexcept;

    ROCKET_PURE
    int
    compare(chars_view cmps)
      const noexcept;

    // Gets the case-insensitive hash value of this name.
    ROCKET_PURE
    size_t
    rdhash()
      const noexcept;
  };

struct HTTP_Field_Name::hash
  {
    size_t
    operator()(const HTTP_Field_Name& name)
      const noexcept
      { return name.rdhash();  }
  };

// Checks whether `text` is a valid HTTP token.
ROCKET_PURE
bool
is_http_token(chars_view text)
  noexcept;

inline
void
swap(HTTP_Field_Name& lhs, HTTP_Field_Name& rhs)
  noexcept
  { lhs.swap(rhs);  }

inline
bool
operator==(const HTTP_Field_Name& lhs, const HTTP_Field_Name& rhs)
  noexcept
  { return lhs.equals(rhs.str());  }

inline
bool
operator==(const HTTP_Field_Name& lhs, const cow_string& rhs)
  noexcept
  { return lhs.equals(rhs);  }

inline
bool
operator==(const HTTP_Field_Name& lhs, const char* rhs)
  noexcept
  { return lhs.equals(rhs);  }

inline
bool
operator==(const cow_string& lhs, const HTTP_Field_Name& rhs)
  noexcept
  { return rhs.equals(lhs);  }

inline
bool
operator==(const char* lhs, const HTTP_Field_Name& rhs)
  noexcept
  { return rhs.equals(lhs);  }

inline
bool
operator!=(const HTTP_Field_Name& lhs, const HTTP_Field_Name& rhs)
  noexcept
  { return !lhs.equals(rhs.str());  }

inline
bool
operator!=(const HTTP_Field_Name& lhs, const cow_string& rhs)
  noexcept
  { return !lhs.equals(rhs);  }

inline
bool
operator!=(const HTTP_Field_Name& lhs, const char* rhs)
  noexcept
  { return !lhs.equals(rhs);  }

inline
bool
operator!=(const cow_string& lhs, const HTTP_Field_Name& rhs)
  noexcept
  { return !rhs.equals(lhs);  }

inline
bool
operator!=(const char* lhs, const HTTP_Field_Name& rhs)
  noexcept
  { return !rhs.equals(lhs);  }

inline
bool
operator<(const HTTP_Field_Name& lhs, const HTTP_Field_Name& rhs)
  noexcept
  { return lhs.compare(rhs.str()) < 0;  }

inline
tinyfmt&
operator<<(tinyfmt& fmt, const HTTP_Field_Name& name)
  { return fmt << name.str();  }

}  // namespace caravel
#endif
