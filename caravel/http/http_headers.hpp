// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#ifndef CARAVEL_HTTP_HTTP_HEADERS_
#define CARAVEL_HTTP_HTTP_HEADERS_

#include "../fwd.hpp"
#include "http_field_name.hpp"
#include "http_header_value.hpp"
namespace caravel {

// This is an entry in `HTTP_Headers`. The first value is stored inline, and
// additional values are stored in a vector which is allocated only when a
// second value is appended.
class HTTP_Header_Entry
  {
  private:
    HTTP_Field_Name m_name;
    HTTP_Header_Value m_first;
    cow_vector<HTTP_Header_Value> m_rest;

  public:
    HTTP_Header_Entry(const HTTP_Field_Name& name, const HTTP_Header_Value& first)
      :
        m_name(name), m_first(first)
      { }

  public:
    HTTP_Header_Entry(const HTTP_Header_Entry&) = default;
    HTTP_Header_Entry(HTTP_Header_Entry&&) = default;
    HTTP_Header_Entry& operator=(const HTTP_Header_Entry&) & = default;
    HTTP_Header_Entry& operator=(HTTP_Header_Entry&&) & = default;
    ~HTTP_Header_Entry();

    const HTTP_Field_Name&
    name()
      const noexcept
      { return this->m_name;  }

    const HTTP_Header_Value&
    first()
      const noexcept
      { return this->m_first;  }

    HTTP_Header_Value&
    mut_first()
      noexcept
      { return this->m_first;  }

    // Gets the number of values, which is always positive.
    size_t
    count()
      const noexcept
      { return 1 + this->m_rest.size();  }

    const HTTP_Header_Value&
    at(size_t index)
      const
      {
        if(index == 0)
          return this->m_first;
        return this->m_rest.at(index - 1);
      }

    void
    append(const HTTP_Header_Value& value)
      { this->m_rest.emplace_back(value);  }
  };

// This is a range of values of a header entry.
class HTTP_Header_Values
  {
  public:
    class const_iterator;

  private:
    const HTTP_Header_Entry* m_entry;

  public:
    explicit
    HTTP_Header_Values(const HTTP_Header_Entry* entry) noexcept
      :
        m_entry(entry)
      { }

    bool
    empty()
      const noexcept
      { return this->m_entry == nullptr;  }

    size_t
    size()
      const noexcept
      { return this->m_entry ? this->m_entry->count() : 0;  }

    const_iterator
    begin()
      const noexcept;

    const_iterator
    end()
      const noexcept;
  };

class HTTP_Header_Values::const_iterator
  {
  private:
    const HTTP_Header_Entry* m_entry;
    size_t m_index;

  public:
    const_iterator(const HTTP_Header_Entry* entry, size_t index) noexcept
      :
        m_entry(entry), m_index(index)
      { }

    const HTTP_Header_Value&
    operator*()
      const
      { return this->m_entry->at(this->m_index);  }

    const HTTP_Header_Value*
    operator->()
      const
      { return &(this->m_entry->at(this->m_index));  }

    const_iterator&
    operator++()
      noexcept
      {
        this->m_index ++;
        return *this;
      }

    bool
    operator==(const const_iterator& other)
      const noexcept
      { return this->m_index == other.m_index;  }

    bool
    operator!=(const const_iterator& other)
      const noexcept
      { return this->m_index != other.m_index;  }
  };

inline
HTTP_Header_Values::const_iterator
HTTP_Header_Values::
begin()
  const noexcept
  {
    return const_iterator(this->m_entry, 0);
  }

inline
HTTP_Header_Values::const_iterator
HTTP_Header_Values::
end()
  const noexcept
  {
    return const_iterator(this->m_entry, this->size());
  }

// This is an ordered multimap of HTTP headers. Each entry has a name and one
// or more values. Lookups are case-insensitive linear scans.
class HTTP_Headers
  {
  private:
    cow_vector<HTTP_Header_Entry> m_entries;

  private:
    size_t
    do_find(chars_view name)
      const noexcept;

  public:
    HTTP_Headers() noexcept;

    HTTP_Headers&
    swap(HTTP_Headers& other)
      noexcept
      {
        this->m_entries.swap(other.m_entries);
        return *this;
      }

  public:
    HTTP_Headers(const HTTP_Headers&) = default;
    HTTP_Headers(HTTP_Headers&&) = default;
    HTTP_Headers& operator=(const HTTP_Headers&) & = default;
    HTTP_Headers& operator=(HTTP_Headers&&) & = default;
    ~HTTP_Headers();

    // Gets the number of entries. An entry with multiple values is counted
    // only once.
    size_t
    size()
      const noexcept
      { return this->m_entries.size();  }

    bool
    empty()
      const noexcept
      { return this->m_entries.empty();  }

    void
    clear()
      noexcept
      { this->m_entries.clear();  }

    cow_vector<HTTP_Header_Entry>::const_iterator
    begin()
      const noexcept
      { return this->m_entries.begin();  }

    cow_vector<HTTP_Header_Entry>::const_iterator
    end()
      const noexcept
      { return this->m_entries.end();  }

    bool
    contains(chars_view name)
      const noexcept
      { return this->do_find(name) != SIZE_MAX;  }

    // Gets the first value of an entry. If no such entry exists, a null
    // pointer is returned.
    const HTTP_Header_Value*
    get(chars_view name)
      const noexcept;

    HTTP_Header_Value*
    get_mut(chars_view name);

    // Gets all values of an entry, in insertion order. If no such entry
    // exists, an empty range is returned.
    HTTP_Header_Values
    get_all(chars_view name)
      const noexcept;

    // Replaces all values of an entry with `value`, or creates a new entry.
    // The old first value is returned.
    opt<HTTP_Header_Value>
    insert(const HTTP_Field_Name& name, const HTTP_Header_Value& value);

    // Appends a value to an entry, or creates a new entry. The return value
    // indicates whether the entry existed.
    bool
    append(const HTTP_Field_Name& name, const HTTP_Header_Value& value);

    // Removes an entry with all its values. The old first value is returned.
    opt<HTTP_Header_Value>
    remove(chars_view name);

    // Encodes headers in wire format. Each entry is written as a line, and
    // multiple values are joined by commas, except for `Set-Cookie`, which
    // is written as a separate line for each value. Each line is terminated
    // by a CR LF pair. The empty line after headers is not written.
    void
    encode(tinyfmt& fmt)
      const;
  };

inline
void
swap(HTTP_Headers& lhs, HTTP_Headers& rhs)
  noexcept
  { lhs.swap(rhs);  }

inline
tinyfmt&
operator<<(tinyfmt& fmt, const HTTP_Headers& headers)
  {
    headers.encode(fmt);
    return fmt;
  }

}  // namespace caravel
#endif
