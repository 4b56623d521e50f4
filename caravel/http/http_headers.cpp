// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "http_headers.hpp"
#include "../utils.hpp"
namespace caravel {

HTTP_Header_Entry::
~HTTP_Header_Entry()
  {
  }

HTTP_Headers::
HTTP_Headers() noexcept
  {
  }

HTTP_Headers::
~HTTP_Headers()
  {
  }

size_t
HTTP_Headers::
do_find(chars_view name)
  const noexcept
  {
    for(size_t k = 0;  k != this->m_entries.size();  ++k)
      if(this->m_entries[k].name().equals(name))
        return k;

    return SIZE_MAX;
  }

const HTTP_Header_Value*
HTTP_Headers::
get(chars_view name)
  const noexcept
  {
    size_t k = this->do_find(name);
    if(k == SIZE_MAX)
      return nullptr;

    return &(this->m_entries[k].first());
  }

HTTP_Header_Value*
HTTP_Headers::
get_mut(chars_view name)
  {
    size_t k = this->do_find(name);
    if(k == SIZE_MAX)
      return nullptr;

    return &(this->m_entries.mut(k).mut_first());
  }

HTTP_Header_Values
HTTP_Headers::
get_all(chars_view name)
  const noexcept
  {
    size_t k = this->do_find(name);
    if(k == SIZE_MAX)
      return HTTP_Header_Values(nullptr);

    return HTTP_Header_Values(&(this->m_entries[k]));
  }

opt<HTTP_Header_Value>
HTTP_Headers::
insert(const HTTP_Field_Name& name, const HTTP_Header_Value& value)
  {
    opt<HTTP_Header_Value> old;
    size_t k = this->do_find(name.str());
    if(k == SIZE_MAX) {
      this->m_entries.emplace_back(name, value);
      return old;
    }

    // Replace all values. The original spelling of the name is preserved.
    old.emplace(this->m_entries[k].first());
    HTTP_Header_Entry entry(this->m_entries[k].name(), value);
    this->m_entries.mut(k) = move(entry);
    return old;
  }

bool
HTTP_Headers::
append(const HTTP_Field_Name& name, const HTTP_Header_Value& value)
  {
    size_t k = this->do_find(name.str());
    if(k == SIZE_MAX) {
      this->m_entries.emplace_back(name, value);
      return false;
    }

    this->m_entries.mut(k).append(value);
    return true;
  }

opt<HTTP_Header_Value>
HTTP_Headers::
remove(chars_view name)
  {
    opt<HTTP_Header_Value> old;
    size_t k = this->do_find(name);
    if(k == SIZE_MAX)
      return old;

    old.emplace(this->m_entries[k].first());
    this->m_entries.erase(this->m_entries.begin() + static_cast<ptrdiff_t>(k));
    return old;
  }

void
HTTP_Headers::
encode(tinyfmt& fmt)
  const
  {
    for(const auto& entry : this->m_entries)
      if(entry.name() == "Set-Cookie") {
        // Cookies may contain commas, so they can't be joined.
        for(const auto& value : HTTP_Header_Values(&entry))
          fmt << entry.name() << ": " << value << "\r\n";
      }
      else {
        fmt << entry.name() << ": " << entry.first();
        for(size_t k = 1;  k < entry.count();  ++k)
          fmt << ", " << entry.at(k);
        fmt << "\r\n";
      }
  }

}  // namespace caravel
