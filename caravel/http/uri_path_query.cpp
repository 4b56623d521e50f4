// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "uri_path_query.hpp"
#include "http_error.hpp"
#include "../utils.hpp"
namespace caravel {

URI_Query_Value::
~URI_Query_Value()
  {
  }

URI_Query_Map::
~URI_Query_Map()
  {
  }

const URI_Query_Value*
URI_Query_Map::
find(chars_view key)
  const noexcept
  {
    for(const auto& r : this->m_entries)
      if(r.first == key)
        return &(r.second);

    return nullptr;
  }

opt<cow_string>
URI_Query_Map::
get(chars_view key)
  const
  {
    auto qval = this->find(key);
    if(!qval)
      return nullopt;

    return qval->first();
  }

cow_vector<cow_string>
URI_Query_Map::
get_all(chars_view key)
  const
  {
    auto qval = this->find(key);
    if(!qval)
      return { };

    return qval->values();
  }

void
URI_Query_Map::
add(const cow_string& key, const cow_string& value)
  {
    for(size_t k = 0;  k != this->m_entries.size();  ++k)
      if(this->m_entries[k].first == key) {
        // Upgrade the existent value to a list.
        this->m_entries.mut(k).second.append(value);
        return;
      }

    this->m_entries.emplace_back(key, URI_Query_Value(value));
  }

URI_Path_Query::
URI_Path_Query()
  :
    m_path(&"/")
  {
  }

URI_Path_Query::
URI_Path_Query(const cow_string& path, const opt<cow_string>& query,
               const opt<cow_string>& fragment)
  :
    m_path(path), m_query(query), m_fragment(fragment)
  {
    ROCKET_ASSERT_MSG(this->m_path[0] == '/', "Path shall start with a slash");
  }

URI_Path_Query::
URI_Path_Query(chars_view text)
  :
    m_path(&"/")
  {
    if(text.n == 0)
      return;

    if(text.p[0] != '/')
      CARAVEL_URI_THROW(uri_error_invalid_path, (
          "Invalid path `$1`: path shall start with a slash"),
          text);

    // A fragment may contain question marks, so it must be removed before
    // looking for the query.
    chars_view rem = text;
    auto hash_pos = static_cast<const char*>(::memchr(rem.p, '#', rem.n));
    if(hash_pos) {
      size_t hash_off = static_cast<size_t>(hash_pos - rem.p);
      this->m_fragment.emplace(hash_pos + 1, rem.n - hash_off - 1);
      rem.n = hash_off;
    }

    auto qmark_pos = static_cast<const char*>(::memchr(rem.p, '?', rem.n));
    if(qmark_pos) {
      size_t qmark_off = static_cast<size_t>(qmark_pos - rem.p);
      this->m_query.emplace(qmark_pos + 1, rem.n - qmark_off - 1);
      rem.n = qmark_off;
    }

    this->m_path.assign(rem.p, rem.n);
  }

URI_Path_Query::
~URI_Path_Query()
  {
  }

cow_bivector<cow_string, cow_string>
URI_Path_Query::
query_values()
  const
  {
    cow_bivector<cow_string, cow_string> pairs;
    if(!this->m_query)
      return pairs;

    const char* bptr = this->m_query->data();
    const char* const eptr = bptr + this->m_query->size();
    for(;;) {
      auto amp_pos = static_cast<const char*>(::memchr(bptr, '&', static_cast<size_t>(eptr - bptr)));
      const char* pair_end = amp_pos ? amp_pos : eptr;

      // Pairs without an equals sign are ignored.
      auto eq_pos = static_cast<const char*>(::memchr(bptr, '=', static_cast<size_t>(pair_end - bptr)));
      if(eq_pos)
        pairs.emplace_back(cow_string(bptr, static_cast<size_t>(eq_pos - bptr)),
                           cow_string(eq_pos + 1, static_cast<size_t>(pair_end - eq_pos - 1)));

      if(!amp_pos)
        break;

      bptr = amp_pos + 1;
    }

    return pairs;
  }

URI_Query_Map
URI_Path_Query::
query_map()
  const
  {
    URI_Query_Map qmap;
    for(const auto& r : this->query_values())
      qmap.add(r.first, r.second);
    return qmap;
  }

cow_vector<cow_string>
URI_Path_Query::
segments()
  const
  {
    const char* bptr = this->m_path.data();
    const char* eptr = bptr + this->m_path.size();

    if((bptr != eptr) && (bptr[0] == '/'))
      bptr ++;

    if((bptr != eptr) && (eptr[-1] == '/'))
      eptr --;

    cow_vector<cow_string> segs;
    for(;;) {
      auto slash_pos = static_cast<const char*>(::memchr(bptr, '/', static_cast<size_t>(eptr - bptr)));
      if(!slash_pos) {
        segs.emplace_back(bptr, static_cast<size_t>(eptr - bptr));
        break;
      }

      segs.emplace_back(bptr, static_cast<size_t>(slash_pos - bptr));
      bptr = slash_pos + 1;
    }

    return segs;
  }

tinyfmt&
URI_Path_Query::
print(tinyfmt& fmt)
  const
  {
    fmt << this->m_path;

    if(this->m_query)
      fmt << '?' << *(this->m_query);

    if(this->m_fragment)
      fmt << '#' << *(this->m_fragment);

    return fmt;
  }

cow_string
URI_Path_Query::
print_to_string()
  const
  {
    tinyfmt_str fmt;
    this->print(fmt);
    return fmt.extract_string();
  }

}  // namespace caravel
