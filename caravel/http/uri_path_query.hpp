// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#ifndef CARAVEL_HTTP_URI_PATH_QUERY_
#define CARAVEL_HTTP_URI_PATH_QUERY_

#include "../fwd.hpp"
namespace caravel {

// A query value is a list of one or more strings. A key that occurs once in
// a query string maps to a single value. Each subsequent occurrence appends
// a value to the list, in order of appearance.
class URI_Query_Value
  {
  private:
    cow_vector<cow_string> m_values;

  public:
    explicit
    URI_Query_Value(const cow_string& first)
      {
        this->m_values.emplace_back(first);
      }

  public:
    URI_Query_Value(const URI_Query_Value&) = default;
    URI_Query_Value(URI_Query_Value&&) = default;
    URI_Query_Value& operator=(const URI_Query_Value&) & = default;
    URI_Query_Value& operator=(URI_Query_Value&&) & = default;
    ~URI_Query_Value();

    // Checks whether this value has been upgraded to a list.
    bool
    is_list()
      const noexcept
      { return this->m_values.size() > 1;  }

    const cow_string&
    first()
      const noexcept
      { return this->m_values.front();  }

    const cow_vector<cow_string>&
    values()
      const noexcept
      { return this->m_values;  }

    void
    append(const cow_string& value)
      { this->m_values.emplace_back(value);  }
  };

// This is an ordered multimap of query parameters. Keys are compared in a
// case-sensitive way.
class URI_Query_Map
  {
  private:
    cow_bivector<cow_string, URI_Query_Value> m_entries;

  public:
    URI_Query_Map() noexcept = default;

  public:
    URI_Query_Map(const URI_Query_Map&) = default;
    URI_Query_Map(URI_Query_Map&&) = default;
    URI_Query_Map& operator=(const URI_Query_Map&) & = default;
    URI_Query_Map& operator=(URI_Query_Map&&) & = default;
    ~URI_Query_Map();

    bool
    empty()
      const noexcept
      { return this->m_entries.empty();  }

    size_t
    size()
      const noexcept
      { return this->m_entries.size();  }

    cow_bivector<cow_string, URI_Query_Value>::const_iterator
    begin()
      const noexcept
      { return this->m_entries.begin();  }

    cow_bivector<cow_string, URI_Query_Value>::const_iterator
    end()
      const noexcept
      { return this->m_entries.end();  }

    // Looks up a key. If the key does not exist, a null pointer is returned.
    const URI_Query_Value*
    find(chars_view key)
      const noexcept;

    bool
    contains(chars_view key)
      const noexcept
      { return this->find(key) != nullptr;  }

    // Gets the first value of a key.
    opt<cow_string>
    get(chars_view key)
      const;

    // Gets all values of a key, in order of appearance. If the key does not
    // exist, an empty vector is returned.
    cow_vector<cow_string>
    get_all(chars_view key)
      const;

    // Adds a value. If the key exists, the value is appended to its list.
    void
    add(const cow_string& key, const cow_string& value);
  };

// This class contains the path, query and fragment of a URI. The path always
// starts with a slash. Components are stored as they appear in the original
// URI, without decoding.
class URI_Path_Query
  {
  private:
    cow_string m_path;
    opt<cow_string> m_query;
    opt<cow_string> m_fragment;

  public:
    // Creates the default path `/`.
    URI_Path_Query();

    // Assembles components. `path` must start with a slash.
    URI_Path_Query(const cow_string& path, const opt<cow_string>& query,
                   const opt<cow_string>& fragment);

    // Parses the text `path[?query][#fragment]`. An empty string denotes the
    // default path `/`. If the text does not start with a slash, an
    // `HTTP_Error` with `uri_error_invalid_path` is thrown.
    explicit
    URI_Path_Query(chars_view text);

    URI_Path_Query&
    swap(URI_Path_Query& other)
      noexcept
      {
        this->m_path.swap(other.m_path);
        this->m_query.swap(other.m_query);
        this->m_fragment.swap(other.m_fragment);
        return *this;
      }

  public:
    URI_Path_Query(const URI_Path_Query&) = default;
    URI_Path_Query(URI_Path_Query&&) = default;
    URI_Path_Query& operator=(const URI_Path_Query&) & = default;
    URI_Path_Query& operator=(URI_Path_Query&&) & = default;
    ~URI_Path_Query();

    const cow_string&
    path()
      const noexcept
      { return this->m_path;  }

    const opt<cow_string>&
    query()
      const noexcept
      { return this->m_query;  }

    const opt<cow_string>&
    fragment()
      const noexcept
      { return this->m_fragment;  }

    // Splits the query string into key-value pairs. Pairs are separated by
    // `&`, and each pair is split at its first `=`. Pairs without an equals
    // sign are skipped.
    cow_bivector<cow_string, cow_string>
    query_values()
      const;

    // Collects key-value pairs of the query string into a map.
    URI_Query_Map
    query_map()
      const;

    // Splits the path into segments. One leading slash and one trailing slash
    // are removed first, so `/one/two/` yields `one` and `two`, and `/`
    // yields a single empty segment.
    cow_vector<cow_string>
    segments()
      const;

    // Writes this object in the form `path[?query][#fragment]`.
    tinyfmt&
    print(tinyfmt& fmt)
      const;

    cow_string
    print_to_string()
      const;
  };

inline
void
swap(URI_Path_Query& lhs, URI_Path_Query& rhs)
  noexcept
  { lhs.swap(rhs);  }

inline
tinyfmt&
operator<<(tinyfmt& fmt, const URI_Path_Query& pq)
  { return pq.print(fmt);  }

}  // namespace caravel
#endif
