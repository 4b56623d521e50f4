// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#ifndef CARAVEL_HTTP_URI_
#define CARAVEL_HTTP_URI_

#include "../fwd.hpp"
#include "uri_path_query.hpp"
#include <cstring>
namespace caravel {

// A scheme is stored in lowercase. `http` and `https` are recognized
// specially; all others are kept as they are.
class URI_Scheme
  {
  private:
    cow_string m_str;

  public:
    // Validates and lowercases `text`. If `text` is empty or contains an
    // invalid character, an `HTTP_Error` with `uri_error_invalid_scheme` is
    // thrown.
    explicit
    URI_Scheme(chars_view text);

    URI_Scheme&
    swap(URI_Scheme& other)
      noexcept
      {
        this->m_str.swap(other.m_str);
        return *this;
      }

  public:
    URI_Scheme(const URI_Scheme&) = default;
    URI_Scheme(URI_Scheme&&) = default;
    URI_Scheme& operator=(const URI_Scheme&) & = default;
    URI_Scheme& operator=(URI_Scheme&&) & = default;
    ~URI_Scheme();

    const cow_string&
    str()
      const noexcept
      { return this->m_str;  }

    bool
    is_http()
      const noexcept
      { return this->m_str == "http";  }

    bool
    is_https()
      const noexcept
      { return this->m_str == "https";  }

    // Gets the default port of this scheme. If the scheme is neither `http`
    // nor `https`, zero is returned.
    uint16_t
    default_port()
      const noexcept;
  };

inline
void
swap(URI_Scheme& lhs, URI_Scheme& rhs)
  noexcept
  { lhs.swap(rhs);  }

inline
bool
operator==(const URI_Scheme& lhs, const URI_Scheme& rhs)
  noexcept
  { return lhs.str() == rhs.str();  }

inline
bool
operator!=(const URI_Scheme& lhs, const URI_Scheme& rhs)
  noexcept
  { return lhs.str() != rhs.str();  }

inline
tinyfmt&
operator<<(tinyfmt& fmt, const URI_Scheme& scheme)
  { return fmt << scheme.str();  }

// An authority has the form `[user_info@]host[:port]`. An IPv6 host is
// stored without its brackets.
class URI_Authority
  {
  private:
    opt<cow_string> m_user_info;
    cow_string m_host;
    opt<uint16_t> m_port;

  public:
    // Assembles components. `host` shall not be empty.
    URI_Authority(const cow_string& host, opt<uint16_t> port,
                  const opt<cow_string>& user_info = nullopt);

    // Parses an authority. In case of an error, an `HTTP_Error` is thrown.
    explicit
    URI_Authority(chars_view text);

    URI_Authority&
    swap(URI_Authority& other)
      noexcept
      {
        this->m_user_info.swap(other.m_user_info);
        this->m_host.swap(other.m_host);
        this->m_port.swap(other.m_port);
        return *this;
      }

  public:
    URI_Authority(const URI_Authority&) = default;
    URI_Authority(URI_Authority&&) = default;
    URI_Authority& operator=(const URI_Authority&) & = default;
    URI_Authority& operator=(URI_Authority&&) & = default;
    ~URI_Authority();

    const opt<cow_string>&
    user_info()
      const noexcept
      { return this->m_user_info;  }

    const cow_string&
    host()
      const noexcept
      { return this->m_host;  }

    opt<uint16_t>
    port()
      const noexcept
      { return this->m_port;  }

    // Checks whether the host is an IPv6 address.
    bool
    is_ipv6()
      const noexcept
      { return ::memchr(this->m_host.data(), ':', this->m_host.size()) != nullptr;  }

    // Writes this object in the form `[user_info@]host[:port]`. An IPv6 host
    // is enclosed in brackets.
    tinyfmt&
    print(tinyfmt& fmt)
      const;

    cow_string
    print_to_string()
      const;
  };

inline
void
swap(URI_Authority& lhs, URI_Authority& rhs)
  noexcept
  { lhs.swap(rhs);  }

inline
tinyfmt&
operator<<(tinyfmt& fmt, const URI_Authority& auth)
  { return auth.print(fmt);  }

// A URI is either in absolute form `scheme://authority/path?query#fragment`,
// or in origin form `/path?query#fragment`. The scheme is optional when an
// authority is present.
class URI
  {
  private:
    opt<URI_Scheme> m_scheme;
    opt<URI_Authority> m_authority;
    URI_Path_Query m_path_query;

  public:
    // Creates the URI `/`.
    URI() = default;

    // Assembles components.
    URI(const opt<URI_Scheme>& scheme, const opt<URI_Authority>& authority,
        const URI_Path_Query& path_query);

    // Parses a URI. Surrounding spaces are ignored. In case of an error, an
    // `HTTP_Error` with `http_error_invalid_uri` is thrown; its `uri_kind()`
    // describes what is wrong.
    explicit
    URI(chars_view text);

    URI&
    swap(URI& other)
      noexcept
      {
        this->m_scheme.swap(other.m_scheme);
        this->m_authority.swap(other.m_authority);
        this->m_path_query.swap(other.m_path_query);
        return *this;
      }

  public:
    URI(const URI&) = default;
    URI(URI&&) = default;
    URI& operator=(const URI&) & = default;
    URI& operator=(URI&&) & = default;
    ~URI();

    const opt<URI_Scheme>&
    scheme()
      const noexcept
      { return this->m_scheme;  }

    const opt<URI_Authority>&
    authority()
      const noexcept
      { return this->m_authority;  }

    const URI_Path_Query&
    path_query()
      const noexcept
      { return this->m_path_query;  }

    const cow_string&
    path()
      const noexcept
      { return this->m_path_query.path();  }

    const opt<cow_string>&
    query()
      const noexcept
      { return this->m_path_query.query();  }

    // Writes this URI in the form `scheme://authority/path?query#fragment`.
    // Absent components are omitted.
    tinyfmt&
    print(tinyfmt& fmt)
      const;

    cow_string
    print_to_string()
      const;
  };

inline
void
swap(URI& lhs, URI& rhs)
  noexcept
  { lhs.swap(rhs);  }

inline
tinyfmt&
operator<<(tinyfmt& fmt, const URI& uri)
  { return uri.print(fmt);  }

}  // namespace caravel
#endif
