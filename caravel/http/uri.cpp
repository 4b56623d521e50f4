// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "uri.hpp"
#include "http_error.hpp"
#include "../utils.hpp"
namespace caravel {
namespace {

chars_view
do_trim_space(chars_view text)
  noexcept
  {
    const char* bptr = text.p;
    const char* eptr = text.p + text.n;

    while((bptr != eptr) && is_any_of(bptr[0], {' ', '\t', '\r', '\n'}))
      bptr ++;

    while((bptr != eptr) && is_any_of(eptr[-1], {' ', '\t', '\r', '\n'}))
      eptr --;

    return chars_view(bptr, static_cast<size_t>(eptr - bptr));
  }

uint16_t
do_parse_port(chars_view text)
  {
    if(text.n == 0)
      CARAVEL_URI_THROW(uri_error_invalid_port, (
          "Invalid port: port number expected after a colon"));

    uint32_t value = 0;
    for(size_t k = 0;  k != text.n;  ++k) {
      if((text.p[k] < '0') || (text.p[k] > '9'))
        CARAVEL_URI_THROW(uri_error_invalid_port, (
            "Invalid port `$1`: not a decimal number"),
            text);

      value = value * 10 + static_cast<uint32_t>(text.p[k] - '0');
      if(value > 0xFFFF)
        CARAVEL_URI_THROW(uri_error_invalid_port, (
            "Invalid port `$1`: value out of range"),
            text);
    }

    return static_cast<uint16_t>(value);
  }

}  // namespace

URI_Scheme::
URI_Scheme(chars_view text)
  {
    if(text.n == 0)
      CARAVEL_URI_THROW(uri_error_invalid_scheme, (
          "Invalid scheme: scheme shall not be empty"));

    // scheme = ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )
    this->m_str.reserve(text.n);
    for(size_t k = 0;  k != text.n;  ++k)
      switch(text.p[k])
        {
        case 'a' ... 'z':
          this->m_str.push_back(text.p[k]);
          break;

        case 'A' ... 'Z':
          // Convert this letter to lowercase.
          this->m_str.push_back(static_cast<char>(text.p[k] | 0x20));
          break;

        case '0' ... '9':
        case '+':
        case '-':
        case '.':
          if(k != 0) {
            this->m_str.push_back(text.p[k]);
            break;
          }
          // fallthrough

        default:
          CARAVEL_URI_THROW(uri_error_invalid_scheme, (
              "Invalid scheme `$1`: invalid character at offset `$2`"),
              text, k);
        }
  }

URI_Scheme::
~URI_Scheme()
  {
  }

uint16_t
URI_Scheme::
default_port()
  const noexcept
  {
    if(this->is_http())
      return 80;

    if(this->is_https())
      return 443;

    return 0;
  }

URI_Authority::
URI_Authority(const cow_string& host, opt<uint16_t> port, const opt<cow_string>& user_info)
  :
    m_user_info(user_info), m_host(host), m_port(port)
  {
    if(this->m_host.empty())
      CARAVEL_URI_THROW(uri_error_empty_host, (
          "Invalid authority: host shall not be empty"));
  }

URI_Authority::
URI_Authority(chars_view text)
  {
    chars_view rem = text;

    // Split the user info, if any.
    auto at_pos = static_cast<const char*>(::memchr(rem.p, '@', rem.n));
    if(at_pos) {
      size_t at_off = static_cast<size_t>(at_pos - rem.p);
      this->m_user_info.emplace(rem.p, at_off);
      rem >>= at_off + 1;
    }

    if((rem.n != 0) && (rem.p[0] == '[')) {
      // IPv6 addresses contain colons, so they are enclosed in brackets.
      auto rb_pos = static_cast<const char*>(::memchr(rem.p, ']', rem.n));
      if(!rb_pos)
        CARAVEL_URI_THROW(uri_error_invalid_host, (
            "Invalid host `$1`: missing closed bracket"),
            rem);

      size_t rb_off = static_cast<size_t>(rb_pos - rem.p);
      this->m_host.assign(rem.p + 1, rb_off - 1);
      rem >>= rb_off + 1;

      if(rem.n != 0) {
        if(rem.p[0] != ':')
          CARAVEL_URI_THROW(uri_error_invalid_host, (
              "Invalid host: junk `$1` after IPv6 address"),
              rem);

        this->m_port = do_parse_port(rem >> 1);
      }
    }
    else {
      // Split the port, if any.
      auto colon_pos = static_cast<const char*>(::memchr(rem.p, ':', rem.n));
      if(colon_pos) {
        size_t colon_off = static_cast<size_t>(colon_pos - rem.p);
        this->m_host.assign(rem.p, colon_off);
        this->m_port = do_parse_port(rem >> (colon_off + 1));
      }
      else
        this->m_host.assign(rem.p, rem.n);
    }

    if(this->m_host.empty())
      CARAVEL_URI_THROW(uri_error_empty_host, (
          "Invalid authority `$1`: host shall not be empty"),
          text);
  }

URI_Authority::
~URI_Authority()
  {
  }

tinyfmt&
URI_Authority::
print(tinyfmt& fmt)
  const
  {
    if(this->m_user_info)
      fmt << *(this->m_user_info) << '@';

    if(this->is_ipv6())
      fmt << '[' << this->m_host << ']';
    else
      fmt << this->m_host;

    if(this->m_port)
      fmt << ':' << *(this->m_port);

    return fmt;
  }

cow_string
URI_Authority::
print_to_string()
  const
  {
    tinyfmt_str fmt;
    this->print(fmt);
    return fmt.extract_string();
  }

URI::
URI(const opt<URI_Scheme>& scheme, const opt<URI_Authority>& authority,
    const URI_Path_Query& path_query)
  :
    m_scheme(scheme), m_authority(authority), m_path_query(path_query)
  {
  }

URI::
URI(chars_view text)
  {
    chars_view rem = do_trim_space(text);
    if(rem.n == 0)
      CARAVEL_URI_THROW(uri_error_empty_uri, (
          "Invalid URI: empty string"));

    // Get the scheme, if any. It ends at the first colon, which must start a
    // `://`. A `://` after a slash, question mark or hash sign is data.
    size_t css_off = 0;
    while((css_off != rem.n) && is_none_of(rem.p[css_off], {'/', '?', '#', ':'}))
      css_off ++;

    if((rem.n - css_off >= 3) && (::memcmp(rem.p + css_off, "://", 3) == 0)) {
      this->m_scheme.emplace(chars_view(rem.p, css_off));
      rem >>= css_off + 3;
    }

    // If the remainder does not start with a slash, it starts with an
    // authority, which ends at the first slash, question mark or hash sign.
    if((rem.n == 0) || (rem.p[0] != '/')) {
      size_t auth_len = 0;
      while((auth_len != rem.n) && is_none_of(rem.p[auth_len], {'/', '?', '#'}))
        auth_len ++;

      this->m_authority.emplace(chars_view(rem.p, auth_len));
      rem >>= auth_len;

      if((rem.n != 0) && (rem.p[0] != '/')) {
        // Add an implicit slash before the query or fragment.
        cow_string pq_str;
        pq_str.reserve(rem.n + 1);
        pq_str.push_back('/');
        pq_str.append(rem.p, rem.n);
        URI_Path_Query(chars_view(pq_str)).swap(this->m_path_query);
        return;
      }
    }

    URI_Path_Query(rem).swap(this->m_path_query);
  }

URI::
~URI()
  {
  }

tinyfmt&
URI::
print(tinyfmt& fmt)
  const
  {
    if(this->m_scheme)
      fmt << *(this->m_scheme) << "://";

    if(this->m_authority)
      fmt << *(this->m_authority);

    return this->m_path_query.print(fmt);
  }

cow_string
URI::
print_to_string()
  const
  {
    tinyfmt_str fmt;
    this->print(fmt);
    return fmt.extract_string();
  }

}  // namespace caravel
