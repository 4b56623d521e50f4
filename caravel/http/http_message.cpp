// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "http_message.hpp"
#include "abstract_http_body.hpp"
#include "http_bytes_body.hpp"
#include "../utils.hpp"
namespace caravel {
namespace {

// Checks whether a comma-separated list of connection options contains an
// option, case-insensitively.
bool
do_has_connection_option(const HTTP_Headers& headers, chars_view option)
  noexcept
  {
    for(const auto& value : headers.get_all("Connection")) {
      chars_view text = value.str();
      while(text.n != 0) {
        auto comma = static_cast<const char*>(::memchr(text.p, ',', text.n));
        size_t len = comma ? static_cast<size_t>(comma - text.p) : text.n;
        chars_view token = trim_blank(chars_view(text.p, len));
        if(::rocket::ascii_ci_equal(token.p, token.n, option.p, option.n))
          return true;

        text >>= comma ? len + 1 : len;
      }
    }
    return false;
  }

bool
do_should_close(HTTP_Version version, const HTTP_Headers& headers)
  noexcept
  {
    if(version == http_version_1_1)
      return do_has_connection_option(headers, "close");

    // HTTP/1.0 connections are closed unless persistence is requested.
    return !do_has_connection_option(headers, "keep-alive");
  }

}  // namespace

HTTP_Extensions::
HTTP_Extensions() noexcept
  {
  }

HTTP_Extensions::
~HTTP_Extensions()
  {
  }

size_t
HTTP_Extensions::
do_find(const type_info& type)
  const noexcept
  {
    for(size_t k = 0;  k != this->m_slots.size();  ++k)
      if(*(this->m_slots[k].first) == type)
        return k;

    return SIZE_MAX;
  }

HTTP_Request_Parts::
~HTTP_Request_Parts()
  {
  }

bool
HTTP_Request_Parts::
should_close()
  const noexcept
  {
    return do_should_close(this->version, this->headers);
  }

HTTP_Response_Parts::
~HTTP_Response_Parts()
  {
  }

bool
HTTP_Response_Parts::
should_close()
  const noexcept
  {
    return do_should_close(this->version, this->headers);
  }

HTTP_Request::
HTTP_Request() noexcept
  {
  }

HTTP_Request::
HTTP_Request(HTTP_Request_Parts&& xparts, uniptr<Abstract_HTTP_Body>&& xbody) noexcept
  :
    parts(move(xparts)), body(move(xbody))
  {
  }

HTTP_Request::
HTTP_Request(HTTP_Request&&) noexcept = default;

HTTP_Request&
HTTP_Request::
operator=(HTTP_Request&&) & noexcept = default;

HTTP_Request::
~HTTP_Request()
  {
  }

HTTP_Response::
HTTP_Response() noexcept
  {
  }

HTTP_Response::
HTTP_Response(HTTP_Response_Parts&& xparts, uniptr<Abstract_HTTP_Body>&& xbody) noexcept
  :
    parts(move(xparts)), body(move(xbody))
  {
  }

HTTP_Response::
HTTP_Response(HTTP_Response&&) noexcept = default;

HTTP_Response&
HTTP_Response::
operator=(HTTP_Response&&) & noexcept = default;

HTTP_Response::
~HTTP_Response()
  {
  }

void
HTTP_Response::
set_bytes(HTTP_Status status, const cow_string& data, chars_view content_type)
  {
    this->parts.status = status;
    if(content_type.n != 0)
      this->parts.headers.insert(HTTP_Field_Name("Content-Type"), HTTP_Header_Value(cow_string(content_type)));

    this->body = new_uni<HTTP_Bytes_Body>(data);
  }

}  // namespace caravel
