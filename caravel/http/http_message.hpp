// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#ifndef CARAVEL_HTTP_HTTP_MESSAGE_
#define CARAVEL_HTTP_HTTP_MESSAGE_

#include "../fwd.hpp"
#include "enums.hpp"
#include "uri.hpp"
#include "http_headers.hpp"
#include <typeinfo>
namespace caravel {

// This is a small map whose keys are types. Each type has at most one value.
// Copies of this map share values, so values shall not be modified after
// insertion.
class HTTP_Extensions
  {
  private:
    cow_bivector<const type_info*, shptr<const void>> m_slots;

  private:
    size_t
    do_find(const type_info& type)
      const noexcept;

  public:
    HTTP_Extensions() noexcept;

    HTTP_Extensions&
    swap(HTTP_Extensions& other)
      noexcept
      {
        this->m_slots.swap(other.m_slots);
        return *this;
      }

  public:
    HTTP_Extensions(const HTTP_Extensions&) = default;
    HTTP_Extensions(HTTP_Extensions&&) = default;
    HTTP_Extensions& operator=(const HTTP_Extensions&) & = default;
    HTTP_Extensions& operator=(HTTP_Extensions&&) & = default;
    ~HTTP_Extensions();

    size_t
    size()
      const noexcept
      { return this->m_slots.size();  }

    bool
    empty()
      const noexcept
      { return this->m_slots.empty();  }

    void
    clear()
      noexcept
      { this->m_slots.clear();  }

    template<typename xValue>
    bool
    contains()
      const noexcept
      { return this->do_find(typeid(xValue)) != SIZE_MAX;  }

    // Gets the value of type `xValue`. If no such value exists, a null
    // pointer is returned.
    template<typename xValue>
    const xValue*
    get()
      const noexcept
      {
        size_t index = this->do_find(typeid(xValue));
        if(index == SIZE_MAX)
          return nullptr;
        return static_cast<const xValue*>(this->m_slots[index].second.get());
      }

    // Sets the value of type `xValue`, replacing the old one if any. The
    // return value indicates whether an old value has been replaced.
    template<typename xValue>
    bool
    insert(const xValue& value)
      {
        shptr<const void> ptr = new_sh<xValue>(value);
        size_t index = this->do_find(typeid(xValue));
        if(index != SIZE_MAX) {
          this->m_slots.mut(index).second.swap(ptr);
          return true;
        }

        this->m_slots.emplace_back(&typeid(xValue), move(ptr));
        return false;
      }

    template<typename xValue>
    bool
    remove()
      {
        size_t index = this->do_find(typeid(xValue));
        if(index == SIZE_MAX)
          return false;

        this->m_slots.erase(this->m_slots.begin() + static_cast<ptrdiff_t>(index));
        return true;
      }
  };

inline
void
swap(HTTP_Extensions& lhs, HTTP_Extensions& rhs)
  noexcept
  { lhs.swap(rhs);  }

// This is attached to request extensions when `http.include_conn_info` is
// enabled.
struct HTTP_Connection_Info
  {
    cow_string peer_address;
  };

struct HTTP_Request_Parts
  {
    HTTP_Headers headers;
    HTTP_Method method = http_GET;
    HTTP_Version version = http_version_1_1;
    URI uri;
    HTTP_Extensions extensions;

    HTTP_Request_Parts() = default;
    HTTP_Request_Parts(const HTTP_Request_Parts&) = default;
    HTTP_Request_Parts(HTTP_Request_Parts&&) = default;
    HTTP_Request_Parts& operator=(const HTTP_Request_Parts&) & = default;
    HTTP_Request_Parts& operator=(HTTP_Request_Parts&&) & = default;
    ~HTTP_Request_Parts();

    // Checks whether the connection shall be closed after this request,
    // according to its version and `Connection` header.
    bool
    should_close()
      const noexcept;
  };

struct HTTP_Response_Parts
  {
    HTTP_Headers headers;
    HTTP_Status status = http_status_ok;
    cow_string reason;
    HTTP_Version version = http_version_1_1;
    HTTP_Extensions extensions;

    HTTP_Response_Parts() = default;
    HTTP_Response_Parts(const HTTP_Response_Parts&) = default;
    HTTP_Response_Parts(HTTP_Response_Parts&&) = default;
    HTTP_Response_Parts& operator=(const HTTP_Response_Parts&) & = default;
    HTTP_Response_Parts& operator=(HTTP_Response_Parts&&) & = default;
    ~HTTP_Response_Parts();

    bool
    should_close()
      const noexcept;
  };

// A request with a body. A null body denotes an empty body.
struct HTTP_Request
  {
    HTTP_Request_Parts parts;
    uniptr<Abstract_HTTP_Body> body;

    HTTP_Request() noexcept;
    HTTP_Request(HTTP_Request_Parts&& xparts, uniptr<Abstract_HTTP_Body>&& xbody) noexcept;
    HTTP_Request(HTTP_Request&&) noexcept;
    HTTP_Request& operator=(HTTP_Request&&) & noexcept;
    ~HTTP_Request();
  };

// A response with a body. A null body denotes an empty body.
struct HTTP_Response
  {
    HTTP_Response_Parts parts;
    uniptr<Abstract_HTTP_Body> body;

    HTTP_Response() noexcept;
    HTTP_Response(HTTP_Response_Parts&& xparts, uniptr<Abstract_HTTP_Body>&& xbody) noexcept;
    HTTP_Response(HTTP_Response&&) noexcept;
    HTTP_Response& operator=(HTTP_Response&&) & noexcept;
    ~HTTP_Response();

    // Sets the status, and replaces the body with a byte string. The
    // `Content-Type` header is set if `content_type` is not empty.
    void
    set_bytes(HTTP_Status status, const cow_string& data, chars_view content_type = "");
  };

}  // namespace caravel
#endif
