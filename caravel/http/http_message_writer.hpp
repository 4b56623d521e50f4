// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#ifndef CARAVEL_HTTP_HTTP_MESSAGE_WRITER_
#define CARAVEL_HTTP_HTTP_MESSAGE_WRITER_

#include "../fwd.hpp"
#include "http_message.hpp"
namespace caravel {

// This class serializes messages into byte sinks. A body of known size is
// sent with `Content-Length`. A body of unknown size is sent in chunked
// transfer encoding.
class HTTP_Message_Writer
  {
  private:
    bool m_include_date_header = true;
    bool m_include_server_info = true;

  public:
    HTTP_Message_Writer() noexcept;

    explicit
    HTTP_Message_Writer(const HTTP_Server_Config& conf) noexcept;

  public:
    HTTP_Message_Writer(const HTTP_Message_Writer&) = default;
    HTTP_Message_Writer& operator=(const HTTP_Message_Writer&) & = default;
    ~HTTP_Message_Writer();

    // Writes a response. A null `body` denotes an empty body. `req_method` is
    // the method of the request; a response to a HEAD request has no body.
    // `Date`, `Server`, `Content-Length` and `Transfer-Encoding` headers are
    // added as necessary. The number of body bytes that have been written is
    // returned.
    uint64_t
    write_response(Abstract_Byte_Sink& sink, const HTTP_Response_Parts& parts,
                   Abstract_HTTP_Body* body, HTTP_Method req_method = http_GET)
      const;

    // Writes a request in origin form. A `Host` header is added from the
    // authority of the URI if absent. A null `body` denotes an empty body.
    uint64_t
    write_request(Abstract_Byte_Sink& sink, const HTTP_Request_Parts& parts,
                  Abstract_HTTP_Body* body)
      const;
  };

// Gets the standard reason phrase of a status code, such as `Not Found`.
ROCKET_CONST
const char*
http_status_get_reason(HTTP_Status status)
  noexcept;

}  // namespace caravel
#endif
