// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#ifndef CARAVEL_HTTP_HTTP_RESPONSE_PARSER_
#define CARAVEL_HTTP_HTTP_RESPONSE_PARSER_

#include "../fwd.hpp"
#include "http_message.hpp"
namespace caravel {

class HTTP_Response_Parser
  {
  private:
    uint32_t m_max_header_bytes = 65536;
    uint64_t m_max_content_length = 1048576;

  public:
    // Constructs a parser with limits from the global configuration.
    HTTP_Response_Parser();

    explicit
    HTTP_Response_Parser(const Config_File& conf);

  public:
    HTTP_Response_Parser(const HTTP_Response_Parser&) = default;
    HTTP_Response_Parser& operator=(const HTTP_Response_Parser&) & = default;
    ~HTTP_Response_Parser();

    uint32_t
    max_header_bytes()
      const noexcept
      { return this->m_max_header_bytes;  }

    uint64_t
    max_content_length()
      const noexcept
      { return this->m_max_content_length;  }

    void
    reload(const Config_File& conf);

    // Parses the status line and headers of a response, such as
    // `HTTP/1.1 404 Not Found`. The reader is left at the first byte of the
    // body.
    HTTP_Response_Parts
    parse_status_line_and_headers(HTTP_Stream_Reader& reader)
      const;

    // Creates the body of a response. A response to a HEAD request, and a
    // response with status 1xx, 204 or 304, has no body.
    uniptr<Abstract_HTTP_Body>
    make_body(HTTP_Stream_Reader& reader, const HTTP_Response_Parts& parts, HTTP_Method req_method)
      const;

    HTTP_Response
    parse_response(HTTP_Stream_Reader& reader, HTTP_Method req_method)
      const;
  };

// Checks whether a response must not have a body.
ROCKET_CONST
bool
http_response_has_no_body(HTTP_Method req_method, HTTP_Status status)
  noexcept;

}  // namespace caravel
#endif
