// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#ifndef CARAVEL_HTTP_HTTP_REQUEST_PARSER_
#define CARAVEL_HTTP_HTTP_REQUEST_PARSER_

#include "../fwd.hpp"
#include "http_message.hpp"
namespace caravel {

class HTTP_Request_Parser
  {
  private:
    uint32_t m_max_header_bytes = 65536;
    uint64_t m_max_content_length = 1048576;

  public:
    // Constructs a parser with limits from the global configuration.
    HTTP_Request_Parser();

    // Constructs a parser with limits from `conf`.
    explicit
    HTTP_Request_Parser(const Config_File& conf);

  public:
    HTTP_Request_Parser(const HTTP_Request_Parser&) = default;
    HTTP_Request_Parser& operator=(const HTTP_Request_Parser&) & = default;
    ~HTTP_Request_Parser();

    // Get configuration values.
    uint32_t
    max_header_bytes()
      const noexcept
      { return this->m_max_header_bytes;  }

    uint64_t
    max_content_length()
      const noexcept
      { return this->m_max_content_length;  }

    // Reloads limits from a configuration file. Absent values are set to
    // their defaults; values out of range are clamped.
    void
    reload(const Config_File& conf);

    // Parses the request line and headers of a request. The reader is left
    // at the first byte of the body. In case of an error, an `HTTP_Error` is
    // thrown. If the stream ends before a complete request head, an
    // `HTTP_Error` with `http_error_unexpected_eof` is thrown.
    HTTP_Request_Parts
    parse_request_line_and_headers(HTTP_Stream_Reader& reader)
      const;

    // Creates the body of a request whose head has been parsed. A GET or HEAD
    // request without framing headers has an empty body. Any other request
    // without framing headers has a body that extends to end of stream.
    uniptr<Abstract_HTTP_Body>
    make_body(HTTP_Stream_Reader& reader, const HTTP_Request_Parts& parts)
      const;

    // Parses a request head and creates its body.
    HTTP_Request
    parse_request(HTTP_Stream_Reader& reader)
      const;
  };

// Parses a method. Standard methods are matched case-insensitively and are
// returned in canonical form. Other tokens of up to seven characters are
// returned as written. Anything else yields `http_NULL`.
HTTP_Method
parse_http_method(chars_view text)
  noexcept;

}  // namespace caravel
#endif
