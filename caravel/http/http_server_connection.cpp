// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#include "../xprecompiled.hpp"
#include "http_server_connection.hpp"
#include "http_error.hpp"
#include "abstract_http_body.hpp"
#include "http_bytes_body.hpp"
#include "../base/abstract_byte_sink.hpp"
#include "../base/config_file.hpp"
#include "../static/main_config.hpp"
#include "../utils.hpp"
namespace caravel {

HTTP_Server_Connection::
HTTP_Server_Connection(Abstract_Byte_Source& source, Abstract_Byte_Sink& sink,
                       const HTTP_Handler& handler)
  :
    HTTP_Server_Connection(source, sink, handler, main_config.copy())
  {
  }

HTTP_Server_Connection::
HTTP_Server_Connection(Abstract_Byte_Source& source, Abstract_Byte_Sink& sink,
                       const HTTP_Handler& handler, const Config_File& conf)
  :
    m_reader(source), m_sink(&sink), m_handler(handler),
    m_conf(HTTP_Server_Config::load(conf)), m_parser(conf), m_writer(m_conf)
  {
  }

HTTP_Server_Connection::
~HTTP_Server_Connection()
  {
  }

void
HTTP_Server_Connection::
do_write_error_response(HTTP_Status status)
  {
    HTTP_Response_Parts parts;
    parts.status = status;
    parts.headers.insert(&"Connection", &"close");
    parts.headers.insert(&"Content-Type", &"text/plain; charset=utf-8");

    HTTP_Bytes_Body body(sformat("$1 $2\n", static_cast<uint32_t>(status), http_status_get_reason(status)));
    this->m_writer.write_response(*(this->m_sink), parts, &body);
  }

void
HTTP_Server_Connection::
serve()
  {
    cow_string chunk;

    for(;;) {
      this->m_reader.reset_bytes_read();

      // A connection may be closed by the client between requests.
      if(this->m_reader.at_eof()) {
        CARAVEL_LOG_TRACE(("Connection closed by peer `$1`"), this->m_peer_address);
        return;
      }

      HTTP_Request req;
      try {
        req.parts = this->m_parser.parse_request_line_and_headers(this->m_reader);
        req.body = this->m_parser.make_body(this->m_reader, req.parts);
      }
      catch(HTTP_Error& err) {
        CARAVEL_LOG_DEBUG((
            "Rejecting malformed request from `$1`: $2"),
            this->m_peer_address, err.what());

        this->do_write_error_response(http_status_from_error(err.code()));
        return;
      }

      if(this->m_conf.include_conn_info)
        req.parts.extensions.insert(HTTP_Connection_Info{ this->m_peer_address });

      // A body that extends to end of stream can't be followed by another
      // request.
      bool close = !this->m_conf.keep_alive || req.parts.should_close()
                   || (!req.body->size_hint() && !req.parts.headers.contains("Transfer-Encoding"));

      HTTP_Response resp;
      try {
        this->m_handler(req, resp);
      }
      catch(HTTP_Error& err) {
        // The handler has failed to read a malformed body, so the stream is
        // out of sync.
        CARAVEL_LOG_DEBUG((
            "Rejecting malformed request body from `$1`: $2"),
            this->m_peer_address, err.what());

        this->do_write_error_response(http_status_from_error(err.code()));
        return;
      }
      catch(exception& stdex) {
        CARAVEL_LOG_ERROR((
            "Unhandled exception from HTTP handler: $1",
            "[request: $2 $3]"),
            stdex, req.parts.method, req.parts.uri);

        resp = HTTP_Response();
        resp.set_bytes(http_status_internal_server_error, &"500 Internal Server Error\n",
                       &"text/plain; charset=utf-8");
      }

      if(close)
        resp.parts.headers.insert(&"Connection", &"close");
      else if(req.parts.version == http_version_1_0)
        resp.parts.headers.insert(&"Connection", &"keep-alive");

      this->m_writer.write_response(*(this->m_sink), resp.parts, resp.body.get(), req.parts.method);
      this->m_requests_served ++;

      if(close)
        return;

      // Discard the unread part of the request body, so the next request can
      // be parsed.
      try {
        while(req.body->read_next(chunk));
      }
      catch(HTTP_Error& err) {
        CARAVEL_LOG_DEBUG((
            "Closing connection after malformed request body from `$1`: $2"),
            this->m_peer_address, err.what());
        return;
      }
    }
  }

}  // namespace caravel
