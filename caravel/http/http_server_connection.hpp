// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#ifndef CARAVEL_HTTP_HTTP_SERVER_CONNECTION_
#define CARAVEL_HTTP_HTTP_SERVER_CONNECTION_

#include "../fwd.hpp"
#include "http_message.hpp"
#include "http_stream_reader.hpp"
#include "http_request_parser.hpp"
#include "http_message_writer.hpp"
#include "http_server_config.hpp"
namespace caravel {

// This is the callback that handles requests. It is called once for each
// request, and shall fill in the response. The request body may be read
// partially or not at all; unread bytes are discarded afterwards.
using HTTP_Handler = shared_function<void (HTTP_Request&, HTTP_Response&)>;

// This class serves requests on a single connection, one at a time, until
// the connection is closed by either side.
class HTTP_Server_Connection
  {
  private:
    HTTP_Stream_Reader m_reader;
    Abstract_Byte_Sink* m_sink;
    HTTP_Handler m_handler;

    HTTP_Server_Config m_conf;
    HTTP_Request_Parser m_parser;
    HTTP_Message_Writer m_writer;

    cow_string m_peer_address;
    uint64_t m_requests_served = 0;

  private:
    void
    do_write_error_response(HTTP_Status status);

  public:
    // Creates a connection with options from the global configuration. The
    // source and sink are borrowed and shall outlive this connection; they
    // may be the same object.
    HTTP_Server_Connection(Abstract_Byte_Source& source, Abstract_Byte_Sink& sink,
                           const HTTP_Handler& handler);

    // Creates a connection with options from `conf`.
    HTTP_Server_Connection(Abstract_Byte_Source& source, Abstract_Byte_Sink& sink,
                           const HTTP_Handler& handler, const Config_File& conf);

  public:
    HTTP_Server_Connection(const HTTP_Server_Connection&) = delete;
    HTTP_Server_Connection& operator=(const HTTP_Server_Connection&) & = delete;
    ~HTTP_Server_Connection();

    const HTTP_Server_Config&
    config()
      const noexcept
      { return this->m_conf;  }

    // Sets the address of the remote peer, which is attached to requests if
    // `http.include_conn_info` is enabled.
    void
    set_peer_address(const cow_string& addr)
      { this->m_peer_address = addr;  }

    const cow_string&
    peer_address()
      const noexcept
      { return this->m_peer_address;  }

    uint64_t
    requests_served()
      const noexcept
      { return this->m_requests_served;  }

    // Serves requests until either side closes the connection, or until a
    // malformed request is received, in which case an error response is sent.
    // I/O errors are propagated to the caller.
    void
    serve();
  };

}  // namespace caravel
#endif
