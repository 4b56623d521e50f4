// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#include "utils.hpp"
#include "../caravel/http/http_chunked_body.hpp"
#include "../caravel/http/http_chunked_encoder.hpp"
#include "../caravel/http/http_stream_reader.hpp"
#include "../caravel/base/memory_byte_stream.hpp"
using namespace ::caravel;

namespace {

cow_string
do_decode(const cow_string& wire, size_t step, uint64_t max_length = UINT64_MAX)
  {
    Memory_Byte_Source src(wire, step);
    HTTP_Stream_Reader reader(src);
    HTTP_Chunked_Body body(reader, max_length);
    return body.read_all_bytes();
  }

}  // namespace

int
main()
  {
    // Encoding
    Memory_Byte_Sink sink;
    HTTP_Chunked_Encoder enc(sink);
    CARAVEL_TEST_CHECK(enc.write("Hello, ") == true);
    CARAVEL_TEST_CHECK(enc.write("") == false);
    CARAVEL_TEST_CHECK(enc.write(cow_string(26, 'z')) == true);
    CARAVEL_TEST_CHECK(!enc.closed());
    CARAVEL_TEST_CHECK(enc.total() == 33);
    enc.close();
    CARAVEL_TEST_CHECK(enc.closed());
    enc.close();
    CARAVEL_TEST_CHECK(sink.data() ==
        "7\r\nHello, \r\n"
        "1a\r\nzzzzzzzzzzzzzzzzzzzzzzzzzz\r\n"
        "0\r\n\r\n");
    CARAVEL_TEST_CHECK_CATCH(enc.write("late"));

    // Decoding, with input split at every possible point
    const cow_string wire = sink.data();
    for(size_t step = 1;  step <= wire.size();  ++step)
      CARAVEL_TEST_CHECK(do_decode(wire, step) == "Hello, zzzzzzzzzzzzzzzzzzzzzzzzzz");

    // Extensions, uppercase digits and trailers
    CARAVEL_TEST_CHECK(do_decode(&"4;name=value\r\nWiki\r\n0A\r\n0123456789\r\n"
                                  "0\r\nExpires: never\r\nX-Trailer: 1\r\n\r\n", 5)
                       == "Wiki0123456789");

    // Data after the terminating chunk is not consumed.
    Memory_Byte_Source src(&"3\r\nabc\r\n0\r\n\r\nNEXT", 4);
    HTTP_Stream_Reader reader(src);
    HTTP_Chunked_Body body(reader, 100);
    cow_string chunk;
    CARAVEL_TEST_CHECK(body.read_next(chunk));
    CARAVEL_TEST_CHECK(chunk == "abc");
    CARAVEL_TEST_CHECK(!body.read_next(chunk));
    CARAVEL_TEST_CHECK(chunk.empty());
    CARAVEL_TEST_CHECK(body.done());
    CARAVEL_TEST_CHECK(!body.read_next(chunk));
    CARAVEL_TEST_CHECK(body.total() == 3);
    CARAVEL_TEST_CHECK(reader.read_to_end() == "NEXT");

    // Errors
    CARAVEL_TEST_CHECK_HTTP_ERROR(http_error_invalid_chunk, do_decode(&"xyz\r\nabc\r\n0\r\n\r\n", 100));
    CARAVEL_TEST_CHECK_HTTP_ERROR(http_error_invalid_chunk, do_decode(&"3 junk\r\nabc\r\n0\r\n\r\n", 100));
    CARAVEL_TEST_CHECK_HTTP_ERROR(http_error_invalid_chunk, do_decode(&"3\nabc\r\n0\r\n\r\n", 100));
    CARAVEL_TEST_CHECK_HTTP_ERROR(http_error_invalid_chunk, do_decode(&"3\r\nabcd\r\n0\r\n\r\n", 100));
    CARAVEL_TEST_CHECK_HTTP_ERROR(http_error_invalid_chunk, do_decode(&"5\r\nabc", 100));
    CARAVEL_TEST_CHECK_HTTP_ERROR(http_error_invalid_chunk, do_decode(&"3\r\nabc\r\n", 100));
    CARAVEL_TEST_CHECK_HTTP_ERROR(http_error_invalid_chunk, do_decode(&"11111111111111111\r\n", 100));
    CARAVEL_TEST_CHECK_HTTP_ERROR(http_error_payload_too_large, do_decode(&"8\r\n12345678\r\n0\r\n\r\n", 100, 7));
    CARAVEL_TEST_CHECK_HTTP_ERROR(http_error_payload_too_large,
                                  do_decode(&"4\r\n1234\r\n4\r\n5678\r\n0\r\n\r\n", 100, 7));
    CARAVEL_TEST_CHECK_HTTP_ERROR(http_error_limit_reached, do_decode(cow_string(5000, '1'), 100));
  }
