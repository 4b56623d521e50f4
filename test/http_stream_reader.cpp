// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#include "utils.hpp"
#include "../caravel/http/http_stream_reader.hpp"
#include "../caravel/base/memory_byte_stream.hpp"
using namespace ::caravel;

int
main()
  {
    // Delimited reads
    Memory_Byte_Source src1(&"GET / HTTP/1.1\r\nHost: a\r\n\r\nbody", 3);
    HTTP_Stream_Reader reader(src1);
    CARAVEL_TEST_CHECK(!reader.at_eof());
    CARAVEL_TEST_CHECK(reader.read_until('\n') == "GET / HTTP/1.1\r\n");
    CARAVEL_TEST_CHECK(reader.total_bytes_read() == 16);

    chars_view pv = reader.peek(4);
    CARAVEL_TEST_CHECK(pv.n == 4);
    CARAVEL_TEST_CHECK(::memcmp(pv.p, "Host", 4) == 0);
    CARAVEL_TEST_CHECK(reader.total_bytes_read() == 16);

    auto r = reader.read_until_sequence("\r\n\r\n");
    CARAVEL_TEST_CHECK(r.first);
    CARAVEL_TEST_CHECK(r.second == "Host: a\r\n\r\n");
    CARAVEL_TEST_CHECK(reader.read_exact(2) == "bo");
    CARAVEL_TEST_CHECK(reader.read_to_end() == "dy");
    CARAVEL_TEST_CHECK(reader.at_eof());
    CARAVEL_TEST_CHECK(reader.read_until('\n') == "");
    CARAVEL_TEST_CHECK(reader.read_exact(10) == "");
    CARAVEL_TEST_CHECK(reader.peek(10).n == 0);
    CARAVEL_TEST_CHECK(reader.total_bytes_read() == 31);

    // A delimiter that never appears
    Memory_Byte_Source src2(&"no newline here");
    HTTP_Stream_Reader reader2(src2);
    CARAVEL_TEST_CHECK(reader2.read_until('\n') == "no newline here");
    CARAVEL_TEST_CHECK(reader2.at_eof());

    // A sequence split across fragments at every possible point
    static constexpr char data[] = "abc\r\n\r\r\n\r\ndef";
    for(size_t step = 1;  step != sizeof(data);  ++step) {
      Memory_Byte_Source src(cow_string(data, sizeof(data) - 1), step);
      HTTP_Stream_Reader rd(src);
      auto rs = rd.read_until_sequence("\r\n\r\n");
      CARAVEL_TEST_CHECK(rs.first);
      CARAVEL_TEST_CHECK(rs.second == "abc\r\n\r\r\n\r\n");
      CARAVEL_TEST_CHECK(rd.read_to_end() == "def");
    }

    // A sequence that is not found
    Memory_Byte_Source src3(&"abc\r\n\r", 2);
    HTTP_Stream_Reader reader3(src3);
    r = reader3.read_until_sequence("\r\n\r\n");
    CARAVEL_TEST_CHECK(!r.first);
    CARAVEL_TEST_CHECK(r.second == "abc\r\n\r");
    r = reader3.read_until_sequence("");
    CARAVEL_TEST_CHECK(r.first);
    CARAVEL_TEST_CHECK(r.second == "");

    // Total limit on consumed bytes
    Memory_Byte_Source src4(cow_string(200, 'x'), 7);
    HTTP_Stream_Reader reader4(src4);
    reader4.set_bytes_limit(100);
    CARAVEL_TEST_CHECK(reader4.bytes_limit() == 100);
    CARAVEL_TEST_CHECK(reader4.read_exact(60).size() == 60);
    CARAVEL_TEST_CHECK(reader4.read_exact(40).size() == 40);
    CARAVEL_TEST_CHECK_HTTP_ERROR(http_error_limit_reached, reader4.read_exact(1));
    CARAVEL_TEST_CHECK(reader4.total_bytes_read() == 100);

    // The counter can be restarted between messages.
    reader4.reset_bytes_read();
    CARAVEL_TEST_CHECK(reader4.total_bytes_read() == 0);
    CARAVEL_TEST_CHECK(reader4.discard(1000) == 100);
    CARAVEL_TEST_CHECK(reader4.at_eof());

    // Limit on a single delimited read, counting the delimiter
    Memory_Byte_Source src5(&"0123456789\nabcdefghijklmnop\n", 4);
    HTTP_Stream_Reader reader5(src5);
    CARAVEL_TEST_CHECK(reader5.read_until_with_limit('\n', 11) == "0123456789\n");
    CARAVEL_TEST_CHECK_HTTP_ERROR(http_error_limit_reached, reader5.read_until_with_limit('\n', 10));

    // Discarding
    Memory_Byte_Source src6(&"0123456789", 3);
    HTTP_Stream_Reader reader6(src6);
    CARAVEL_TEST_CHECK(reader6.discard(4) == 4);
    CARAVEL_TEST_CHECK(reader6.read_exact(2) == "45");
    CARAVEL_TEST_CHECK(reader6.buffered() <= 4);
    CARAVEL_TEST_CHECK(reader6.discard(100) == 4);
    CARAVEL_TEST_CHECK(reader6.at_eof());
  }
