// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#include "utils.hpp"
#include "../caravel/http/http_bytes_body.hpp"
#include "../caravel/http/http_reader_body.hpp"
#include "../caravel/http/http_stream_body.hpp"
#include "../caravel/http/http_channel_body.hpp"
#include "../caravel/http/http_stream_reader.hpp"
#include "../caravel/base/memory_byte_stream.hpp"
#include <pthread.h>
#include <unistd.h>
using namespace ::caravel;

namespace {

struct Sender_Param
  {
    HTTP_Chunk_Sender* sender;
    int id;
  };

void*
do_sender_thread(void* param)
  {
    auto& sp = *static_cast<Sender_Param*>(param);
    for(int k = 0;  k != 100;  ++k)
      sp.sender->send(sformat("[$1:$2]", sp.id, k));
    sp.sender->close();
    return nullptr;
  }

}  // namespace

int
main()
  {
    cow_string chunk;

    // Empty
    HTTP_Empty_Body empty;
    CARAVEL_TEST_CHECK(*(empty.size_hint()) == 0);
    CARAVEL_TEST_CHECK(!empty.done());
    CARAVEL_TEST_CHECK(!empty.read_next(chunk));
    CARAVEL_TEST_CHECK(empty.done());

    // Bytes
    HTTP_Bytes_Body bytes(&"hello world");
    CARAVEL_TEST_CHECK(*(bytes.size_hint()) == 11);
    CARAVEL_TEST_CHECK(bytes.data() == "hello world");
    CARAVEL_TEST_CHECK(bytes.read_next(chunk));
    CARAVEL_TEST_CHECK(chunk == "hello world");
    CARAVEL_TEST_CHECK(!bytes.read_next(chunk));
    CARAVEL_TEST_CHECK(chunk.empty());
    CARAVEL_TEST_CHECK(!bytes.read_next(chunk));

    HTTP_Bytes_Body no_bytes(&"");
    CARAVEL_TEST_CHECK(!no_bytes.read_next(chunk));
    CARAVEL_TEST_CHECK(no_bytes.read_all_bytes() == "");

    // Readers
    auto src = new_sh<Memory_Byte_Source>(cow_string(10000, 'r'), 3000);
    HTTP_Reader_Body rbody(src);
    CARAVEL_TEST_CHECK(!rbody.size_hint());
    CARAVEL_TEST_CHECK(rbody.read_next(chunk));
    CARAVEL_TEST_CHECK(chunk.size() == 3000);
    CARAVEL_TEST_CHECK(rbody.read_all_bytes().size() == 7000);
    CARAVEL_TEST_CHECK(rbody.done());
    CARAVEL_TEST_CHECK_CATCH(HTTP_Reader_Body(nullptr));

    // Files
    char path[] = "/tmp/caravel_test_body_XXXXXX";
    int fd = ::mkstemp(path);
    CARAVEL_TEST_CHECK(fd >= 0);
    CARAVEL_TEST_CHECK(::write(fd, "file contents\n", 14) == 14);
    ::close(fd);

    cow_string fpath(path);
    HTTP_File_Body fbody(fpath);
    CARAVEL_TEST_CHECK(fbody.path() == path);
    CARAVEL_TEST_CHECK(*(fbody.size_hint()) == 14);
    CARAVEL_TEST_CHECK(fbody.read_all_bytes() == "file contents\n");
    ::unlink(path);
    CARAVEL_TEST_CHECK_CATCH(HTTP_File_Body(fpath));

    // Streams with fixed lengths
    Memory_Byte_Source src2(cow_string(5000, 's') + "tail", 700);
    HTTP_Stream_Reader reader2(src2);
    HTTP_Stream_Body sbody(reader2, 5000, 0);
    CARAVEL_TEST_CHECK(*(sbody.size_hint()) == 5000);
    CARAVEL_TEST_CHECK(sbody.read_all_bytes() == cow_string(5000, 's'));
    CARAVEL_TEST_CHECK(sbody.offset() == 5000);
    CARAVEL_TEST_CHECK(reader2.read_to_end() == "tail");

    Memory_Byte_Source src3(&"short");
    HTTP_Stream_Reader reader3(src3);
    HTTP_Stream_Body short_body(reader3, 10, 0);
    CARAVEL_TEST_CHECK_HTTP_ERROR(http_error_unexpected_eof, short_body.read_all_bytes());

    // Streams that extend to end of stream
    Memory_Byte_Source src4(&"until the connection closes", 5);
    HTTP_Stream_Reader reader4(src4);
    HTTP_Stream_Body ubody(reader4, nullopt, 100);
    CARAVEL_TEST_CHECK(!ubody.size_hint());
    CARAVEL_TEST_CHECK(ubody.read_all_bytes() == "until the connection closes");

    Memory_Byte_Source src5(cow_string(101, 'u'));
    HTTP_Stream_Reader reader5(src5);
    HTTP_Stream_Body big_body(reader5, nullopt, 100);
    CARAVEL_TEST_CHECK_HTTP_ERROR(http_error_payload_too_large, big_body.read_all_bytes());

    // Channels, with senders from multiple threads
    HTTP_Channel_Body channel;
    HTTP_Chunk_Sender s1 = channel.make_sender();
    HTTP_Chunk_Sender s2 = s1;
    CARAVEL_TEST_CHECK(s1.send(&""));

    Sender_Param p1 = { &s1, 1 };
    Sender_Param p2 = { &s2, 2 };
    ::pthread_t t1, t2;
    CARAVEL_TEST_CHECK(::pthread_create(&t1, nullptr, do_sender_thread, &p1) == 0);
    CARAVEL_TEST_CHECK(::pthread_create(&t2, nullptr, do_sender_thread, &p2) == 0);

    cow_string all = channel.read_all_bytes();
    CARAVEL_TEST_CHECK(channel.done());
    ::pthread_join(t1, nullptr);
    ::pthread_join(t2, nullptr);

    CARAVEL_TEST_CHECK(::strstr(all.c_str(), "[1:0]") != nullptr);
    CARAVEL_TEST_CHECK(::strstr(all.c_str(), "[1:99]") != nullptr);
    CARAVEL_TEST_CHECK(::strstr(all.c_str(), "[2:0]") != nullptr);
    CARAVEL_TEST_CHECK(::strstr(all.c_str(), "[2:99]") != nullptr);
    CARAVEL_TEST_CHECK(all.size() == 1180);

    // Closed senders can't send.
    CARAVEL_TEST_CHECK(!s1.send(&"late"));

    // Senders outlive their body.
    uniptr<HTTP_Channel_Body> chan2 = new_uni<HTTP_Channel_Body>();
    HTTP_Chunk_Sender s3 = chan2->make_sender();
    CARAVEL_TEST_CHECK(s3.send(&"queued"));
    chan2.reset();
    CARAVEL_TEST_CHECK(!s3.send(&"lost"));
  }
