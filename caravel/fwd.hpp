// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#ifndef CARAVEL_FWD_
#define CARAVEL_FWD_

#include "version.h"
#include <rocket/atomic.hpp>
#include <rocket/mutex.hpp>
#include <rocket/condition_variable.hpp>
#include <rocket/tinyfmt_str.hpp>
#include <rocket/unique_posix_fd.hpp>
#include <rocket/shared_function.hpp>
#include <asteria/value.hpp>
#include <asteria/utils.hpp>
#include <memory>
#include <chrono>
#include <string>

// Evaluates a system call, retrying it while it fails with `EINTR`.
#define CARAVEL_SYSCALL_LOOP(...)  \
    __extension__  \
      ({  \
        auto wdLAlUiJ = (__VA_ARGS__);  \
        while(ROCKET_UNEXPECT(wdLAlUiJ < 0) && (errno == EINTR))  \
          wdLAlUiJ = (__VA_ARGS__);  \
        wdLAlUiJ;  \
      })

namespace caravel {
namespace fwd {

using ::std::nullptr_t;
using ::std::uint8_t;
using ::std::uint16_t;
using ::std::uint32_t;
using ::std::int64_t;
using ::std::uint64_t;
using ::std::ptrdiff_t;
using ::std::size_t;
using ::std::exception;
using ::std::type_info;
using ::std::pair;

using ::std::chrono::system_clock;
using seconds = ::std::chrono::duration<int64_t>;
using unix_time = ::std::chrono::time_point<system_clock, seconds>;
using ::std::chrono::time_point_cast;

using ::rocket::atomic_relaxed;
using plain_mutex = ::rocket::mutex;
using ::rocket::condition_variable;
using ::rocket::cow_vector;
using ::rocket::cow_string;
using ::rocket::phcow_string;
using ::rocket::linear_buffer;
using ::rocket::tinyfmt;
using ::rocket::tinyfmt_str;
using ::rocket::unique_posix_fd;
using ::rocket::shared_function;

template<typename... Ts> using cow_bivector = cow_vector<pair<Ts...>>;
template<typename... Ts> using opt = ::rocket::optional<Ts...>;
template<typename... Ts> using uniptr = ::std::unique_ptr<Ts...>;
template<typename... Ts> using shptr = ::std::shared_ptr<Ts...>;

using ::rocket::begin;
using ::rocket::end;
using ::rocket::swap;
using ::rocket::move;
using ::rocket::forward;
using ::rocket::size;
using ::rocket::min;
using ::rocket::clamp;
using ::rocket::is_any_of;
using ::rocket::is_none_of;
using ::rocket::nullopt;
using ::rocket::xmemrpcpy;

using ::asteria::format;
using ::asteria::sformat;

template<typename xValue, typename... xArgs>
ROCKET_ALWAYS_INLINE
uniptr<xValue>
new_uni(xArgs&&... args)
  {
    return ::std::make_unique<xValue>(forward<xArgs>(args)...);
  }

template<typename xValue, typename... xArgs>
ROCKET_ALWAYS_INLINE
shptr<xValue>
new_sh(xArgs&&... args)
  {
    return ::std::make_shared<xValue>(forward<xArgs>(args)...);
  }

struct chars_view
  {
    const char* p;
    size_t n;

    constexpr
    chars_view(nullptr_t = nullptr) noexcept
      : p(nullptr), n(0U)  { }

    constexpr
    chars_view(const char* xp, size_t xn) noexcept
      : p(xp), n(xn)  { }

    constexpr
    chars_view(const char* xs) noexcept
      : p(xs), n(xs ? ::rocket::xstrlen(xs) : 0U)  { }

    template<typename traitsT, typename allocT>
    constexpr
    chars_view(const ::std::basic_string<char, traitsT, allocT>& rs) noexcept
      : p(rs.data()), n(rs.size())  { }

    constexpr
    chars_view(const ::rocket::shallow_string rs) noexcept
      : p(rs.data()), n(rs.size())  { }

    template<size_t N>
    constexpr
    chars_view(const char (*ps)[N]) noexcept
      : p(*ps), n((ROCKET_ASSERT(*(*ps + N - 1) == '\0'), N - 1))  { }

    template<typename allocT>
    constexpr
    chars_view(const ::rocket::basic_cow_string<char, allocT>& rs) noexcept
      : p(rs.data()), n(rs.size())  { }

    template<typename allocT>
    constexpr
    chars_view(const ::rocket::basic_tinyfmt_str<char, allocT>& rs) noexcept
      : p(rs.data()), n(rs.size())  { }

    template<typename allocT>
    constexpr
    chars_view(const ::rocket::basic_linear_buffer<char, allocT>& rs) noexcept
      : p(rs.data()), n(rs.size())  { }

    // Returns the first character. Depending on the nature of the source string,
    // reading one character past the end might be allowed, so we don't check
    // whether `n` equals zero here.
    constexpr
    char
    operator*() const noexcept
      { return *(this->p);  }

    constexpr
    char
    operator[](size_t index) const noexcept
      { return ROCKET_ASSERT(index <= this->n), *(this->p + index);  }

    // Moves the view to the right.
    constexpr
    chars_view
    operator>>(size_t dist) const noexcept
      { return chars_view(this->p + dist, this->n - dist);  }

    constexpr
    chars_view&
    operator>>=(size_t dist) & noexcept
      { return *this = *this >> dist;  }

    // Makes a copy.
    explicit operator cow_string() const
      { return cow_string(this->p, this->n);  }
  };

inline
tinyfmt&
operator<<(tinyfmt& fmt, chars_view data)
  { return fmt.putn(data.p, data.n);  }

constexpr
bool
operator==(chars_view lhs, chars_view rhs) noexcept
  { return (lhs.n == rhs.n) && (::rocket::xmemcmp(lhs.p, rhs.p, lhs.n) == 0);  }

constexpr
bool
operator==(chars_view lhs, const char* rhs) noexcept
  { return (lhs.n == ::rocket::xstrlen(rhs)) && (::rocket::xmemcmp(lhs.p, rhs, lhs.n) == 0);  }

constexpr
bool
operator==(const char* lhs, chars_view rhs) noexcept
  { return (::rocket::xstrlen(lhs) == rhs.n) && (::rocket::xmemcmp(lhs, rhs.p, rhs.n) == 0);  }

constexpr
bool
operator!=(chars_view lhs, chars_view rhs) noexcept
  { return (lhs.n != rhs.n) || (::rocket::xmemcmp(lhs.p, rhs.p, lhs.n) != 0);  }

constexpr
bool
operator!=(chars_view lhs, const char* rhs) noexcept
  { return (lhs.n != ::rocket::xstrlen(rhs)) || (::rocket::xmemcmp(lhs.p, rhs, lhs.n) != 0);  }

constexpr
bool
operator!=(const char* lhs, chars_view rhs) noexcept
  { return (::rocket::xstrlen(lhs) != rhs.n) || (::rocket::xmemcmp(lhs, rhs.p, rhs.n) != 0);  }

}  // namespace fwd
using namespace fwd;

// Base types
class Config_File;
class Abstract_Byte_Source;
class Abstract_Byte_Sink;
class Memory_Byte_Source;
class Memory_Byte_Sink;
class POSIX_FD_Stream;

// URI types
enum URI_Error_Kind : uint8_t;
class URI_Scheme;
class URI_Authority;
class URI_Query_Value;
class URI_Query_Map;
class URI_Path_Query;
class URI;

// HTTP types
enum HTTP_Method : uint64_t;
enum HTTP_Status : uint16_t;
enum HTTP_Version : uint16_t;
enum HTTP_Error_Code : uint8_t;
class HTTP_Error;
class HTTP_DateTime;
class HTTP_Field_Name;
class HTTP_Header_Value;
class HTTP_Header_Entry;
class HTTP_Header_Values;
class HTTP_Headers;
class HTTP_Extensions;
struct HTTP_Connection_Info;
struct HTTP_Request_Parts;
struct HTTP_Response_Parts;
struct HTTP_Request;
struct HTTP_Response;
class HTTP_Stream_Reader;
class Abstract_HTTP_Body;
class HTTP_Empty_Body;
class HTTP_Bytes_Body;
class HTTP_Reader_Body;
class HTTP_File_Body;
class HTTP_Stream_Body;
class HTTP_Chunked_Body;
class HTTP_Channel_Body;
class HTTP_Chunk_Sender;
class HTTP_Chunked_Encoder;
class HTTP_Request_Parser;
class HTTP_Response_Parser;
class HTTP_Message_Writer;
struct HTTP_Server_Config;
class HTTP_Server_Connection;

// Singletons
extern const cow_string empty_cow_string;

extern atomic_relaxed<int> exit_signal;
extern class Main_Config& main_config;
extern class Logger& logger;

}  // namespace caravel
#endif
