// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#ifndef CARAVEL_HTTP_HTTP_ERROR_
#define CARAVEL_HTTP_HTTP_ERROR_

#include "../fwd.hpp"
#include "../details/error_handling.hpp"
#include "enums.hpp"
#include <stdexcept>
namespace caravel {

// This is the exception type for malformed messages and for violations of
// size limits. I/O errors are not reported with this type.
class HTTP_Error
  : public ::std::runtime_error
  {
  private:
    HTTP_Error_Code m_code;
    URI_Error_Kind m_uri_kind;

  public:
    HTTP_Error(HTTP_Error_Code code, URI_Error_Kind uri_kind, const cow_string& msg);

  public:
    HTTP_Error(const HTTP_Error&) = default;
    HTTP_Error& operator=(const HTTP_Error&) & = default;
    virtual ~HTTP_Error();

    HTTP_Error_Code
    code()
      const noexcept
      { return this->m_code;  }

    // Gets the kind of a URI error. If `code()` is not `http_error_invalid_uri`,
    // `uri_error_none` is returned.
    URI_Error_Kind
    uri_kind()
      const noexcept
      { return this->m_uri_kind;  }
  };

// Gets the status code of a response to a request that has caused an error.
ROCKET_CONST
HTTP_Status
http_status_from_error(HTTP_Error_Code code)
  noexcept;

// Gets a short description of an error code, such as `invalid chunk`.
ROCKET_CONST
const char*
describe_http_error_code(HTTP_Error_Code code)
  noexcept;

HTTP_Error
do_create_http_error(HTTP_Error_Code code, URI_Error_Kind uri_kind,
                     const char* func, const char* file, uint32_t line,
                     const void* composer, message_composer_fn* composer_fn);

// Throws an `HTTP_Error` object. The `TEMPLATE` argument shall be a list of
// string literals in parentheses, like `CARAVEL_THROW`. As these errors are
// usually caused by remote peers, no stack backtrace is attached.
#define CARAVEL_HTTP_THROW_(CODE, URI_KIND, TEMPLATE, ...)  \
  (throw \
   ([&](const char* func_ce7d) -> ::caravel::HTTP_Error  \
      __attribute__((__noinline__))  \
    {  \
      auto c_Ru6q = [&](::rocket::tinyfmt& fmt_Ko0i)  \
        {  \
          using ::asteria::format;  \
          format(fmt_Ko0i, (::asteria::make_string_template TEMPLATE),  \
                  ##__VA_ARGS__);  \
        };  \
      \
      return ::caravel::do_create_http_error(\
          CODE, URI_KIND, func_ce7d, __FILE__, __LINE__,  \
          &c_Ru6q,  \
          [](::rocket::tinyfmt& fmt_Ko0i, const void* p_5Gae)  \
            { (* static_cast<const decltype(c_Ru6q)*>(p_5Gae)) (fmt_Ko0i);  });  \
    } (__func__)))

#define CARAVEL_HTTP_THROW(CODE, ...)  \
  CARAVEL_HTTP_THROW_(CODE, ::caravel::uri_error_none, __VA_ARGS__)

#define CARAVEL_URI_THROW(URI_KIND, ...)  \
  CARAVEL_HTTP_THROW_(::caravel::http_error_invalid_uri, URI_KIND, __VA_ARGS__)

}  // namespace caravel
#endif
