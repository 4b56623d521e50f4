// This file is part of Caravel.
// Copyright (C) 2024-2026, Caravel contributors. All wrongs reserved.

#ifndef CARAVEL_HTTP_URL_ENCODING_
#define CARAVEL_HTTP_URL_ENCODING_

#include "../fwd.hpp"
namespace caravel {

// Encodes a URI component. Letters, digits, `-`, `_`, `.` and `~` are copied
// verbatim, and all the other bytes are written as `%XX`.
void
url_encode(cow_string& out, chars_view text);

cow_string
url_encode(chars_view text);

// Decodes a URI component. `%XX` sequences are converted to bytes, and `+` is
// converted to a space. If a percent sign is not followed by two hexadecimal
// digits, an `HTTP_Error` with `uri_error_decode` is thrown.
void
url_decode(cow_string& out, chars_view text);

cow_string
url_decode(chars_view text);

}  // namespace caravel
#endif
