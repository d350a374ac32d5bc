/* Rejection of zero bytes in string values.
 *
 * DO NOT INCLUDE THIS FILE DIRECTLY; include pgquote/escape instead.
 *
 * Copyright (c) 2000-2025, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PGQUOTE_H_NUL_GUARD
#define PGQUOTE_H_NUL_GUARD

#if !defined(PGQUOTE_HEADER_PRE)
#  error "Include pgquote headers as <pgquote/header>, not <pgquote/header.hxx>."
#endif

#include <string_view>

#include "pgquote/types.hxx"


namespace pgquote
{
/// Error message for a string containing a zero byte.
/** The server terminates strings at the first zero byte, so it could never
 * receive such a value intact.
 */
inline constexpr std::string_view nul_message{
  "A string literal cannot contain NUL (0x00) characters."};


/// Throw @ref nul_byte_error if `data` contains a zero byte.
/** Works on the bytes as they will go to the server, i.e. after transcoding.
 * No multibyte encoding that PostgreSQL supports uses a zero byte inside a
 * character, so a plain byte search is enough.
 */
PGQUOTE_LIBEXPORT void
check_no_nul(std::string_view data, sl loc = sl::current());
} // namespace pgquote
#endif
