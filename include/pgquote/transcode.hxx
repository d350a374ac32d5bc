/* Conversion of Unicode text to and from client encodings.
 *
 * DO NOT INCLUDE THIS FILE DIRECTLY; include pgquote/transcode instead.
 *
 * Copyright (c) 2000-2025, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PGQUOTE_H_TRANSCODE
#define PGQUOTE_H_TRANSCODE

#if !defined(PGQUOTE_HEADER_PRE)
#  error "Include pgquote headers as <pgquote/header>, not <pgquote/header.hxx>."
#endif

#include <string>
#include <string_view>

#include "pgquote/encodings.hxx"


namespace pgquote
{
/// Convert UTF-8 text to the given encoding.
/** @throw encoding_error if `text` is not valid UTF-8, or if it contains a
 * character that `encoding` can't represent.  The error's `position()` is the
 * byte offset of the offending character in `text`.
 * @throw unsupported_encoding if this system can't convert to `encoding` at
 * all.
 */
[[nodiscard]] PGQUOTE_LIBEXPORT std::string encode_text(
  std::string_view text, encoding_descriptor const &encoding,
  sl loc = sl::current());


/// Convert text in the given encoding to UTF-8.
/** @throw encoding_error if `data` is not valid in `encoding`.
 * @throw unsupported_encoding if this system can't convert from `encoding`.
 */
[[nodiscard]] PGQUOTE_LIBEXPORT std::string decode_text(
  std::string_view data, encoding_descriptor const &encoding,
  sl loc = sl::current());
} // namespace pgquote
#endif
