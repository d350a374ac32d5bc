/* The kinds of value that pgquote can quote.
 *
 * DO NOT INCLUDE THIS FILE DIRECTLY; include pgquote/escape instead.
 *
 * Copyright (c) 2000-2025, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PGQUOTE_H_VALUE
#define PGQUOTE_H_VALUE

#if !defined(PGQUOTE_HEADER_PRE)
#  error "Include pgquote headers as <pgquote/header>, not <pgquote/header.hxx>."
#endif

#include <string>
#include <variant>

#include "pgquote/types.hxx"


namespace pgquote
{
/// Unicode text, in UTF-8.  Gets converted to the client encoding.
struct text
{
  std::string utf8;
};


/// Text that is already in the client encoding.  Quoted byte for byte.
struct encoded_text
{
  std::string data;
};


/// Raw binary data.  Quoted as a `bytea` literal.
struct binary
{
  bytes data;
};


/// Any value that pgquote can turn into an SQL literal.
using value = std::variant<text, encoded_text, binary>;
} // namespace pgquote
#endif
