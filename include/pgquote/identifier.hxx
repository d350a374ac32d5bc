/* Quoting of SQL identifiers.
 *
 * DO NOT INCLUDE THIS FILE DIRECTLY; include pgquote/identifier instead.
 *
 * Copyright (c) 2000-2025, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PGQUOTE_H_IDENTIFIER
#define PGQUOTE_H_IDENTIFIER

#if !defined(PGQUOTE_HEADER_PRE)
#  error "Include pgquote headers as <pgquote/header>, not <pgquote/header.hxx>."
#endif

#include <initializer_list>
#include <span>
#include <string>
#include <string_view>

#include "pgquote/types.hxx"


namespace pgquote
{
/// Quote an identifier, e.g. a table or column name, for use in SQL.
/** Wraps `name` in double quotes, doubling any double quotes inside it.  The
 * result is always a quoted identifier, so the server will not fold it to
 * lower case, and it can be a keyword.
 *
 * @param name The identifier, in UTF-8.
 * @param context The connection the identifier is for.
 * @throw encoding_error if `name` is not valid UTF-8.
 * @throw nul_byte_error if `name` contains a zero byte.
 * @throw feature_not_supported if `name` contains non-ASCII characters but
 * `context` does not support those in identifiers.
 */
[[nodiscard]] PGQUOTE_LIBEXPORT std::string quote_identifier(
  std::string_view name, connection_context const &context,
  sl loc = sl::current());


/// Quote an identifier, assuming a server that accepts Unicode names.
[[nodiscard]] PGQUOTE_LIBEXPORT std::string
quote_identifier(std::string_view name, sl loc = sl::current());


/// Quote a dotted name, e.g. schema and table: `"schema"."table"`.
[[nodiscard]] PGQUOTE_LIBEXPORT std::string quote_table(
  std::span<std::string_view const> path, connection_context const &context,
  sl loc = sl::current());


/// Quote a dotted name, e.g. schema and table: `"schema"."table"`.
[[nodiscard]] inline std::string quote_table(
  std::initializer_list<std::string_view> path,
  connection_context const &context, sl loc = sl::current())
{
  return quote_table(
    std::span<std::string_view const>{std::begin(path), std::size(path)},
    context, loc);
}
} // namespace pgquote
#endif
