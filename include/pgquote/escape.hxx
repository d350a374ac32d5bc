/* Quoting of SQL string and bytea literals.
 *
 * DO NOT INCLUDE THIS FILE DIRECTLY; include pgquote/escape instead.
 *
 * Copyright (c) 2000-2025, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PGQUOTE_H_ESCAPE
#define PGQUOTE_H_ESCAPE

#if !defined(PGQUOTE_HEADER_PRE)
#  error "Include pgquote headers as <pgquote/header>, not <pgquote/header.hxx>."
#endif

#include <string>
#include <string_view>

#include "pgquote/encodings.hxx"
#include "pgquote/nul_guard.hxx"
#include "pgquote/value.hxx"


namespace pgquote
{
/// Server settings that affect how a literal must be written.
/** Normally you get these from @ref connection_context::options().  The
 * defaults describe a server we know nothing about, and produce literals
 * that any server will read correctly.
 */
/// First PostgreSQL version that outputs bytea in hex format: 9.0.
inline constexpr int default_bytea_hex_since{90000};


struct PGQUOTE_LIBEXPORT quoting_options
{
  /// Does the server treat backslashes in `'...'` strings as plain text?
  /** If this is false, or we don't know, a string containing backslashes
   * goes out in the `E'...'` form, which means the same thing regardless of
   * this setting.
   */
  bool standard_conforming_strings{false};

  /// Server version, in libpq's format (e.g. 160002), or 0 if unknown.
  int server_version{0};

  /// First server version to get bytea values in hex format.
  int bytea_hex_since{default_bytea_hex_since};
};


/// Formats for bytea data.
enum class bytea_format
{
  /// `\x` followed by two hex digits per byte.
  hex,
  /// The old escape format: printable ASCII as-is, everything else in octal.
  escape,
};


/// Pick the bytea format for a server of the given version.
/** Hex unless the server is known to be older than `hex_since`.
 */
[[nodiscard]] constexpr bytea_format
choose_bytea_format(
  int server_version, int hex_since = default_bytea_hex_since) noexcept
{
  if (server_version == 0 or server_version >= hex_since)
    return bytea_format::hex;
  else
    return bytea_format::escape;
}


/// Write binary data in bytea hex format.  Does not add quotes.
[[nodiscard]] PGQUOTE_LIBEXPORT std::string esc_bin_hex(bytes_view data);


/// Write binary data in the old bytea escape format.  Does not add quotes.
[[nodiscard]] PGQUOTE_LIBEXPORT std::string esc_bin_octal(bytes_view data);


/// A function which writes binary data in a bytea format.
using bytea_formatter = std::string (*)(bytes_view);


/// Get the function which writes bytea data in `format`.
[[nodiscard]] PGQUOTE_LIBEXPORT bytea_formatter
get_bytea_formatter(bytea_format format, sl loc = sl::current());


/// Decode bytea data, as the server would send it.
/** Accepts both formats.  Data starting with `\x` is hex; anything else is in
 * the escape format.
 *
 * @throw failure if the data is not valid in its format.
 */
[[nodiscard]] PGQUOTE_LIBEXPORT bytes
unesc_bin(std::string_view escaped, sl loc = sl::current());


/// Quote a string which is already in the client encoding.
/** @param data The bytes of the string, in `encoding`.
 * @param encoding The encoding of `data`.  It determines where characters
 * begin and end, so that a quote or backslash byte inside a multibyte
 * character is left alone.
 * @param options How the server treats backslashes.
 * @throw nul_byte_error if `data` contains a zero byte.
 * @throw encoding_error if `data` is not valid in `encoding`.
 */
[[nodiscard]] PGQUOTE_LIBEXPORT std::string quote_encoded(
  std::string_view data, encoding_descriptor const &encoding,
  quoting_options const &options = {}, sl loc = sl::current());


/// Quote binary data as a bytea literal, e.g. `'\x0102'::bytea`.
[[nodiscard]] PGQUOTE_LIBEXPORT std::string quote_bytea(
  bytes_view data, quoting_options const &options = {},
  sl loc = sl::current());


/// Quote any value as an SQL literal.
/** Text gets converted from UTF-8 to `encoding` first.  Binary values ignore
 * `encoding`.
 *
 * @throw encoding_error if text can't be represented in `encoding`.
 * @throw nul_byte_error if a text value contains a zero byte.
 */
[[nodiscard]] PGQUOTE_LIBEXPORT std::string quote_literal(
  value const &val, encoding_descriptor const &encoding,
  quoting_options const &options = {}, sl loc = sl::current());
} // namespace pgquote
#endif
