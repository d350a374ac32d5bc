/* Registry of the client encodings that pgquote knows how to quote for.
 *
 * DO NOT INCLUDE THIS FILE DIRECTLY; include pgquote/encodings instead.
 *
 * Copyright (c) 2000-2025, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PGQUOTE_H_ENCODINGS
#define PGQUOTE_H_ENCODINGS

#if !defined(PGQUOTE_HEADER_PRE)
#  error "Include pgquote headers as <pgquote/header>, not <pgquote/header.hxx>."
#endif

#include <span>
#include <string>
#include <string_view>

#include "pgquote/encoding_group.hxx"
#include "pgquote/types.hxx"


namespace pgquote
{
/// Everything pgquote needs to know about one client encoding.
/** You don't create these.  Get them from @ref lookup_encoding, which hands
 * out references into a constant table.  That means you can compare
 * descriptors by address.
 */
struct PGQUOTE_LIBEXPORT encoding_descriptor
{
  /// PostgreSQL's canonical name for the encoding, e.g. "UTF8" or "LATIN1".
  std::string_view name;

  /// The normalised form of `name`, i.e. "EUCJP" for "EUC_JP".
  std::string_view key;

  /// Scheme for finding character boundaries in this encoding.
  encoding_group group;

  /// What iconv calls this encoding.
  std::string_view charset;

  /// Is this encoding a strict superset of ASCII at the byte level?
  /** If so, any byte below 0x80 is an ASCII character, and quoting can look
   * at each byte in isolation.  Otherwise, it has to step through the text
   * character by character.
   */
  [[nodiscard]] constexpr bool ascii_safe() const noexcept
  {
    return group == encoding_group::ascii_safe;
  }
};


/// Reduce an encoding name to the form we use for lookups.
/** Drops all characters except ASCII letters and digits, and converts letters
 * to upper case.  So "utf-8", "utf_8", "Utf8" all come out as "UTF8".
 *
 * This does not resolve aliases.  "UNICODE" stays "UNICODE".
 */
[[nodiscard]] PGQUOTE_LIBEXPORT std::string
normalize_encoding_name(std::string_view name);


/// Find an encoding by name, or alias.
/** Accepts PostgreSQL's names, including its historical aliases such as
 * "UNICODE" or "KOI8", and ISO or Windows style names such as "ISO-8859-15"
 * or "windows-1252".  Case and punctuation do not matter.
 *
 * @throw unsupported_encoding if the name is not one we know.
 */
[[nodiscard]] PGQUOTE_LIBEXPORT encoding_descriptor const &
lookup_encoding(std::string_view name, sl loc = sl::current());


/// The encoding to use when nobody told us anything better: LATIN1.
[[nodiscard]] PGQUOTE_LIBEXPORT encoding_descriptor const &
default_encoding() noexcept;


/// All encodings in the registry.
[[nodiscard]] PGQUOTE_LIBEXPORT std::span<encoding_descriptor const>
known_encodings() noexcept;
} // namespace pgquote
#endif
