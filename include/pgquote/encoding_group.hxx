/** Enum type for supporting encodings in pgquote
 *
 * Copyright (c) 2000-2025, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#if !defined(PGQUOTE_H_ENCODING_GROUP)
#  define PGQUOTE_H_ENCODING_GROUP

#  include <cstddef>
#  include <string_view>

#  include "pgquote/types.hxx"

namespace pgquote
{
/** The supported types of text encoding supported.
 *
 * See:
 * https://www.postgresql.org/docs/current/static/multibyte.html#CHARSET-TABLE
 *
 * This enum does not name the individual supported encodings, only the various
 * schemes for determining where in memory a character ends and a potential new
 * one may begin.  This is crucial for quoting: a byte in the text may look
 * like an ASCII quote or backslash, but is it really, or is it merely a byte
 * inside a multibyte character which just happens to have the same value?
 * Doubling such a byte would corrupt the character, and failing to double a
 * real quote would end the literal early.  That can pose a real security
 * risk.
 *
 * All supported encodings are supersets of ASCII: any byte with a value
 * between 0 and 127 inclusive at the beginning of a character is always a
 * simple, single-byte ASCII character.
 */
enum class encoding_group
{
  /// "ASCII-safe" encodings.
  /**
   * This includes all single-byte encodings (such as ASCII or ISO 8859-15)
   * but also all other encodings where there is no risk of ever confusing a
   * byte inside a multibyte character for an ASCII character.  UTF-8 is an
   * example of an ASCII-safe encoding, as are the EUC encodings.
   *
   * This property makes encodings very efficient to parse: to find the next
   * character (if any), just move to the next byte.
   */
  ascii_safe,

  /// Non-ASCII-safe: BIG5 for Traditional Chinese.
  big5,

  /// Non-ASCII-safe: GB18030 for Chinese (Traditional & Simplified).
  gb18030,

  /// Non-ASCII-safe: GBK for Simplified Chinese.
  gbk,

  /// Non-ASCII-safe: JOHAB for Korean.
  johab,

  /// Non-ASCII-safe: Japanese JIS and Shift JIS.
  sjis,

  /// Non-ASCII-safe: Unified Hangul Code, for Korean.
  uhc,
};


/// Human-readable name for an encoding group.
[[nodiscard]] PGQUOTE_LIBEXPORT std::string_view
name_group(encoding_group) noexcept;
} // namespace pgquote


namespace pgquote::internal
{
/// Function type: "find first occurrence of any of these ASCII characters."
/** This type of function takes a text buffer, and a location in that buffer;
 * it returns the location of the first occurrence within that string, from
 * the `start` position onwards, of any of a specific set of ASCII characters.
 *
 * The `start` offset marks the beginning of the current glyph.  So, if this
 * glyph matches, the function will return `start`
 *
 * If there is no match, returns the end of `haystack`.
 */
using char_finder_func =
  std::size_t(std::string_view haystack, std::size_t start, sl);


/// Function type: "find the glyph boundary after `start` in `buffer`."
using glyph_scanner_func =
  std::size_t(std::string_view buffer, std::size_t start, sl);
} // namespace pgquote::internal

#endif
