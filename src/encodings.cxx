/** Implementation of string encodings support
 *
 * Copyright (c) 2000-2025, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#include "pgquote-source.hxx"

#include <algorithm>
#include <array>
#include <utility>

#include "pgquote/internal/header-pre.hxx"

#include "pgquote/encodings.hxx"
#include "pgquote/except.hxx"
#include "pgquote/internal/concat.hxx"

#include "pgquote/internal/header-post.hxx"


using namespace std::literals;


namespace
{
using pgquote::encoding_descriptor;
using pgquote::encoding_group;

constexpr auto ascii_safe{encoding_group::ascii_safe};


// C++23: Use a std::flat_map?
/// The registry itself.
/** The second field is the normalised name.  Keep it in sync with the first;
 * the DEBUG build checks that.
 */
constexpr std::array<encoding_descriptor, 41u> registry{{
  {"SQL_ASCII"sv, "SQLASCII"sv, ascii_safe, "ASCII"sv},
  {"UTF8"sv, "UTF8"sv, ascii_safe, "UTF-8"sv},
  {"LATIN1"sv, "LATIN1"sv, ascii_safe, "ISO-8859-1"sv},
  {"LATIN2"sv, "LATIN2"sv, ascii_safe, "ISO-8859-2"sv},
  {"LATIN3"sv, "LATIN3"sv, ascii_safe, "ISO-8859-3"sv},
  {"LATIN4"sv, "LATIN4"sv, ascii_safe, "ISO-8859-4"sv},
  {"LATIN5"sv, "LATIN5"sv, ascii_safe, "ISO-8859-9"sv},
  {"LATIN6"sv, "LATIN6"sv, ascii_safe, "ISO-8859-10"sv},
  {"LATIN7"sv, "LATIN7"sv, ascii_safe, "ISO-8859-13"sv},
  {"LATIN8"sv, "LATIN8"sv, ascii_safe, "ISO-8859-14"sv},
  {"LATIN9"sv, "LATIN9"sv, ascii_safe, "ISO-8859-15"sv},
  {"LATIN10"sv, "LATIN10"sv, ascii_safe, "ISO-8859-16"sv},
  {"ISO_8859_5"sv, "ISO88595"sv, ascii_safe, "ISO-8859-5"sv},
  {"ISO_8859_6"sv, "ISO88596"sv, ascii_safe, "ISO-8859-6"sv},
  {"ISO_8859_7"sv, "ISO88597"sv, ascii_safe, "ISO-8859-7"sv},
  {"ISO_8859_8"sv, "ISO88598"sv, ascii_safe, "ISO-8859-8"sv},
  {"KOI8R"sv, "KOI8R"sv, ascii_safe, "KOI8-R"sv},
  {"KOI8U"sv, "KOI8U"sv, ascii_safe, "KOI8-U"sv},
  {"WIN866"sv, "WIN866"sv, ascii_safe, "CP866"sv},
  {"WIN874"sv, "WIN874"sv, ascii_safe, "CP874"sv},
  {"WIN1250"sv, "WIN1250"sv, ascii_safe, "CP1250"sv},
  {"WIN1251"sv, "WIN1251"sv, ascii_safe, "CP1251"sv},
  {"WIN1252"sv, "WIN1252"sv, ascii_safe, "CP1252"sv},
  {"WIN1253"sv, "WIN1253"sv, ascii_safe, "CP1253"sv},
  {"WIN1254"sv, "WIN1254"sv, ascii_safe, "CP1254"sv},
  {"WIN1255"sv, "WIN1255"sv, ascii_safe, "CP1255"sv},
  {"WIN1256"sv, "WIN1256"sv, ascii_safe, "CP1256"sv},
  {"WIN1257"sv, "WIN1257"sv, ascii_safe, "CP1257"sv},
  {"WIN1258"sv, "WIN1258"sv, ascii_safe, "CP1258"sv},
  // All the EUC encodings are ASCII-safe.
  {"EUC_CN"sv, "EUCCN"sv, ascii_safe, "EUC-CN"sv},
  {"EUC_JP"sv, "EUCJP"sv, ascii_safe, "EUC-JP"sv},
  {"EUC_JIS_2004"sv, "EUCJIS2004"sv, ascii_safe, "EUC-JISX0213"sv},
  {"EUC_KR"sv, "EUCKR"sv, ascii_safe, "EUC-KR"sv},
  {"EUC_TW"sv, "EUCTW"sv, ascii_safe, "EUC-TW"sv},
  {"BIG5"sv, "BIG5"sv, encoding_group::big5, "BIG5"sv},
  {"GBK"sv, "GBK"sv, encoding_group::gbk, "GBK"sv},
  {"GB18030"sv, "GB18030"sv, encoding_group::gb18030, "GB18030"sv},
  {"JOHAB"sv, "JOHAB"sv, encoding_group::johab, "JOHAB"sv},
  {"SJIS"sv, "SJIS"sv, encoding_group::sjis, "CP932"sv},
  {"SHIFT_JIS_2004"sv, "SHIFTJIS2004"sv, encoding_group::sjis,
   "SHIFT_JISX0213"sv},
  {"UHC"sv, "UHC"sv, encoding_group::uhc, "CP949"sv},
}};


/// Alternative names, normalised, mapped to the normalised canonical name.
/** Most of these are PostgreSQL's own historical aliases.  The ISO ones let
 * people use the names they know from other software.
 */
constexpr std::array<std::pair<std::string_view, std::string_view>, 24u>
  aliases{{
    {"UNICODE"sv, "UTF8"sv},
    {"KOI8"sv, "KOI8R"sv},
    {"WIN"sv, "WIN1251"sv},
    {"ALT"sv, "WIN866"sv},
    {"ABC"sv, "WIN1258"sv},
    {"TCVN"sv, "WIN1258"sv},
    {"TCVN5712"sv, "WIN1258"sv},
    {"VSCII"sv, "WIN1258"sv},
    {"SHIFTJIS"sv, "SJIS"sv},
    {"MSKANJI"sv, "SJIS"sv},
    {"WIN932"sv, "SJIS"sv},
    {"WIN936"sv, "GBK"sv},
    {"WIN949"sv, "UHC"sv},
    {"WIN950"sv, "BIG5"sv},
    {"ISO88591"sv, "LATIN1"sv},
    {"ISO88592"sv, "LATIN2"sv},
    {"ISO88593"sv, "LATIN3"sv},
    {"ISO88594"sv, "LATIN4"sv},
    {"ISO88599"sv, "LATIN5"sv},
    {"ISO885910"sv, "LATIN6"sv},
    {"ISO885913"sv, "LATIN7"sv},
    {"ISO885914"sv, "LATIN8"sv},
    {"ISO885915"sv, "LATIN9"sv},
    {"ISO885916"sv, "LATIN10"sv},
  }};


constexpr bool is_alnum(char c) noexcept
{
  return (c >= '0' and c <= '9') or (c >= 'a' and c <= 'z') or
         (c >= 'A' and c <= 'Z');
}


constexpr char to_upper(char c) noexcept
{
  return (c >= 'a' and c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
}


/// Find a registry entry by normalised name.  Returns nullptr if none.
encoding_descriptor const *find_key(std::string_view key) noexcept
{
  auto const here{std::find_if(
    std::begin(registry), std::end(registry),
    [key](encoding_descriptor const &d) { return d.key == key; })};
  return (here == std::end(registry)) ? nullptr : &*here;
}


/// Resolve an alias.  Returns the key itself if it is not a known alias.
std::string_view resolve_alias(std::string_view key) noexcept
{
  for (auto const &[alias, target] : aliases)
    if (alias == key)
      return target;
  return key;
}


#if defined(DEBUG)
constexpr bool keys_are_normalised() noexcept
{
  for (auto const &d : registry)
  {
    std::size_t k{0};
    for (char const c : d.name)
    {
      if (not is_alnum(c))
        continue;
      if (k >= std::size(d.key) or d.key[k] != to_upper(c))
        return false;
      ++k;
    }
    if (k != std::size(d.key))
      return false;
  }
  return true;
}
static_assert(keys_are_normalised());
#endif // DEBUG
} // namespace


std::string_view pgquote::name_group(encoding_group group) noexcept
{
  switch (group)
  {
  case encoding_group::ascii_safe: return "ascii_safe"sv;
  case encoding_group::big5: return "big5"sv;
  case encoding_group::gb18030: return "gb18030"sv;
  case encoding_group::gbk: return "gbk"sv;
  case encoding_group::johab: return "johab"sv;
  case encoding_group::sjis: return "sjis"sv;
  case encoding_group::uhc: return "uhc"sv;
  }
  return "unknown"sv;
}


std::string pgquote::normalize_encoding_name(std::string_view name)
{
  std::string out;
  out.reserve(std::size(name));
  for (char const c : name)
    if (is_alnum(c))
      out.push_back(to_upper(c));
  return out;
}


pgquote::encoding_descriptor const &
pgquote::lookup_encoding(std::string_view name, sl loc)
{
  auto const key{normalize_encoding_name(name)};
  if (auto const direct{find_key(key)}; direct != nullptr)
    return *direct;

  std::string_view target{resolve_alias(key)};

  // "WINDOWS1252" and friends are just long-hand for "WIN1252".
  std::string shortened;
  if (target.starts_with("WINDOWS"sv) and std::size(target) > 7)
  {
    shortened = internal::concat("WIN"sv, target.substr(7));
    target = resolve_alias(shortened);
  }

  if (auto const found{find_key(target)}; found != nullptr)
    return *found;

  throw unsupported_encoding{
    internal::concat("Unrecognized encoding: '", name, "'."),
    std::string{name}, loc};
}


pgquote::encoding_descriptor const &pgquote::default_encoding() noexcept
{
  // Must match the LATIN1 entry.
  return registry[2];
}


std::span<pgquote::encoding_descriptor const>
pgquote::known_encodings() noexcept
{
  return registry;
}
