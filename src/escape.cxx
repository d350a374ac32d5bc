/** Implementation of string and bytea literal quoting.
 *
 * Copyright (c) 2000-2025, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#include "pgquote-source.hxx"

#include <type_traits>

#include "pgquote/internal/header-pre.hxx"

#include "pgquote/escape.hxx"
#include "pgquote/except.hxx"
#include "pgquote/internal/concat.hxx"
#include "pgquote/internal/encodings.hxx"
#include "pgquote/transcode.hxx"

#include "pgquote/internal/header-post.hxx"


using namespace std::literals;


namespace
{
/// Translate a number (must be between 0 and 16 exclusive) to a hex digit.
constexpr char hex_digit(int c) noexcept
{
  constexpr char hex[] = {'0', '1', '2', '3', '4', '5', '6', '7',
                          '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
  return hex[c];
}


/// Translate a hex digit to a nibble.  Return -1 if it's not a valid digit.
constexpr int nibble(int c) noexcept
{
  if (c >= '0' and c <= '9')
    return c - '0';
  else if (c >= 'a' and c <= 'f')
    return 10 + (c - 'a');
  else if (c >= 'A' and c <= 'F')
    return 10 + (c - 'A');
  else
    return -1;
}


constexpr bool is_octal_digit(char c) noexcept
{
  return c >= '0' and c <= '7';
}


/// Can the escape format represent this byte as itself?
constexpr bool is_printable(unsigned char c) noexcept
{
  return c >= 0x20 and c < 0x7f and c != '\\';
}


pgquote::bytes unesc_hex(std::string_view escaped, pgquote::sl loc)
{
  auto const in_size{std::size(escaped)};
  if ((in_size % 2) != 0)
    throw pgquote::failure{"Invalid escaped binary length.", loc};

  pgquote::bytes out;
  out.reserve((in_size - 2) / 2);
  for (std::size_t here{2}; here < in_size; here += 2)
  {
    int const hi{nibble(escaped[here])};
    if (hi < 0)
      throw pgquote::failure{"Invalid hex-escaped data.", loc};
    int const lo{nibble(escaped[here + 1])};
    if (lo < 0)
      throw pgquote::failure{"Invalid hex-escaped data.", loc};
    out.push_back(static_cast<std::byte>((hi << 4) | lo));
  }
  return out;
}


pgquote::bytes unesc_octal(std::string_view escaped, pgquote::sl loc)
{
  auto const in_size{std::size(escaped)};
  pgquote::bytes out;
  out.reserve(in_size);
  std::size_t here{0};
  while (here < in_size)
  {
    char const c{escaped[here]};
    if (c != '\\')
    {
      out.push_back(static_cast<std::byte>(c));
      ++here;
    }
    else if (here + 1 < in_size and escaped[here + 1] == '\\')
    {
      out.push_back(static_cast<std::byte>('\\'));
      here += 2;
    }
    else if (
      here + 3 < in_size and is_octal_digit(escaped[here + 1]) and
      is_octal_digit(escaped[here + 2]) and is_octal_digit(escaped[here + 3]))
    {
      int const val{
        ((escaped[here + 1] - '0') << 6) | ((escaped[here + 2] - '0') << 3) |
        (escaped[here + 3] - '0')};
      if (val > 0xff)
        throw pgquote::failure{
          pgquote::internal::concat(
            "Octal escape out of range at byte ", std::to_string(here), "."),
          loc};
      out.push_back(static_cast<std::byte>(val));
      here += 4;
    }
    else
    {
      throw pgquote::failure{
        pgquote::internal::concat(
          "Invalid escape sequence in binary data at byte ",
          std::to_string(here), "."),
        loc};
    }
  }
  return out;
}


/// Quote `data` as a string literal.  The caller has checked for zero bytes.
std::string quote_text(
  std::string_view data, pgquote::encoding_group group,
  pgquote::quoting_options const &options, pgquote::sl loc)
{
  auto const find{
    pgquote::internal::get_char_finder<'\'', '\\'>(group, loc)};
  bool const escape_backslashes{not options.standard_conforming_strings};
  bool saw_backslash{false};

  auto const sz{std::size(data)};
  std::string out;
  out.reserve(sz + 3);
  out.push_back('\'');
  std::size_t here{0};
  while (here < sz)
  {
    auto const next{find(data, here, loc)};
    out.append(data.substr(here, next - here));
    if (next >= sz)
      break;

    char const special{data[next]};
    if (special == '\'')
    {
      out.push_back('\'');
    }
    else if (escape_backslashes)
    {
      out.push_back('\\');
      saw_backslash = true;
    }
    out.push_back(special);
    here = next + 1;
  }
  out.push_back('\'');

  // With doubled backslashes, the literal only means what we want in the
  // E'...' form.  That form means the same regardless of server settings.
  if (saw_backslash)
    out.insert(0, 1, 'E');
  return out;
}
} // namespace


void pgquote::check_no_nul(std::string_view data, sl loc)
{
  auto const zero{data.find('\0')};
  if (zero != std::string_view::npos)
    throw nul_byte_error{zero, loc};
}


std::string pgquote::esc_bin_hex(bytes_view data)
{
  std::string buf;
  buf.reserve(2 + 2 * std::size(data));
  buf.push_back('\\');
  buf.push_back('x');
  for (auto const byte : data)
  {
    auto const uc{static_cast<unsigned char>(byte)};
    buf.push_back(hex_digit(uc >> 4));
    buf.push_back(hex_digit(uc & 0x0f));
  }
  return buf;
}


std::string pgquote::esc_bin_octal(bytes_view data)
{
  std::string buf;
  buf.reserve(std::size(data));
  for (auto const byte : data)
  {
    auto const uc{static_cast<unsigned char>(byte)};
    if (is_printable(uc))
    {
      buf.push_back(static_cast<char>(uc));
    }
    else if (uc == '\\')
    {
      buf.append("\\\\"sv);
    }
    else
    {
      buf.push_back('\\');
      buf.push_back(static_cast<char>('0' + ((uc >> 6) & 0x07)));
      buf.push_back(static_cast<char>('0' + ((uc >> 3) & 0x07)));
      buf.push_back(static_cast<char>('0' + (uc & 0x07)));
    }
  }
  return buf;
}


pgquote::bytea_formatter
pgquote::get_bytea_formatter(bytea_format format, sl loc)
{
  switch (format)
  {
  case bytea_format::hex: return esc_bin_hex;
  case bytea_format::escape: return esc_bin_octal;
  }
  throw internal_error{
    internal::concat(
      "Unexpected bytea format: ", std::to_string(static_cast<int>(format)),
      "."),
    loc};
}


pgquote::bytes pgquote::unesc_bin(std::string_view escaped, sl loc)
{
  if (escaped.starts_with("\\x"sv))
    return unesc_hex(escaped, loc);
  else
    return unesc_octal(escaped, loc);
}


std::string pgquote::quote_encoded(
  std::string_view data, encoding_descriptor const &encoding,
  quoting_options const &options, sl loc)
{
  check_no_nul(data, loc);
  return quote_text(data, encoding.group, options, loc);
}


std::string
pgquote::quote_bytea(bytes_view data, quoting_options const &options, sl loc)
{
  auto const format{
    choose_bytea_format(options.server_version, options.bytea_hex_since)};
  auto const payload{get_bytea_formatter(format, loc)(data)};
  // The payload is pure ASCII, so any encoding group will do.
  return internal::concat(
    quote_text(payload, encoding_group::ascii_safe, options, loc),
    "::bytea"sv);
}


std::string pgquote::quote_literal(
  value const &val, encoding_descriptor const &encoding,
  quoting_options const &options, sl loc)
{
  return std::visit(
    [&](auto const &v) -> std::string {
      using T = std::remove_cvref_t<decltype(v)>;
      if constexpr (std::is_same_v<T, text>)
      {
        // Check before transcoding, so the position refers to the input.
        check_no_nul(v.utf8, loc);
        return quote_encoded(
          encode_text(v.utf8, encoding, loc), encoding, options, loc);
      }
      else if constexpr (std::is_same_v<T, encoded_text>)
        return quote_encoded(v.data, encoding, options, loc);
      else
        return quote_bytea(v.data, options, loc);
    },
    val);
}
