/* Minimal reimplementation of the server's rules for reading literals.
 *
 * This lets the tests check that a quoted value means what it should, without
 * needing a database.
 */

#include "helpers.hxx"
#include "literal_parser.hxx"

using namespace std::literals;

namespace
{
[[noreturn]] void
bad_literal(std::string_view literal, std::string const &problem)
{
  throw pgquote::test::test_failure{
    "Malformed literal " + pgquote::test::describe_text(literal) + ": " +
    problem};
}


constexpr bool is_octal(char c) noexcept
{
  return c >= '0' and c <= '7';
}


constexpr int hex_value(char c) noexcept
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


/// Process one backslash escape in an `E'...'` constant.
/** Returns the position just past the escape.
 */
std::size_t read_escape(
  std::string_view literal, std::size_t here, std::string &out)
{
  // `here` points at the character following the backslash.
  if (here >= std::size(literal))
    bad_literal(literal, "backslash at end");
  char const c{literal[here]};
  switch (c)
  {
  case 'b': out.push_back('\b'); return here + 1;
  case 'f': out.push_back('\f'); return here + 1;
  case 'n': out.push_back('\n'); return here + 1;
  case 'r': out.push_back('\r'); return here + 1;
  case 't': out.push_back('\t'); return here + 1;
  case 'u':
  case 'U': bad_literal(literal, "Unicode escapes are not supported here");
  default: break;
  }

  if (is_octal(c))
  {
    int val{0};
    std::size_t end{here};
    while (end < std::size(literal) and end < here + 3 and
           is_octal(literal[end]))
      val = (val << 3) | (literal[end++] - '0');
    out.push_back(static_cast<char>(val & 0xff));
    return end;
  }

  if (c == 'x' and here + 1 < std::size(literal) and
      hex_value(literal[here + 1]) >= 0)
  {
    int val{hex_value(literal[here + 1])};
    std::size_t end{here + 2};
    if (end < std::size(literal) and hex_value(literal[end]) >= 0)
      val = (val << 4) | hex_value(literal[end++]);
    out.push_back(static_cast<char>(val));
    return end;
  }

  // Anything else stands for itself, including backslash and quote.
  out.push_back(c);
  return here + 1;
}
} // namespace


std::string pgquote::test::parse_string_literal(
  std::string_view literal, bool standard_conforming_strings)
{
  std::size_t here{0};
  bool escapes{not standard_conforming_strings};
  if (literal.starts_with("E'"sv) or literal.starts_with("e'"sv))
  {
    escapes = true;
    ++here;
  }
  if (here >= std::size(literal) or literal[here] != '\'')
    bad_literal(literal, "no opening quote");
  ++here;

  std::string out;
  for (;;)
  {
    if (here >= std::size(literal))
      bad_literal(literal, "no closing quote");
    char const c{literal[here]};
    if (c == '\'')
    {
      if (here + 1 < std::size(literal) and literal[here + 1] == '\'')
      {
        out.push_back('\'');
        here += 2;
      }
      else
      {
        ++here;
        break;
      }
    }
    else if (c == '\\' and escapes)
    {
      here = read_escape(literal, here + 1, out);
    }
    else
    {
      out.push_back(c);
      ++here;
    }
  }

  if (here != std::size(literal))
    bad_literal(literal, "trailing text after closing quote");
  return out;
}


pgquote::bytes pgquote::test::parse_bytea_literal(
  std::string_view literal, bool standard_conforming_strings)
{
  constexpr auto suffix{"::bytea"sv};
  if (not literal.ends_with(suffix))
    bad_literal(literal, "no ::bytea cast");
  auto const text{parse_string_literal(
    literal.substr(0, std::size(literal) - std::size(suffix)),
    standard_conforming_strings)};

  bytes out;
  if (text.starts_with("\\x"sv))
  {
    std::size_t here{2};
    while (here < std::size(text))
    {
      if (text[here] == ' ' or text[here] == '\n' or text[here] == '\t')
      {
        ++here;
        continue;
      }
      if (here + 1 >= std::size(text))
        bad_literal(literal, "odd number of hex digits");
      int const hi{hex_value(text[here])}, lo{hex_value(text[here + 1])};
      if (hi < 0 or lo < 0)
        bad_literal(literal, "invalid hex digit");
      out.push_back(static_cast<std::byte>((hi << 4) | lo));
      here += 2;
    }
    return out;
  }

  std::size_t here{0};
  while (here < std::size(text))
  {
    if (text[here] != '\\')
    {
      out.push_back(static_cast<std::byte>(text[here]));
      ++here;
    }
    else if (here + 1 < std::size(text) and text[here + 1] == '\\')
    {
      out.push_back(static_cast<std::byte>('\\'));
      here += 2;
    }
    else if (
      here + 3 < std::size(text) and text[here + 1] >= '0' and
      text[here + 1] <= '3' and is_octal(text[here + 2]) and
      is_octal(text[here + 3]))
    {
      out.push_back(static_cast<std::byte>(
        ((text[here + 1] - '0') << 6) | ((text[here + 2] - '0') << 3) |
        (text[here + 3] - '0')));
      here += 4;
    }
    else
    {
      bad_literal(literal, "invalid bytea escape");
    }
  }
  return out;
}
