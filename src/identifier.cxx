/** Implementation of identifier quoting.
 *
 * Copyright (c) 2000-2025, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#include "pgquote-source.hxx"

#include "pgquote/internal/header-pre.hxx"

#include "pgquote/connection_context.hxx"
#include "pgquote/except.hxx"
#include "pgquote/identifier.hxx"
#include "pgquote/internal/concat.hxx"
#include "pgquote/internal/encodings.hxx"

#include "pgquote/internal/header-post.hxx"


namespace
{
std::string
quote_name(std::string_view name, bool allow_unicode, pgquote::sl loc)
{
  pgquote::check_no_nul(name, loc);

  auto const sz{std::size(name)};
  std::string out;
  out.reserve(sz + 2);
  out.push_back('"');
  std::size_t here{0};
  while (here < sz)
  {
    auto const next{pgquote::internal::next_utf8_glyph(name, here, loc)};
    if (next - here > 1)
    {
      if (not allow_unicode)
        throw pgquote::feature_not_supported{
          pgquote::internal::concat(
            "This server does not support non-ASCII identifiers, such as ",
            name, "."),
          loc};
      out.append(name.substr(here, next - here));
    }
    else
    {
      if (name[here] == '"')
        out.push_back('"');
      out.push_back(name[here]);
    }
    here = next;
  }
  out.push_back('"');
  return out;
}
} // namespace


std::string pgquote::quote_identifier(
  std::string_view name, connection_context const &context, sl loc)
{
  return quote_name(name, context.unicode_identifiers(), loc);
}


std::string pgquote::quote_identifier(std::string_view name, sl loc)
{
  return quote_name(name, true, loc);
}


std::string pgquote::quote_table(
  std::span<std::string_view const> path, connection_context const &context,
  sl loc)
{
  if (std::empty(path))
    throw usage_error{"Quoting an empty table path.", loc};
  bool const unicode{context.unicode_identifiers()};
  std::string out;
  for (auto const &part : path)
  {
    if (not std::empty(out))
      out.push_back('.');
    out.append(quote_name(part, unicode, loc));
  }
  return out;
}
