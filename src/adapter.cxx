/** Implementation of the pgquote::adapter class.
 *
 * Copyright (c) 2000-2025, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#include "pgquote-source.hxx"

#include <utility>

#include "pgquote/internal/header-pre.hxx"

#include "pgquote/adapter.hxx"
#include "pgquote/except.hxx"
#include "pgquote/internal/concat.hxx"

#include "pgquote/internal/header-post.hxx"


pgquote::adapter::adapter(value val) :
        m_value{std::move(val)}, m_encoding{&default_encoding()}
{}


pgquote::adapter::adapter(value val, std::string_view encoding, sl loc) :
        m_value{std::move(val)},
        m_override{&lookup_encoding(encoding, loc)},
        m_encoding{m_override}
{}


void pgquote::adapter::set_encoding(std::string_view name, sl loc)
{
  if (m_state == adapter_state::prepared)
    throw usage_error{
      internal::concat(
        "Can't set encoding to ", name,
        ": adapter is already prepared for encoding ", m_encoding->name, "."),
      loc};
  auto const &enc{lookup_encoding(name, loc)};
  m_override = &enc;
  m_encoding = &enc;
}


void pgquote::adapter::prepare(connection_context const &context, sl loc)
{
  auto const name{context.client_encoding()};
  if (not std::empty(name))
    m_encoding = &lookup_encoding(name, loc);
  else if (m_override != nullptr)
    m_encoding = m_override;
  else
    m_encoding = &default_encoding();
  m_options = context.options();
  m_state = adapter_state::prepared;
}


std::string pgquote::adapter::get_quoted(sl loc) const
{
  return quote_literal(m_value, *m_encoding, m_options, loc);
}
