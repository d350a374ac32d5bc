/** Implementation of the connection context classes.
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

#include "pgquote/connection_context.hxx"

#include "pgquote/internal/header-post.hxx"


pgquote::connection_context::~connection_context() noexcept = default;


bool pgquote::connection_context::unicode_identifiers() const
{
  auto const version{server_version()};
  return version == 0 or version >= 80000;
}


pgquote::quoting_options pgquote::connection_context::options() const
{
  quoting_options opts;
  opts.standard_conforming_strings = standard_conforming_strings();
  opts.server_version = server_version();
  opts.bytea_hex_since = bytea_hex_since();
  return opts;
}


pgquote::fixed_context::fixed_context(
  std::string encoding, bool standard_conforming_strings,
  int server_version) :
        m_encoding{std::move(encoding)},
        m_scs{standard_conforming_strings},
        m_version{server_version}
{}


bool pgquote::fixed_context::unicode_identifiers() const
{
  if (m_unicode_ids < 0)
    return connection_context::unicode_identifiers();
  return m_unicode_ids != 0;
}
