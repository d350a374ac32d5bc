/** Implementation of pgquote exception classes.
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

#include "pgquote/except.hxx"
#include "pgquote/internal/concat.hxx"
#include "pgquote/nul_guard.hxx"

#include "pgquote/internal/header-post.hxx"

pgquote::failure::failure(std::string const &whatarg, sl loc) :
        std::runtime_error{whatarg}, location{loc}
{}


pgquote::broken_connection::broken_connection() :
        failure{"Connection to database failed."}
{}


pgquote::broken_connection::broken_connection(
  std::string const &whatarg, sl loc) :
        failure{whatarg, loc}
{}


pgquote::sql_error::sql_error(
  std::string const &whatarg, std::string Q, char const *sqlstate, sl loc) :
        failure{whatarg, loc},
        m_query{std::move(Q)},
        m_sqlstate{sqlstate ? sqlstate : ""}
{}


pgquote::sql_error::~sql_error() noexcept = default;


PGQUOTE_PURE std::string const &pgquote::sql_error::query() const noexcept
{
  return m_query;
}


PGQUOTE_PURE std::string const &pgquote::sql_error::sqlstate() const noexcept
{
  return m_sqlstate;
}


pgquote::feature_not_supported::feature_not_supported(
  std::string const &whatarg, sl loc) :
        failure{whatarg, loc}
{}


pgquote::internal_error::internal_error(std::string const &whatarg, sl loc) :
        std::logic_error{internal::concat("pgquote internal error: ", whatarg)},
        location{loc}
{}


pgquote::usage_error::usage_error(std::string const &whatarg, sl loc) :
        std::logic_error{whatarg}, location{loc}
{}


pgquote::argument_error::argument_error(std::string const &whatarg, sl loc) :
        invalid_argument{whatarg}, location{loc}
{}


pgquote::nul_byte_error::nul_byte_error(std::size_t position, sl loc) :
        argument_error{std::string{nul_message}, loc}, m_position{position}
{}


pgquote::encoding_error::encoding_error(
  std::string const &whatarg, std::string encoding, std::size_t position,
  sl loc) :
        argument_error{whatarg, loc},
        m_encoding{std::move(encoding)},
        m_position{position}
{}


pgquote::encoding_error::~encoding_error() noexcept = default;


pgquote::unsupported_encoding::unsupported_encoding(
  std::string const &whatarg, std::string name, sl loc) :
        argument_error{whatarg, loc}, m_name{std::move(name)}
{}


pgquote::unsupported_encoding::~unsupported_encoding() noexcept = default;
