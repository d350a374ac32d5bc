/* Definition of pgquote exception classes.
 *
 * pgquote::nul_byte_error, pgquote::encoding_error, pgquote::failure, ...
 *
 * DO NOT INCLUDE THIS FILE DIRECTLY; include pgquote/except instead.
 *
 * Copyright (c) 2000-2025, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PGQUOTE_H_EXCEPT
#define PGQUOTE_H_EXCEPT

#if !defined(PGQUOTE_HEADER_PRE)
#  error "Include pgquote headers as <pgquote/header>, not <pgquote/header.hxx>."
#endif

#include <cstddef>
#include <stdexcept>
#include <string>

#include "pgquote/types.hxx"


namespace pgquote
{
/**
 * @addtogroup exception Exception classes
 *
 * Two families.  Problems with the values you ask pgquote to quote derive
 * from @ref argument_error: an embedded NUL byte, a character that the
 * target encoding can't represent, an encoding name nobody has heard of.
 * Retrying with the same input will fail in the same way.
 *
 * Problems talking to the database derive from @ref failure.
 *
 * Every exception records the source location of the call that led to it.
 *
 * @{
 */

/// Run-time failure encountered by pgquote, similar to std::runtime_error.
struct PGQUOTE_LIBEXPORT failure : std::runtime_error
{
  explicit failure(std::string const &, sl = sl::current());
  sl location;
};


/// Exception class for lost or failed backend connection.
struct PGQUOTE_LIBEXPORT broken_connection : failure
{
  broken_connection();
  explicit broken_connection(std::string const &, sl = sl::current());
};


/// Exception class for failed queries.
/** Carries, in addition to a regular error message, a copy of the failed query
 * and (if available) the SQLSTATE value accompanying the error.
 */
class PGQUOTE_LIBEXPORT sql_error : public failure
{
  /// Query string.  Empty if unknown.
  std::string const m_query;
  /// SQLSTATE string describing the error type, if known; or empty string.
  std::string const m_sqlstate;

public:
  explicit sql_error(
    std::string const &whatarg = "", std::string Q = "",
    char const *sqlstate = nullptr, sl = sl::current());
  virtual ~sql_error() noexcept override;

  /// The query whose execution triggered the exception
  [[nodiscard]] PGQUOTE_PURE std::string const &query() const noexcept;

  /// SQLSTATE error code if known, or empty string otherwise.
  [[nodiscard]] PGQUOTE_PURE std::string const &sqlstate() const noexcept;
};


/// Database feature not supported in current setup.
struct PGQUOTE_LIBEXPORT feature_not_supported : failure
{
  explicit feature_not_supported(std::string const &, sl = sl::current());
};


/// Internal error in pgquote library
struct PGQUOTE_LIBEXPORT internal_error : std::logic_error
{
  explicit internal_error(std::string const &, sl = sl::current());
  sl location;
};


/// Error in usage of pgquote library, similar to std::logic_error
struct PGQUOTE_LIBEXPORT usage_error : std::logic_error
{
  explicit usage_error(std::string const &, sl = sl::current());
  sl location;
};


/// Invalid argument passed to pgquote, similar to std::invalid_argument
struct PGQUOTE_LIBEXPORT argument_error : std::invalid_argument
{
  explicit argument_error(std::string const &, sl = sl::current());
  sl location;
};


/// A string value contains a zero byte.
/** The message is always the same, and suitable for showing to end users.
 * The input must be cleaned up before trying again.
 */
class PGQUOTE_LIBEXPORT nul_byte_error : public argument_error
{
public:
  explicit nul_byte_error(std::size_t position, sl = sl::current());

  /// Offset of the first zero byte in the offending input.
  /** For text values, this is the offset in the UTF-8 text as given, not in
   * its transcoded form.
   */
  [[nodiscard]] std::size_t position() const noexcept { return m_position; }

private:
  std::size_t m_position;
};


/// Text can't be represented in, or is not valid in, a given encoding.
/** You may be able to succeed by trying again with a different encoding.
 */
class PGQUOTE_LIBEXPORT encoding_error : public argument_error
{
public:
  encoding_error(
    std::string const &whatarg, std::string encoding, std::size_t position,
    sl = sl::current());
  ~encoding_error() noexcept override;

  /// Canonical name of the encoding that we were working with.
  [[nodiscard]] std::string const &encoding() const noexcept
  {
    return m_encoding;
  }

  /// Byte offset (into the input) of the offending character.
  [[nodiscard]] std::size_t position() const noexcept { return m_position; }

private:
  std::string m_encoding;
  std::size_t m_position;
};


/// An encoding name was not recognised, or the encoding is not usable.
/** This usually indicates a configuration problem.
 */
class PGQUOTE_LIBEXPORT unsupported_encoding : public argument_error
{
public:
  unsupported_encoding(
    std::string const &whatarg, std::string name, sl = sl::current());
  ~unsupported_encoding() noexcept override;

  /// The encoding name as it was given to us.
  [[nodiscard]] std::string const &name() const noexcept { return m_name; }

private:
  std::string m_name;
};

/**
 * @}
 */
} // namespace pgquote
#endif
