/* What pgquote needs to know about a database connection.
 *
 * DO NOT INCLUDE THIS FILE DIRECTLY; include pgquote/adapter instead.
 *
 * Copyright (c) 2000-2025, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PGQUOTE_H_CONNECTION_CONTEXT
#define PGQUOTE_H_CONNECTION_CONTEXT

#if !defined(PGQUOTE_HEADER_PRE)
#  error "Include pgquote headers as <pgquote/header>, not <pgquote/header.hxx>."
#endif

#include <string>
#include <utility>

#include "pgquote/escape.hxx"


namespace pgquote
{
/// Abstract view of a connection's quoting-relevant settings.
/** An @ref adapter consults one of these when it gets prepared.  The
 * @ref connection class implements it on top of a live libpq connection; use
 * @ref fixed_context when there is no connection, e.g. in tests or when
 * generating SQL scripts.
 */
class PGQUOTE_LIBEXPORT connection_context
{
public:
  connection_context() = default;
  connection_context(connection_context const &) = default;
  connection_context &operator=(connection_context const &) = default;
  virtual ~connection_context() noexcept;

  /// The connection's client encoding, or an empty string if not known.
  [[nodiscard]] virtual std::string client_encoding() const = 0;

  /// Does the server treat backslashes literally in `'...'` strings?
  [[nodiscard]] virtual bool standard_conforming_strings() const = 0;

  /// Server version in libpq's numeric format, or 0 if not known.
  [[nodiscard]] virtual int server_version() const = 0;

  /// Can identifiers contain non-ASCII characters?
  /** By default: yes, unless the server is known to predate 8.0.
   */
  [[nodiscard]] virtual bool unicode_identifiers() const;

  /// First server version for which bytea literals should use hex format.
  /** Older servers get the escape format.  The default is 9.0, the version
   * that introduced hex.
   */
  [[nodiscard]] virtual int bytea_hex_since() const
  {
    return default_bytea_hex_since;
  }

  /// Collect the settings that matter for writing literals.
  [[nodiscard]] quoting_options options() const;
};


/// A @ref connection_context with settings that you set yourself.
class PGQUOTE_LIBEXPORT fixed_context final : public connection_context
{
public:
  fixed_context() = default;
  explicit fixed_context(
    std::string encoding, bool standard_conforming_strings = true,
    int server_version = 0);

  [[nodiscard]] std::string client_encoding() const override
  {
    return m_encoding;
  }
  [[nodiscard]] bool standard_conforming_strings() const override
  {
    return m_scs;
  }
  [[nodiscard]] int server_version() const override { return m_version; }
  [[nodiscard]] bool unicode_identifiers() const override;
  [[nodiscard]] int bytea_hex_since() const override { return m_hex_since; }

  void set_client_encoding(std::string encoding)
  {
    m_encoding = std::move(encoding);
  }
  void set_standard_conforming_strings(bool on) noexcept { m_scs = on; }
  void set_server_version(int version) noexcept { m_version = version; }

  /// Override the default answer to @ref unicode_identifiers().
  void set_unicode_identifiers(bool supported) noexcept
  {
    m_unicode_ids = supported ? 1 : 0;
  }

  /// Move the boundary between escape-format and hex-format bytea.
  void set_bytea_hex_since(int version) noexcept { m_hex_since = version; }

private:
  std::string m_encoding;
  bool m_scs{true};
  int m_version{0};
  /// Explicit answer to @ref unicode_identifiers(), or -1 for the default.
  int m_unicode_ids{-1};
  int m_hex_since{default_bytea_hex_since};
};
} // namespace pgquote
#endif
