/* A live libpq connection, as a context for quoting.
 *
 * DO NOT INCLUDE THIS FILE DIRECTLY; include pgquote/connection instead.
 *
 * Copyright (c) 2000-2025, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PGQUOTE_H_CONNECTION
#define PGQUOTE_H_CONNECTION

#if !defined(PGQUOTE_HEADER_PRE)
#  error "Include pgquote headers as <pgquote/header>, not <pgquote/header.hxx>."
#endif

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "pgquote/connection_context.hxx"


// Forward declaration of libpq's connection struct, so that we don't need to
// include libpq-fe.h here.
extern "C"
{
  struct pg_conn;
}


namespace pgquote::internal
{
namespace pq
{
using PGconn = pg_conn;
} // namespace pq


/// Receives the server's notices on behalf of a connection.
/** libpq's notice processor gets a pointer to one of these.  It lives on the
 * heap, so that the connection can move without invalidating that pointer.
 */
struct notice_waiters
{
  std::function<void(std::string_view)> notice_handler;
};
} // namespace pgquote::internal


namespace pgquote
{
/// Connection to a database, through libpq.
/** This is a @ref connection_context, so you can prepare an @ref adapter
 * against it.  It does very little beyond that: it can tell you about the
 * server, and run a query that produces a single value.
 *
 * Connection parameters come from the options string, in the format that
 * libpq's `PQconnectdb()` accepts, and from the standard `PG*` environment
 * variables.  An empty options string means "just use the environment."
 */
class PGQUOTE_LIBEXPORT connection final : public connection_context
{
public:
  /// Connect, using only environment variables and libpq defaults.
  connection() : connection{""} {}

  /// Connect.
  /** @throw broken_connection if the connection attempt fails.
   */
  explicit connection(std::string const &options, sl loc = sl::current());

  connection(connection &&rhs) noexcept;
  connection &operator=(connection &&rhs);
  connection(connection const &) = delete;
  connection &operator=(connection const &) = delete;

  ~connection() noexcept override;

  /// Is this connection open, and healthy?
  [[nodiscard]] bool is_open() const noexcept;

  /// Explicitly close the connection.  Does nothing if already closed.
  void close() noexcept;

  /// The client encoding, as PostgreSQL names it (e.g. "UTF8").
  [[nodiscard]] std::string get_client_encoding(sl loc = sl::current()) const;

  /// Change the client encoding.
  /** Adapters that you prepared against this connection before the change
   * will not notice.  Prepare them again.
   */
  void set_client_encoding(std::string_view encoding, sl loc = sl::current());

  [[nodiscard]] std::string client_encoding() const override;
  [[nodiscard]] bool standard_conforming_strings() const override;
  [[nodiscard]] int server_version() const override;

  /// Execute a query, and return the first field of its first row.
  /** Returns an empty optional if there is no row, or if the field is null.
   * The value comes out in the client encoding.
   *
   * @throw sql_error if the query fails.
   * @throw broken_connection if the connection is lost.
   */
  std::optional<std::string>
  query_value(std::string_view query, sl loc = sl::current());

  /// Set a function to receive notices and warnings from the server.
  /** Without a handler, notices are discarded.  The handler must not throw.
   */
  void set_notice_handler(std::function<void(std::string_view)> handler)
  {
    if (not m_notice_waiters)
      m_notice_waiters = std::make_shared<internal::notice_waiters>();
    m_notice_waiters->notice_handler = std::move(handler);
  }

  /// Invoke the notice handler, if any, on `msg`.
  void process_notice(std::string_view msg) noexcept;

private:
  void set_up_notice_handlers();
  [[nodiscard]] char const *err_msg() const noexcept;
  void check_open(sl loc) const;

  internal::pq::PGconn *m_conn{nullptr};
  std::shared_ptr<internal::notice_waiters> m_notice_waiters;
};
} // namespace pgquote
#endif
