/** Implementation of the pgquote::connection class.
 *
 * Copyright (c) 2000-2025, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#include "pgquote-source.hxx"

#include <memory>
#include <new>
#include <utility>

extern "C"
{
#include <libpq-fe.h>
}

#include "pgquote/internal/header-pre.hxx"

#include "pgquote/connection.hxx"
#include "pgquote/except.hxx"
#include "pgquote/internal/concat.hxx"

#include "pgquote/internal/header-post.hxx"


using namespace std::literals;


namespace
{
void process_notice_raw(
  pgquote::internal::notice_waiters *waiters, std::string_view msg) noexcept
{
  if ((waiters != nullptr) and not msg.empty() and waiters->notice_handler)
    waiters->notice_handler(msg);
}


using result_ptr = std::unique_ptr<PGresult, void (*)(PGresult *)>;
} // namespace


extern "C"
{
  // The PQnoticeProcessor that receives an error or warning from libpq and
  // sends it to the appropriate connection for processing.
  void pgquote_notice_processor(void *cx, char const *msg) noexcept
  {
    process_notice_raw(
      reinterpret_cast<pgquote::internal::notice_waiters *>(cx),
      std::string_view{msg});
  }
} // extern "C"


pgquote::connection::connection(std::string const &options, sl loc) :
        m_conn{PQconnectdb(options.c_str())}
{
  if (m_conn == nullptr)
    throw std::bad_alloc{};

  set_up_notice_handlers();

  if (PQstatus(m_conn) != CONNECTION_OK)
  {
    std::string const msg{PQerrorMessage(m_conn)};
    PQfinish(m_conn);
    m_conn = nullptr;
    throw broken_connection{msg, loc};
  }
}


pgquote::connection::connection(connection &&rhs) noexcept :
        m_conn{std::exchange(rhs.m_conn, nullptr)},
        m_notice_waiters{std::move(rhs.m_notice_waiters)}
{}


pgquote::connection &pgquote::connection::operator=(connection &&rhs)
{
  close();
  m_conn = std::exchange(rhs.m_conn, nullptr);
  m_notice_waiters = std::move(rhs.m_notice_waiters);
  return *this;
}


pgquote::connection::~connection() noexcept
{
  close();
}


void pgquote::connection::set_up_notice_handlers()
{
  if (not m_notice_waiters)
    m_notice_waiters = std::make_shared<internal::notice_waiters>();

  // The notice processor gets a pointer to our notice_waiters, not to the
  // connection itself, which may move.
  if (m_conn != nullptr)
    PQsetNoticeProcessor(
      m_conn, pgquote_notice_processor, m_notice_waiters.get());
}


bool pgquote::connection::is_open() const noexcept
{
  return (m_conn != nullptr) and (PQstatus(m_conn) == CONNECTION_OK);
}


void pgquote::connection::close() noexcept
{
  if (m_conn == nullptr)
    return;
  PQfinish(m_conn);
  m_conn = nullptr;
}


char const *pgquote::connection::err_msg() const noexcept
{
  return (m_conn == nullptr) ? "No connection to database" :
                               PQerrorMessage(m_conn);
}


void pgquote::connection::check_open(sl loc) const
{
  if (m_conn == nullptr)
    throw usage_error{"Using a connection that has been closed.", loc};
  if (PQstatus(m_conn) != CONNECTION_OK)
    throw broken_connection{"Lost connection to the database server.", loc};
}


void pgquote::connection::process_notice(std::string_view msg) noexcept
{
  process_notice_raw(m_notice_waiters.get(), msg);
}


std::string pgquote::connection::get_client_encoding(sl loc) const
{
  check_open(loc);
  int const enc{PQclientEncoding(m_conn)};
  if (enc == -1)
  {
    if (is_open())
      throw failure{"Could not obtain client encoding.", loc};
    else
      throw broken_connection{"Lost connection to the database server.", loc};
  }
  char const *const name{pg_encoding_to_char(enc)};
  if ((name == nullptr) or (*name == '\0'))
    throw internal_error{
      internal::concat("Unknown client encoding ID: ", std::to_string(enc)),
      loc};
  return name;
}


void pgquote::connection::set_client_encoding(
  std::string_view encoding, sl loc)
{
  check_open(loc);
  std::string const name{encoding};
  switch (auto const retval{PQsetClientEncoding(m_conn, name.c_str())}; retval)
  {
  case 0:
    // OK.
    break;
  case -1:
    if (is_open())
      throw failure{
        internal::concat("Setting client encoding to ", name, " failed."),
        loc};
    else
      throw broken_connection{"Lost connection to the database server.", loc};
  default:
    throw internal_error{
      internal::concat(
        "Unexpected result from PQsetClientEncoding: ",
        std::to_string(retval)),
      loc};
  }
}


std::string pgquote::connection::client_encoding() const
{
  return get_client_encoding();
}


bool pgquote::connection::standard_conforming_strings() const
{
  check_open(sl::current());
  char const *const value{
    PQparameterStatus(m_conn, "standard_conforming_strings")};
  return (value != nullptr) and (value == "on"sv);
}


int pgquote::connection::server_version() const
{
  check_open(sl::current());
  return PQserverVersion(m_conn);
}


std::optional<std::string>
pgquote::connection::query_value(std::string_view query, sl loc)
{
  check_open(loc);
  std::string const q{query};
  result_ptr const res{PQexec(m_conn, q.c_str()), PQclear};
  if (not res)
  {
    if (is_open())
      throw failure{err_msg(), loc};
    else
      throw broken_connection{"Lost connection to the database server.", loc};
  }

  switch (PQresultStatus(res.get()))
  {
  case PGRES_COMMAND_OK: return {};
  case PGRES_TUPLES_OK:
    if ((PQntuples(res.get()) < 1) or (PQnfields(res.get()) < 1) or
        (PQgetisnull(res.get(), 0, 0) != 0))
      return {};
    return std::string{
      PQgetvalue(res.get(), 0, 0),
      static_cast<std::size_t>(PQgetlength(res.get(), 0, 0))};
  default:
    if (not is_open())
      throw broken_connection{PQresultErrorMessage(res.get()), loc};
    throw sql_error{
      PQresultErrorMessage(res.get()), q,
      PQresultErrorField(res.get(), PG_DIAG_SQLSTATE), loc};
  }
}
