/* Values that get their client encoding late, just before they are sent.
 *
 * DO NOT INCLUDE THIS FILE DIRECTLY; include pgquote/adapter instead.
 *
 * Copyright (c) 2000-2025, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PGQUOTE_H_ADAPTER
#define PGQUOTE_H_ADAPTER

#if !defined(PGQUOTE_HEADER_PRE)
#  error "Include pgquote headers as <pgquote/header>, not <pgquote/header.hxx>."
#endif

#include <string>
#include <string_view>

#include "pgquote/connection_context.hxx"
#include "pgquote/escape.hxx"


namespace pgquote
{
/// Where an @ref adapter is in its life cycle.
enum class adapter_state
{
  /// Not yet bound to a connection.  The encoding can still change.
  unprepared,
  /// Bound to a connection.  The encoding is fixed.
  prepared,
};


/// A value waiting to be quoted as an SQL literal.
/** You can create an adapter before you know which connection the value will
 * go to.  Until then, it uses the encoding you give it, or LATIN1 if you
 * don't.  When it's time to send the value, @ref prepare() it against the
 * connection.  From then on it uses the connection's client encoding, and the
 * connection's settings for backslashes.
 *
 * The adapter never transcodes or quotes anything until you ask for the
 * quoted result, so that's where you'll see any encoding errors.
 *
 * An adapter is not thread-safe.  Don't use one from multiple threads at the
 * same time.
 */
class PGQUOTE_LIBEXPORT adapter
{
public:
  explicit adapter(value val);

  /// Create an adapter with a preset encoding.
  /** @throw unsupported_encoding if the encoding name is not known.
   */
  adapter(value val, std::string_view encoding, sl loc = sl::current());

  /// Name of the encoding this adapter will quote for.
  [[nodiscard]] std::string_view encoding() const noexcept
  {
    return m_encoding->name;
  }

  /// Choose a different encoding.  Only allowed before @ref prepare().
  /** @throw unsupported_encoding if the name is not known.  The adapter stays
   * as it was.
   * @throw usage_error if the adapter has been prepared.
   */
  void set_encoding(std::string_view name, sl loc = sl::current());

  /// Bind the adapter to a connection.
  /** Takes the encoding from the connection, if it reports one; otherwise
   * keeps the one that was set or the default.  Also picks up the
   * connection's settings for backslashes and bytea format.
   *
   * You can call this again, e.g. when the value gets re-sent on another
   * connection.  It re-reads everything.
   */
  void prepare(connection_context const &context, sl loc = sl::current());

  /// Quote the value as an SQL literal.
  /** @throw encoding_error if the value contains text that can't be
   * represented in the adapter's encoding.
   * @throw nul_byte_error if the value is a string containing a zero byte.
   */
  [[nodiscard]] std::string get_quoted(sl loc = sl::current()) const;

  [[nodiscard]] adapter_state state() const noexcept { return m_state; }

  [[nodiscard]] value const &get_value() const noexcept { return m_value; }

private:
  value m_value;
  /// Encoding set through the constructor or @ref set_encoding(), if any.
  encoding_descriptor const *m_override{nullptr};
  encoding_descriptor const *m_encoding;
  quoting_options m_options;
  adapter_state m_state{adapter_state::unprepared};
};


/// Create an adapter for UTF-8 text.
[[nodiscard]] inline adapter adapt(std::string_view utf8)
{
  return adapter{text{std::string{utf8}}};
}


/// Create an adapter for binary data.
[[nodiscard]] inline adapter adapt(bytes_view data)
{
  return adapter{binary{bytes{std::begin(data), std::end(data)}}};
}


/// Create an adapter for text that is already in the client encoding.
[[nodiscard]] inline adapter adapt_encoded(std::string_view data)
{
  return adapter{encoded_text{std::string{data}}};
}
} // namespace pgquote
#endif
