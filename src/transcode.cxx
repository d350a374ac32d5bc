/** Implementation of text transcoding, on top of iconv.
 *
 * Copyright (c) 2000-2025, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#include "pgquote-source.hxx"

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <iconv.h>

#include "pgquote/internal/header-pre.hxx"

#include "pgquote/except.hxx"
#include "pgquote/internal/concat.hxx"
#include "pgquote/internal/encodings.hxx"
#include "pgquote/transcode.hxx"

#include "pgquote/internal/header-post.hxx"


using namespace std::literals;


namespace
{
constexpr auto utf8_charset{"UTF-8"sv};


/// Length of the UTF-8 sequence that starts with `lead`, as far as it says.
/** Returns 1 for bytes that can't start a multibyte sequence; the converter
 * will reject those.
 */
constexpr std::size_t utf8_sequence_length(unsigned char lead) noexcept
{
  if (lead >= 0xf0 and lead <= 0xf7)
    return 4;
  else if (lead >= 0xe0)
    return (lead <= 0xef) ? 3 : 1;
  else if (lead >= 0xc0)
    return 2;
  else
    return 1;
}


/// An open iconv conversion descriptor.
/** An iconv descriptor carries shift state, so it must not be shared between
 * threads.  We open one per conversion.
 */
class converter final
{
public:
  converter(
    std::string_view to, std::string_view from, std::string_view pg_name,
    pgquote::sl loc) :
          m_cd{iconv_open(std::string{to}.c_str(), std::string{from}.c_str())}
  {
    if (m_cd == invalid())
      throw pgquote::unsupported_encoding{
        pgquote::internal::concat(
          "Can't convert between ", from, " and ", to, " on this system (",
          std::strerror(errno), ")."),
        std::string{pg_name}, loc};
  }

  ~converter() noexcept { iconv_close(m_cd); }

  converter(converter const &) = delete;
  converter &operator=(converter const &) = delete;

  /// Convert `input`, appending to `out`.
  /** On failure, calls `fail(offset, errno)`, which throws.  The offset is
   * relative to `input`.
   */
  template<typename FAIL>
  void convert(std::string_view input, std::string &out, FAIL const &fail)
  {
    std::size_t done{std::size(out)};
    // Most conversions we do are between single-byte encodings and UTF-8, so
    // this is usually enough on the first try.
    out.resize(done + std::size(input) * 2 + 16);

    // iconv's interface is not const-correct.
    auto in_ptr{const_cast<char *>(std::data(input))};
    std::size_t in_left{std::size(input)};

    while (in_left > 0)
    {
      auto out_ptr{std::data(out) + done};
      std::size_t out_left{std::size(out) - done};
      auto const rc{iconv(m_cd, &in_ptr, &in_left, &out_ptr, &out_left)};
      done = std::size(out) - out_left;
      if (rc != static_cast<std::size_t>(-1))
        break;

      auto const err{errno};
      if (err == E2BIG)
        out.resize(std::size(out) * 2);
      else
        fail(std::size(input) - in_left, err);
    }
    out.resize(done);
  }

  /// Append any pending output, such as a shift sequence, to `out`.
  template<typename FAIL> void finish(std::string &out, FAIL const &fail)
  {
    std::size_t done{std::size(out)};
    out.resize(done + 16);
    for (;;)
    {
      auto out_ptr{std::data(out) + done};
      std::size_t out_left{std::size(out) - done};
      auto const rc{iconv(m_cd, nullptr, nullptr, &out_ptr, &out_left)};
      done = std::size(out) - out_left;
      if (rc != static_cast<std::size_t>(-1))
        break;
      auto const err{errno};
      if (err != E2BIG)
        fail(0u, err);
      out.resize(std::size(out) * 2);
    }
    out.resize(done);
  }

private:
  static iconv_t invalid() noexcept { return reinterpret_cast<iconv_t>(-1); }

  iconv_t m_cd;
};
} // namespace


std::string pgquote::encode_text(
  std::string_view text, encoding_descriptor const &encoding, sl loc)
{
  converter conv{encoding.charset, utf8_charset, encoding.name, loc};
  auto const sz{std::size(text)};
  std::string out;
  out.reserve(sz);

  std::size_t here{0};
  auto const fail{[&](std::size_t offset, int err) {
    offset += here;
    if (err == EILSEQ)
      throw encoding_error{
        internal::concat(
          "Character at byte ", std::to_string(offset),
          " cannot be represented in encoding ", encoding.name,
          ", or is not valid UTF-8."),
        std::string{encoding.name}, offset, loc};
    if (err == EINVAL)
      throw encoding_error{
        internal::concat(
          "Text ends in an incomplete UTF-8 sequence at byte ",
          std::to_string(offset), "."),
        std::string{encoding.name}, offset, loc};
    throw failure{
      internal::concat(
        "Could not convert text to ", encoding.name, ": ",
        std::strerror(err)),
      loc};
  }};

  while (here < sz)
  {
    auto const lead{static_cast<unsigned char>(text[here])};
    if (lead < 0x80)
    {
      // To PostgreSQL, a byte below 0x80 at a character boundary is always
      // that ASCII character.  Some iconv charsets disagree (JOHAB and
      // SHIFT_JISX0213 read 0x5c as a currency sign), so ASCII skips iconv.
      out.push_back(text[here]);
      ++here;
      continue;
    }

    // One character at a time, so we can check what it turned into.  The
    // converter validates the sequence.
    auto const len{std::min(utf8_sequence_length(lead), sz - here)};
    auto const start{std::size(out)};
    conv.convert(text.substr(here, len), out, fail);
    conv.finish(out, fail);

    // iconv may "approximate" a character as an ASCII byte, e.g. the yen sign
    // as a backslash.  The server would read that as a different character.
    if (
      (std::size(out) == start) or
      (static_cast<unsigned char>(out[start]) < 0x80))
      throw encoding_error{
        internal::concat(
          "Character at byte ", std::to_string(here),
          " has no exact equivalent in encoding ", encoding.name, "."),
        std::string{encoding.name}, here, loc};
    here += len;
  }
  return out;
}


std::string pgquote::decode_text(
  std::string_view data, encoding_descriptor const &encoding, sl loc)
{
  converter conv{utf8_charset, encoding.charset, encoding.name, loc};
  auto const scan{internal::get_glyph_scanner(encoding.group, loc)};
  auto const sz{std::size(data)};
  std::string out;
  out.reserve(sz);

  std::size_t here{0};
  auto const fail{[&](std::size_t offset, int err) {
    offset += here;
    if ((err == EILSEQ) or (err == EINVAL))
      throw encoding_error{
        internal::concat(
          "Invalid byte sequence for encoding ", encoding.name, " at byte ",
          std::to_string(offset), "."),
        std::string{encoding.name}, offset, loc};
    throw failure{
      internal::concat(
        "Could not convert text from ", encoding.name, ": ",
        std::strerror(err)),
      loc};
  }};

  while (here < sz)
  {
    if (static_cast<unsigned char>(data[here]) < 0x80)
    {
      out.push_back(data[here]);
      ++here;
      continue;
    }

    // Convert a run of non-ASCII characters.  Each of them must come out as
    // non-ASCII too.
    auto end{here};
    while (end < sz and static_cast<unsigned char>(data[end]) >= 0x80)
      end = scan(data, end, loc);
    auto const start{std::size(out)};
    // Flush, so that a character the converter holds back (CP1258 does that,
    // waiting for combining marks) comes out before the next ASCII byte.
    conv.convert(data.substr(here, end - here), out, fail);
    conv.finish(out, fail);
    for (auto i{start}; i < std::size(out); ++i)
      if (static_cast<unsigned char>(out[i]) < 0x80)
        throw encoding_error{
          internal::concat(
            "Text in encoding ", encoding.name, " at byte ",
            std::to_string(here), " converts to ASCII."),
          std::string{encoding.name}, here, loc};
    here = end;
  }
  return out;
}
