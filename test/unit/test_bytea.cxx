#include <tuple>

#include <pgquote/escape>

#include "../helpers.hxx"
#include "../literal_parser.hxx"


namespace
{
using namespace std::literals;


/// All 256 byte values, in order.
pgquote::bytes all_bytes()
{
  pgquote::bytes data;
  for (int b{0}; b < 256; ++b) data.push_back(static_cast<std::byte>(b));
  return data;
}


void test_choose_bytea_format()
{
  PGQUOTE_CHECK(
    pgquote::choose_bytea_format(0) == pgquote::bytea_format::hex,
    "Unknown server version should get hex.");
  PGQUOTE_CHECK(pgquote::choose_bytea_format(90000) == pgquote::bytea_format::hex);
  PGQUOTE_CHECK(pgquote::choose_bytea_format(160002) == pgquote::bytea_format::hex);
  PGQUOTE_CHECK(
    pgquote::choose_bytea_format(80400) == pgquote::bytea_format::escape);
  PGQUOTE_CHECK(
    pgquote::choose_bytea_format(90000, 100000) ==
    pgquote::bytea_format::escape);
}


void test_esc_bin_hex()
{
  PGQUOTE_CHECK_EQUAL(pgquote::esc_bin_hex(pgquote::bytes_view{}), "\\x");
  PGQUOTE_CHECK_EQUAL(
    pgquote::esc_bin_hex(pgquote::binary_cast("12")), "\\x3132");
  PGQUOTE_CHECK_EQUAL(
    pgquote::esc_bin_hex(pgquote::binary_cast("\x00\xff\x5c"sv)),
    "\\x00ff5c");
}


void test_esc_bin_octal()
{
  PGQUOTE_CHECK_EQUAL(pgquote::esc_bin_octal(pgquote::bytes_view{}), "");
  PGQUOTE_CHECK_EQUAL(pgquote::esc_bin_octal(pgquote::binary_cast("ab")), "ab");
  PGQUOTE_CHECK_EQUAL(
    pgquote::esc_bin_octal(pgquote::binary_cast("\x00\\\x7f\xff'"sv)),
    "\\000\\\\\\177\\377'");
}


void test_get_bytea_formatter()
{
  auto const data{pgquote::binary_cast("\x01")};
  PGQUOTE_CHECK_EQUAL(
    pgquote::get_bytea_formatter(pgquote::bytea_format::hex)(data), "\\x01");
  PGQUOTE_CHECK_EQUAL(
    pgquote::get_bytea_formatter(pgquote::bytea_format::escape)(data),
    "\\001");
}


void test_quote_bytea()
{
  auto const data{pgquote::binary_cast("12")};
  pgquote::quoting_options opts;

  opts.standard_conforming_strings = true;
  PGQUOTE_CHECK_EQUAL(
    pgquote::quote_bytea(data, opts), "'\\x3132'::bytea");

  opts.standard_conforming_strings = false;
  PGQUOTE_CHECK_EQUAL(
    pgquote::quote_bytea(data, opts), "E'\\\\x3132'::bytea");

  opts.server_version = 80400;
  PGQUOTE_CHECK_EQUAL(pgquote::quote_bytea(data, opts), "'12'::bytea");
  PGQUOTE_CHECK_EQUAL(
    pgquote::quote_bytea(pgquote::binary_cast("\x01'"sv), opts),
    "E'\\\\001'''::bytea");

  opts.standard_conforming_strings = true;
  PGQUOTE_CHECK_EQUAL(
    pgquote::quote_bytea(pgquote::binary_cast("\x01'"sv), opts),
    "'\\001'''::bytea");
}


void test_quote_literal_binary_allows_nul()
{
  pgquote::binary const zeroes{pgquote::bytes(3u, std::byte{0})};
  pgquote::quoting_options opts;
  opts.standard_conforming_strings = true;
  PGQUOTE_CHECK_EQUAL(
    pgquote::quote_literal(zeroes, pgquote::lookup_encoding("UTF8"), opts),
    "'\\x000000'::bytea");
}


void test_binary_round_trip()
{
  auto const data{all_bytes()};
  for (int const version : {0, 80400, 90000, 160002})
    for (bool const scs : {false, true})
    {
      pgquote::quoting_options opts;
      opts.standard_conforming_strings = scs;
      opts.server_version = version;
      auto const quoted{pgquote::quote_bytea(data, opts)};
      PGQUOTE_CHECK_EQUAL(
        pgquote::test::parse_bytea_literal(quoted, scs), data,
        "Binary data did not survive quoting for server version " +
          std::to_string(version) + (scs ? " with" : " without") +
          " standard conforming strings.");
    }
}


void test_binary_round_trip_random()
{
  for (int i{0}; i < 20; ++i)
  {
    pgquote::bytes data;
    auto const len{pgquote::test::make_num(100)};
    for (int j{0}; j < len; ++j)
      data.push_back(static_cast<std::byte>(pgquote::test::random_char()));
    pgquote::quoting_options opts;
    opts.server_version = 80200;
    PGQUOTE_CHECK_EQUAL(
      pgquote::test::parse_bytea_literal(pgquote::quote_bytea(data, opts), false),
      data);
  }
}


void test_unesc_bin()
{
  PGQUOTE_CHECK_EQUAL(pgquote::unesc_bin("\\x"), pgquote::bytes{});
  PGQUOTE_CHECK_EQUAL(
    pgquote::unesc_bin("\\x3132"),
    (pgquote::bytes{std::byte{'1'}, std::byte{'2'}}));
  PGQUOTE_CHECK_EQUAL(
    pgquote::unesc_bin("\\xA0ff"),
    (pgquote::bytes{std::byte{0xa0}, std::byte{0xff}}));
  PGQUOTE_CHECK_EQUAL(
    pgquote::unesc_bin("a\\\\\\000\\377"),
    (pgquote::bytes{
      std::byte{'a'}, std::byte{'\\'}, std::byte{0}, std::byte{0xff}}));

  auto const data{all_bytes()};
  PGQUOTE_CHECK_EQUAL(pgquote::unesc_bin(pgquote::esc_bin_hex(data)), data);
  PGQUOTE_CHECK_EQUAL(pgquote::unesc_bin(pgquote::esc_bin_octal(data)), data);
}


void test_unesc_bin_rejects_garbage()
{
  PGQUOTE_CHECK_THROWS(
    std::ignore = pgquote::unesc_bin("\\x1"), pgquote::failure);
  PGQUOTE_CHECK_THROWS(
    std::ignore = pgquote::unesc_bin("\\xgg"), pgquote::failure);
  PGQUOTE_CHECK_THROWS(
    std::ignore = pgquote::unesc_bin("\\"), pgquote::failure);
  PGQUOTE_CHECK_THROWS(
    std::ignore = pgquote::unesc_bin("\\12"), pgquote::failure);
  PGQUOTE_CHECK_THROWS(
    std::ignore = pgquote::unesc_bin("\\400"), pgquote::failure);
}


PGQUOTE_REGISTER_TEST(test_choose_bytea_format);
PGQUOTE_REGISTER_TEST(test_esc_bin_hex);
PGQUOTE_REGISTER_TEST(test_esc_bin_octal);
PGQUOTE_REGISTER_TEST(test_get_bytea_formatter);
PGQUOTE_REGISTER_TEST(test_quote_bytea);
PGQUOTE_REGISTER_TEST(test_quote_literal_binary_allows_nul);
PGQUOTE_REGISTER_TEST(test_binary_round_trip);
PGQUOTE_REGISTER_TEST(test_binary_round_trip_random);
PGQUOTE_REGISTER_TEST(test_unesc_bin);
PGQUOTE_REGISTER_TEST(test_unesc_bin_rejects_garbage);
} // namespace
