#include <tuple>

#include <pgquote/adapter>
#include <pgquote/identifier>

#include "../helpers.hxx"


namespace
{
using namespace std::literals;


void test_quote_identifier()
{
  pgquote::fixed_context const cx{"UTF8"};
  PGQUOTE_CHECK_EQUAL(
    pgquote::quote_identifier("blah-blah", cx), "\"blah-blah\"");
  PGQUOTE_CHECK_EQUAL(
    pgquote::quote_identifier("quote\"inside", cx), "\"quote\"\"inside\"");
  PGQUOTE_CHECK_EQUAL(pgquote::quote_identifier("x", cx), "\"x\"");
  PGQUOTE_CHECK_EQUAL(pgquote::quote_identifier("", cx), "\"\"");
  PGQUOTE_CHECK_EQUAL(pgquote::quote_identifier("\"", cx), "\"\"\"\"");
  // Keywords and mixed case get quoted too.
  PGQUOTE_CHECK_EQUAL(pgquote::quote_identifier("select", cx), "\"select\"");
  PGQUOTE_CHECK_EQUAL(pgquote::quote_identifier("MixedCase"), "\"MixedCase\"");
  // Single quotes and backslashes mean nothing special here.
  PGQUOTE_CHECK_EQUAL(pgquote::quote_identifier("a'b\\c"), "\"a'b\\c\"");
}


void test_quote_unicode_identifier()
{
  pgquote::fixed_context const cx{"UTF8"};
  PGQUOTE_CHECK_EQUAL(
    pgquote::quote_identifier("\xe2\x98\x83", cx), "\"\xe2\x98\x83\"");
  PGQUOTE_CHECK_EQUAL(
    pgquote::quote_identifier("\xe2\x98\x83\"\xe2\x98\x83"),
    "\"\xe2\x98\x83\"\"\xe2\x98\x83\"");
}


void test_quote_identifier_rejects_bad_input()
{
  PGQUOTE_CHECK_THROWS(
    std::ignore = pgquote::quote_identifier("a\0b"sv),
    pgquote::nul_byte_error);
  PGQUOTE_CHECK_THROWS(
    std::ignore = pgquote::quote_identifier("a\xff"), pgquote::encoding_error);
  PGQUOTE_CHECK_THROWS(
    std::ignore = pgquote::quote_identifier("\xe2\x98"),
    pgquote::encoding_error);
}


void test_quote_identifier_without_unicode_support()
{
  pgquote::fixed_context cx{"UTF8"};
  cx.set_unicode_identifiers(false);
  PGQUOTE_CHECK_EQUAL(pgquote::quote_identifier("plain", cx), "\"plain\"");
  PGQUOTE_CHECK_THROWS(
    std::ignore = pgquote::quote_identifier("\xe2\x98\x83", cx),
    pgquote::feature_not_supported);

  // Old servers don't get Unicode identifiers by default.
  pgquote::fixed_context old{"UTF8", false, 70400};
  PGQUOTE_CHECK(not old.unicode_identifiers());
  PGQUOTE_CHECK_THROWS(
    std::ignore = pgquote::quote_identifier("\xc3\xa9", old),
    pgquote::feature_not_supported);

  pgquote::fixed_context const modern{"UTF8", true, 80000};
  PGQUOTE_CHECK(modern.unicode_identifiers());
}


void test_quote_table()
{
  pgquote::fixed_context const cx{"UTF8"};
  PGQUOTE_CHECK_EQUAL(
    pgquote::quote_table({"public"sv, "my table"sv}, cx),
    "\"public\".\"my table\"");
  PGQUOTE_CHECK_EQUAL(pgquote::quote_table({"t"sv}, cx), "\"t\"");
  PGQUOTE_CHECK_EQUAL(
    pgquote::quote_table({"a.b"sv, "c\"d"sv}, cx), "\"a.b\".\"c\"\"d\"");
  PGQUOTE_CHECK_THROWS(
    std::ignore = pgquote::quote_table({}, cx), pgquote::usage_error);
}


PGQUOTE_REGISTER_TEST(test_quote_identifier);
PGQUOTE_REGISTER_TEST(test_quote_unicode_identifier);
PGQUOTE_REGISTER_TEST(test_quote_identifier_rejects_bad_input);
PGQUOTE_REGISTER_TEST(test_quote_identifier_without_unicode_support);
PGQUOTE_REGISTER_TEST(test_quote_table);
} // namespace
