#if !defined(PGQUOTE_H_TEST_HELPERS)
#  define PGQUOTE_H_TEST_HELPERS

#  include <array>
#  include <concepts>
#  include <cstdint>
#  include <map>
#  include <mutex>
#  include <optional>
#  include <sstream>
#  include <stdexcept>
#  include <string>
#  include <string_view>
#  include <type_traits>

#  include <pgquote/except>

namespace pgquote::test
{
/// Exception: A test does not satisfy expected condition.
class test_failure : public std::logic_error
{
public:
  test_failure(std::string const &desc, sl loc = sl::current());
  ~test_failure() noexcept override;

  sl const location;

private:
  test_failure &operator=(test_failure const &) = delete;
};


using testfunc = void (*)();


/// Maximum number of tests in the test suite.
/** If this should prove insufficient, increase it.
 */
constexpr inline std::size_t max_tests{1000};


/// The test suite.
/** This is where the tests get registered at initialisation time.
 *
 * This gets a bit hacky.  It relies on an internal counter being
 * zero-initialised before the test registrations get constructed.
 */
class suite
{
public:
  /// Register a test function.
  static void register_test(char const name[], testfunc func) noexcept;

  /// Collect all tests into a map: test name to test function.
  static std::map<std::string_view, testfunc> gather();

private:
  /// Number of registered tests.
  static constinit std::size_t s_num_tests;

  static constinit std::array<std::string_view, max_tests> s_names;
  static constinit std::array<testfunc, max_tests> s_funcs;
};


// Register a test function, so the runner will run it.
#  define PGQUOTE_REGISTER_TEST(func)                                         \
    [[maybe_unused]] pgquote::test::registrar const tst_##func                \
    {                                                                         \
      #func, func                                                             \
    }


/// Register a test while not inside a function.
struct registrar
{
  registrar(char const name[], testfunc func) noexcept
  {
    pgquote::test::suite::register_test(name, func);
  }
};


/// Return an arbitrary nonnegative integer.
inline int make_num()
{
  // We use rand(), which is not guaranteed to be thread-safe.
  static std::mutex l;
  std::lock_guard<std::mutex> guard{l};
  return rand();
}


/// Return an arbitrary nonnegative integer below `ceiling`.
inline int make_num(int ceiling)
{
  return make_num() % ceiling;
}


/// Return an arbitrary `char` value from the full 8-bit range.
inline char random_char()
{
  return static_cast<char>(
    static_cast<std::uint8_t>(pgquote::test::make_num(256)));
}


/// Render a string for a failure message, making control bytes visible.
std::string describe_text(std::string_view text);

/// Render binary data for a failure message.
std::string describe_bytes(bytes_view data);


/// Render a value for a failure message.
template<typename T> inline std::string describe(T const &value)
{
  if constexpr (std::is_same_v<T, bool>)
    return value ? "true" : "false";
  else if constexpr (std::is_enum_v<T>)
    return std::to_string(static_cast<long long>(value));
  else if constexpr (std::is_arithmetic_v<T>)
    return std::to_string(value);
  else if constexpr (std::is_convertible_v<T const &, std::string_view>)
    return describe_text(std::string_view{value});
  else if constexpr (std::is_convertible_v<T const &, bytes_view>)
    return describe_bytes(bytes_view{value});
  else if constexpr (requires { value.has_value(); })
    return value.has_value() ? describe(*value) : std::string{"<nullopt>"};
  else
  {
    std::stringstream out;
    out << value;
    return out.str();
  }
}


// Unconditional test failure.
[[noreturn]] void check_notreached(
  std::string const &desc =
    "Execution was never supposed to reach this point.",
  sl loc = sl::current());

// Verify that a condition is met, similar to assert().
// Takes an optional failure description as a second argument.
#  define PGQUOTE_CHECK(condition, ...)                                       \
    pgquote::test::check((condition), #condition __VA_OPT__(, ) __VA_ARGS__)

void check(
  bool condition, char const text[],
  std::string const &desc = "Condition check failed,", sl loc = sl::current());

// Verify that variable has the expected value.
// Takes an optional failure description as a third argument.
#  define PGQUOTE_CHECK_EQUAL(actual, expected, ...)                          \
    pgquote::test::check_equal(                                               \
      (actual), #actual, (expected), #expected __VA_OPT__(, ) __VA_ARGS__)

template<typename ACTUAL, typename EXPECTED>
inline void check_equal(
  ACTUAL const &actual, char const actual_text[], EXPECTED const &expected,
  char const expected_text[],
  std::string const &desc = "Equality check failed.", sl loc = sl::current())
{
  if (expected == actual)
    return;
  std::string const fulldesc = desc + " (" + actual_text + " <> " +
                               expected_text +
                               ": "
                               "actual=" +
                               describe(actual) +
                               ", "
                               "expected=" +
                               describe(expected) + ")";
  throw test_failure{fulldesc, loc};
}

// Verify that two values are not equal.
// Takes an optional failure description as a third argument.
#  define PGQUOTE_CHECK_NOT_EQUAL(value1, value2, ...)                        \
    pgquote::test::check_not_equal(                                           \
      (value1), #value1, (value2), #value2 __VA_OPT__(, ) __VA_ARGS__)

template<typename VALUE1, typename VALUE2>
inline void check_not_equal(
  VALUE1 const &value1, char const text1[], VALUE2 const &value2,
  char const text2[], std::string const &desc = "Inequality check failed.",
  sl loc = sl::current())
{
  if (value1 != value2)
    return;
  std::string const fulldesc = desc + " (" + text1 + " == " + text2 +
                               ": "
                               "both are " +
                               describe(value2) + ")";
  throw test_failure{fulldesc, loc};
}


// Verify that value1 is less/greater than value2.
// Takes an optional failure description as a third argument.
#  define PGQUOTE_CHECK_LESS(value1, value2, ...)                             \
    pgquote::test::check_less(                                                \
      (value1), #value1, (value2), #value2 __VA_OPT__(, ) __VA_ARGS__)
#  define PGQUOTE_CHECK_GREATER(value2, value1, ...)                          \
    pgquote::test::check_less(                                                \
      (value1), #value1, (value2), #value2 __VA_OPT__(, ) __VA_ARGS__)

template<typename VALUE1, typename VALUE2>
inline void check_less(
  VALUE1 const &value1, char const text1[], VALUE2 const &value2,
  char const text2[], std::string const &desc = "Less/greater check failed.",
  sl loc = sl::current())
{
  if (value1 < value2)
    return;
  std::string const fulldesc = desc + " (" + text1 + " >= " + text2 +
                               ": "
                               "\"lower\"=" +
                               describe(value1) +
                               ", "
                               "\"upper\"=" +
                               describe(value2) + ")";
  throw test_failure{fulldesc, loc};
}


/// A special exception type not derived from `std::exception`.
struct failure_to_fail
{};


// Verify that "action" does not throw an exception.
// Takes an optional failure description as a second argument.
#  define PGQUOTE_CHECK_SUCCEEDS(action, ...)                                 \
    pgquote::test::check_succeeds(                                            \
      ([&]() { action; }), #action __VA_OPT__(, ) __VA_ARGS__)

template<std::invocable F>
inline void check_succeeds(
  F &&f, char const text[], std::string desc = "Expected this to succeed.",
  sl loc = sl::current())
{
  try
  {
    f();
  }
  catch (std::exception const &e)
  {
    pgquote::test::check_notreached(
      desc + " - \"" + text + "\" threw exception: " + e.what(), loc);
  }
  catch (...)
  {
    pgquote::test::check_notreached(
      desc + " - \"" + text + "\" threw a non-exception!", loc);
  }
}


template<typename EXC, std::invocable F>
inline void check_throws(
  F &&f, char const text[],
  std::string desc = "This code did not thow the expected exception.",
  sl loc = sl::current())
{
  try
  {
    f();
    throw failure_to_fail{};
  }
  catch (failure_to_fail const &)
  {
    check_notreached(desc + " (\"" + text + "\" did not throw).", loc);
  }
  catch (EXC const &)
  {}
  catch (std::exception const &e)
  {
    check_notreached(
      desc + " (\"" + text + "\" threw the wrong exception type: " + e.what() +
        ").",
      loc);
  }
  catch (...)
  {
    check_notreached(
      desc + " (\"" + text + "\" threw a non-exception type!)", loc);
  }
}


// Verify that "action" throws "exception_type" (which is not std::exception).
// Takes an optional failure description as an 2nd argument.
#  define PGQUOTE_CHECK_THROWS(action, exception_type, ...)                   \
    pgquote::test::check_throws<exception_type>(                              \
      ([&] { return action, 0; }), #action __VA_OPT__(, ) __VA_ARGS__)


/// Run `f`, which must throw `EXC`, and return the exception it threw.
/** For tests that want to look inside the exception object.
 */
template<typename EXC, std::invocable F>
inline EXC
catch_exception(F &&f, char const text[], sl loc = sl::current())
{
  try
  {
    f();
  }
  catch (EXC const &e)
  {
    return e;
  }
  check_notreached(
    std::string{"\""} + text + "\" did not throw the expected exception.",
    loc);
}


// Obtain the exception of type "exception_type" that "action" throws.
#  define PGQUOTE_CATCH(action, exception_type)                               \
    pgquote::test::catch_exception<exception_type>(                           \
      ([&] { return action, 0; }), #action)


// Report expected exception
void expected_exception(std::string const &);
} // namespace pgquote::test
#endif
