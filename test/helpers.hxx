#if !defined(SQLGATE_H_TEST_HELPERS)
#  define SQLGATE_H_TEST_HELPERS

#  include <array>
#  include <concepts>
#  include <cstddef>
#  include <format>
#  include <map>
#  include <stdexcept>
#  include <string>
#  include <string_view>

#  include <sqlgate/sqlgate>

namespace sqlgate::test
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


/// For use by tests that need to simulate an exception.
struct deliberate_error : std::exception
{};


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
#  define SQLGATE_REGISTER_TEST(func)                                         \
    [[maybe_unused]] sqlgate::test::registrar const tst_##func                \
    {                                                                         \
      #func, func                                                             \
    }


/// Register a test while not inside a function.
struct registrar
{
  registrar(char const name[], testfunc func) noexcept
  {
    sqlgate::test::suite::register_test(name, func);
  }
};


// Unconditional test failure.
[[noreturn]] void check_notreached(
  std::string const &desc =
    "Execution was never supposed to reach this point.",
  sl loc = sl::current());

// Verify that a condition is met, similar to assert().
// Takes an optional failure description as a second argument.
#  define SQLGATE_CHECK(condition, ...)                                       \
    sqlgate::test::check((condition), #condition __VA_OPT__(, ) __VA_ARGS__)

void check(
  bool condition, char const text[],
  std::string const &desc = "Condition check failed.", sl loc = sl::current());

// Verify that variable has the expected value.
// Takes an optional failure description as a third argument.
#  define SQLGATE_CHECK_EQUAL(actual, expected, ...)                          \
    sqlgate::test::check_equal(                                               \
      (actual), #actual, (expected), #expected __VA_OPT__(, ) __VA_ARGS__)

template<typename ACTUAL, typename EXPECTED>
inline void check_equal(
  ACTUAL const &actual, char const actual_text[], EXPECTED const &expected,
  char const expected_text[],
  std::string const &desc = "Equality check failed.", sl loc = sl::current())
{
  if (expected == actual)
    return;
  throw test_failure{
    std::format(
      "{} ({} <> {}: actual={}, expected={})", desc, actual_text,
      expected_text, actual, expected),
    loc};
}

// Verify that two values are not equal.
// Takes an optional failure description as a third argument.
#  define SQLGATE_CHECK_NOT_EQUAL(value1, value2, ...)                        \
    sqlgate::test::check_not_equal(                                           \
      (value1), #value1, (value2), #value2 __VA_OPT__(, ) __VA_ARGS__)

template<typename VALUE1, typename VALUE2>
inline void check_not_equal(
  VALUE1 const &value1, char const text1[], VALUE2 const &value2,
  char const text2[], std::string const &desc = "Inequality check failed.",
  sl loc = sl::current())
{
  if (value1 != value2)
    return;
  throw test_failure{
    std::format("{} ({} == {}: both are {})", desc, text1, text2, value2),
    loc};
}


/// A special exception type not derived from `std::exception`.
struct failure_to_fail
{};


// Verify that "action" does not throw an exception.
// Takes an optional failure description as a second argument.
#  define SQLGATE_CHECK_SUCCEEDS(action, ...)                                 \
    sqlgate::test::check_succeeds(                                            \
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
    sqlgate::test::check_notreached(
      std::format("{} - \"{}\" threw exception: {}", desc, text, e.what()),
      loc);
  }
  catch (...)
  {
    sqlgate::test::check_notreached(
      std::format("{} - \"{}\" threw a non-exception!", desc, text), loc);
  }
}


// Verify that "action" throws "exception_type".
// Takes an optional failure description as an 2nd argument.
#  define SQLGATE_CHECK_THROWS(action, exception_type, ...)                   \
    sqlgate::test::check_throws<exception_type>(                              \
      ([&] { return action, 0; }), #action __VA_OPT__(, ) __VA_ARGS__)

template<typename EXC, std::invocable F>
inline void check_throws(
  F &&f, char const text[],
  std::string desc = "This code did not throw the expected exception.",
  sl loc = sl::current())
{
  try
  {
    f();
    throw failure_to_fail{};
  }
  catch (failure_to_fail const &)
  {
    check_notreached(
      std::format("{} (\"{}\" did not throw).", desc, text), loc);
  }
  catch (EXC const &)
  {}
  catch (std::exception const &e)
  {
    check_notreached(
      std::format(
        "{} (\"{}\" threw the wrong exception type: {}).", desc, text,
        e.what()),
      loc);
  }
  catch (...)
  {
    check_notreached(
      std::format("{} (\"{}\" threw a non-exception type!)", desc, text), loc);
  }
}
} // namespace sqlgate::test
#endif
