#include <format>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <sqlgate/sqlgate>

namespace
{
/// A toy execution layer.  It only prints the queries it gets.
/** A real one would send them to a database.  The point is the signature:
 * `exec()` takes a `sqlgate::query_string`, so nobody can pass it a query
 * they built from untrusted input by accident.
 */
class printer
{
public:
  explicit printer(std::function<void(std::string_view)> notice_handler) :
          m_notice_handler{std::move(notice_handler)}
  {}

  void exec(sqlgate::query_string query)
  {
    m_notice_handler(std::format("[{}] {}", query.mode(), query));
  }

private:
  std::function<void(std::string_view)> m_notice_handler;
};
} // namespace


int main(int, char *argv[])
{
  try
  {
    printer cx{[](std::string_view msg) { std::cout << msg << '\n'; }};

    // A string literal is fine.  It can't contain anything from outside.
    cx.exec(
      "CREATE TEMP TABLE Employee (id integer, name varchar, salary integer)");

    // This would not compile: the name comes from the command line.
    //
    // cx.exec("SELECT id FROM Employee WHERE name = '" +
    //   std::string{argv[1]} + "'");
    //
    // Pass the name as a statement parameter instead.  The query text itself
    // stays constant.
    char const *const name{(argv[1] == nullptr) ? "Ichiban" : argv[1]};
    cx.exec("SELECT id FROM Employee WHERE name = $1");
    std::cout << "  (with $1 = '" << name << "')\n";

    // Sometimes you really do need to build a query at run time.  If you're
    // sure it's safe, say so.
    std::string const table{"Employee"};
    cx.exec(sqlgate::assert_query_safe{
      std::format("UPDATE {} SET salary = salary + 1 WHERE id = $1", table)});

    // Shared text can go to any number of queries without copying.
    auto const vacuum{std::make_shared<std::string const>("VACUUM Employee")};
    cx.exec(sqlgate::assert_query_safe{vacuum});
  }
  catch (sqlgate::argument_error const &e)
  {
    std::cerr << "Argument error: " << e.what() << '\n';
    std::cerr << "Happened in " << sqlgate::source_loc(e.location) << ".\n";
    return 1;
  }
}
