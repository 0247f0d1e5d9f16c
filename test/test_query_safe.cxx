#include <memory>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

#include <sqlgate/query_safe>

#include "helpers.hxx"

using namespace std::literals;


namespace
{
using shared_text = std::shared_ptr<std::string const>;


/// Does `TEXT` convert to a query string without any help?
template<typename TEXT>
inline constexpr bool implicitly_trusted{
  std::is_convertible_v<TEXT, sqlgate::query_string>};


void test_trusted_types()
{
  static_assert(sqlgate::query_safe<sqlgate::static_text>);
  static_assert(sqlgate::query_safe<sqlgate::query_string>);
  static_assert(sqlgate::query_safe<sqlgate::query_string const &>);
  static_assert(
    sqlgate::query_safe<sqlgate::assert_query_safe<std::string_view>>);
  static_assert(sqlgate::query_safe<sqlgate::assert_query_safe<std::string>>);
  static_assert(
    sqlgate::query_safe<sqlgate::assert_query_safe<std::string> const &>);
  static_assert(sqlgate::query_safe<sqlgate::assert_query_safe<shared_text>>);

  static_assert(implicitly_trusted<sqlgate::static_text>);
  static_assert(
    implicitly_trusted<sqlgate::assert_query_safe<std::string_view>>);
  static_assert(implicitly_trusted<sqlgate::assert_query_safe<std::string>>);
  static_assert(implicitly_trusted<sqlgate::assert_query_safe<shared_text>>);
}


void test_untrusted_types()
{
  static_assert(not sqlgate::query_safe<std::string>);
  static_assert(not sqlgate::query_safe<std::string_view>);
  static_assert(not sqlgate::query_safe<char const *>);
  static_assert(not sqlgate::query_safe<shared_text>);
  static_assert(not sqlgate::query_safe<
                sqlgate::assert_query_safe<std::shared_ptr<std::string>>>);
  static_assert(
    not sqlgate::query_safe<sqlgate::assert_query_safe<char const *>>);
  static_assert(not sqlgate::query_safe<int>);

  static_assert(not implicitly_trusted<std::string>);
  static_assert(not implicitly_trusted<std::string const &>);
  static_assert(not implicitly_trusted<std::string_view>);
  static_assert(not implicitly_trusted<char const *>);
  static_assert(not implicitly_trusted<char *>);
  static_assert(not implicitly_trusted<shared_text>);
  static_assert(not implicitly_trusted<
                sqlgate::assert_query_safe<std::shared_ptr<std::string>>>);
}


void test_literal_converts_to_static()
{
  auto const query{sqlgate::into_query_string("SELECT 1")};
  SQLGATE_CHECK_EQUAL(query, "SELECT 1");
  SQLGATE_CHECK_EQUAL(query.mode(), sqlgate::storage::static_text);

  using sqlgate::operator""_sql;
  auto const from_static{sqlgate::into_query_string("SELECT 2"_sql)};
  SQLGATE_CHECK_EQUAL(from_static, "SELECT 2");
  SQLGATE_CHECK_EQUAL(from_static.mode(), sqlgate::storage::static_text);
}


void test_asserted_runtime_string()
{
  std::string query_text{"SELECT * FROM t WHERE id = "};
  query_text += std::to_string(5);

  auto const query{
    sqlgate::into_query_string(sqlgate::assert_query_safe{query_text})};
  SQLGATE_CHECK_EQUAL(query, "SELECT * FROM t WHERE id = 5");
  SQLGATE_CHECK_EQUAL(query.mode(), sqlgate::storage::owned);
  SQLGATE_CHECK_EQUAL(query_text, "SELECT * FROM t WHERE id = 5");

  SQLGATE_CHECK_SUCCEEDS(
    sqlgate::query_string{sqlgate::assert_query_safe{std::string{}}});
}


void test_asserted_string_view()
{
  std::string const text{"SELECT 3"};
  sqlgate::assert_query_safe const wrapped{std::string_view{text}};
  static_assert(std::is_same_v<
                std::remove_cvref_t<decltype(wrapped)>,
                sqlgate::assert_query_safe<std::string_view>>);

  auto const query{sqlgate::into_query_string(wrapped)};
  SQLGATE_CHECK_EQUAL(query.mode(), sqlgate::storage::borrowed);
  SQLGATE_CHECK(query.data() == text.data());
  SQLGATE_CHECK_EQUAL(query, "SELECT 3");
}


void test_asserted_shared_text()
{
  auto const text{std::make_shared<std::string const>("SELECT 4")};
  auto const query{
    sqlgate::into_query_string(sqlgate::assert_query_safe{text})};
  SQLGATE_CHECK_EQUAL(query.mode(), sqlgate::storage::shared);
  SQLGATE_CHECK(query.data() == text->data());
  SQLGATE_CHECK_EQUAL(text.use_count(), 2);
}


void test_query_string_converts_to_itself()
{
  std::string const text{"SELECT 5"};
  sqlgate::query_string const original{
    sqlgate::assert_query_safe{std::string_view{text}}};

  auto const query{sqlgate::into_query_string(original)};
  SQLGATE_CHECK_EQUAL(query, original);
  SQLGATE_CHECK_EQUAL(query.mode(), sqlgate::storage::borrowed);
  SQLGATE_CHECK(query.data() == original.data());
}


void test_null_shared_text_is_rejected()
{
  std::shared_ptr<std::string const> const null;
  SQLGATE_CHECK_THROWS(
    sqlgate::query_string{sqlgate::assert_query_safe{null}},
    sqlgate::argument_error);

  try
  {
    sqlgate::query_string const query{sqlgate::assert_query_safe{null}};
    sqlgate::test::check_notreached("Null shared text was accepted.");
  }
  catch (sqlgate::argument_error const &e)
  {
    // The error points to the caller, not to sqlgate's internals.
    SQLGATE_CHECK_EQUAL(
      std::string_view{e.location.file_name()},
      std::string_view{sqlgate::sl::current().file_name()});
  }
}


void test_null_shared_text_reports_given_location()
{
  std::shared_ptr<std::string const> const null;
  sqlgate::sl const here{sqlgate::sl::current()};
  try
  {
    std::ignore =
      sqlgate::into_query_string(sqlgate::assert_query_safe{null}, here);
    sqlgate::test::check_notreached("Null shared text was accepted.");
  }
  catch (sqlgate::argument_error const &e)
  {
    SQLGATE_CHECK_EQUAL(e.location.line(), here.line());
    SQLGATE_CHECK(
      std::string_view{e.what()}.find("null") != std::string_view::npos);
  }
}


/// A wrapper for query text, with its own path through the trust gate.
struct canned_query
{
  sqlgate::static_text text;
};
} // namespace


/// A third-party producer goes through one of the existing conversions.
template<> struct sqlgate::query_safe_traits<canned_query> final
{
  [[nodiscard]] static sqlgate::query_string
  into_query_string(canned_query const &query, sl) noexcept
  {
    return sqlgate::query_string{query.text};
  }
};


namespace
{
void test_custom_producer()
{
  using sqlgate::operator""_sql;
  static_assert(sqlgate::query_safe<canned_query>);

  canned_query const canned{"SELECT now()"_sql};
  sqlgate::query_string const query{canned};
  SQLGATE_CHECK_EQUAL(query, "SELECT now()");
  SQLGATE_CHECK_EQUAL(query.mode(), sqlgate::storage::static_text);
  SQLGATE_CHECK_EQUAL(sqlgate::into_query_string(canned), query);
}


SQLGATE_REGISTER_TEST(test_trusted_types);
SQLGATE_REGISTER_TEST(test_untrusted_types);
SQLGATE_REGISTER_TEST(test_literal_converts_to_static);
SQLGATE_REGISTER_TEST(test_asserted_runtime_string);
SQLGATE_REGISTER_TEST(test_asserted_string_view);
SQLGATE_REGISTER_TEST(test_asserted_shared_text);
SQLGATE_REGISTER_TEST(test_query_string_converts_to_itself);
SQLGATE_REGISTER_TEST(test_null_shared_text_is_rejected);
SQLGATE_REGISTER_TEST(test_null_shared_text_reports_given_location);
SQLGATE_REGISTER_TEST(test_custom_producer);
} // namespace
