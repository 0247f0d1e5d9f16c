/* The trust gate: which kinds of text may become a query_string, and how.
 *
 * DO NOT INCLUDE THIS FILE DIRECTLY; include sqlgate/query_safe instead.
 *
 * Copyright (c) 2026, the sqlgate authors.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the authors.
 */
#ifndef SQLGATE_H_QUERY_SAFE
#define SQLGATE_H_QUERY_SAFE

#if !defined(SQLGATE_HEADER_PRE)
#  error "Include sqlgate headers as <sqlgate/header>, not <sqlgate/header.hxx>."
#endif

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "sqlgate/query_string.hxx"
#include "sqlgate/static_text.hxx"
#include "sqlgate/types.hxx"


namespace sqlgate
{
/// Assert that query text is safe to execute.
/** Wrap text in this to turn it into a @ref query_string.
 *
 * Using this means that **you** have made sure that the text does not
 * contain an SQL injection vulnerability.  If you built it at run time, and
 * especially if you built it from user input, you have sanitised that input
 * yourself.  sqlgate does not look at the text at all; it takes your word for
 * it.
 *
 * String literals don't need this.  They convert to `query_string` directly.
 *
 * Supported types for `TEXT`:
 * * `std::string_view`: the query string borrows the text.  The text must
 *   stay alive and unchanged for as long as you use the query string, or
 *   until you call @ref query_string::detach().
 * * `std::string`: the query string makes its own copy of the text, in a
 *   buffer that it never resizes.  That's one allocation and one copy.
 * * `std::shared_ptr<std::string const>`: the query string shares ownership.
 *   The text must not be null.
 *
 * There is deliberately no support for `std::shared_ptr<std::string>`.  Any
 * other owner of that pointer could modify the text, from any thread, while
 * the query string is using it.
 *
 * ```cxx
 * std::string const query{build_my_query()};
 * tx.exec(sqlgate::assert_query_safe{query});
 * ```
 */
template<typename TEXT> struct assert_query_safe
{
  TEXT value;
};

template<typename TEXT> assert_query_safe(TEXT) -> assert_query_safe<TEXT>;


template<> struct query_safe_traits<static_text>;
template<> struct query_safe_traits<query_string>;
template<> struct query_safe_traits<assert_query_safe<std::string_view>>;
template<> struct query_safe_traits<assert_query_safe<std::string>>;
template<>
struct query_safe_traits<assert_query_safe<std::shared_ptr<std::string const>>>;
} // namespace sqlgate


#include "sqlgate/internal/gates/query_string-query_safe_traits.hxx"


namespace sqlgate
{
/// Compile-time constant text goes straight through, with static storage.
template<> struct query_safe_traits<static_text> final
{
  [[nodiscard]] static constexpr query_string
  into_query_string(static_text text, sl) noexcept
  {
    return query_string{text};
  }
};


/// A query string is already trusted.  Converting it changes nothing.
/** This lets a function that accepts "anything query-safe" accept an
 * existing `query_string` as well.
 */
template<> struct query_safe_traits<query_string> final
{
  [[nodiscard]] static query_string into_query_string(query_string query, sl)
  {
    return query;
  }
};


/// Borrowed text.  Does not copy.
template<>
struct query_safe_traits<assert_query_safe<std::string_view>> final
{
  [[nodiscard]] static query_string
  into_query_string(assert_query_safe<std::string_view> text, sl) noexcept
  {
    return internal::gate::query_string_query_safe_traits::borrowed(
      text.value);
  }
};


/// Owned text.  Copies the string into a heap buffer of exactly its size.
template<> struct query_safe_traits<assert_query_safe<std::string>> final
{
  [[nodiscard]] static query_string
  into_query_string(assert_query_safe<std::string> const &text, sl)
  {
    return internal::gate::query_string_query_safe_traits::owned(text.value);
  }
};


/// Text with shared ownership.  Takes a reference, does not copy.
/** @throw argument_error if the pointer is null.
 */
template<>
struct SQLGATE_LIBEXPORT
  query_safe_traits<assert_query_safe<std::shared_ptr<std::string const>>>
        final
{
  [[nodiscard]] static query_string into_query_string(
    assert_query_safe<std::shared_ptr<std::string const>> text, sl loc);
};


/// Convert text to a @ref query_string, through the trust gate.
/** Works for any type that satisfies @ref query_safe.
 *
 * The `loc` argument is the source location to report if the conversion
 * fails.
 */
template<query_safe PRODUCER>
[[nodiscard]] inline query_string
into_query_string(PRODUCER &&producer, sl loc = sl::current())
{
  return query_safe_traits<std::remove_cvref_t<PRODUCER>>::into_query_string(
    std::forward<PRODUCER>(producer), loc);
}


/// Convert a string literal to a @ref query_string.
/** Only accepts text that is constant at compile time.
 */
template<std::size_t size>
[[nodiscard]] consteval query_string
into_query_string(char const (&literal)[size])
{
  return query_string{literal};
}
} // namespace sqlgate
#endif
