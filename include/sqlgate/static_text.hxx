/* Compile-time constant text.
 *
 * DO NOT INCLUDE THIS FILE DIRECTLY; include sqlgate/static_text instead.
 *
 * Copyright (c) 2026, the sqlgate authors.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the authors.
 */
#ifndef SQLGATE_H_STATIC_TEXT
#define SQLGATE_H_STATIC_TEXT

#if !defined(SQLGATE_HEADER_PRE)
#  error "Include sqlgate headers as <sqlgate/header>, not <sqlgate/header.hxx>."
#endif

#include <cstddef>
#include <string_view>

#include "sqlgate/except.hxx"
#include "sqlgate/types.hxx"


namespace sqlgate
{
/// View on text which is fixed in the program's source code.
/** A `static_text` can only be created during compilation, from text that is
 * a constant expression with static storage duration: a string literal, a
 * `constexpr` character array, or a `constexpr std::string_view` on either.
 * Anything else fails to compile.
 *
 * Text like that cannot contain anything from the outside world, so it is
 * trusted without further ado.  A @ref query_string made from a
 * `static_text` just points to the text; it never copies it.
 *
 * The terminating zero of a string literal is not "in" the text, so it does
 * not count as part of the view's length.  Zero bytes inside the literal do.
 */
class static_text final
{
public:
  /// An empty text.
  constexpr static_text() noexcept = default;

  /// Construct a `static_text` from a string literal.
  /** A C++ string literal ("foo") is an array of char, so we know its size
   * and don't need to scan through the string to find out its length.  Any
   * zero bytes before the end stay part of the text.
   */
  template<std::size_t size>
  consteval static_text(char const (&literal)[size]) :
          static_text{std::string_view{literal, size - 1}}
  {
    // Also ensures that the array is a constant.  Reading a non-const array
    // is not a constant expression.
    if (literal[size - 1] != '\0')
      throw usage_error{"static_text array is not zero-terminated."};
  }

  /// Construct a `static_text` from a constant string view.
  /** The view must point to text with static storage duration, and that text
   * must be a constant.  The constructor reads every byte to make sure.
   */
  consteval explicit static_text(std::string_view text) : m_view{text}
  {
    for (char const c : text) static_cast<void>(c);
  }

  [[nodiscard]] constexpr std::string_view view() const noexcept
  {
    return m_view;
  }
  [[nodiscard]] constexpr char const *data() const noexcept
  {
    return m_view.data();
  }
  [[nodiscard]] constexpr std::size_t size() const noexcept
  {
    return m_view.size();
  }
  [[nodiscard]] constexpr bool empty() const noexcept
  {
    return m_view.empty();
  }

  friend constexpr bool
  operator==(static_text const &lhs, static_text const &rhs) noexcept
  {
    return lhs.m_view == rhs.m_view;
  }

private:
  std::string_view m_view;
};


/// Support @c static_text literals.
/** You can "import" this selectively into your namespace, without pulling in
 * all of the @c sqlgate namespace:
 *
 * @c using sqlgate::operator""_sql;
 */
consteval static_text operator""_sql(char const str[], std::size_t len)
{
  return static_text{std::string_view{str, len}};
}
} // namespace sqlgate
#endif
