/* Definition of the sqlgate::query_string class.
 *
 * sqlgate::query_string is text which has been cleared for execution as SQL.
 *
 * DO NOT INCLUDE THIS FILE DIRECTLY; include sqlgate/query_string instead.
 *
 * Copyright (c) 2026, the sqlgate authors.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the authors.
 */
#ifndef SQLGATE_H_QUERY_STRING
#define SQLGATE_H_QUERY_STRING

#if !defined(SQLGATE_HEADER_PRE)
#  error "Include sqlgate headers as <sqlgate/header>, not <sqlgate/header.hxx>."
#endif

#include <cassert>
#include <concepts>
#include <cstddef>
#include <format>
#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "sqlgate/static_text.hxx"
#include "sqlgate/types.hxx"


namespace sqlgate::internal::gate
{
class query_string_query_safe_traits;
} // namespace sqlgate::internal::gate


namespace sqlgate
{
/// Traits class: how does a "producer" type turn into a @ref query_string?
/** This is the trust gate.  If there is a specialisation of this template
 * for a type, then values of that type can become query strings.  If not,
 * they can't, and any attempt to pass one where a query is expected will fail
 * to compile.
 *
 * The specialisations are a closed set:
 * * @ref static_text converts to a query string directly.  (So does a string
 *   literal, but that's handled by a `consteval` constructor.)
 * * @ref query_string converts to itself.
 * * @ref assert_query_safe of `std::string_view`, `std::string`, or
 *   `std::shared_ptr<std::string const>` convert, but only because the code
 *   that wraps them explicitly vouches for their safety.
 *
 * Only these specialisations can get at the internal constructors of
 * `query_string`.  You can specialise this template for a type of your own,
 * but your implementation will have to go through one of the existing paths.
 * If it wraps runtime text in `assert_query_safe`, it makes the same promise
 * as any other caller of `assert_query_safe`, so it deserves the same
 * scrutiny in code review.
 *
 * A specialisation has a static member function
 * `query_string into_query_string(PRODUCER, sl)`, taking the producer by
 * value or by reference as appropriate.
 */
template<typename PRODUCER> struct query_safe_traits
{};


/// Concept: `PRODUCER` passes the trust gate.
/** String literals are not in here, even though they convert to a
 * @ref query_string.  The check that makes them safe needs to happen right
 * where the literal is written; it does not survive being passed around as a
 * reference.
 */
template<typename PRODUCER>
concept query_safe = requires(PRODUCER &&producer, sl loc) {
  {
    query_safe_traits<std::remove_cvref_t<PRODUCER>>::into_query_string(
      std::forward<PRODUCER>(producer), loc)
  } -> std::same_as<query_string>;
};


namespace internal
{
/// Text in a heap buffer of its own.  Just a pointer and a length.
/** Unlike `std::string` there is no capacity, and no small-string buffer.
 * The text always lives on the heap, so moving it never moves the bytes.
 */
struct owned_text final
{
  std::unique_ptr<char[]> buffer;
  std::size_t size{0};
};


/// Make an @ref owned_text holding a copy of `text`.
[[nodiscard]] SQLGATE_LIBEXPORT owned_text copy_text(std::string_view text);


/// Storage for the text of a @ref query_string, in any of its forms.
/** The owner keeps track of which member is active, and constructs and
 * destroys that member.
 */
template<typename OWNED, typename SHARED> union query_payload
{
  constexpr query_payload() noexcept : view{} {}
  constexpr explicit query_payload(std::string_view text) noexcept :
          view{text}
  {}
  explicit query_payload(OWNED &&text) noexcept : owned{std::move(text)} {}
  explicit query_payload(SHARED &&text) noexcept : shared{std::move(text)} {}
  constexpr ~query_payload() {}

  /// Active for @ref storage::borrowed and @ref storage::static_text.
  std::string_view view;
  /// Active for @ref storage::owned.
  OWNED owned;
  /// Active for @ref storage::shared.
  SHARED shared;
};
} // namespace internal


/// SQL text which is cleared for execution.
/** An execution API which only accepts `query_string` for its query text
 * cannot be given a query that was built up at run time, e.g. by
 * concatenating user input into a string.  Not by accident, anyway.
 *
 * There are two ways to get a `query_string`:
 * 1. Write the query as a string literal.  It converts implicitly.
 * 2. Wrap any other text in @ref assert_query_safe.  By doing this, _you_
 *    promise that the text is safe to execute.  If you built it from outside
 *    input, you will have made sure that there is no SQL injection problem.
 *
 * The recommended way to get variable data into a query is not to build it
 * into the query text at all, but to pass it as a statement parameter.
 *
 * A `query_string` never modifies its text.  Depending on where the text came
 * from, it may point to it, keep its own copy, or hold a reference to a
 * shared buffer.  See @ref storage.  It does not matter for the value: two
 * query strings with the same text compare equal and hash the same.
 *
 * @warning A `query_string` made from an `assert_query_safe<std::string_view>`
 * does not own its text.  It is only valid as long as the text it points to.
 * Call @ref detach() if you need to keep it around longer.
 */
class SQLGATE_LIBEXPORT query_string final
{
public:
  /// Empty query.
  constexpr query_string() noexcept = default;

  /// Accept a string literal as a query.
  /** This is what makes the easy case easy: `exec("SELECT 1")` just works,
   * without any copying.
   *
   * The constructor only works for text that is a compile-time constant.  A
   * `char` array built at run time won't compile.
   */
  template<std::size_t size>
  consteval query_string(char const (&literal)[size]) :
          query_string{static_text{literal}}
  {}

  /// Accept compile-time constant text as a query.
  constexpr query_string(static_text text) noexcept :
          m_mode{storage::static_text}, m_payload{text.view()}
  {}

  /// Convert any other type that passes the trust gate.
  /** @see query_safe_traits for the types that do.
   */
  template<typename PRODUCER>
    requires(
      not std::same_as<std::remove_cvref_t<PRODUCER>, query_string> and
      not std::same_as<std::remove_cvref_t<PRODUCER>, static_text> and
      query_safe<PRODUCER>)
  query_string(PRODUCER &&producer, sl loc = sl::current()) :
          query_string{
            query_safe_traits<std::remove_cvref_t<PRODUCER>>::into_query_string(
              std::forward<PRODUCER>(producer), loc)}
  {}

  /// Copy.  Copies owned text into a new buffer; shares everything else.
  query_string(query_string const &);
  /// Move.  Leaves `other` as an empty query.
  query_string(query_string &&other) noexcept;
  query_string &operator=(query_string const &);
  query_string &operator=(query_string &&other) noexcept;

  constexpr ~query_string() { destroy(); }

  /// Read-only view on the query text, regardless of how it's stored.
  [[nodiscard]] constexpr std::string_view view() const noexcept
  {
    switch (m_mode)
    {
    case storage::borrowed:
    case storage::static_text: return m_payload.view;
    case storage::owned:
      return {m_payload.owned.buffer.get(), m_payload.owned.size};
    case storage::shared: return *m_payload.shared;
    }
    SQLGATE_UNREACHABLE;
    return {};
  }

  /// Pointer to the query text.  Not necessarily zero-terminated.
  [[nodiscard]] constexpr char const *data() const noexcept
  {
    return view().data();
  }

  /// Length of the query text, in bytes.
  [[nodiscard]] constexpr std::size_t size() const noexcept
  {
    return view().size();
  }

  [[nodiscard]] constexpr bool empty() const noexcept
  {
    return view().empty();
  }

  /// How is the text stored?
  [[nodiscard]] constexpr storage mode() const noexcept { return m_mode; }

  /// Release any dependency on the lifetime of borrowed text.
  /** If this query string was made from borrowed text, returns a query
   * string with its own copy of the text.  That's one allocation and one
   * copy.
   *
   * Otherwise, returns the same query string, unchanged.  It was never tied
   * to anybody else's lifetime, so there's nothing to copy.
   */
  [[nodiscard]] query_string detach() &&;

  friend constexpr bool
  operator==(query_string const &lhs, query_string const &rhs) noexcept
  {
    return lhs.view() == rhs.view();
  }

  /// Compare to any kind of text.
  /** Like two query strings, a query string and a text are equal if their
   * bytes are equal.
   */
  template<typename TEXT>
    requires std::convertible_to<TEXT const &, std::string_view>
  friend constexpr bool
  operator==(query_string const &lhs, TEXT const &rhs) noexcept
  {
    return lhs.view() == std::string_view{rhs};
  }

private:
  friend class internal::gate::query_string_query_safe_traits;

  struct borrowed_tag
  {};
  struct owned_tag
  {};

  /// Borrow text.
  constexpr query_string(borrowed_tag, std::string_view text) noexcept :
          m_mode{storage::borrowed}, m_payload{text}
  {}

  /// Make a private copy of text.
  query_string(owned_tag, std::string_view text) :
          m_mode{storage::owned}, m_payload{internal::copy_text(text)}
  {}

  /// Share ownership of text.
  explicit query_string(std::shared_ptr<std::string const> &&text) noexcept :
          m_mode{storage::shared}, m_payload{std::move(text)}
  {}

  /// Destroy the active payload member, if it needs destroying.
  constexpr void destroy() noexcept
  {
    if (m_mode == storage::owned)
      std::destroy_at(&m_payload.owned);
    else if (m_mode == storage::shared)
      std::destroy_at(&m_payload.shared);
  }

  /// Become an empty query with static storage.
  void reset() noexcept;

  /// Take over `other`'s text, leaving `other` empty.  We must be empty.
  void steal(query_string &other) noexcept;

  storage m_mode{storage::static_text};
  internal::query_payload<
    internal::owned_text, std::shared_ptr<std::string const>>
    m_payload;
};


/// Write the query text to a stream.
inline std::ostream &operator<<(std::ostream &s, query_string const &query)
{
  return s.write(query.data(), static_cast<std::streamsize>(query.size()));
}
} // namespace sqlgate


/// Hash a query string by its text.
/** Hashes exactly like `std::hash<std::string_view>` on the query text.
 *
 * The hash is transparent, so a set or map keyed on query strings can look
 * up a `std::string_view` directly, if its equality comparison is
 * transparent as well (e.g. `std::equal_to<>`).
 */
template<> struct std::hash<sqlgate::query_string>
{
  using is_transparent = void;

  [[nodiscard]] std::size_t
  operator()(sqlgate::query_string const &query) const noexcept
  {
    return std::hash<std::string_view>{}(query.view());
  }

  [[nodiscard]] std::size_t operator()(std::string_view text) const noexcept
  {
    return std::hash<std::string_view>{}(text);
  }
};


/// Format a query string as its text.
template<>
struct std::formatter<sqlgate::query_string>
        : std::formatter<std::string_view>
{
  template<typename CONTEXT>
  auto format(sqlgate::query_string const &query, CONTEXT &ctx) const
  {
    return std::formatter<std::string_view>::format(query.view(), ctx);
  }
};
#endif
