/* Basic type aliases and forward declarations.
 *
 * DO NOT INCLUDE THIS FILE DIRECTLY; include sqlgate/types instead.
 *
 * Copyright (c) 2026, the sqlgate authors.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the authors.
 */
#ifndef SQLGATE_H_TYPES
#define SQLGATE_H_TYPES

#if !defined(SQLGATE_HEADER_PRE)
#  error "Include sqlgate headers as <sqlgate/header>, not <sqlgate/header.hxx>."
#endif

#include <format>
#include <source_location>
#include <string_view>


namespace sqlgate
{
/// Convenience alias for `std::source_location`.  It's just too long.
using sl = std::source_location;


// Forward declarations, to help break compilation dependencies.
class query_string;
class static_text;
template<typename TEXT> struct assert_query_safe;
template<typename PRODUCER> struct query_safe_traits;


/// How a @ref query_string stores its text.
/** The storage mode is an implementation detail as far as the query's
 * meaning goes: equality and hashing ignore it.  It's exposed so that you can
 * see whether a conversion copied your text or not.
 */
enum class storage : unsigned char
{
  /// Points to text owned by somebody else.  Lives no longer than the owner.
  borrowed,
  /// Points to text that lives as long as the program.  Never copied.
  static_text,
  /// Owns a private copy of the text.
  owned,
  /// Holds a reference to text in an atomically reference-counted buffer.
  shared,
};


/// Human-readable name for a storage mode.
[[nodiscard]] constexpr std::string_view name_of(storage mode) noexcept
{
  switch (mode)
  {
  case storage::borrowed: return "borrowed";
  case storage::static_text: return "static";
  case storage::owned: return "owned";
  case storage::shared: return "shared";
  }
  return "unknown";
}
} // namespace sqlgate


/// Format a storage mode as its name.
template<>
struct std::formatter<sqlgate::storage> : std::formatter<std::string_view>
{
  template<typename CONTEXT>
  auto format(sqlgate::storage mode, CONTEXT &ctx) const
  {
    return std::formatter<std::string_view>::format(
      sqlgate::name_of(mode), ctx);
  }
};
#endif
