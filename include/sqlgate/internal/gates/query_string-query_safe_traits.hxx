#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "sqlgate/query_string.hxx"


namespace sqlgate::internal::gate
{
/// Call gate: lets the trust gate's conversions construct query strings.
/** Only the `query_safe_traits` specialisations for @ref assert_query_safe
 * get to use this.  Nothing else can produce a borrowed, owned, or shared
 * @ref query_string.
 */
class SQLGATE_PRIVATE query_string_query_safe_traits final
{
  friend struct sqlgate::query_safe_traits<
    sqlgate::assert_query_safe<std::string_view>>;
  friend struct sqlgate::query_safe_traits<
    sqlgate::assert_query_safe<std::string>>;
  friend struct sqlgate::query_safe_traits<
    sqlgate::assert_query_safe<std::shared_ptr<std::string const>>>;

  [[nodiscard]] static query_string borrowed(std::string_view text) noexcept
  {
    return query_string{query_string::borrowed_tag{}, text};
  }

  [[nodiscard]] static query_string owned(std::string_view text)
  {
    return query_string{query_string::owned_tag{}, text};
  }

  [[nodiscard]] static query_string
  shared(std::shared_ptr<std::string const> &&text) noexcept
  {
    return query_string{std::move(text)};
  }
};
} // namespace sqlgate::internal::gate
