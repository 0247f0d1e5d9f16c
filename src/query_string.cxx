/** Implementation of the sqlgate::query_string class.
 *
 * sqlgate::query_string is text which has been cleared for execution as SQL.
 *
 * Copyright (c) 2026, the sqlgate authors.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the authors.
 */
#include "sqlgate-source.hxx"

#include <algorithm>
#include <format>
#include <memory>
#include <string_view>
#include <utility>

#include "sqlgate/internal/header-pre.hxx"

#include "sqlgate/except.hxx"
#include "sqlgate/query_safe.hxx"
#include "sqlgate/query_string.hxx"

#include "sqlgate/internal/header-post.hxx"


sqlgate::internal::owned_text
sqlgate::internal::copy_text(std::string_view text)
{
  owned_text copy{std::make_unique_for_overwrite<char[]>(std::size(text)),
                  std::size(text)};
  std::ranges::copy(text, copy.buffer.get());
  return copy;
}


sqlgate::query_string::query_string(query_string const &other)
{
  switch (other.m_mode)
  {
  case storage::borrowed:
  case storage::static_text: m_payload.view = other.m_payload.view; break;
  case storage::owned:
    std::construct_at(
      &m_payload.owned, internal::copy_text(other.view()));
    break;
  case storage::shared:
    std::construct_at(&m_payload.shared, other.m_payload.shared);
    break;
  default:
    throw internal_error{std::format(
      "Copying query_string with unknown storage mode {}.",
      static_cast<int>(other.m_mode))};
  }
  m_mode = other.m_mode;
}


sqlgate::query_string::query_string(query_string &&other) noexcept
{
  steal(other);
}


sqlgate::query_string &
sqlgate::query_string::operator=(query_string const &rhs)
{
  if (&rhs != this)
    *this = query_string{rhs};
  return *this;
}


sqlgate::query_string &
sqlgate::query_string::operator=(query_string &&other) noexcept
{
  if (&other != this)
  {
    reset();
    steal(other);
  }
  return *this;
}


void sqlgate::query_string::reset() noexcept
{
  destroy();
  m_mode = storage::static_text;
  std::construct_at(&m_payload.view);
}


void sqlgate::query_string::steal(query_string &other) noexcept
{
  switch (other.m_mode)
  {
  case storage::borrowed:
  case storage::static_text: m_payload.view = other.m_payload.view; break;
  case storage::owned:
    std::construct_at(&m_payload.owned, std::move(other.m_payload.owned));
    break;
  case storage::shared:
    std::construct_at(&m_payload.shared, std::move(other.m_payload.shared));
    break;
  }
  m_mode = other.m_mode;
  other.reset();
}


sqlgate::query_string sqlgate::query_string::detach() &&
{
  if (m_mode == storage::borrowed)
    return query_string{owned_tag{}, m_payload.view};
  else
    return std::move(*this);
}
