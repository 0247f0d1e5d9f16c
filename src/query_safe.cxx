/** Implementation of the trust gate's out-of-line conversions.
 *
 * Copyright (c) 2026, the sqlgate authors.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the authors.
 */
#include "sqlgate-source.hxx"

#include <memory>
#include <string>
#include <utility>

#include "sqlgate/internal/header-pre.hxx"

#include "sqlgate/except.hxx"
#include "sqlgate/query_safe.hxx"

#include "sqlgate/internal/header-post.hxx"


sqlgate::query_string sqlgate::query_safe_traits<
  sqlgate::assert_query_safe<std::shared_ptr<std::string const>>>::
  into_query_string(
    assert_query_safe<std::shared_ptr<std::string const>> text, sl loc)
{
  if (not text.value)
    throw argument_error{
      "Got null pointer where shared query text was expected.", loc};
  return internal::gate::query_string_query_safe_traits::shared(
    std::move(text.value));
}
