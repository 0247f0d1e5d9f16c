/** Implementation of sqlgate exception classes.
 *
 * Copyright (c) 2026, the sqlgate authors.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the authors.
 */
#include "sqlgate-source.hxx"

#include <format>

#include "sqlgate/internal/header-pre.hxx"

#include "sqlgate/except.hxx"

#include "sqlgate/internal/header-post.hxx"


sqlgate::internal_error::internal_error(std::string const &whatarg, sl loc) :
        std::logic_error{"sqlgate internal error: " + whatarg}, location{loc}
{}


sqlgate::usage_error::usage_error(std::string const &whatarg, sl loc) :
        std::logic_error{whatarg}, location{loc}
{}


sqlgate::argument_error::argument_error(std::string const &whatarg, sl loc) :
        std::invalid_argument{whatarg}, location{loc}
{}


std::string sqlgate::source_loc(sl const &loc)
{
  std::string_view const func{loc.function_name()};
  if (std::empty(func))
    return std::format("{}:{}:{}", loc.file_name(), loc.line(), loc.column());
  else
    return std::format(
      "{}:{}:{}: ({})", loc.file_name(), loc.line(), loc.column(), func);
}
