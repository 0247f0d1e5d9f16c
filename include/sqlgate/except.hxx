/* Definition of sqlgate exception classes.
 *
 * sqlgate::argument_error, sqlgate::usage_error, sqlgate::internal_error.
 *
 * DO NOT INCLUDE THIS FILE DIRECTLY; include sqlgate/except instead.
 *
 * Copyright (c) 2026, the sqlgate authors.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the authors.
 */
#ifndef SQLGATE_H_EXCEPT
#define SQLGATE_H_EXCEPT

#if !defined(SQLGATE_HEADER_PRE)
#  error "Include sqlgate headers as <sqlgate/header>, not <sqlgate/header.hxx>."
#endif

#include <stdexcept>
#include <string>

#include "sqlgate/types.hxx"


namespace sqlgate
{
/**
 * @addtogroup exception Exception classes
 *
 * None of these should happen when you pass query text through the trust
 * gate in the normal way.  Wrong usage is caught at compile time wherever
 * that is possible.  These exceptions cover the remaining cases, which only
 * become visible at run time.
 *
 * Every exception carries the source location of the call that triggered it.
 *
 * @{
 */

/// Internal error in sqlgate library
struct SQLGATE_LIBEXPORT internal_error : std::logic_error
{
  SQLGATE_COLD explicit internal_error(
    std::string const &, sl = sl::current());

  sl location;
};


/// Error in usage of sqlgate library, similar to std::logic_error
/** When sqlgate detects wrong usage during constant evaluation, it throws
 * this.  Throwing is not allowed in a constant expression, so in practice the
 * exception becomes a compile error that quotes its message.
 */
struct SQLGATE_LIBEXPORT usage_error : std::logic_error
{
  SQLGATE_COLD explicit usage_error(
    std::string const &, sl = sl::current());

  sl location;
};


/// Invalid argument passed to sqlgate, similar to std::invalid_argument
struct SQLGATE_LIBEXPORT argument_error : std::invalid_argument
{
  SQLGATE_COLD explicit argument_error(
    std::string const &, sl = sl::current());

  sl location;
};

/**
 * @}
 */


/// Represent a source location as human-readable text.
/** Useful for logging the `location` of an exception.  Includes the file
 * name, line, column, and function name, as far as the compiler provides
 * them.
 */
[[nodiscard]] SQLGATE_COLD SQLGATE_LIBEXPORT std::string
source_loc(sl const &loc);
} // namespace sqlgate
#endif
