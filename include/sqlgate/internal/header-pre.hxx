/* Compiler settings for compiling sqlgate headers, and workarounds for all.
 *
 * Include this before including any other sqlgate headers from within
 * sqlgate.  And to balance it out, also include header-post.hxx at the end of
 * the batch of headers.
 *
 * The public sqlgate headers (e.g. `<sqlgate/query_string>`) include this
 * already; there's no need to do this from within an application.
 *
 * Include this file at the highest aggregation level possible to avoid
 * nesting and to keep things simple.
 *
 * Copyright (c) 2026, the sqlgate authors.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the authors.
 */

#if __has_include(<version>)
#  include <version>
#endif

// NO GUARD HERE! This part should be included every time this file is.
#if defined(_MSC_VER)

// Save compiler's warning state, and set warning level 4 for maximum
// sensitivity to warnings.
#  pragma warning(push, 4)

// Visual C++ generates some entirely unreasonable warnings.  Disable them.
#  pragma warning(disable : 4061 4251 4275 4275 4511 4512 4514 4623 4625)
#  pragma warning(disable : 4626 4702 4820 4868 5026 5027 5031 5045 6294)

#endif // _MSC_VER


#if defined(SQLGATE_HEADER_PRE)
#  error "Avoid nesting #include of sqlgate/internal/header-pre.hxx."
#endif

#define SQLGATE_HEADER_PRE


// Workarounds & definitions that need to be included even in library's headers
#include "sqlgate/config-compiler.h"

// MSVC has a nonstandard definition of __cplusplus.
#if defined(_MSC_VER)
#  define SQLGATE_CPLUSPLUS _MSVC_LANG
#else
#  define SQLGATE_CPLUSPLUS __cplusplus
#endif

#if SQLGATE_CPLUSPLUS < 202002L
#  error "sqlgate needs C++20 or better."
#endif

#if __has_cpp_attribute(gnu::cold)
/// Tell the compiler to optimise a function for size, not speed.
#  define SQLGATE_COLD [[gnu::cold]]
#else
#  define SQLGATE_COLD /* cold */
#endif


// Workarounds for Windows
#ifdef _WIN32

/* For now, export DLL symbols if _DLL is defined.  This is done automatically
 * by the compiler when linking to the dynamic version of the runtime library,
 * according to "gzh"
 */
#  if defined(SQLGATE_SHARED) && !defined(SQLGATE_LIBEXPORT)
#    define SQLGATE_LIBEXPORT __declspec(dllimport)
#  endif // SQLGATE_SHARED && !SQLGATE_LIBEXPORT

#elif defined(SQLGATE_HAVE_GCC_VISIBILITY) // !_WIN32

#  define SQLGATE_LIBEXPORT [[gnu::visibility("default")]]
#  define SQLGATE_PRIVATE [[gnu::visibility("hidden")]]

#endif // SQLGATE_HAVE_GCC_VISIBILITY


#ifndef SQLGATE_LIBEXPORT
#  define SQLGATE_LIBEXPORT /* libexport */
#endif

#ifndef SQLGATE_PRIVATE
#  define SQLGATE_PRIVATE /* private */
#endif


// C++23: Retire wrapper.
// SQLGATE_UNREACHABLE: equivalent to `std::unreachable()` if available.
#if !defined(__cpp_lib_unreachable)
#  define SQLGATE_UNREACHABLE assert(false)
#elif !__cpp_lib_unreachable
#  define SQLGATE_UNREACHABLE assert(false)
#else
#  define SQLGATE_UNREACHABLE std::unreachable()
#endif
