/* Compiler settings for compiling sqlgate itself.
 *
 * Include this header in every source file that goes into the sqlgate library
 * binary, and nowhere else.
 *
 * To ensure this, include this file once, as the very first header, in each
 * compilation unit for the library.
 *
 * DO NOT INCLUDE THIS FILE when building client programs.
 *
 * Copyright (c) 2026, the sqlgate authors.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the authors.
 */
#ifndef SQLGATE_H_SOURCE
#define SQLGATE_H_SOURCE

#if defined(_WIN32) && defined(SQLGATE_SHARED)
// We're building sqlgate as a shared library.
#  define SQLGATE_LIBEXPORT __declspec(dllexport)
#  define SQLGATE_PRIVATE __declspec()
#endif // _WIN32 && SQLGATE_SHARED

#endif
