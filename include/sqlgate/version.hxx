/* Version info for sqlgate.
 *
 * DO NOT INCLUDE THIS FILE DIRECTLY; include sqlgate/version instead.
 *
 * Copyright (c) 2026, the sqlgate authors.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the authors.
 */
#ifndef SQLGATE_H_VERSION
#define SQLGATE_H_VERSION

#if !defined(SQLGATE_HEADER_PRE)
#  error "Include sqlgate headers as <sqlgate/header>, not <sqlgate/header.hxx>."
#endif

/// Full sqlgate version string.
#define SQLGATE_VERSION "1.0.0"
/// Library ABI version.
#define SQLGATE_ABI "1.0"

/// Major version number.
#define SQLGATE_VERSION_MAJOR 1
/// Minor version number.
#define SQLGATE_VERSION_MINOR 0
#endif
