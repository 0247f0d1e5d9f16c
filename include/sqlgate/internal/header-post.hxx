/* Compiler deficiency workarounds for compiling sqlgate headers.
 *
 * To be included at the end of each sqlgate header, in order to restore the
 * client program's settings.
 *
 * Copyright (c) 2026, the sqlgate authors.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the authors.
 */
// NO GUARDS HERE! This code should be executed every time!

#if defined(_MSC_VER)
#  pragma warning(pop) // Restore client program's warning state
#endif


#if !defined(SQLGATE_HEADER_PRE)
#  error "Include sqlgate/internal/header-post.hxx AFTER its 'pre' counterpart."
#endif

#undef SQLGATE_HEADER_PRE
