/* Compiler settings for compiling pgquote itself.
 *
 * Include this header in every source file that goes into the pgquote library
 * binary, and nowhere else.
 *
 * To ensure this, include this file once, as the very first header, in each
 * compilation unit for the library.
 *
 * DO NOT INCLUDE THIS FILE when building client programs.
 *
 * Copyright (c) 2000-2025, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PGQUOTE_H_SOURCE
#define PGQUOTE_H_SOURCE

// We're compiling the library itself.  Headers may want to know that, e.g. to
// pick the right kind of symbol visibility.
#define PGQUOTE_INTERNAL

#endif
