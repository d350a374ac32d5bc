/* Compiler settings for compiling pgquote headers, and workarounds for all.
 *
 * Include this before including any other pgquote headers from within
 * pgquote.  And to balance it out, also include header-post.hxx at the end of
 * the batch of headers.
 *
 * The public pgquote headers (e.g. `<pgquote/adapter>`) include this already;
 * there's no need to do this from within an application.
 *
 * Include this file at the highest aggregation level possible to avoid nesting
 * and to keep things simple.
 *
 * Copyright (c) 2000-2025, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
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


#if defined(PGQUOTE_HEADER_PRE)
#  error "Avoid nesting #include of pgquote/internal/header-pre.hxx."
#endif

#define PGQUOTE_HEADER_PRE


// The rest is only needed once.
#if !defined(PGQUOTE_H_HEADER_PRE_DEFINITIONS)
#  define PGQUOTE_H_HEADER_PRE_DEFINITIONS

#  if __has_cpp_attribute(gnu::pure)
/// Declare function "pure": no side effects, only reads globals and its args.
/** Be careful with exceptions.  The compiler may elide calls, which may stop
 * an exception from happening; or reorder them, moving a call outside of a
 * `try` block that was meant to catch the exception.
 */
#    define PGQUOTE_PURE [[gnu::pure]]
#  else
#    define PGQUOTE_PURE /* pure */
#  endif


#  if __has_cpp_attribute(gnu::cold)
/// Tell the compiler to optimise a function for size, not speed.
#    define PGQUOTE_COLD [[gnu::cold]]
#  else
#    define PGQUOTE_COLD /* cold */
#  endif


#  if __has_cpp_attribute(gnu::always_inline)
/// Never generate an out-of-line version of this inline function.
#    define PGQUOTE_INLINE_ONLY [[gnu::always_inline]]
#  else
#    define PGQUOTE_INLINE_ONLY /* always inline */
#  endif


#  if __has_cpp_attribute(gnu::returns_nonnull)
/// For functions returning a pointer: the pointer is never null.
#    define PGQUOTE_RETURNS_NONNULL [[gnu::returns_nonnull]]
#  else
#    define PGQUOTE_RETURNS_NONNULL /* returns nonnull */
#  endif


#  if defined(_WIN32) && defined(PGQUOTE_SHARED)
#    if defined(PGQUOTE_INTERNAL)
#      define PGQUOTE_LIBEXPORT __declspec(dllexport)
#    else
#      define PGQUOTE_LIBEXPORT __declspec(dllimport)
#    endif
#  elif __has_cpp_attribute(gnu::visibility)
#    define PGQUOTE_LIBEXPORT [[gnu::visibility("default")]]
#  endif

#  ifndef PGQUOTE_LIBEXPORT
#    define PGQUOTE_LIBEXPORT /* libexport */
#  endif

#endif // PGQUOTE_H_HEADER_PRE_DEFINITIONS
