/** Various internal utilities.
 *
 * Copyright (c) 2000-2025, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#if !defined(PGQUOTE_H_UTIL)
#  define PGQUOTE_H_UTIL

#  include <string>

#  include "pgquote/types.hxx"

namespace pgquote::internal
{
/// Render a source location as a human-readable string.
[[nodiscard]] PGQUOTE_LIBEXPORT std::string source_loc(sl loc);
} // namespace pgquote::internal
#endif
