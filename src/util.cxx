/** Various utility functions.
 *
 * Copyright (c) 2000-2025, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#include "pgquote-source.hxx"

#include "pgquote/internal/header-pre.hxx"

#include "pgquote/internal/concat.hxx"
#include "pgquote/internal/util.hxx"

#include "pgquote/internal/header-post.hxx"


std::string pgquote::internal::source_loc(sl loc)
{
  // Not all compilers give us a column number.
  std::string const column{
    (loc.column() == 0) ? std::string{} :
                          concat(":", std::to_string(loc.column()))};
  char const *const func{loc.function_name()};
  if ((func == nullptr) or (*func == '\0'))
    return concat(
      loc.file_name(), ":", std::to_string(loc.line()), column);
  else
    return concat(
      loc.file_name(), ":", std::to_string(loc.line()), column, ": (", func,
      ")");
}
