/* Basic type aliases and forward declarations.
 *
 * Copyright (c) 2000-2025, Jeroen T. Vermeulen
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PGQUOTE_H_TYPES
#define PGQUOTE_H_TYPES

#if !defined(PGQUOTE_HEADER_PRE)
#  error "Include pgquote headers as <pgquote/header>, not <pgquote/header.hxx>."
#endif

#include <cstddef>
#include <source_location>
#include <span>
#include <string_view>
#include <vector>


namespace pgquote
{
/// Convenience alias: the source location type we attach to exceptions.
using sl = std::source_location;


/// Type alias for a container containing bytes.
using bytes = std::vector<std::byte>;

/// Type alias for a view of bytes.
using bytes_view = std::span<std::byte const>;


/// Cast binary data to a type that pgquote will recognise as binary.
/** The result refers to the same memory as `data`.  Make sure the original
 * stays alive for as long as you use the view.
 */
inline bytes_view binary_cast(std::string_view data) noexcept
{
  return {reinterpret_cast<std::byte const *>(std::data(data)), std::size(data)};
}


/// Reinterpret binary data as a string of `char`.
inline std::string_view text_cast(bytes_view data) noexcept
{
  return {reinterpret_cast<char const *>(std::data(data)), std::size(data)};
}


// Forward declarations, to help break compilation dependencies.
class adapter;
class connection;
class connection_context;
struct encoding_descriptor;
struct quoting_options;
} // namespace pgquote
#endif
