/** Internal string concatenation helper.
 *
 * Copyright (c) 2000-2025, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#if !defined(PGQUOTE_H_CONCAT)
#  define PGQUOTE_H_CONCAT

#  include <concepts>
#  include <string>
#  include <string_view>

namespace pgquote::internal
{
/// Represent a piece of a `concat()` call as something appendable.
template<typename T>
inline std::string_view concat_piece(T const &item) noexcept
  requires std::convertible_to<T const &, std::string_view>
{
  return std::string_view{item};
}


/// Represent a single character as a piece of a `concat()` call.
inline std::string_view concat_piece(char const &c) noexcept
{
  return std::string_view{&c, 1u};
}


/// Efficiently combine a bunch of items into one big string.
/** Integers need converting beforehand; use `std::to_string()`.
 */
template<typename... TYPE>
[[nodiscard]] inline std::string concat(TYPE const &...item)
{
  std::string buf;
  buf.reserve((0u + ... + std::size(concat_piece(item))));
  (buf.append(concat_piece(item)), ...);
  return buf;
}
} // namespace pgquote::internal
#endif
