#ifndef HF_STRING_H
#define HF_STRING_H

#include <compare>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "gsl/gsl"


namespace hf {

[[nodiscard]]
constexpr bool contains(const std::string_view str0, const std::string_view str1) noexcept
{ return str0.find(str1) != std::string_view::npos; }

[[nodiscard]]
auto case_compare(const std::string_view str0, const std::string_view str1) noexcept
    -> std::weak_ordering;

/* Strips leading and trailing whitespace. */
[[nodiscard]]
auto trim(std::string_view str) noexcept -> std::string_view;

/* Splits a delimited list, trimming each element and dropping empty ones. */
[[nodiscard]]
auto split_list(std::string_view str, char delim=',') -> std::vector<std::string>;

/* Returns the environment variable's value, or nullopt if unset or empty. */
auto getenv(const gsl::czstring envname) -> std::optional<std::string>;

/* path::u8string() returns char8_t strings in C++20, while everything here
 * holds UTF-8 in plain char strings. These reinterpret between the two.
 */
inline auto char_as_u8(const std::string_view str) -> std::u8string_view
{ return std::u8string_view{reinterpret_cast<const char8_t*>(str.data()), str.size()}; }

inline auto u8_as_char(const std::u8string_view str) -> std::string_view
{ return std::string_view{reinterpret_cast<const char*>(str.data()), str.size()}; }

} // namespace hf

#endif /* HF_STRING_H */
