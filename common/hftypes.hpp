#ifndef HF_TYPES_HPP
#define HF_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <type_traits>

#include "gsl/gsl"


using i8 = std::int8_t;
using u8 = std::uint8_t;
using i16 = std::int16_t;
using u16 = std::uint16_t;
using i32 = std::int32_t;
using u32 = std::uint32_t;
using i64 = std::int64_t;
using u64 = std::uint64_t;
using usize = std::size_t;
using f32 = float;
using f64 = double;

[[nodiscard]] consteval
auto operator ""_u32(unsigned long long const n) noexcept { return gsl::narrow_cast<u32>(n); }
[[nodiscard]] consteval
auto operator ""_uz(unsigned long long const n) noexcept { return gsl::narrow_cast<usize>(n); }

namespace hf {

template<typename T> [[nodiscard]]
constexpr auto to_underlying(T const e) noexcept -> std::underlying_type_t<T>
{ return static_cast<std::underlying_type_t<T>>(e); }

} // namespace hf

#endif /* HF_TYPES_HPP */
