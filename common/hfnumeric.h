#ifndef HF_NUMERIC_H
#define HF_NUMERIC_H

#include <cmath>
#include <concepts>
#include <limits>
#include <type_traits>
#include <utility>

#include "hftypes.hpp"
#include "gsl/gsl"


namespace hf {

/* Converts between integer types, clamping to the range of R. */
template<std::integral R, std::integral T> [[nodiscard]]
constexpr auto saturate_cast(T const val) noexcept -> R
{
    if(std::cmp_less(val, std::numeric_limits<R>::min()))
        return std::numeric_limits<R>::min();
    if(std::cmp_greater(val, std::numeric_limits<R>::max()))
        return std::numeric_limits<R>::max();
    return static_cast<R>(val);
}

} /* namespace hf */

template<std::integral T> [[nodiscard]]
constexpr auto as_unsigned(T const value) noexcept
{ return static_cast<std::make_unsigned_t<T>>(value); }


/* Smallest power of 2 that is not less than the value (1 for 0). Values
 * above 2^31 return 2^31.
 */
[[nodiscard]]
constexpr auto NextPowerOf2(u32 const value) noexcept -> u32
{
    auto ret = 1_u32;
    while(ret < value && ret < 0x8000'0000_u32)
        ret <<= 1;
    return ret;
}

/* Rounds to the nearest multiple of the given step, collapsing -0 to 0. */
[[nodiscard]]
inline auto RoundToStep(f64 const value, f64 const step) noexcept -> f64
{
    auto const ret = std::round(value / step) * step;
    return (ret == 0.0) ? 0.0 : ret;
}

/* Number of output samples when converting n samples between rates. */
[[nodiscard]]
constexpr auto ScaledLength(usize const n, u32 const srcRate, u32 const dstRate) noexcept -> usize
{
    auto const num = u64{n} * dstRate;
    return gsl::narrow_cast<usize>((num + srcRate - 1) / srcRate);
}

#endif /* HF_NUMERIC_H */
