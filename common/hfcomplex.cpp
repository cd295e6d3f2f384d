
#include "config.h"

#include "hfcomplex.h"

#include <algorithm>
#include <bit>
#include <cstddef>
#include <numbers>
#include <utility>
#include <vector>

#include "hftypes.hpp"
#include "gsl/gsl"


namespace {

using complex_d = std::complex<double>;

/* Puts the buffer in bit-reversed index order, using the reverse-carry
 * counter so no per-index bit loop is needed.
 */
void BitReversePermute(const std::span<complex_d> buffer)
{
    auto const size = buffer.size();
    auto rev = 0_uz;
    for(auto idx = 1_uz;idx < size;++idx)
    {
        auto bit = size >> 1;
        while((rev & bit) != 0)
        {
            rev ^= bit;
            bit >>= 1;
        }
        rev |= bit;
        if(idx < rev)
            std::swap(buffer[idx], buffer[rev]);
    }
}

} // namespace

void complex_fft(const std::span<std::complex<double>> buffer, const double sign)
{
    auto const size = buffer.size();
    Expects(std::has_single_bit(size));

    BitReversePermute(buffer);

    /* Butterflies, doubling the sub-transform length each pass. */
    auto twiddles = std::vector<complex_d>{};
    for(auto half = 1_uz;half < size;half <<= 1)
    {
        auto const step = std::numbers::pi * sign / gsl::narrow_cast<double>(half);
        twiddles.resize(half);
        for(auto j = 0_uz;j < half;++j)
            twiddles[j] = std::polar(1.0, step * gsl::narrow_cast<double>(j));

        for(auto start = 0_uz;start < size;start += half*2)
        {
            auto const lower = buffer.subspan(start, half);
            auto const upper = buffer.subspan(start+half, half);
            for(auto j = 0_uz;j < half;++j)
            {
                auto const odd = upper[j] * twiddles[j];
                upper[j] = lower[j] - odd;
                lower[j] += odd;
            }
        }
    }
}

void complex_hilbert(const std::span<std::complex<double>> buffer)
{
    auto const size = buffer.size();
    Expects(size >= 2);

    /* The analytic signal keeps DC and nyquist, doubles the positive
     * frequencies and zeroes the negative ones. The inverse transform is
     * done first, with the frequency weights and 1/N applied to that half,
     * and the forward transform last. This gives the same result as the
     * usual order because the input is real.
     */
    inverse_fft(buffer);

    auto const scale = 1.0 / gsl::narrow_cast<double>(size);
    auto const half = size / 2;
    buffer[0] *= scale;
    for(auto i = 1_uz;i < half;++i)
        buffer[i] *= scale * 2.0;
    buffer[half] *= scale;
    std::fill(buffer.begin() + gsl::narrow_cast<std::ptrdiff_t>(half+1), buffer.end(),
        complex_d{});

    forward_fft(buffer);
}
