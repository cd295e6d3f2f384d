
#include "config.h"

#include "hrir_transform.hpp"

#include <algorithm>
#include <cmath>
#include <complex>
#include <ranges>

#include "except.h"
#include "hfcomplex.h"
#include "hfnumeric.h"
#include "hfstring.h"


namespace hf {

namespace {

using namespace std::string_view_literals;
using complex_d = std::complex<f64>;

/* Floor for magnitudes, to keep logarithms finite. */
constexpr auto Epsilon = 1e-9;

auto FftSizeFor(usize const count) -> usize
{ return NextPowerOf2(gsl::narrow<u32>(std::max(count, 2_uz))); }

/* Zero-padded FFT of the samples. */
auto Spectrum(std::span<const f64> const samples) -> std::vector<complex_d>
{
    auto h = std::vector<complex_d>(FftSizeFor(samples.size()));
    std::ranges::copy(samples, h.begin());
    forward_fft(h);
    return h;
}

} // namespace

auto GetDomainName(ResponseDomain const domain) noexcept -> std::string_view
{
    switch(domain)
    {
    case ResponseDomain::Time: return "time"sv;
    case ResponseDomain::Magnitude: return "magnitude"sv;
    case ResponseDomain::MagnitudeDb: return "magnitude-db"sv;
    case ResponseDomain::Phase: return "phase"sv;
    }
    return "<unknown>"sv;
}

auto ParseResponseDomain(std::string_view const name) -> std::optional<ResponseDomain>
{
    if(hf::case_compare(name, "time"sv) == 0)
        return ResponseDomain::Time;
    if(hf::case_compare(name, "magnitude"sv) == 0)
        return ResponseDomain::Magnitude;
    if(hf::case_compare(name, "magnitude-db"sv) == 0
        || hf::case_compare(name, "magnitude_db"sv) == 0)
        return ResponseDomain::MagnitudeDb;
    if(hf::case_compare(name, "phase"sv) == 0)
        return ResponseDomain::Phase;
    return std::nullopt;
}

void ValidateProcessingOptions(const ProcessingOptions &opts)
{
    if(opts.length && *opts.length == 0)
        throw config_error{"Response length must be positive"};
    if(!std::isfinite(opts.scaleFactor))
        throw_error<config_error>("Invalid scale factor {}", opts.scaleFactor);
}

/* Reconstructs the minimum-phase component for the magnitude response of the
 * signal. This is equivalent to phase recomposition, sans the missing
 * residuals (which were discarded).
 */
auto MinimumPhaseResponse(std::span<const f64> const samples) -> std::vector<f64>
{
    if(samples.size() < 2)
        return std::vector<f64>(samples.begin(), samples.end());

    auto h = Spectrum(samples);
    const auto n = h.size();
    const auto m = (n/2) + 1;

    auto mags = std::vector<f64>(n);
    for(auto i = 0_uz;i < m;++i)
    {
        mags[i] = std::max(std::abs(h[i]), Epsilon);
        h[i] = std::log(mags[i]);
    }
    /* Mirror the upper half so the log-magnitude is an even sequence. */
    for(auto i = m;i < n;++i)
    {
        mags[i] = mags[n - i];
        h[i] = h[n - i];
    }
    complex_hilbert(h);
    for(auto i = 0_uz;i < n;++i)
        h[i] = std::polar(mags[i], h[i].imag());

    inverse_fft(h);
    auto ret = std::vector<f64>(samples.size());
    const auto scale = 1.0 / gsl::narrow_cast<f64>(n);
    std::ranges::transform(h | std::views::take(ret.size()), ret.begin(),
        [scale](const complex_d c) { return c.real() * scale; });
    return ret;
}

auto MagnitudeResponse(std::span<const f64> const samples) -> std::vector<f64>
{
    const auto h = Spectrum(samples);
    auto ret = std::vector<f64>((h.size()/2) + 1);
    std::ranges::transform(h | std::views::take(ret.size()), ret.begin(),
        [](const complex_d c) { return std::abs(c); });
    return ret;
}

auto PhaseResponse(std::span<const f64> const samples) -> std::vector<f64>
{
    const auto h = Spectrum(samples);
    auto ret = std::vector<f64>((h.size()/2) + 1);
    std::ranges::transform(h | std::views::take(ret.size()), ret.begin(),
        [](const complex_d c) { return std::arg(c); });
    return ret;
}

auto ProcessResponse(std::vector<f64> samples, const ProcessingOptions &opts)
    -> std::vector<f64>
{
    if(opts.minPhase)
        samples = MinimumPhaseResponse(samples);

    if(opts.length)
        samples.resize(*opts.length, 0.0);

    if(opts.scaleFactor != 1.0)
        std::ranges::transform(samples, samples.begin(),
            [scale=opts.scaleFactor](const f64 s) { return s * scale; });

    switch(opts.domain)
    {
    case ResponseDomain::Time:
        break;
    case ResponseDomain::Magnitude:
        samples = MagnitudeResponse(samples);
        break;
    case ResponseDomain::MagnitudeDb:
        samples = MagnitudeResponse(samples);
        std::ranges::transform(samples, samples.begin(),
            [](const f64 mag) { return 20.0 * std::log10(std::max(mag, Epsilon)); });
        break;
    case ResponseDomain::Phase:
        samples = PhaseResponse(samples);
        break;
    }
    return samples;
}

} // namespace hf
