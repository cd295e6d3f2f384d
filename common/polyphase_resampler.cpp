
#include "config.h"

#include "polyphase_resampler.h"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <numeric>

#include "gsl/gsl"


namespace {

/* Zero-order modified Bessel function of the first kind, by its power
 * series:
 *
 *   I_0(x) = sum_{k=0}^inf ((x / 2)^k / k!)^2
 *
 * Terms are added until they no longer change the sum.
 */
auto BesselI0(f64 const x) -> f64
{
    auto const halfx = x / 2.0;
    auto term = 1.0;
    auto sum = 1.0;
    for(auto k = 1.0;;k += 1.0)
    {
        auto const ratio = halfx / k;
        term *= ratio * ratio;
        auto const next = sum + term;
        if(next == sum)
            return sum;
        sum = next;
    }
}

/* Kaiser window design values for a given stop-band rejection (dB) and
 * transition width (normalized frequency, 0.5 is nyquist). See Oppenheim &
 * Schafer, "Discrete-Time Signal Processing", eqs. 7.62 and 7.63.
 */
struct KaiserDesign {
    f64 beta{};
    f64 besselBeta{};
    u32 halfLength{};

    KaiserDesign(f64 const rejection, f64 const transition)
    {
        if(rejection > 50.0)
            beta = 0.1102 * (rejection - 8.7);
        else if(rejection >= 21.0)
            beta = 0.5842*std::pow(rejection - 21.0, 0.4) + 0.07886*(rejection - 21.0);
        besselBeta = BesselI0(beta);

        auto const omega = 2.0 * std::numbers::pi * transition;
        auto const order = (rejection > 21.0) ? (rejection - 7.95) / (2.285 * omega)
            : 5.79 / omega;
        /* Rounding the half-length up keeps the transition from widening. */
        halfLength = (gsl::narrow_cast<u32>(std::ceil(order)) + 1) / 2;
    }

    /* Window value at a position normalized to [-1,1]. */
    [[nodiscard]] auto window(f64 const k) const -> f64
    {
        if(!(std::abs(k) <= 1.0))
            return 0.0;
        return BesselI0(beta * std::sqrt(1.0 - k*k)) / besselBeta;
    }
};

/* Normalized sinc, sin(pi x)/(pi x). */
auto Sinc(f64 const x) -> f64
{
    if(std::abs(x) < 1e-9)
        return 1.0;
    auto const px = std::numbers::pi * x;
    return std::sin(px) / px;
}

} // namespace

void PPhaseResampler::init(u32 const srcRate, u32 const dstRate, f64 const rejection,
    f64 const transition)
{
    Expects(srcRate > 0 && dstRate > 0);
    Expects(transition > 0.0 && transition < 0.5);

    mSrcRate = srcRate;
    mDstRate = dstRate;

    auto const gcd = std::gcd(srcRate, dstRate);
    mP = dstRate / gcd;
    mQ = srcRate / gcd;

    /* The filter runs at the upsampled rate, so the band edges shrink by the
     * larger of the two factors. The cutoff sits half a transition below
     * nyquist so the stop band starts at nyquist.
     */
    auto const factor = gsl::narrow_cast<f64>(std::max(mP, mQ));
    auto const cutoff = (0.5 - transition/2.0) / factor;
    auto const design = KaiserDesign{rejection, transition / factor};

    mL = design.halfLength;
    mM = mL*2 + 1;
    mF.resize(mM);

    /* Each tap is w(x/l) 2 p f_c sinc(2 f_c x), with x centered on tap l.
     * The factor p restores the gain lost to zero-stuffing.
     */
    auto const gain = 2.0 * mP * cutoff;
    for(auto i = 0_uz;i < mM;++i)
    {
        auto const x = gsl::narrow_cast<f64>(i) - mL;
        mF[i] = design.window(x / mL) * gain * Sinc(2.0 * cutoff * x);
    }
}

/* Output sample i is at upsampled position l + q i, where the l offset
 * removes the filter's group delay. Only the taps that line up with real
 * (non-stuffed) input samples are evaluated: tap phase + p j meets input
 * sample base - j.
 */
void PPhaseResampler::process(const std::span<const f64> in, const std::span<f64> out) const
{
    auto const p = usize{mP};
    auto const q = usize{mQ};
    auto const taps = std::span{mF};

    for(auto i = 0_uz;i < out.size();++i)
    {
        auto const pos = usize{mL} + q*i;
        auto const phase = pos % p;
        auto const base = pos / p;

        auto acc = 0.0;
        if(phase < taps.size())
        {
            /* Taps j with phase + p j inside the filter and base - j inside
             * the input.
             */
            auto const tapCount = (taps.size() - phase + p - 1) / p;
            auto const first = (base >= in.size()) ? base - in.size() + 1 : 0_uz;
            auto const last = std::min(tapCount, base + 1);
            for(auto j = first;j < last;++j)
                acc += taps[phase + p*j] * in[base - j];
        }
        out[i] = acc;
    }
}
