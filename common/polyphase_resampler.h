#ifndef POLYPHASE_RESAMPLER_H
#define POLYPHASE_RESAMPLER_H

#include <span>
#include <vector>

#include "hftypes.hpp"


/* Rational-ratio sinc resampler for offline use. Conceptually the input is
 * zero-stuffed by p, low-pass filtered with a Kaiser-windowed sinc and
 * decimated by q, with p/q the reduced ratio of the destination and source
 * rates. process() only evaluates the taps that meet non-zero input.
 */
struct PPhaseResampler {
    /* Rejection is the stop-band attenuation in dB. Transition is the width
     * of the transition band as normalized frequency (0.5 is nyquist), before
     * scaling by the larger of p and q.
     */
    void init(u32 srcRate, u32 dstRate, f64 rejection=180.0, f64 transition=0.05);
    void process(std::span<const f64> in, std::span<f64> out) const;

    [[nodiscard]] auto srcRate() const noexcept -> u32 { return mSrcRate; }
    [[nodiscard]] auto dstRate() const noexcept -> u32 { return mDstRate; }
    [[nodiscard]] auto filterLength() const noexcept -> usize { return mF.size(); }

    explicit operator bool() const noexcept { return !mF.empty(); }

private:
    u32 mSrcRate{}, mDstRate{};
    u32 mP{}, mQ{}, mM{}, mL{};
    std::vector<f64> mF;
};

#endif /* POLYPHASE_RESAMPLER_H */
