#ifndef CORE_RESAMPLER_HPP
#define CORE_RESAMPLER_HPP

#include <memory>
#include <mutex>
#include <span>
#include <vector>

#include "hftypes.hpp"

struct PPhaseResampler;

namespace hf {

struct ResamplerParams {
    /* Stop-band attenuation in dB. */
    f64 rejection{180.0};
    /* Transition band width as normalized frequency (0.5 is nyquist). */
    f64 transition{0.05};
};

/* Throws config_error for out-of-range parameters. */
void ValidateResamplerParams(const ResamplerParams &params);

/* Converts the samples from srcRate to dstRate with a band-limited polyphase
 * filter. The result has ceil(n * dstRate / srcRate) samples. Equal rates
 * return a copy of the input. Throws invalid_rate_error for a zero rate.
 */
[[nodiscard]] auto Resample(std::span<const f64> samples, u32 srcRate, u32 dstRate,
    const ResamplerParams &params={}) -> std::vector<f64>;

/* Resamples with filters cached per rate pair. The filters are immutable
 * once built, so resample() can be called concurrently.
 */
class Resampler {
    ResamplerParams mParams;

    mutable std::mutex mFilterLock;
    mutable std::vector<std::shared_ptr<const PPhaseResampler>> mFilters;

public:
    explicit Resampler(ResamplerParams params={});

    [[nodiscard]] auto params() const noexcept -> const ResamplerParams& { return mParams; }

    [[nodiscard]] auto resample(std::span<const f64> samples, u32 srcRate, u32 dstRate) const
        -> std::vector<f64>;

    [[nodiscard]] auto getFilter(u32 srcRate, u32 dstRate) const
        -> std::shared_ptr<const PPhaseResampler>;
};

} // namespace hf

#endif /* CORE_RESAMPLER_HPP */
