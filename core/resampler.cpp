
#include "config.h"

#include "resampler.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <tuple>
#include <utility>

#include "except.h"
#include "hfnumeric.h"
#include "logging.h"
#include "polyphase_resampler.h"


namespace hf {

namespace {

void CheckRates(u32 const srcRate, u32 const dstRate)
{
    if(srcRate == 0 || dstRate == 0)
        throw_error<invalid_rate_error>("Invalid resampling rates {}hz -> {}hz", srcRate,
            dstRate);
}

auto RunFilter(const PPhaseResampler &rs, std::span<const f64> const samples)
    -> std::vector<f64>
{
    auto ret = std::vector<f64>(ScaledLength(samples.size(), rs.srcRate(), rs.dstRate()));
    rs.process(samples, ret);
    return ret;
}

} // namespace

void ValidateResamplerParams(const ResamplerParams &params)
{
    if(!(params.rejection > 0.0) || !std::isfinite(params.rejection))
        throw_error<config_error>("Invalid resampler rejection {} dB", params.rejection);
    if(!(params.transition > 0.0 && params.transition < 0.5))
        throw_error<config_error>("Invalid resampler transition width {}", params.transition);
}

auto Resample(std::span<const f64> const samples, u32 const srcRate, u32 const dstRate,
    const ResamplerParams &params) -> std::vector<f64>
{
    CheckRates(srcRate, dstRate);
    if(srcRate == dstRate)
        return std::vector<f64>(samples.begin(), samples.end());
    ValidateResamplerParams(params);

    auto rs = PPhaseResampler{};
    rs.init(srcRate, dstRate, params.rejection, params.transition);
    return RunFilter(rs, samples);
}


Resampler::Resampler(ResamplerParams params) : mParams{params}
{ ValidateResamplerParams(mParams); }

auto Resampler::getFilter(u32 const srcRate, u32 const dstRate) const
    -> std::shared_ptr<const PPhaseResampler>
{
    CheckRates(srcRate, dstRate);

    auto const lock = std::lock_guard{mFilterLock};
    auto iter = std::ranges::lower_bound(mFilters, std::make_tuple(srcRate, dstRate),
        std::less{}, [](const std::shared_ptr<const PPhaseResampler> &rs)
        { return std::make_tuple(rs->srcRate(), rs->dstRate()); });
    if(iter != mFilters.end() && (*iter)->srcRate() == srcRate && (*iter)->dstRate() == dstRate)
        return *iter;

    TRACE("Creating resampler filter {}hz -> {}hz", srcRate, dstRate);
    auto rs = std::make_shared<PPhaseResampler>();
    rs->init(srcRate, dstRate, mParams.rejection, mParams.transition);
    return *mFilters.emplace(iter, std::move(rs));
}

auto Resampler::resample(std::span<const f64> const samples, u32 const srcRate,
    u32 const dstRate) const -> std::vector<f64>
{
    CheckRates(srcRate, dstRate);
    if(srcRate == dstRate)
        return std::vector<f64>(samples.begin(), samples.end());

    auto const filter = getFilter(srcRate, dstRate);
    return RunFilter(*filter, samples);
}

} // namespace hf
