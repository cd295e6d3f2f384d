
#include "config.h"

#include "sofa_adapter.hpp"

#include <algorithm>
#include <cmath>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "except.h"
#include "hfnumeric.h"
#include "hfstring.h"
#include "logging.h"
#include "sofa_support.hpp"

#include "mysofa.h"


namespace hf {

/* The parts of a SOFA file needed to serve responses, copied out of the
 * libmysofa structure so it can be released right after loading.
 */
struct SofaData {
    u32 mSampleRate{};
    u32 mMeasurements{};
    u32 mReceivers{};
    u32 mSamples{};
    std::vector<Position> mPositions;
    std::vector<f32> mIrs;

    [[nodiscard]] auto ir(u32 const measurement, u32 const receiver) const
        -> std::span<const f32>
    {
        auto const offset = (usize{measurement}*mReceivers + receiver) * mSamples;
        return std::span{mIrs}.subspan(offset, mSamples);
    }
};

namespace {

using namespace std::string_view_literals;

auto GetSampleRate(MYSOFA_HRTF *sofaHrtf, std::string_view const filename) -> u32
{
    MYSOFA_ARRAY *srate_array{&sofaHrtf->DataSamplingRate};
    auto const *srate_dim = FindSofaAttribute(srate_array->attributes, "DIMENSION_LIST"sv);
    auto const *srate_units = FindSofaAttribute(srate_array->attributes, "Units"sv);

    if(srate_dim && srate_dim != "I"sv)
        throw_error<format_error>("sofa: {}: unsupported sample rate dimensions: {}", filename,
            srate_dim);
    if(!srate_units)
        WARN("{}: missing sample rate unit type, assuming hertz", filename);
    else if(hf::case_compare(srate_units, "hertz"sv) != 0)
        throw_error<format_error>("sofa: {}: unsupported sample rate unit type: {}", filename,
            srate_units);

    if(srate_array->elements < 1 || !srate_array->values)
        throw_error<format_error>("sofa: {}: missing sample rate", filename);

    /* I dimensions guarantees 1 element, so just extract it. */
    auto const value = std::span{srate_array->values, srate_array->elements}[0];
    if(!(value >= 1.0f) || value > 1'000'000.0f)
        throw_error<format_error>("sofa: {}: sample rate out of range: {}", filename, value);
    return gsl::narrow_cast<u32>(std::lround(value));
}

void CheckIrData(MYSOFA_HRTF *sofaHrtf, std::string_view const filename)
{
    auto const *ir_dim = FindSofaAttribute(sofaHrtf->DataIR.attributes, "DIMENSION_LIST"sv);
    if(ir_dim && ir_dim != "M,R,N"sv)
        throw_error<format_error>("sofa: {}: unsupported IR dimensions: {}", filename, ir_dim);

    auto const expected = usize{sofaHrtf->M} * sofaHrtf->R * sofaHrtf->N;
    if(!sofaHrtf->DataIR.values || sofaHrtf->DataIR.elements != expected)
        throw_error<format_error>("sofa: {}: IR data has {} values, expected {}", filename,
            sofaHrtf->DataIR.elements, expected);
}

/* The responses are served as stored; any separately stored delays are not
 * applied.
 */
void CheckDelays(MYSOFA_HRTF *sofaHrtf, std::string_view const filename)
{
    MYSOFA_ARRAY *delay_array{&sofaHrtf->DataDelay};
    if(!delay_array->values || delay_array->elements == 0)
        return;

    auto const delays = std::span{delay_array->values, delay_array->elements};
    if(std::ranges::any_of(delays, [](const f32 d) { return d != 0.0f; }))
        WARN("{}: ignoring non-zero Data.Delay values", filename);
}

auto LoadSofaData(const std::string &filename) -> std::unique_ptr<SofaData>
{
    TRACE("Loading {}...", filename);

    auto err = int{};
    auto sofaHrtf = MySofaHrtfPtr{mysofa_load(filename.c_str(), &err)};
    if(!sofaHrtf)
        throw_error<format_error>("sofa: could not load {}: {}", filename, SofaErrorStr(err));

    /* NOTE: Some valid SOFA files are failing this check. */
    err = mysofa_check(sofaHrtf.get());
    if(err != MYSOFA_OK)
        WARN("Supposedly malformed source file '{}' ({})", filename, SofaErrorStr(err));

    mysofa_tocartesian(sofaHrtf.get());

    /* Make sure emitter and receiver counts are sane. */
    if(sofaHrtf->E != 1)
        throw_error<format_error>("sofa: {}: {} emitters not supported", filename, sofaHrtf->E);
    if(sofaHrtf->R > 2 || sofaHrtf->R < 1)
        throw_error<format_error>("sofa: {}: {} receivers not supported", filename,
            sofaHrtf->R);
    if(sofaHrtf->M < 1 || sofaHrtf->N < 1)
        throw_error<format_error>("sofa: {}: empty measurement set ({} x {})", filename,
            sofaHrtf->M, sofaHrtf->N);

    auto data = std::make_unique<SofaData>();
    data->mSampleRate = GetSampleRate(sofaHrtf.get(), filename);
    CheckIrData(sofaHrtf.get(), filename);
    CheckDelays(sofaHrtf.get(), filename);

    data->mMeasurements = sofaHrtf->M;
    data->mReceivers = sofaHrtf->R;
    data->mSamples = sofaHrtf->N;

    const auto srcPosCount = usize{sofaHrtf->M} * 3;
    if(!sofaHrtf->SourcePosition.values || sofaHrtf->SourcePosition.elements < srcPosCount)
        throw_error<format_error>("sofa: {}: source positions have {} values, expected {}",
            filename, sofaHrtf->SourcePosition.elements, srcPosCount);
    const auto srcPosValues = std::span{sofaHrtf->SourcePosition.values, srcPosCount};

    data->mPositions.reserve(sofaHrtf->M);
    for(auto si = 0_uz;si < sofaHrtf->M;++si)
    {
        auto const xyz = srcPosValues.subspan(si*3, 3);
        if(!std::ranges::all_of(xyz, [](const f32 v) { return std::isfinite(v); }))
            throw_error<format_error>("sofa: {}: non-finite source position {}", filename, si);
        data->mPositions.emplace_back(PositionFromCartesian(xyz[0], xyz[1], xyz[2]));
    }

    auto const irValues = std::span{sofaHrtf->DataIR.values, sofaHrtf->DataIR.elements};
    data->mIrs.assign(irValues.begin(), irValues.end());

    TRACE("Loaded {}: {} measurements, {} receivers, {} samples at {}hz", filename,
        data->mMeasurements, data->mReceivers, data->mSamples, data->mSampleRate);
    return data;
}

} // namespace

SofaAdapter::SofaAdapter(std::filesystem::path root, CollectionInfo info, usize const cacheSize)
    : mRoot{std::move(root)}, mInfo{std::move(info)}, mCache{cacheSize}
{ }

auto SofaAdapter::load(const std::string &filename) const -> std::shared_ptr<const SofaData>
{ return mCache.get(filename, [&filename]{ return LoadSofaData(filename); }); }

auto SofaAdapter::enumerate() const -> std::vector<IndexEntry>
{
    auto const files = DiscoverFiles(format(), mRoot, mInfo.pattern);
    CheckUniqueSubjects(files, format());

    auto ret = std::vector<IndexEntry>{};
    for(const auto &file : files)
    {
        auto filename = std::string{hf::u8_as_char(file.path.u8string())};
        auto const data = load(filename);

        for(auto mi = 0u;mi < data->mMeasurements;++mi)
        {
            for(auto ri = 0u;ri < data->mReceivers;++ri)
            {
                auto const side = (ri == 0) ? Side::Left : Side::Right;
                ret.emplace_back(IndexEntry{MeasurementKey{file.subject, side,
                    data->mPositions[mi]}, Locator{filename, mi, ri}});
            }
        }
    }
    TRACE("sofa: enumerated {} responses from {} files", ret.size(), files.size());
    return ret;
}

auto SofaAdapter::read(const Locator &loc) const -> MeasurementRecord
{
    CheckLocatorFile(loc, format());

    auto const subject = SubjectForFile(mRoot, mInfo.pattern,
        std::filesystem::path(hf::char_as_u8(loc.file)));
    if(!subject)
        throw_error<key_error>("sofa: locator {} is outside the dataset", FormatLocator(loc));

    auto const data = load(loc.file);
    if(loc.measurement >= data->mMeasurements || loc.receiver >= data->mReceivers)
        throw_error<key_error>("sofa: locator {} out of range ({} measurements, {} receivers)",
            FormatLocator(loc), data->mMeasurements, data->mReceivers);

    auto const ir = data->ir(loc.measurement, loc.receiver);
    auto record = MeasurementRecord{};
    record.key = MeasurementKey{*subject, (loc.receiver == 0) ? Side::Left : Side::Right,
        data->mPositions[loc.measurement]};
    record.sampleRate = data->mSampleRate;
    record.samples.assign(ir.begin(), ir.end());
    return record;
}

} // namespace hf
