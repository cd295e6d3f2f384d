
#include "config.h"

#include "mat_adapter.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <iterator>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "except.h"
#include "hfstring.h"
#include "logging.h"
#include "mat_reader.hpp"


namespace hf {

/* Responses of one file rearranged to [measurement][sample] per ear. */
struct MatData {
    u32 mSampleRate{};
    usize mMeasurements{};
    usize mSamples{};
    std::vector<Position> mPositions;
    /* Left and right ear; an absent ear is empty. */
    std::array<std::vector<f64>,2> mIrs;

    [[nodiscard]] auto hasEar(u32 const receiver) const noexcept -> bool
    { return receiver < mIrs.size() && !mIrs[receiver].empty(); }

    [[nodiscard]] auto ir(u32 const measurement, u32 const receiver) const
        -> std::span<const f64>
    { return std::span{mIrs[receiver]}.subspan(measurement*mSamples, mSamples); }
};

namespace {

using namespace std::string_view_literals;

constexpr auto EarVariables = std::array{"hrir_l"sv, "hrir_r"sv};

auto ScalarVariable(const MatFile &mat, std::string_view const name) -> std::optional<f64>
{
    auto const *arr = mat.find(name);
    if(!arr || arr->numel() != 1)
        return std::nullopt;
    return arr->values[0];
}

auto GetSampleRate(const MatFile &mat, const CollectionInfo &info, std::string_view filename)
    -> u32
{
    auto rate = ScalarVariable(mat, "samplerate"sv);
    if(!rate) rate = ScalarVariable(mat, "fs"sv);
    if(rate)
    {
        if(!(*rate >= 1.0) || *rate > 1'000'000.0)
            throw_error<format_error>("mat: {}: sample rate out of range: {}", filename, *rate);
        return gsl::narrow_cast<u32>(std::lround(*rate));
    }
    if(info.sampleRate)
        return *info.sampleRate;
    throw_error<format_error>("mat: {}: no samplerate variable and no collection default",
        filename);
}

void CheckFinite(std::span<const f64> const values, std::string_view const name,
    std::string_view const filename)
{
    auto const iter = std::ranges::find_if_not(values,
        [](f64 const v) { return std::isfinite(v); });
    if(iter != values.end())
        throw_error<format_error>("mat: {}: non-finite {} value at index {}", filename, name,
            std::distance(values.begin(), iter));
}

auto GridPosition(GridCoordinates const coords, f64 const az, f64 const el, f64 const dist)
    -> Position
{
    if(coords == GridCoordinates::InterauralPolar)
        return PositionFromInterauralPolar(az, el, dist);
    return MakePosition(az, el, dist);
}

/* Positions of an [A x E x N] grid, azimuth-major. */
auto GridPositions(const MatFile &mat, const CollectionInfo &info, usize const numAz,
    usize const numEl, std::string_view const filename) -> std::vector<Position>
{
    auto azimuths = std::vector<f64>{};
    auto elevations = std::vector<f64>{};
    auto distance = 1.0;
    auto coords = GridCoordinates::VerticalPolar;
    if(info.grid)
    {
        azimuths = info.grid->azimuths;
        elevations = info.grid->elevations;
        distance = info.grid->distance;
        coords = info.grid->coordinates;
    }
    if(auto const *azvar = mat.find("azimuths"sv))
        azimuths = azvar->values;
    if(auto const *elvar = mat.find("elevations"sv))
        elevations = elvar->values;
    if(auto const dist = ScalarVariable(mat, "distance"sv))
        distance = *dist;

    CheckFinite(azimuths, "azimuths"sv, filename);
    CheckFinite(elevations, "elevations"sv, filename);
    CheckFinite(std::span{&distance, 1}, "distance"sv, filename);

    if(azimuths.size() != numAz || elevations.size() != numEl)
        throw_error<format_error>("mat: {}: {} x {} grid does not match {} azimuths and {} "
            "elevations", filename, numAz, numEl, azimuths.size(), elevations.size());

    auto ret = std::vector<Position>{};
    ret.reserve(numAz * numEl);
    for(auto ei = 0_uz;ei < numEl;++ei)
    {
        for(auto ai = 0_uz;ai < numAz;++ai)
            ret.emplace_back(GridPosition(coords, azimuths[ai], elevations[ei], distance));
    }
    return ret;
}

/* Positions from an [M x 2] or [M x 3] variable. */
auto ListPositions(const MatFile &mat, const CollectionInfo &info, usize const count,
    std::string_view const filename) -> std::vector<Position>
{
    auto const *posvar = mat.find("positions"sv);
    if(!posvar || posvar->rank() != 2 || posvar->dim(0) != count
        || (posvar->dim(1) != 2 && posvar->dim(1) != 3))
        throw_error<format_error>("mat: {}: expected a {} x 2 or {} x 3 positions variable",
            filename, count, count);

    auto const coords = info.grid ? info.grid->coordinates : GridCoordinates::VerticalPolar;
    auto const defdist = info.grid ? info.grid->distance : 1.0;
    auto const &vals = posvar->values;
    CheckFinite(vals, "positions"sv, filename);

    auto ret = std::vector<Position>{};
    ret.reserve(count);
    for(auto mi = 0_uz;mi < count;++mi)
    {
        auto const dist = (posvar->dim(1) == 3) ? vals[mi + 2*count] : defdist;
        ret.emplace_back(GridPosition(coords, vals[mi], vals[mi + count], dist));
    }
    return ret;
}

auto LoadMatData(const std::string &filename, const CollectionInfo &info)
    -> std::unique_ptr<MatData>
{
    TRACE("Loading {}...", filename);
    auto const mat = MatFile::Load(std::filesystem::path(hf::char_as_u8(filename)));

    auto const *left = mat.find(EarVariables[0]);
    auto const *right = mat.find(EarVariables[1]);
    if(!left && !right)
        throw_error<format_error>("mat: {}: no {} or {} variable", filename, EarVariables[0],
            EarVariables[1]);

    auto const &shape = left ? left->dims : right->dims;
    if(left && right && left->dims != right->dims)
        throw_error<format_error>("mat: {}: {} and {} have different shapes", filename,
            EarVariables[0], EarVariables[1]);

    auto data = std::make_unique<MatData>();
    data->mSampleRate = GetSampleRate(mat, info, filename);

    if(shape.size() == 3)
    {
        data->mMeasurements = shape[0] * shape[1];
        data->mSamples = shape[2];
        data->mPositions = GridPositions(mat, info, shape[0], shape[1], filename);
    }
    else if(shape.size() == 2)
    {
        data->mMeasurements = shape[0];
        data->mSamples = shape[1];
        data->mPositions = ListPositions(mat, info, shape[0], filename);
    }
    else
        throw_error<format_error>("mat: {}: responses have {} dimensions, expected 2 or 3",
            filename, shape.size());

    if(data->mMeasurements == 0 || data->mSamples == 0)
        throw_error<format_error>("mat: {}: empty response set", filename);

    /* Column-major storage puts sample n of measurement m at m + M*n. */
    auto const measurements = data->mMeasurements;
    auto const samples = data->mSamples;
    auto rearrange = [measurements,samples](const MatArray &arr) -> std::vector<f64>
    {
        auto ret = std::vector<f64>(measurements * samples);
        for(auto mi = 0_uz;mi < measurements;++mi)
        {
            for(auto ni = 0_uz;ni < samples;++ni)
                ret[mi*samples + ni] = arr.values[mi + measurements*ni];
        }
        return ret;
    };
    if(left) data->mIrs[0] = rearrange(*left);
    if(right) data->mIrs[1] = rearrange(*right);

    TRACE("Loaded {}: {} measurements, {} samples at {}hz", filename, data->mMeasurements,
        data->mSamples, data->mSampleRate);
    return data;
}

} // namespace

MatAdapter::MatAdapter(std::filesystem::path root, CollectionInfo info, usize const cacheSize)
    : mRoot{std::move(root)}, mInfo{std::move(info)}, mCache{cacheSize}
{ }

auto MatAdapter::load(const std::string &filename) const -> std::shared_ptr<const MatData>
{ return mCache.get(filename, [this,&filename]{ return LoadMatData(filename, mInfo); }); }

auto MatAdapter::enumerate() const -> std::vector<IndexEntry>
{
    auto const files = DiscoverFiles(format(), mRoot, mInfo.pattern);
    CheckUniqueSubjects(files, format());

    auto ret = std::vector<IndexEntry>{};
    for(const auto &file : files)
    {
        auto filename = std::string{hf::u8_as_char(file.path.u8string())};
        auto const data = load(filename);

        for(auto mi = 0_uz;mi < data->mMeasurements;++mi)
        {
            for(auto ri = 0u;ri < data->mIrs.size();++ri)
            {
                if(!data->hasEar(ri))
                    continue;
                auto const side = (ri == 0) ? Side::Left : Side::Right;
                ret.emplace_back(IndexEntry{MeasurementKey{file.subject, side,
                    data->mPositions[mi]}, Locator{filename, gsl::narrow<u32>(mi), ri}});
            }
        }
    }
    TRACE("mat: enumerated {} responses from {} files", ret.size(), files.size());
    return ret;
}

auto MatAdapter::read(const Locator &loc) const -> MeasurementRecord
{
    CheckLocatorFile(loc, format());

    auto const subject = SubjectForFile(mRoot, mInfo.pattern,
        std::filesystem::path(hf::char_as_u8(loc.file)));
    if(!subject)
        throw_error<key_error>("mat: locator {} is outside the dataset", FormatLocator(loc));

    auto const data = load(loc.file);
    if(loc.measurement >= data->mMeasurements || !data->hasEar(loc.receiver))
        throw_error<key_error>("mat: locator {} out of range ({} measurements)",
            FormatLocator(loc), data->mMeasurements);

    auto const ir = data->ir(loc.measurement, loc.receiver);
    auto record = MeasurementRecord{};
    record.key = MeasurementKey{*subject, (loc.receiver == 0) ? Side::Left : Side::Right,
        data->mPositions[loc.measurement]};
    record.sampleRate = data->mSampleRate;
    record.samples.assign(ir.begin(), ir.end());
    return record;
}

} // namespace hf
