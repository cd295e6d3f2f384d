
#include "config.h"

#include "dataset_config.hpp"

#include <array>
#include <cmath>
#include <limits>
#include <string>

#include "config_file.hpp"
#include "except.h"
#include "hfstring.h"
#include "measurement.hpp"


namespace hf {

namespace {

using namespace std::string_view_literals;

struct SideSelectionName {
    SideSelection sides;
    std::string_view name;
};
constexpr auto SideSelectionNames = std::array{
    SideSelectionName{SideSelection::Left, "left"sv},
    SideSelectionName{SideSelection::Right, "right"sv},
    SideSelectionName{SideSelection::Both, "both"sv},
    SideSelectionName{SideSelection::Any, "any"sv},
    SideSelectionName{SideSelection::BothLeft, "both-left"sv},
    SideSelectionName{SideSelection::BothRight, "both-right"sv},
    SideSelectionName{SideSelection::AnyLeft, "any-left"sv},
    SideSelectionName{SideSelection::AnyRight, "any-right"sv},
};

auto InRange(const ValueRange &range, f64 const value) noexcept -> bool
{ return value >= range.min && value <= range.max; }

void CheckRange(const std::optional<ValueRange> &range, std::string_view const name)
{
    if(!range) return;
    if(std::isnan(range->min) || std::isnan(range->max) || range->min > range->max)
        throw_error<config_error>("Invalid {} range [{}, {}]", name, range->min, range->max);
}

auto LoadRange(const ConfigFile &conf, std::string_view const name, ValueRange const defaults)
    -> std::optional<ValueRange>
{
    auto const minval = conf.valueF64("positions"sv, std::string{name}+"-min");
    auto const maxval = conf.valueF64("positions"sv, std::string{name}+"-max");
    if(!minval && !maxval)
        return std::nullopt;
    return ValueRange{minval.value_or(defaults.min), maxval.value_or(defaults.max)};
}

/* Bounds outside [0,360] are wrapped first. The range runs counter-clockwise
 * from min to max, so it crosses 0 when the wrapped min is above the wrapped
 * max.
 */
auto AzimuthInRange(const ValueRange &range, f64 const azimuth) -> bool
{
    if(range.max - range.min >= 360.0)
        return true;

    auto const lo = (range.min < 0.0 || range.min >= 360.0) ? WrapAzimuth(range.min)
        : range.min;
    auto const hi = (range.max < 0.0 || range.max > 360.0) ? WrapAzimuth(range.max)
        : range.max;
    if(lo <= hi)
        return azimuth >= lo && azimuth <= hi;
    return azimuth >= lo || azimuth <= hi;
}

} // namespace

auto GetSideSelectionName(SideSelection const sides) noexcept -> std::string_view
{
    for(const auto &entry : SideSelectionNames)
    {
        if(entry.sides == sides)
            return entry.name;
    }
    return "<unknown>"sv;
}

auto ParseSideSelection(std::string_view const name) -> std::optional<SideSelection>
{
    for(const auto &entry : SideSelectionNames)
    {
        if(hf::case_compare(entry.name, name) == 0)
            return entry.sides;
    }
    return std::nullopt;
}

auto PositionFilter::accepts(const Position &pos) const -> bool
{
    if(azimuth && !AzimuthInRange(*azimuth, pos.azimuth))
        return false;
    if(elevation && !InRange(*elevation, pos.elevation))
        return false;
    if(distance && !InRange(*distance, pos.distance))
        return false;
    return !predicate || predicate(pos);
}

void ValidateConfig(const DatasetConfig &config)
{
    if(config.sampleRate == 0)
        throw config_error{"Target samplerate must be positive"};

    ValidateProcessingOptions(config.processing);
    ValidateResamplerParams(config.resampler);

    if(auto const &az = config.positions.azimuth)
    {
        if(!std::isfinite(az->min) || !std::isfinite(az->max))
            throw_error<config_error>("Invalid azimuth range [{}, {}]", az->min, az->max);
    }
    CheckRange(config.positions.elevation, "elevation"sv);
    CheckRange(config.positions.distance, "distance"sv);
}

auto LoadDatasetConfig(const ConfigFile &conf) -> DatasetConfig
{
    auto config = DatasetConfig{};

    auto const rate = conf.valueU32("hrirs"sv, "samplerate"sv);
    if(!rate)
        throw_error<config_error>("{}: missing hrirs/samplerate", conf.source());
    config.sampleRate = *rate;

    if(auto const side = conf.valueStr("hrirs"sv, "side"sv))
    {
        auto const sides = ParseSideSelection(*side);
        if(!sides)
            throw_error<config_error>("{}: invalid hrirs/side \"{}\"", conf.source(), *side);
        config.sides = *sides;
    }

    if(auto const length = conf.valueU32("hrirs"sv, "length"sv))
        config.processing.length = *length;
    if(auto const scale = conf.valueF64("hrirs"sv, "scale"sv))
        config.processing.scaleFactor = *scale;
    if(auto const minphase = conf.valueBool("hrirs"sv, "min-phase"sv))
        config.processing.minPhase = *minphase;
    if(auto const domain = conf.valueStr("hrirs"sv, "domain"sv))
    {
        auto const parsed = ParseResponseDomain(*domain);
        if(!parsed)
            throw_error<config_error>("{}: invalid hrirs/domain \"{}\"", conf.source(),
                *domain);
        config.processing.domain = *parsed;
    }

    config.subjects.include = conf.valueU32List("subjects"sv, "include"sv);
    config.subjects.exclude = conf.valueU32List("subjects"sv, "exclude"sv);
    if(auto const pick = conf.valueStr("subjects"sv, "pick"sv))
    {
        if(hf::case_compare(*pick, "all"sv) == 0)
            config.subjects.pick = SubjectPick::All;
        else if(hf::case_compare(*pick, "first"sv) == 0)
            config.subjects.pick = SubjectPick::First;
        else if(hf::case_compare(*pick, "last"sv) == 0)
            config.subjects.pick = SubjectPick::Last;
        else
            throw_error<config_error>("{}: invalid subjects/pick \"{}\"", conf.source(), *pick);
    }

    constexpr auto maxdist = std::numeric_limits<f64>::max();
    config.positions.azimuth = LoadRange(conf, "azimuth"sv, {0.0, 360.0});
    config.positions.elevation = LoadRange(conf, "elevation"sv, {-90.0, 90.0});
    config.positions.distance = LoadRange(conf, "distance"sv, {0.0, maxdist});

    if(auto const rejection = conf.valueF64("resampler"sv, "rejection"sv))
        config.resampler.rejection = *rejection;
    if(auto const transition = conf.valueF64("resampler"sv, "transition"sv))
        config.resampler.transition = *transition;

    ValidateConfig(config);
    return config;
}

auto LoadDatasetSource(const ConfigFile &conf, const CollectionRegistry &registry)
    -> DatasetSource
{
    auto const name = conf.valueStr("dataset"sv, "collection"sv);
    if(!name)
        throw_error<config_error>("{}: missing dataset/collection", conf.source());
    auto const root = conf.valueStr("dataset"sv, "root"sv);
    if(!root)
        throw_error<config_error>("{}: missing dataset/root", conf.source());

    auto source = DatasetSource{registry.get(*name),
        std::filesystem::path(hf::char_as_u8(*root)), std::nullopt};

    if(auto const format = conf.valueStr("dataset"sv, "format"sv))
    {
        source.format = ParseFormatType(*format);
        if(!source.format)
            throw_error<config_error>("{}: invalid dataset/format \"{}\"", conf.source(),
                *format);
    }
    if(auto pattern = conf.valueStr("dataset"sv, "pattern"sv))
        source.collection.pattern = std::move(*pattern);

    return source;
}

} // namespace hf
