
#include "config.h"

#include "measurement.hpp"

#include <cmath>
#include <numbers>

#include "hfformat.hpp"
#include "hfnumeric.h"


namespace hf {

namespace {

using namespace std::string_view_literals;

constexpr auto PositionStep = 1e-6;
constexpr auto Rad2Deg = 180.0 / std::numbers::pi;
constexpr auto Deg2Rad = std::numbers::pi / 180.0;

} // namespace

auto GetSideName(Side const side) noexcept -> std::string_view
{
    switch(side)
    {
    case Side::Left: return "left"sv;
    case Side::Right: return "right"sv;
    case Side::MirroredLeft: return "mirrored-left"sv;
    case Side::MirroredRight: return "mirrored-right"sv;
    }
    return "<unknown>"sv;
}

auto WrapAzimuth(f64 const azimuth) -> f64
{
    auto ret = RoundToStep(std::fmod(azimuth, 360.0), PositionStep);
    if(ret < 0.0) ret += 360.0;
    if(ret >= 360.0) ret -= 360.0;
    return RoundToStep(ret, PositionStep);
}

auto MakePosition(f64 const azimuth, f64 const elevation, f64 const distance) -> Position
{
    return Position{WrapAzimuth(azimuth), RoundToStep(elevation, PositionStep),
        RoundToStep(distance, PositionStep)};
}

auto MirrorPosition(const Position &pos) -> Position
{ return MakePosition(360.0 - pos.azimuth, pos.elevation, pos.distance); }

auto PositionFromCartesian(f64 const x, f64 const y, f64 const z) -> Position
{
    auto const r = std::sqrt(x*x + y*y + z*z);
    auto const az = std::atan2(y, x) * Rad2Deg;
    auto const el = std::atan2(z, std::hypot(x, y)) * Rad2Deg;
    return MakePosition(az, el, r);
}

auto PositionFromInterauralPolar(f64 const lateral, f64 const polar, f64 const distance)
    -> Position
{
    auto const lat = lateral * Deg2Rad;
    auto const pol = polar * Deg2Rad;
    auto const x = std::cos(lat) * std::cos(pol);
    auto const y = -std::sin(lat);
    auto const z = std::cos(lat) * std::sin(pol);
    auto const pos = PositionFromCartesian(x, y, z);
    return MakePosition(pos.azimuth, pos.elevation, distance);
}

auto FormatPosition(const Position &pos) -> std::string
{ return hf::format("(az {:g}, el {:g}, r {:g})", pos.azimuth, pos.elevation, pos.distance); }

auto FormatKey(const MeasurementKey &key) -> std::string
{
    return hf::format("subject {} {} {}", key.subject, GetSideName(key.side),
        FormatPosition(key.position));
}

auto FormatLocator(const Locator &loc) -> std::string
{ return hf::format("{}[m={}, r={}]", loc.file, loc.measurement, loc.receiver); }

} // namespace hf
