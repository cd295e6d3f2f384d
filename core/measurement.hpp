#ifndef CORE_MEASUREMENT_HPP
#define CORE_MEASUREMENT_HPP

#include <compare>
#include <string>
#include <string_view>
#include <vector>

#include "hftypes.hpp"


namespace hf {

/* The ear a response belongs to. The mirrored sides hold the named ear's
 * data reflected across the median plane, standing in for the opposite ear.
 */
enum class Side : u8 {
    Left,
    Right,
    MirroredLeft,
    MirroredRight
};

[[nodiscard]] auto GetSideName(Side side) noexcept -> std::string_view;

[[nodiscard]] constexpr
auto IsMirrored(Side const side) noexcept -> bool
{ return side == Side::MirroredLeft || side == Side::MirroredRight; }

/* The real ear whose data backs the given side. */
[[nodiscard]] constexpr
auto SourceSide(Side const side) noexcept -> Side
{
    switch(side)
    {
    case Side::Left: case Side::MirroredLeft: return Side::Left;
    case Side::Right: case Side::MirroredRight: return Side::Right;
    }
    return side;
}

/* Vertical-polar spherical coordinates: azimuth in degrees [0,360) counter-
 * clockwise from the front, elevation in degrees [-90,90] up from the
 * horizontal plane, distance in metres.
 */
struct Position {
    f64 azimuth{};
    f64 elevation{};
    f64 distance{};

    auto operator<=>(const Position&) const = default;
};

/* Wraps the azimuth and rounds all components to 1e-6, so repeated
 * measurements of the same point compare equal.
 */
[[nodiscard]] auto MakePosition(f64 azimuth, f64 elevation, f64 distance) -> Position;

/* Reflects the position across the median plane. */
[[nodiscard]] auto MirrorPosition(const Position &pos) -> Position;

/* x points to the front, y to the left, z up. */
[[nodiscard]] auto PositionFromCartesian(f64 x, f64 y, f64 z) -> Position;

/* Interaural-polar coordinates: lateral angle in degrees (positive to the
 * right), polar angle in degrees (0 front, 90 up, 180 back).
 */
[[nodiscard]] auto PositionFromInterauralPolar(f64 lateral, f64 polar, f64 distance) -> Position;

[[nodiscard]] auto WrapAzimuth(f64 azimuth) -> f64;


struct MeasurementKey {
    u32 subject{};
    Side side{Side::Left};
    Position position;

    auto operator<=>(const MeasurementKey&) const = default;
};

/* Identifies where a response is stored: a file, the measurement offset in
 * that file, and the receiver (channel) index.
 */
struct Locator {
    std::string file;
    u32 measurement{};
    u32 receiver{};

    bool operator==(const Locator&) const = default;
};

struct IndexEntry {
    MeasurementKey key;
    Locator locator;
};

struct MeasurementRecord {
    MeasurementKey key;
    u32 sampleRate{};
    std::vector<f64> samples;
};

[[nodiscard]] auto FormatPosition(const Position &pos) -> std::string;
[[nodiscard]] auto FormatKey(const MeasurementKey &key) -> std::string;
[[nodiscard]] auto FormatLocator(const Locator &loc) -> std::string;

} // namespace hf

#endif /* CORE_MEASUREMENT_HPP */
