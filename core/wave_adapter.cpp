
#include "config.h"

#include "wave_adapter.hpp"

#include <charconv>
#include <cmath>
#include <memory>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "except.h"
#include "hfnumeric.h"
#include "hfstring.h"
#include "logging.h"

#include "sndfile.h"


namespace hf {

namespace {

using namespace std::string_view_literals;

using SndFilePtr = std::unique_ptr<SNDFILE, decltype([](SNDFILE *sndfile) { sf_close(sndfile); })>;

auto ParseNumber(std::string_view const str) -> std::optional<f64>
{
    auto value = 0.0;
    auto const *first = str.data();
    auto const *last = first + str.size();
    if(!str.empty() && str.front() == '+')
        ++first;
    auto const res = std::from_chars(first, last, value);
    if(res.ec != std::errc{} || res.ptr != last || !std::isfinite(value))
        return std::nullopt;
    return value;
}

struct OpenedWave {
    SndFilePtr mFile;
    SF_INFO mInfo{};
};

auto OpenWave(const std::string &filename) -> OpenedWave
{
    auto ret = OpenedWave{};
    ret.mFile = SndFilePtr{sf_open(filename.c_str(), SFM_READ, &ret.mInfo)};
    if(!ret.mFile)
        throw_error<format_error>("wave: could not open {}: {}", filename,
            sf_strerror(nullptr));
    if(ret.mInfo.channels < 1 || ret.mInfo.channels > 2)
        throw_error<format_error>("wave: {}: {} channels not supported", filename,
            ret.mInfo.channels);
    if(ret.mInfo.samplerate < 1)
        throw_error<format_error>("wave: {}: invalid sample rate {}", filename,
            ret.mInfo.samplerate);
    return ret;
}

auto PositionForFile(const std::filesystem::path &path, const CollectionInfo &info)
    -> Position
{
    auto const stem = std::string{hf::u8_as_char(path.stem().u8string())};
    auto const defdist = info.grid ? info.grid->distance : 1.0;
    if(auto const pos = ParseWavePosition(stem, defdist))
        return *pos;
    throw_error<format_error>("wave: {}: no position in file name (expected az<deg>_el<deg>)",
        hf::u8_as_char(path.u8string()));
}

} // namespace

auto ParseWavePosition(std::string_view const stem, f64 const defaultDistance)
    -> std::optional<Position>
{
    auto az = std::optional<f64>{};
    auto el = std::optional<f64>{};
    auto dist = defaultDistance;

    for(const auto &token : hf::split_list(stem, '_'))
    {
        auto const tok = std::string_view{token};
        if(tok.starts_with("az"sv))
            az = ParseNumber(tok.substr(2));
        else if(tok.starts_with("el"sv))
            el = ParseNumber(tok.substr(2));
        else if(tok.starts_with('d'))
        {
            if(auto const d = ParseNumber(tok.substr(1)))
                dist = *d;
        }
    }
    if(!az || !el)
        return std::nullopt;
    return MakePosition(*az, *el, dist);
}

WaveAdapter::WaveAdapter(std::filesystem::path root, CollectionInfo info)
    : mRoot{std::move(root)}, mInfo{std::move(info)}
{ }

auto WaveAdapter::enumerate() const -> std::vector<IndexEntry>
{
    auto const files = DiscoverFiles(format(), mRoot, mInfo.pattern);

    auto ret = std::vector<IndexEntry>{};
    for(const auto &file : files)
    {
        auto filename = std::string{hf::u8_as_char(file.path.u8string())};
        auto const position = PositionForFile(file.path, mInfo);
        auto const wave = OpenWave(filename);

        for(auto ci = 0u;ci < as_unsigned(wave.mInfo.channels);++ci)
        {
            auto const side = (ci == 0) ? Side::Left : Side::Right;
            ret.emplace_back(IndexEntry{MeasurementKey{file.subject, side, position},
                Locator{filename, 0u, ci}});
        }
    }
    TRACE("wave: enumerated {} responses from {} files", ret.size(), files.size());
    return ret;
}

auto WaveAdapter::read(const Locator &loc) const -> MeasurementRecord
{
    CheckLocatorFile(loc, format());

    auto const path = std::filesystem::path(hf::char_as_u8(loc.file));
    auto const subject = SubjectForFile(mRoot, mInfo.pattern, path);
    if(!subject || loc.measurement != 0)
        throw_error<key_error>("wave: locator {} does not resolve", FormatLocator(loc));

    auto const wave = OpenWave(loc.file);
    auto const channels = as_unsigned(wave.mInfo.channels);
    if(loc.receiver >= channels)
        throw_error<key_error>("wave: locator {} out of range ({} channels)",
            FormatLocator(loc), channels);

    auto const frames = hf::saturate_cast<usize>(wave.mInfo.frames);
    auto interleaved = std::vector<f64>(frames * channels);
    auto const got = sf_readf_double(wave.mFile.get(), interleaved.data(),
        gsl::narrow_cast<sf_count_t>(frames));
    if(got < 0 || as_unsigned(got) != frames)
        throw_error<format_error>("wave: {}: read {} of {} frames", loc.file, got, frames);

    auto record = MeasurementRecord{};
    record.key = MeasurementKey{*subject, (loc.receiver == 0) ? Side::Left : Side::Right,
        PositionForFile(path, mInfo)};
    record.sampleRate = gsl::narrow_cast<u32>(wave.mInfo.samplerate);
    record.samples.resize(frames);
    for(auto i = 0_uz;i < frames;++i)
        record.samples[i] = interleaved[i*channels + loc.receiver];
    return record;
}

} // namespace hf
