/*
 * Dataset info utility for inspecting HRTF collections as the loader sees
 * them: the measurements indexed, the subjects and ears selected, and the
 * shape of the responses at the target samplerate.
 */

#include "config.h"

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "collection.hpp"
#include "config_file.hpp"
#include "dataset.hpp"
#include "dataset_config.hpp"
#include "except.h"
#include "fmt/core.h"
#include "gsl/gsl"
#include "hfstring.h"
#include "hrir_transform.hpp"
#include "measurement.hpp"

namespace {

using namespace std::string_view_literals;

constexpr auto DefaultSampleRate = 48000_u32;

void PrintUsage(std::string_view const progname)
{
    fmt::print("hartufo-info {}\n", HARTUFO_VERSION);
    fmt::print("Usage: {} <config-file>\n", progname);
    fmt::print("       {} <collection> <root> [samplerate]\n", progname);
    fmt::print("       {} --list\n", progname);
}

void PrintCollections(const hf::CollectionRegistry &registry)
{
    fmt::print("Known collections:\n");
    for(const auto &info : registry)
    {
        fmt::print("  {:<16} {:<5} {}", info.name, hf::GetFormatName(info.format),
            info.pattern);
        if(info.sampleRate)
            fmt::print(" ({}hz)", *info.sampleRate);
        fmt::print("\n");
    }
}

auto ParseSampleRate(std::string_view const str) -> u32
{
    auto rate = u32{};
    auto const res = std::from_chars(str.data(), str.data()+str.size(), rate);
    if(res.ec != std::errc{} || res.ptr != str.data()+str.size() || rate == 0)
        hf::throw_error<hf::config_error>("Invalid samplerate \"{}\"", str);
    return rate;
}

void PrintDataset(const hf::Dataset &dataset)
{
    auto const &config = dataset.config();
    fmt::print("Format: {}\n", hf::GetFormatName(dataset.format()));
    fmt::print("Root: {}\n", hf::u8_as_char(dataset.adapter()->root().u8string()));
    fmt::print("Samplerate: {}hz\n", config.sampleRate);
    fmt::print("Sides: {}\n", hf::GetSideSelectionName(config.sides));
    fmt::print("Domain: {}\n", hf::GetDomainName(config.processing.domain));
    fmt::print("Measurements: {}\n", dataset.size());

    auto const subjects = dataset.subjects();
    fmt::print("Subjects: {}\n", subjects.size());

    auto const entries = dataset.index().entries();
    for(u32 const subject : subjects)
    {
        auto counts = std::array<usize,4>{};
        for(const auto &entry : entries)
        {
            if(entry.key.subject == subject)
                ++counts[hf::to_underlying(entry.key.side)];
        }
        fmt::print("  {:>4}:", subject);
        for(usize i{0};i < counts.size();++i)
        {
            if(counts[i] > 0)
                fmt::print(" {} {}", counts[i], hf::GetSideName(static_cast<hf::Side>(i)));
        }
        fmt::print("\n");
    }

    auto const record = dataset.at(0);
    fmt::print("First: {}, {} samples\n", hf::FormatKey(record.key), record.samples.size());
}

auto InfoMain(std::span<const std::string_view> args) -> int
{
    auto const registry = hf::CollectionRegistry::Builtin();

    if(args.size() == 2 && args[1] == "--list"sv)
    {
        PrintCollections(registry);
        return 0;
    }

    if(args.size() == 2)
    {
        auto const conf = hf::ConfigFile::Load(std::filesystem::path(hf::char_as_u8(args[1])));
        auto const dataset = hf::Dataset{hf::LoadDatasetSource(conf, registry),
            hf::LoadDatasetConfig(conf)};
        PrintDataset(dataset);
        return 0;
    }

    if(args.size() == 3 || args.size() == 4)
    {
        auto const &info = registry.get(args[1]);
        auto source = hf::DatasetSource{info, std::filesystem::path(hf::char_as_u8(args[2])),
            std::nullopt};

        auto config = hf::DatasetConfig{};
        config.sampleRate = (args.size() == 4) ? ParseSampleRate(args[3])
            : info.sampleRate.value_or(DefaultSampleRate);

        auto const dataset = hf::Dataset{source, std::move(config)};
        PrintDataset(dataset);
        return 0;
    }

    PrintUsage(args.empty() ? "hartufo-info"sv : args[0]);
    return 1;
}

} /* namespace */

int main(int argc, char **argv)
{
    auto args = std::vector<std::string_view>(gsl::narrow<usize>(argc));
    std::copy_n(argv, args.size(), args.begin());

    try {
        return InfoMain(args);
    }
    catch(hf::base_exception &e) {
        fmt::print(stderr, "Error: {}\n", e.what());
    }
    catch(std::exception &e) {
        fmt::print(stderr, "Unexpected error: {}\n", e.what());
    }
    return 1;
}
