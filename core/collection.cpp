
#include "config.h"

#include "collection.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <functional>
#include <iterator>
#include <ranges>
#include <system_error>
#include <utility>

#include "except.h"
#include "gsl/gsl"
#include "hfstring.h"
#include "logging.h"


namespace hf {

namespace {

using namespace std::string_view_literals;

constexpr auto IdToken = "{id}"sv;
/* Keeps parsed ids within u32. */
constexpr auto MaxIdDigits = 9_uz;

auto IsDigit(const char c) noexcept -> bool
{ return std::isdigit(std::string_view::traits_type::to_int_type(c)) != 0; }

auto MatchFrom(std::string_view pat, std::string_view str, std::optional<u32> &id) -> bool
{
    while(!pat.empty())
    {
        if(pat.starts_with(IdToken))
        {
            pat.remove_prefix(IdToken.size());

            auto digits = 0_uz;
            while(digits < str.size() && digits < MaxIdDigits && IsDigit(str[digits]))
                ++digits;

            /* Try the longest run of digits first. */
            for(auto len = digits;len > 0;--len)
            {
                auto value = 0u;
                std::from_chars(str.data(), str.data()+len, value);
                if(id && *id != value)
                    continue;

                auto const saved = id;
                id = value;
                if(MatchFrom(pat, str.substr(len), id))
                    return true;
                id = saved;
            }
            return false;
        }

        if(pat.front() == '*')
        {
            pat.remove_prefix(1);
            for(auto len = 0_uz;len <= str.size();++len)
            {
                if(len > 0 && str[len-1] == '/')
                    break;
                auto const saved = id;
                if(MatchFrom(pat, str.substr(len), id))
                    return true;
                id = saved;
            }
            return false;
        }

        if(str.empty())
            return false;
        if(pat.front() == '?')
        {
            if(str.front() == '/')
                return false;
        }
        else if(pat.front() != str.front())
            return false;

        pat.remove_prefix(1);
        str.remove_prefix(1);
    }
    return str.empty();
}

auto MakeCipicGrid() -> MeasurementGrid
{
    auto grid = MeasurementGrid{};
    grid.azimuths = {-80.0, -65.0, -55.0};
    for(auto az = -45;az <= 45;az += 5)
        grid.azimuths.emplace_back(az);
    grid.azimuths.insert(grid.azimuths.end(), {55.0, 65.0, 80.0});

    grid.elevations.reserve(50);
    for(auto i = 0;i < 50;++i)
        grid.elevations.emplace_back(-45.0 + 5.625*i);

    grid.distance = 1.0;
    grid.coordinates = GridCoordinates::InterauralPolar;
    return grid;
}

} // namespace

auto GetFormatName(FormatType const type) noexcept -> std::string_view
{
    switch(type)
    {
    case FormatType::Sofa: return "sofa"sv;
    case FormatType::Mat: return "mat"sv;
    case FormatType::WaveDirectory: return "wave"sv;
    }
    return "<unknown>"sv;
}

auto ParseFormatType(std::string_view const name) -> std::optional<FormatType>
{
    if(hf::case_compare(name, "sofa"sv) == 0)
        return FormatType::Sofa;
    if(hf::case_compare(name, "mat"sv) == 0)
        return FormatType::Mat;
    if(hf::case_compare(name, "wave"sv) == 0 || hf::case_compare(name, "wav"sv) == 0)
        return FormatType::WaveDirectory;
    return std::nullopt;
}


void CollectionRegistry::add(CollectionInfo info)
{
    if(info.name.empty())
        throw config_error{"Collection name must not be empty"};
    if(!hf::contains(info.pattern, IdToken))
        throw_error<config_error>("Collection {}: pattern \"{}\" has no {} placeholder",
            info.name, info.pattern, IdToken);

    auto iter = std::ranges::lower_bound(mCollections, info.name, std::less{},
        &CollectionInfo::name);
    if(iter != mCollections.end() && iter->name == info.name)
        *iter = std::move(info);
    else
        mCollections.insert(iter, std::move(info));
}

auto CollectionRegistry::find(std::string_view const name) const noexcept
    -> const CollectionInfo*
{
    auto iter = std::ranges::lower_bound(mCollections, name, std::less{},
        [](const CollectionInfo &info) -> std::string_view { return info.name; });
    if(iter != mCollections.end() && iter->name == name)
        return &*iter;
    return nullptr;
}

auto CollectionRegistry::get(std::string_view const name) const -> const CollectionInfo&
{
    if(auto *info = find(name))
        return *info;
    throw_error<config_error>("Unknown collection \"{}\"", name);
}

auto CollectionRegistry::names() const -> std::vector<std::string>
{
    auto ret = std::vector<std::string>{};
    ret.reserve(mCollections.size());
    std::ranges::transform(mCollections, std::back_inserter(ret), &CollectionInfo::name);
    return ret;
}

auto CollectionRegistry::Builtin() -> CollectionRegistry
{
    auto reg = CollectionRegistry{};
    auto add_sofa = [&reg](std::string name, std::string pattern, std::vector<u32> exclude)
    {
        reg.add(CollectionInfo{std::move(name), FormatType::Sofa, std::move(pattern),
            std::move(exclude), std::nullopt, std::nullopt});
    };

    /* Subject 21 and 165 are the KEMAR dummy head. */
    add_sofa("cipic", "subject_{id}.sofa", {21, 165});
    /* These are missing measurement positions. */
    add_sofa("ari", "hrtf ?_nh{id}.sofa", {10, 22, 826});
    add_sofa("listen", "compensated/44100/IRC_{id}_C_44100.sofa", {});
    add_sofa("bili", "compensated/96000/IRC_{id}_C_HRIR_96000.sofa", {});
    /* Lower resolution measurement grid. */
    add_sofa("ita", "MRT{id}.sofa", {2, 14});
    /* Subject 1 and 96 are the FABIAN dummy head. */
    add_sofa("hutubs", "pp{id}_HRIRs_measured.sofa", {1, 96});
    add_sofa("riec", "RIEC_hrir_subject_{id}.sofa", {46, 80});
    add_sofa("chedar", "chedar_{id}_UV1m.sofa", {});
    add_sofa("widespread", "UV1m_{id}.sofa", {});
    /* The first subjects are dummy heads. */
    add_sofa("sadie2", "?{id}/?{id}_HRIR_SOFA/?{id}_96K_24bit_512tap_FIR_SOFA.sofa",
        {1, 2, 3, 4, 5, 6, 7, 8, 9});
    add_sofa("3d3a", "Acoustic/Subject{id}/Subject{id}_HRIRs.sofa", {37, 44});
    add_sofa("sonicom", "P{id}/HRTF/96kHz/P{id}_FreeFieldComp_96kHz.sofa", {});

    reg.add(CollectionInfo{"cipic-mat", FormatType::Mat, "subject_{id}/hrir_final.mat",
        {21, 165}, 44100u, MakeCipicGrid()});
    reg.add(CollectionInfo{"wave-directory", FormatType::WaveDirectory, "subject_{id}/*.wav",
        {}, std::nullopt, std::nullopt});
    return reg;
}


auto MatchPattern(std::string_view const pattern, std::string_view const path)
    -> std::optional<u32>
{
    auto id = std::optional<u32>{};
    if(MatchFrom(pattern, path, id))
        return id;
    return std::nullopt;
}

auto SubjectForSingleFile(std::string_view const pattern, const std::filesystem::path &file)
    -> u32
{
    auto const depth = gsl::narrow_cast<usize>(std::ranges::count(pattern, '/')) + 1;
    auto const parts = std::vector<std::filesystem::path>(file.begin(), file.end());

    auto tail = std::filesystem::path{};
    for(auto i = parts.size() - std::min(parts.size(), depth);i < parts.size();++i)
        tail /= parts[i];
    return MatchPattern(pattern, hf::u8_as_char(tail.generic_u8string())).value_or(0u);
}

auto DiscoverFiles(FormatType const type, const std::filesystem::path &root,
    std::string_view const pattern) -> std::vector<DiscoveredFile>
{
    namespace fs = std::filesystem;

    auto const fmtname = GetFormatName(type);
    auto ec = std::error_code{};
    if(fs::is_regular_file(root, ec))
    {
        auto const subject = SubjectForSingleFile(pattern, root);
        TRACE("{}: using single file {} as subject {}", fmtname,
            hf::u8_as_char(root.u8string()), subject);
        return {DiscoveredFile{subject, root}};
    }
    if(!fs::is_directory(root, ec))
        throw_error<format_error>("{}: dataset root {} is not a directory or file", fmtname,
            hf::u8_as_char(root.u8string()));

    auto ret = std::vector<DiscoveredFile>{};
    auto iter = fs::recursive_directory_iterator{root,
        fs::directory_options::skip_permission_denied, ec};
    if(ec)
        throw_error<format_error>("{}: failed to scan {}: {}", fmtname,
            hf::u8_as_char(root.u8string()), ec.message());

    for(;iter != fs::recursive_directory_iterator{};iter.increment(ec))
    {
        if(ec)
            throw_error<format_error>("{}: failed to scan {}: {}", fmtname,
                hf::u8_as_char(root.u8string()), ec.message());
        if(!iter->is_regular_file(ec))
            continue;

        auto const relpath = iter->path().lexically_relative(root).generic_u8string();
        if(auto const id = MatchPattern(pattern, hf::u8_as_char(relpath)))
            ret.emplace_back(DiscoveredFile{*id, iter->path()});
    }
    if(ec)
        throw_error<format_error>("{}: failed to scan {}: {}", fmtname,
            hf::u8_as_char(root.u8string()), ec.message());

    std::ranges::sort(ret, [](const DiscoveredFile &lhs, const DiscoveredFile &rhs) -> bool
    {
        if(lhs.subject != rhs.subject)
            return lhs.subject < rhs.subject;
        return lhs.path < rhs.path;
    });
    TRACE("{}: found {} files matching \"{}\" under {}", fmtname, ret.size(), pattern,
        hf::u8_as_char(root.u8string()));
    return ret;
}

} // namespace hf
