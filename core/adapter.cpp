
#include "config.h"

#include "adapter.hpp"

#include <system_error>
#include <utility>

#include "except.h"
#include "hfstring.h"
#include "mat_adapter.hpp"
#include "sofa_adapter.hpp"
#include "wave_adapter.hpp"


namespace hf {

FormatAdapter::~FormatAdapter() = default;

auto CreateAdapter(FormatType const type, std::filesystem::path root, const CollectionInfo &info)
    -> FormatAdapterPtr
{
    switch(type)
    {
    case FormatType::Sofa: return std::make_shared<SofaAdapter>(std::move(root), info);
    case FormatType::Mat: return std::make_shared<MatAdapter>(std::move(root), info);
    case FormatType::WaveDirectory: return std::make_shared<WaveAdapter>(std::move(root), info);
    }
    throw_error<config_error>("Unhandled format type {}", static_cast<int>(type));
}

auto SubjectForFile(const std::filesystem::path &root, std::string_view const pattern,
    const std::filesystem::path &file) -> std::optional<u32>
{
    auto ec = std::error_code{};
    if(std::filesystem::is_regular_file(root, ec))
    {
        if(file != root)
            return std::nullopt;
        return SubjectForSingleFile(pattern, root);
    }

    auto const relpath = file.lexically_relative(root).generic_u8string();
    return MatchPattern(pattern, hf::u8_as_char(relpath));
}

void CheckLocatorFile(const Locator &loc, FormatType const type)
{
    auto ec = std::error_code{};
    if(!std::filesystem::is_regular_file(std::filesystem::path(hf::char_as_u8(loc.file)), ec))
        throw_error<key_error>("{}: locator {} no longer resolves", GetFormatName(type),
            FormatLocator(loc));
}

void CheckUniqueSubjects(const std::vector<DiscoveredFile> &files, FormatType const type)
{
    for(auto i = 1_uz;i < files.size();++i)
    {
        if(files[i].subject == files[i-1].subject)
            throw_error<format_error>("{}: subject {} matched by both {} and {}",
                GetFormatName(type), files[i].subject,
                hf::u8_as_char(files[i-1].path.u8string()),
                hf::u8_as_char(files[i].path.u8string()));
    }
}

} // namespace hf
