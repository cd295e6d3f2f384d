
#include "config.h"

#include "hfstring.h"

#include <algorithm>
#include <cctype>
#include <compare>
#include <cstdlib>


namespace hf {

auto case_compare(const std::string_view str0, const std::string_view str1) noexcept
    -> std::weak_ordering
{
    return std::lexicographical_compare_three_way(str0.cbegin(), str0.cend(),
        str1.cbegin(), str1.cend(), [](const char ch0, const char ch1) -> std::weak_ordering
    {
        using Traits = std::string_view::traits_type;
        return std::toupper(Traits::to_int_type(ch0)) <=> std::toupper(Traits::to_int_type(ch1));
    });
}

auto trim(std::string_view str) noexcept -> std::string_view
{
    auto const isspace = [](const char c) -> bool
    { return std::isspace(std::string_view::traits_type::to_int_type(c)) != 0; };

    while(!str.empty() && isspace(str.front()))
        str.remove_prefix(1);
    while(!str.empty() && isspace(str.back()))
        str.remove_suffix(1);
    return str;
}

auto split_list(std::string_view str, const char delim) -> std::vector<std::string>
{
    auto ret = std::vector<std::string>{};
    while(!str.empty())
    {
        auto const next = std::min(str.find(delim), str.size());
        if(auto const entry = trim(str.substr(0, next)); !entry.empty())
            ret.emplace_back(entry);
        str.remove_prefix(std::min(next+1, str.size()));
    }
    return ret;
}

auto getenv(const gsl::czstring envname) -> std::optional<std::string>
{
    /* NOLINTNEXTLINE(concurrency-mt-unsafe) */
    if(auto const *str = std::getenv(envname); str && *str != '\0')
        return std::string{str};
    return std::nullopt;
}

} // namespace hf
