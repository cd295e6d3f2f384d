
#include "config.h"

#include "config_file.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <fstream>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

#include "except.h"
#include "hfstring.h"
#include "logging.h"


namespace hf {

namespace {

using namespace std::string_view_literals;

auto IsEnvNameChar(char const c) -> bool
{ return c == '_' || std::isalnum(std::string_view::traits_type::to_int_type(c)) != 0; }

/* Expands $NAME and ${NAME} from the environment. "$$" is a literal '$', and
 * a '$' not followed by a name is kept as is. Unset variables expand to
 * nothing.
 */
auto ExpandEnvVars(std::string_view const str) -> std::string
{
    auto output = std::string{};
    output.reserve(str.size());

    auto pos = 0_uz;
    while(pos < str.size())
    {
        auto const dollar = std::min(str.find('$', pos), str.size());
        output += str.substr(pos, dollar-pos);
        if(dollar == str.size())
            break;

        auto const rest = str.substr(dollar+1);
        if(rest.starts_with('$'))
        {
            output += '$';
            pos = dollar + 2;
            continue;
        }

        auto const braced = rest.starts_with('{');
        auto const namestart = braced ? 1_uz : 0_uz;
        auto nameend = namestart;
        while(nameend < rest.size() && IsEnvNameChar(rest[nameend]))
            ++nameend;

        if(nameend == namestart || (braced && (nameend == rest.size() || rest[nameend] != '}')))
        {
            output += '$';
            pos = dollar + 1;
            continue;
        }

        auto const envname = std::string{rest.substr(namestart, nameend-namestart)};
        if(auto const envval = hf::getenv(envname.c_str()))
            output += *envval;
        pos = dollar + 1 + nameend + (braced ? 1 : 0);
    }
    return output;
}

/* Removes a '#' comment and surrounding whitespace. */
auto StripLine(std::string_view line) -> std::string_view
{
    line = line.substr(0, std::min(line.find('#'), line.size()));
    return hf::trim(line);
}

auto Unquote(std::string_view value) -> std::string_view
{
    if(value.size() >= 2 && (value.front() == '"' || value.front() == '\'')
        && value.back() == value.front())
    {
        value.remove_prefix(1);
        value.remove_suffix(1);
    }
    return value;
}

auto MakeKey(std::string_view const section, std::string_view const key) -> std::string
{
    auto ret = std::string{};
    if(!section.empty() && hf::case_compare(section, "general"sv) != 0)
    {
        ret = section;
        ret += '/';
    }
    ret += key;
    return ret;
}

} // namespace

auto ConfigFile::Load(const std::filesystem::path &fname) -> ConfigFile
{
    auto const filename = std::string{hf::u8_as_char(fname.u8string())};
    TRACE("Loading config {}...", filename);

    auto f = std::ifstream{fname};
    if(!f.is_open())
        throw_error<config_error>("Could not open config file {}", filename);
    return Parse(f, filename);
}

auto ConfigFile::Parse(std::istream &f, std::string source) -> ConfigFile
{
    auto ret = ConfigFile{};
    ret.mSource = std::move(source);

    /* Unset after a bad section header, until the next good one. */
    auto section = std::optional<std::string>{std::in_place};
    auto rawline = std::string{};
    auto linenum = 0_uz;
    while(std::getline(f, rawline))
    {
        ++linenum;
        auto const line = StripLine(rawline);
        if(line.empty())
            continue;

        if(line.front() == '[')
        {
            auto const close = line.find(']');
            auto const name = (close == std::string_view::npos) ? std::string_view{}
                : hf::trim(line.substr(1, close-1));
            if(name.empty() || close+1 != line.size())
            {
                ERR("{}:{}: bad section header \"{}\"", ret.mSource, linenum, line);
                section.reset();
            }
            else
                section = std::string{name};
            continue;
        }

        auto const eq = line.find('=');
        auto const key = hf::trim(line.substr(0, std::min(eq, line.size())));
        if(eq == std::string_view::npos || key.empty())
        {
            ERR("{}:{}: expected key = value, got \"{}\"", ret.mSource, linenum, line);
            continue;
        }
        if(!section)
        {
            ERR("{}:{}: ignoring \"{}\" under a bad section header", ret.mSource, linenum,
                key);
            continue;
        }
        auto const value = Unquote(hf::trim(line.substr(eq+1)));

        auto fullKey = MakeKey(*section, key);
        TRACE(" {} = \"{}\"", fullKey, value);
        ret.set(std::move(fullKey), value.empty() ? std::string{} : ExpandEnvVars(value));
    }
    return ret;
}

void ConfigFile::set(std::string key, std::string value)
{
    auto const iter = std::ranges::find(mEntries, key, &ConfigEntry::key);
    if(value.empty())
    {
        if(iter != mEntries.end())
            mEntries.erase(iter);
    }
    else if(iter != mEntries.end())
        iter->value = std::move(value);
    else
        mEntries.emplace_back(ConfigEntry{std::move(key), std::move(value)});
}

auto ConfigFile::findValue(std::string_view const section, std::string_view const key) const
    -> const std::string*
{
    const auto fullKey = MakeKey(section, key);
    const auto iter = std::ranges::find(mEntries, fullKey, &ConfigEntry::key);
    if(iter == mEntries.cend())
        return nullptr;
    TRACE("Found option {} = \"{}\"", fullKey, iter->value);
    return &iter->value;
}

auto ConfigFile::valueStr(std::string_view const section, std::string_view const key) const
    -> std::optional<std::string>
{
    if(auto const *val = findValue(section, key))
        return *val;
    return std::nullopt;
}

auto ConfigFile::valueU32(std::string_view const section, std::string_view const key) const
    -> std::optional<u32>
{
    auto const *val = findValue(section, key);
    if(!val) return std::nullopt;

    auto ret = u32{};
    auto const *last = val->data() + val->size();
    if(auto const res = std::from_chars(val->data(), last, ret);
        res.ec != std::errc{} || res.ptr != last)
        throw_error<config_error>("{}: option {}/{} expects an unsigned integer, got \"{}\"",
            mSource, section, key, *val);
    return ret;
}

auto ConfigFile::valueF64(std::string_view const section, std::string_view const key) const
    -> std::optional<f64>
{
    auto const *val = findValue(section, key);
    if(!val) return std::nullopt;

    auto ret = f64{};
    auto const *last = val->data() + val->size();
    if(auto const res = std::from_chars(val->data(), last, ret);
        res.ec != std::errc{} || res.ptr != last || !std::isfinite(ret))
        throw_error<config_error>("{}: option {}/{} expects a number, got \"{}\"", mSource,
            section, key, *val);
    return ret;
}

auto ConfigFile::valueBool(std::string_view const section, std::string_view const key) const
    -> std::optional<bool>
{
    auto const *val = findValue(section, key);
    if(!val) return std::nullopt;

    if(hf::case_compare(*val, "true"sv) == 0 || hf::case_compare(*val, "yes"sv) == 0
        || hf::case_compare(*val, "on"sv) == 0 || *val == "1"sv)
        return true;
    if(hf::case_compare(*val, "false"sv) == 0 || hf::case_compare(*val, "no"sv) == 0
        || hf::case_compare(*val, "off"sv) == 0 || *val == "0"sv)
        return false;
    throw_error<config_error>("{}: option {}/{} expects a boolean, got \"{}\"", mSource,
        section, key, *val);
}

auto ConfigFile::valueU32List(std::string_view const section, std::string_view const key) const
    -> std::optional<std::vector<u32>>
{
    auto const *val = findValue(section, key);
    if(!val) return std::nullopt;

    auto ret = std::vector<u32>{};
    for(const auto &item : hf::split_list(*val))
    {
        auto id = u32{};
        auto const *last = item.data() + item.size();
        if(auto const res = std::from_chars(item.data(), last, id);
            res.ec != std::errc{} || res.ptr != last)
            throw_error<config_error>("{}: option {}/{} has a bad list entry \"{}\"", mSource,
                section, key, item);
        ret.emplace_back(id);
    }
    return ret;
}

} // namespace hf
