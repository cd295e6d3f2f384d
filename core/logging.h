#ifndef CORE_LOGGING_H
#define CORE_LOGGING_H

#include <filesystem>
#include <utility>

#include "hfformat.hpp"
#include "hftypes.hpp"
#include "gsl/gsl"


enum class LogLevel : u8 {
    Disable,
    Error,
    Warning,
    Trace
};

namespace hf {

using LogCallbackFunc = auto(*)(void *userptr, char level, gsl::czstring message, int length)
    noexcept -> void;

auto get_log_level() noexcept -> LogLevel;
void set_log_level(LogLevel level) noexcept;

void set_log_callback(LogCallbackFunc callback, void *userptr);
auto has_log_callback() noexcept -> bool;

void open_logfile(std::filesystem::path const &fname);
void print_impl(LogLevel level, hf::string_view fmt, hf::format_args&& args);

template<typename ...Args>
void print(LogLevel const level, hf::format_string<Args...> const fmt, Args&& ...args)
{
    if(get_log_level() < level && !has_log_callback())
        return;
    print_impl(level, fmt.get(), hf::make_format_args(args...));
}

} // namespace hf

template<typename ...Args>
void TRACE(hf::format_string<Args...> const fmt, Args&& ...args)
{ hf::print(LogLevel::Trace, fmt, std::forward<Args>(args)...); }

template<typename ...Args>
void WARN(hf::format_string<Args...> const fmt, Args&& ...args)
{ hf::print(LogLevel::Warning, fmt, std::forward<Args>(args)...); }

template<typename ...Args>
void ERR(hf::format_string<Args...> const fmt, Args&& ...args)
{ hf::print(LogLevel::Error, fmt, std::forward<Args>(args)...); }

#endif /* CORE_LOGGING_H */
