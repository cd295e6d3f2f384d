
#include "config.h"

#include "logging.h"

#include <atomic>
#include <charconv>
#include <fstream>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "hfnumeric.h"
#include "hfstring.h"
#include "fmt/ostream.h"


namespace {

using namespace std::string_view_literals;

using lpvoid = void*;

auto gLogLevel = std::atomic<LogLevel>{static_cast<LogLevel>(HARTUFO_DEFAULT_LOGLEVEL)};
auto gLogInitOnce = std::once_flag{};

auto gLogFileMutex = std::mutex{};
auto gLogFile = std::ofstream{}; /* NOLINT(cert-err58-cpp) */

auto gLogCallbackMutex = std::mutex{};
auto gLogCallback = hf::LogCallbackFunc{};
auto gLogCallbackPtr = lpvoid{};
auto gHasLogCallback = std::atomic<bool>{false};

constexpr auto GetLevelCode(LogLevel const level) noexcept -> std::optional<char>
{
    switch(level)
    {
    case LogLevel::Disable: break;
    case LogLevel::Error: return 'E';
    case LogLevel::Warning: return 'W';
    case LogLevel::Trace: return 'I';
    }
    return std::nullopt;
}

/* Reads HARTUFO_LOGLEVEL and HARTUFO_LOGFILE the first time logging is
 * queried.
 */
void InitLogging()
{
    if(auto const loglevel = hf::getenv("HARTUFO_LOGLEVEL"))
    {
        auto value = 0u;
        auto const *first = loglevel->data();
        auto const *last = first + loglevel->size();
        if(auto const res = std::from_chars(first, last, value);
            res.ec == std::errc{} && res.ptr == last && value <= 3)
            gLogLevel.store(static_cast<LogLevel>(value), std::memory_order_relaxed);
    }

    if(auto const logfile = hf::getenv("HARTUFO_LOGFILE"))
    {
        auto const filelock = std::lock_guard{gLogFileMutex};
        gLogFile.open(std::filesystem::path(hf::char_as_u8(*logfile)));
    }
}

} // namespace

namespace hf {

auto get_log_level() noexcept -> LogLevel
{
    try {
        std::call_once(gLogInitOnce, InitLogging);
    }
    catch(std::exception &e) {
        /* Environment setup failed; keep the compiled-in default level. */
        std::cerr << "[HARTUFO] (EE) Failed to initialize logging: " << e.what() << '\n';
    }
    return gLogLevel.load(std::memory_order_relaxed);
}

void set_log_level(LogLevel const level) noexcept
{
    static_cast<void>(get_log_level());
    gLogLevel.store(level, std::memory_order_relaxed);
}

void open_logfile(std::filesystem::path const &fname)
{
    {
        auto const filelock = std::lock_guard{gLogFileMutex};
        if(gLogFile.is_open())
            gLogFile.close();
        gLogFile.open(fname);
        if(gLogFile.is_open())
            return;
    }
    ERR("Failed to open log file '{}'", hf::u8_as_char(fname.u8string()));
}

void set_log_callback(LogCallbackFunc const callback, void *const userptr)
{
    auto const cblock = std::lock_guard{gLogCallbackMutex};
    gLogCallback = callback;
    gLogCallbackPtr = callback ? userptr : nullptr;
    gHasLogCallback.store(callback != nullptr, std::memory_order_relaxed);
}

auto has_log_callback() noexcept -> bool
{ return gHasLogCallback.load(std::memory_order_relaxed); }

void print_impl(LogLevel const level, hf::string_view const fmt, hf::format_args&& args)
{
    const auto msg = hf::vformat(fmt, args);

    auto const prefix = std::invoke([level]() -> std::string_view
    {
        switch(level)
        {
        case LogLevel::Trace: return "[HARTUFO] (II) "sv;
        case LogLevel::Warning: return "[HARTUFO] (WW) "sv;
        case LogLevel::Error: return "[HARTUFO] (EE) "sv;
        case LogLevel::Disable: break;
        }
        return "[HARTUFO] (--) "sv;
    });

    if(get_log_level() >= level)
    {
        auto const filelock = std::lock_guard{gLogFileMutex};
        auto &logfile = gLogFile.is_open() ? static_cast<std::ostream&>(gLogFile) : std::cerr;
        fmt::print(logfile, "{}{}\n", prefix, msg);
        logfile.flush();
    }

    auto const cblock = std::lock_guard{gLogCallbackMutex};
    if(gLogCallback)
    {
        if(auto const logcode = GetLevelCode(level))
            gLogCallback(gLogCallbackPtr, *logcode, msg.data(), hf::saturate_cast<int>(msg.size()));
    }
}

} // namespace hf
