#ifndef CORE_EXCEPT_H
#define CORE_EXCEPT_H

#include <exception>
#include <string>
#include <type_traits>
#include <utility>

#include "hfformat.hpp"


namespace hf {

class base_exception : public std::exception {
    std::string mMessage;

public:
    base_exception() = default;
    template<typename T, std::enable_if_t<std::is_constructible_v<std::string,T>,bool> = true>
    explicit base_exception(T&& msg) : mMessage{std::forward<T>(msg)} { }
    base_exception(const base_exception&) = default;
    base_exception(base_exception&&) = default;
    ~base_exception() override;

    auto operator=(const base_exception&) -> base_exception& = default;
    auto operator=(base_exception&&) -> base_exception& = default;

    [[nodiscard]] auto what() const noexcept -> const char* override { return mMessage.c_str(); }
};

/* Source data is missing required structure, malformed, or truncated. */
class format_error final : public base_exception {
public:
    using base_exception::base_exception;
    ~format_error() override;
};

/* The configuration is invalid or selects nothing. */
class config_error final : public base_exception {
public:
    using base_exception::base_exception;
    ~config_error() override;
};

/* A key is not in the index, or a locator no longer resolves. */
class key_error final : public base_exception {
public:
    using base_exception::base_exception;
    ~key_error() override;
};

/* A samplerate is not positive. */
class invalid_rate_error final : public base_exception {
public:
    using base_exception::base_exception;
    ~invalid_rate_error() override;
};


template<typename E, typename ...Args> [[noreturn]]
void throw_error(hf::format_string<Args...> fmt, Args&& ...args)
{ throw E{hf::vformat(fmt.get(), hf::make_format_args(args...))}; }

} // namespace hf

#endif /* CORE_EXCEPT_H */
