
#include "config.h"

#include "except.h"


namespace hf {

base_exception::~base_exception() = default;
format_error::~format_error() = default;
config_error::~config_error() = default;
key_error::~key_error() = default;
invalid_rate_error::~invalid_rate_error() = default;

} // namespace hf
