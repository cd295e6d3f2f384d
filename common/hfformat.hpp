#ifndef HF_FORMAT_HPP
#define HF_FORMAT_HPP

#include "fmt/format.h"

namespace hf {

using fmt::format;
using fmt::format_args;
using fmt::format_string;
using fmt::make_format_args;
using fmt::string_view;
using fmt::vformat;

} /* namespace hf */

#endif /* HF_FORMAT_HPP */
