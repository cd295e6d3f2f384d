#ifndef CORE_SOFA_SUPPORT_HPP
#define CORE_SOFA_SUPPORT_HPP

#include <memory>
#include <string_view>

#include "mysofa.h"


struct MySofaDeleter {
    void operator()(MYSOFA_HRTF *sofa) const { mysofa_free(sofa); }
};
using MySofaHrtfPtr = std::unique_ptr<MYSOFA_HRTF,MySofaDeleter>;

namespace hf {

[[nodiscard]] auto SofaErrorStr(int err) noexcept -> std::string_view;

/* Returns the value of the named attribute in the list, or nullptr. */
[[nodiscard]] auto FindSofaAttribute(MYSOFA_ATTRIBUTE *attrs, std::string_view name) noexcept
    -> const char*;

} // namespace hf

#endif /* CORE_SOFA_SUPPORT_HPP */
