
#include "config.h"

#include "sofa_support.hpp"


namespace hf {

using namespace std::string_view_literals;

auto SofaErrorStr(int const err) noexcept -> std::string_view
{
    switch(err)
    {
    case MYSOFA_OK: return "OK"sv;
    case MYSOFA_INTERNAL_ERROR: return "Internal error"sv;
    case MYSOFA_INVALID_FORMAT: return "Invalid format"sv;
    case MYSOFA_UNSUPPORTED_FORMAT: return "Unsupported format"sv;
    case MYSOFA_NO_MEMORY: return "Out of memory"sv;
    case MYSOFA_READ_ERROR: return "Read error"sv;
    case MYSOFA_INVALID_ATTRIBUTES: return "Invalid attributes"sv;
    case MYSOFA_INVALID_DIMENSIONS: return "Invalid dimensions"sv;
    case MYSOFA_INVALID_DIMENSION_LIST: return "Invalid dimension list"sv;
    case MYSOFA_INVALID_COORDINATE_TYPE: return "Invalid coordinate type"sv;
    case MYSOFA_ONLY_EMITTER_WITH_ECI_SUPPORTED:
        return "Only emitters with ECI dimensions are supported"sv;
    case MYSOFA_ONLY_DELAYS_WITH_IR_OR_MR_SUPPORTED:
        return "Only delays with IR or MR dimensions are supported"sv;
    case MYSOFA_ONLY_THE_SAME_SAMPLING_RATE_SUPPORTED:
        return "Only the same sample rate is supported"sv;
    case MYSOFA_RECEIVERS_WITH_RCI_SUPPORTED:
        return "Only receivers with RCI dimensions are supported"sv;
    case MYSOFA_RECEIVERS_WITH_CARTESIAN_SUPPORTED:
        return "Only cartesian receivers are supported"sv;
    case MYSOFA_INVALID_RECEIVER_POSITIONS: return "Invalid receiver positions"sv;
    case MYSOFA_ONLY_SOURCES_WITH_MC_SUPPORTED:
        return "Only sources with MC dimensions are supported"sv;
    }
    return "Unknown error"sv;
}

auto FindSofaAttribute(MYSOFA_ATTRIBUTE *attrs, std::string_view const name) noexcept
    -> const char*
{
    while(attrs)
    {
        if(attrs->name && name == attrs->name)
            return attrs->value;
        attrs = attrs->next;
    }
    return nullptr;
}

} // namespace hf
