#ifndef HF_TEST_HPP
#define HF_TEST_HPP

#include "catch2/catch.hpp"

#include <string>

#include "measurement.hpp"

namespace Catch {

template<>
struct StringMaker<hf::Position> {
    static auto convert(const hf::Position &pos) -> std::string
    { return hf::FormatPosition(pos); }
};

template<>
struct StringMaker<hf::MeasurementKey> {
    static auto convert(const hf::MeasurementKey &key) -> std::string
    { return hf::FormatKey(key); }
};

template<>
struct StringMaker<hf::Side> {
    static auto convert(const hf::Side side) -> std::string
    { return std::string{hf::GetSideName(side)}; }
};

} // namespace Catch

#endif /* HF_TEST_HPP */
