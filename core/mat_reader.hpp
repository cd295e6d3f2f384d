#ifndef CORE_MAT_READER_HPP
#define CORE_MAT_READER_HPP

#include <cstddef>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "hftypes.hpp"


namespace hf {

/* A numeric array from a MATLAB v5 file. Values are converted to f64 and
 * kept in MATLAB's column-major order.
 */
struct MatArray {
    std::string name;
    std::vector<usize> dims;
    std::vector<f64> values;

    [[nodiscard]] auto numel() const noexcept -> usize { return values.size(); }
    [[nodiscard]] auto rank() const noexcept -> usize { return dims.size(); }
    /* Size of the given dimension, 1 past the stored rank. */
    [[nodiscard]] auto dim(usize const idx) const noexcept -> usize
    { return (idx < dims.size()) ? dims[idx] : 1; }
};

/* Reads the numeric variables of an uncompressed MATLAB v5 (Level 5) file.
 * Character, cell, struct, sparse and object variables are skipped.
 * Compressed variables and v7.3 (HDF5) files throw format_error.
 */
class MatFile {
    std::vector<MatArray> mArrays;

public:
    [[nodiscard]] static auto Load(const std::filesystem::path &fname) -> MatFile;
    [[nodiscard]] static auto Parse(std::span<const std::byte> data, std::string_view name)
        -> MatFile;

    [[nodiscard]] auto find(std::string_view name) const noexcept -> const MatArray*;
    [[nodiscard]] auto arrays() const noexcept -> const std::vector<MatArray>& { return mArrays; }
};

} // namespace hf

#endif /* CORE_MAT_READER_HPP */
