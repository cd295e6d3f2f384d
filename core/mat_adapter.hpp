#ifndef CORE_MAT_ADAPTER_HPP
#define CORE_MAT_ADAPTER_HPP

#include <filesystem>

#include "adapter.hpp"
#include "file_cache.hpp"


namespace hf {

struct MatData;

/* One MATLAB v5 file per subject, holding the left and right ear responses
 * in the hrir_l and hrir_r variables. Responses are either an [A x E x N]
 * grid over azimuths and elevations, or an [M x N] list of measurements
 * with an [M x 2] or [M x 3] positions variable.
 *
 * Grid coordinates come from the azimuths and elevations variables, or from
 * the collection's grid. The samplerate comes from the samplerate or fs
 * variable, or the collection's fallback.
 */
class MatAdapter final : public FormatAdapter {
    std::filesystem::path mRoot;
    CollectionInfo mInfo;
    mutable FileCache<MatData> mCache;

    [[nodiscard]] auto load(const std::string &filename) const -> std::shared_ptr<const MatData>;

public:
    MatAdapter(std::filesystem::path root, CollectionInfo info, usize cacheSize=4);

    [[nodiscard]] auto format() const noexcept -> FormatType override { return FormatType::Mat; }
    [[nodiscard]] auto root() const noexcept -> const std::filesystem::path& override
    { return mRoot; }

    [[nodiscard]] auto enumerate() const -> std::vector<IndexEntry> override;
    [[nodiscard]] auto read(const Locator &loc) const -> MeasurementRecord override;
};

} // namespace hf

#endif /* CORE_MAT_ADAPTER_HPP */
