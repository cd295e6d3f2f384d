#ifndef CORE_SOFA_ADAPTER_HPP
#define CORE_SOFA_ADAPTER_HPP

#include <filesystem>

#include "adapter.hpp"
#include "file_cache.hpp"


namespace hf {

struct SofaData;

/* One SOFA (AES69) file per subject, loaded with libmysofa. Receiver 0 is the
 * left ear and receiver 1 the right ear. Files with a single receiver only
 * provide the left ear.
 */
class SofaAdapter final : public FormatAdapter {
    std::filesystem::path mRoot;
    CollectionInfo mInfo;
    mutable FileCache<SofaData> mCache;

    [[nodiscard]] auto load(const std::string &filename) const -> std::shared_ptr<const SofaData>;

public:
    SofaAdapter(std::filesystem::path root, CollectionInfo info, usize cacheSize=4);

    [[nodiscard]] auto format() const noexcept -> FormatType override { return FormatType::Sofa; }
    [[nodiscard]] auto root() const noexcept -> const std::filesystem::path& override
    { return mRoot; }

    [[nodiscard]] auto enumerate() const -> std::vector<IndexEntry> override;
    [[nodiscard]] auto read(const Locator &loc) const -> MeasurementRecord override;
};

} // namespace hf

#endif /* CORE_SOFA_ADAPTER_HPP */
