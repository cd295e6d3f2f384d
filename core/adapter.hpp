#ifndef CORE_ADAPTER_HPP
#define CORE_ADAPTER_HPP

#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

#include "collection.hpp"
#include "measurement.hpp"


namespace hf {

/* Reads one on-disk encoding of a dataset. Implementations are immutable
 * after construction apart from internal caches, and read() may be called
 * from multiple threads at once.
 */
class FormatAdapter {
public:
    FormatAdapter() = default;
    FormatAdapter(const FormatAdapter&) = delete;
    virtual ~FormatAdapter();

    auto operator=(const FormatAdapter&) -> FormatAdapter& = delete;

    [[nodiscard]] virtual auto format() const noexcept -> FormatType = 0;
    [[nodiscard]] virtual auto root() const noexcept -> const std::filesystem::path& = 0;

    /* Lists every measurement in the dataset, in a deterministic order.
     * Throws format_error if the root or a file is malformed.
     */
    [[nodiscard]] virtual auto enumerate() const -> std::vector<IndexEntry> = 0;

    /* Reads one response at its native samplerate. Throws key_error if the
     * locator no longer resolves and format_error for corrupt data.
     */
    [[nodiscard]] virtual auto read(const Locator &loc) const -> MeasurementRecord = 0;
};

using FormatAdapterPtr = std::shared_ptr<const FormatAdapter>;

/* Creates the adapter for the declared format type. */
[[nodiscard]] auto CreateAdapter(FormatType type, std::filesystem::path root,
    const CollectionInfo &info) -> FormatAdapterPtr;


/* Helpers shared by the adapters. */

/* Subject id of a file under root, from the collection pattern. A root that
 * is a single file only resolves itself.
 */
[[nodiscard]] auto SubjectForFile(const std::filesystem::path &root, std::string_view pattern,
    const std::filesystem::path &file) -> std::optional<u32>;

/* Throws key_error unless the locator's file still exists. */
void CheckLocatorFile(const Locator &loc, FormatType type);

/* Throws format_error if two discovered files belong to the same subject. */
void CheckUniqueSubjects(const std::vector<DiscoveredFile> &files, FormatType type);

} // namespace hf

#endif /* CORE_ADAPTER_HPP */
