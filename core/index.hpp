#ifndef CORE_INDEX_HPP
#define CORE_INDEX_HPP

#include <functional>
#include <memory>
#include <span>
#include <vector>

#include "collection.hpp"
#include "measurement.hpp"


namespace hf {

class FormatAdapter;

using SubjectPredicate = std::function<bool(u32 subject)>;
using PositionPredicate = std::function<bool(const Position &pos)>;
using SidePredicate = std::function<bool(Side side)>;

/* An immutable, key-ordered mapping from measurement keys to locators.
 * Copies and filtered views share nothing mutable, so an index can be read
 * from any number of threads.
 */
class DatasetIndex {
    std::shared_ptr<const std::vector<IndexEntry>> mEntries;
    FormatType mFormat{FormatType::Sofa};

    DatasetIndex(std::shared_ptr<const std::vector<IndexEntry>> entries, FormatType format)
        : mEntries{std::move(entries)}, mFormat{format}
    { }

public:
    /* Enumerates the adapter once. Throws config_error if it yields nothing
     * and format_error on duplicate keys.
     */
    [[nodiscard]] static auto Build(const FormatAdapter &adapter) -> DatasetIndex;
    [[nodiscard]] static auto FromEntries(std::vector<IndexEntry> entries, FormatType format)
        -> DatasetIndex;

    [[nodiscard]] auto format() const noexcept -> FormatType { return mFormat; }
    [[nodiscard]] auto size() const noexcept -> usize { return mEntries->size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return mEntries->empty(); }

    [[nodiscard]] auto entries() const noexcept -> std::span<const IndexEntry>
    { return *mEntries; }
    [[nodiscard]] auto keys() const -> std::vector<MeasurementKey>;
    [[nodiscard]] auto subjects() const -> std::vector<u32>;

    [[nodiscard]] auto find(const MeasurementKey &key) const noexcept -> const IndexEntry*;
    [[nodiscard]] auto contains(const MeasurementKey &key) const noexcept -> bool
    { return find(key) != nullptr; }

    /* Throws key_error if the key is absent. */
    [[nodiscard]] auto locator_for(const MeasurementKey &key) const -> const Locator&;

    /* Returns a new index with the entries every given predicate accepts.
     * Empty predicates accept everything. The result may be empty.
     */
    [[nodiscard]] auto filter(const SubjectPredicate &subjectPred,
        const PositionPredicate &positionPred, const SidePredicate &sidePred) const
        -> DatasetIndex;
};

} // namespace hf

#endif /* CORE_INDEX_HPP */
