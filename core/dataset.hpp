#ifndef CORE_DATASET_HPP
#define CORE_DATASET_HPP

#include <cstddef>
#include <iterator>
#include <memory>
#include <vector>

#include "adapter.hpp"
#include "dataset_config.hpp"
#include "index.hpp"
#include "measurement.hpp"
#include "resampler.hpp"


namespace hf {

/* Predicates for Dataset::subset. Empty predicates accept everything. */
struct FilterSpec {
    SubjectPredicate subjects;
    PositionPredicate positions;
    SidePredicate sides;
};

/* The public entry point to a dataset. The index is built and the configured
 * selection applied once, at construction. Afterward the dataset is
 * immutable, and get() may be called from any number of threads.
 */
class Dataset {
    FormatAdapterPtr mAdapter;
    std::shared_ptr<const DatasetConfig> mConfig;
    std::shared_ptr<const Resampler> mResampler;
    DatasetIndex mIndex;

    Dataset(FormatAdapterPtr adapter, std::shared_ptr<const DatasetConfig> config,
        std::shared_ptr<const Resampler> resampler, DatasetIndex index);

public:
    class const_iterator {
        const Dataset *mDataset{};
        usize mPos{};

    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = MeasurementRecord;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = MeasurementRecord;

        const_iterator() = default;
        const_iterator(const Dataset *dataset, usize pos) noexcept
            : mDataset{dataset}, mPos{pos}
        { }

        auto operator*() const -> MeasurementRecord { return mDataset->at(mPos); }

        auto operator++() noexcept -> const_iterator& { ++mPos; return *this; }
        auto operator++(int) noexcept -> const_iterator
        {
            auto ret = *this;
            ++mPos;
            return ret;
        }

        bool operator==(const const_iterator&) const = default;
    };

    /* Creates the adapter for the source's format and indexes the root.
     * Throws config_error if the configuration is invalid or selects
     * nothing, and format_error if the data is malformed.
     */
    Dataset(const DatasetSource &source, DatasetConfig config);
    Dataset(FormatAdapterPtr adapter, DatasetConfig config, std::vector<u32> defaultExclude={});

    [[nodiscard]] auto format() const noexcept -> FormatType { return mIndex.format(); }
    [[nodiscard]] auto sampleRate() const noexcept -> u32 { return mConfig->sampleRate; }
    [[nodiscard]] auto config() const noexcept -> const DatasetConfig& { return *mConfig; }
    [[nodiscard]] auto index() const noexcept -> const DatasetIndex& { return mIndex; }
    [[nodiscard]] auto adapter() const noexcept -> const FormatAdapterPtr& { return mAdapter; }

    [[nodiscard]] auto size() const noexcept -> usize { return mIndex.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return mIndex.empty(); }
    [[nodiscard]] auto keys() const -> std::vector<MeasurementKey> { return mIndex.keys(); }
    [[nodiscard]] auto subjects() const -> std::vector<u32> { return mIndex.subjects(); }
    [[nodiscard]] auto contains(const MeasurementKey &key) const noexcept -> bool
    { return mIndex.contains(key); }

    /* Reads the response for the key, resampled to the configured rate and
     * processed. Throws key_error for a key not in the dataset.
     */
    [[nodiscard]] auto get(const MeasurementKey &key) const -> MeasurementRecord;
    /* The i-th record in key order. Throws key_error if out of range. */
    [[nodiscard]] auto at(usize idx) const -> MeasurementRecord;

    [[nodiscard]] auto begin() const noexcept -> const_iterator { return {this, 0}; }
    [[nodiscard]] auto end() const noexcept -> const_iterator { return {this, size()}; }

    /* A dataset over the matching entries, sharing this one's adapter,
     * resampler and configuration. Throws config_error if nothing matches.
     */
    [[nodiscard]] auto subset(const FilterSpec &spec) const -> Dataset;
};

} // namespace hf

#endif /* CORE_DATASET_HPP */
