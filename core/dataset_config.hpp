#ifndef CORE_DATASET_CONFIG_HPP
#define CORE_DATASET_CONFIG_HPP

#include <filesystem>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include "collection.hpp"
#include "hrir_transform.hpp"
#include "index.hpp"
#include "resampler.hpp"


namespace hf {

class ConfigFile;

/* Which ears the dataset serves. The "-left"/"-right" variants turn the
 * opposite ear into a mirrored stand-in, so every key reads as that side:
 * both-left serves left ears plus mirrored right ears (only subjects with
 * both), any-left serves whatever exists of either.
 */
enum class SideSelection : u8 {
    Left,
    Right,
    Both,
    Any,
    BothLeft,
    BothRight,
    AnyLeft,
    AnyRight
};

[[nodiscard]] auto GetSideSelectionName(SideSelection sides) noexcept -> std::string_view;
[[nodiscard]] auto ParseSideSelection(std::string_view name) -> std::optional<SideSelection>;

enum class SubjectPick : u8 {
    All,
    First,
    Last
};

struct SubjectSelection {
    /* When set, only these subjects are considered. */
    std::optional<std::vector<u32>> include;
    /* When unset, the collection's default exclusions apply. */
    std::optional<std::vector<u32>> exclude;
    SubjectPick pick{SubjectPick::All};
};

struct ValueRange {
    f64 min{};
    f64 max{};
};

struct PositionFilter {
    /* Wraps around 0 when min > max (e.g. 300 to 60 keeps the front). */
    std::optional<ValueRange> azimuth;
    std::optional<ValueRange> elevation;
    std::optional<ValueRange> distance;
    PositionPredicate predicate;

    [[nodiscard]] auto accepts(const Position &pos) const -> bool;
    [[nodiscard]] auto isEmpty() const noexcept -> bool
    { return !azimuth && !elevation && !distance && !predicate; }
};

struct DatasetConfig {
    u32 sampleRate{};
    SideSelection sides{SideSelection::Any};
    SubjectSelection subjects;
    PositionFilter positions;
    ProcessingOptions processing;
    ResamplerParams resampler;
};

/* Throws config_error for an invalid configuration. */
void ValidateConfig(const DatasetConfig &config);

/* Where a dataset lives and how it is encoded. */
struct DatasetSource {
    CollectionInfo collection;
    std::filesystem::path root;
    /* Overrides the collection's declared format. */
    std::optional<FormatType> format;
};

/* Reads the [hrirs], [subjects], [positions] and [resampler] sections. */
[[nodiscard]] auto LoadDatasetConfig(const ConfigFile &conf) -> DatasetConfig;

/* Reads the [dataset] section, resolving the collection in the registry. */
[[nodiscard]] auto LoadDatasetSource(const ConfigFile &conf, const CollectionRegistry &registry)
    -> DatasetSource;

} // namespace hf

#endif /* CORE_DATASET_CONFIG_HPP */
