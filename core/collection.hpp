#ifndef CORE_COLLECTION_HPP
#define CORE_COLLECTION_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "hftypes.hpp"


namespace hf {

/* The on-disk encoding of a collection. Adapters are selected by this value,
 * never by inspecting file contents.
 */
enum class FormatType : u8 {
    Sofa,
    Mat,
    WaveDirectory
};

[[nodiscard]] auto GetFormatName(FormatType type) noexcept -> std::string_view;
[[nodiscard]] auto ParseFormatType(std::string_view name) -> std::optional<FormatType>;

enum class GridCoordinates : u8 {
    VerticalPolar,
    InterauralPolar
};

/* A regular measurement grid for formats that store responses without their
 * positions. Responses are laid out azimuth-major: index = a + A*e.
 */
struct MeasurementGrid {
    std::vector<f64> azimuths;
    std::vector<f64> elevations;
    f64 distance{1.0};
    GridCoordinates coordinates{GridCoordinates::VerticalPolar};
};

struct CollectionInfo {
    std::string name;
    FormatType format{FormatType::Sofa};
    /* Path relative to the dataset root. '*' matches any run of characters
     * within a path component, '?' matches one, and "{id}" matches the
     * decimal subject id (every occurrence must agree).
     */
    std::string pattern;
    std::vector<u32> defaultExclude;
    std::optional<u32> sampleRate;
    std::optional<MeasurementGrid> grid;
};


class CollectionRegistry {
    std::vector<CollectionInfo> mCollections;

public:
    /* Adds or replaces the collection with the same name. */
    void add(CollectionInfo info);

    [[nodiscard]] auto find(std::string_view name) const noexcept -> const CollectionInfo*;
    /* Throws config_error for an unknown name. */
    [[nodiscard]] auto get(std::string_view name) const -> const CollectionInfo&;

    [[nodiscard]] auto names() const -> std::vector<std::string>;
    [[nodiscard]] auto size() const noexcept -> usize { return mCollections.size(); }
    [[nodiscard]] auto begin() const noexcept { return mCollections.cbegin(); }
    [[nodiscard]] auto end() const noexcept { return mCollections.cend(); }

    /* The collections with a known published layout. */
    [[nodiscard]] static auto Builtin() -> CollectionRegistry;
};


/* Matches a '/'-separated relative path against a collection pattern,
 * returning the subject id on success.
 */
[[nodiscard]] auto MatchPattern(std::string_view pattern, std::string_view path)
    -> std::optional<u32>;

struct DiscoveredFile {
    u32 subject{};
    std::filesystem::path path;
};

/* Subject id of a dataset given as one file. The pattern is matched against
 * as many trailing components of the path as it has; the id is 0 when that
 * does not match.
 */
[[nodiscard]] auto SubjectForSingleFile(std::string_view pattern,
    const std::filesystem::path &file) -> u32;

/* Finds every regular file under root matching the pattern, ordered by
 * subject then path. A root that is itself a regular file is the only file
 * found. Throws format_error if root is neither.
 */
[[nodiscard]] auto DiscoverFiles(FormatType type, const std::filesystem::path &root,
    std::string_view pattern) -> std::vector<DiscoveredFile>;

} // namespace hf

#endif /* CORE_COLLECTION_HPP */
