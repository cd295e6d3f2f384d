#ifndef CORE_WAVE_ADAPTER_HPP
#define CORE_WAVE_ADAPTER_HPP

#include <filesystem>
#include <optional>
#include <string_view>

#include "adapter.hpp"


namespace hf {

/* A directory per subject holding one WAVE file per position. The position
 * is taken from '_'-separated file name tokens: az<degrees>, el<degrees> and
 * an optional d<metres> (e.g. "az-30_el10_d1.2.wav"). Channel 0 is the left
 * ear and channel 1 the right ear; mono files only provide the left ear.
 */
class WaveAdapter final : public FormatAdapter {
    std::filesystem::path mRoot;
    CollectionInfo mInfo;

public:
    WaveAdapter(std::filesystem::path root, CollectionInfo info);

    [[nodiscard]] auto format() const noexcept -> FormatType override
    { return FormatType::WaveDirectory; }
    [[nodiscard]] auto root() const noexcept -> const std::filesystem::path& override
    { return mRoot; }

    [[nodiscard]] auto enumerate() const -> std::vector<IndexEntry> override;
    [[nodiscard]] auto read(const Locator &loc) const -> MeasurementRecord override;
};

/* Parses the position tokens of a file stem, or nullopt if az or el is
 * missing or malformed.
 */
[[nodiscard]] auto ParseWavePosition(std::string_view stem, f64 defaultDistance=1.0)
    -> std::optional<Position>;

} // namespace hf

#endif /* CORE_WAVE_ADAPTER_HPP */
