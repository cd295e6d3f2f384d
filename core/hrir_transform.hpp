#ifndef CORE_HRIR_TRANSFORM_HPP
#define CORE_HRIR_TRANSFORM_HPP

#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "hftypes.hpp"


namespace hf {

enum class ResponseDomain : u8 {
    Time,
    Magnitude,
    MagnitudeDb,
    Phase
};

[[nodiscard]] auto GetDomainName(ResponseDomain domain) noexcept -> std::string_view;
[[nodiscard]] auto ParseResponseDomain(std::string_view name) -> std::optional<ResponseDomain>;

/* Post-resampling processing of each response. */
struct ProcessingOptions {
    /* Truncate or zero-pad the time-domain response to this many samples. */
    std::optional<usize> length;
    f64 scaleFactor{1.0};
    bool minPhase{false};
    ResponseDomain domain{ResponseDomain::Time};

    [[nodiscard]] auto isIdentity() const noexcept -> bool
    {
        return !length && scaleFactor == 1.0 && !minPhase
            && domain == ResponseDomain::Time;
    }
};

/* Throws config_error for invalid options. */
void ValidateProcessingOptions(const ProcessingOptions &opts);

/* Applies, in order: minimum-phase reconstruction, length, scale, and the
 * domain conversion. Non-time domains return N/2+1 bins of a power-of-two
 * FFT at least as long as the response.
 */
[[nodiscard]] auto ProcessResponse(std::vector<f64> samples, const ProcessingOptions &opts)
    -> std::vector<f64>;

/* Replaces the response with its minimum-phase counterpart, keeping the
 * magnitude response at the FFT size (the next power of two).
 */
[[nodiscard]] auto MinimumPhaseResponse(std::span<const f64> samples) -> std::vector<f64>;

[[nodiscard]] auto MagnitudeResponse(std::span<const f64> samples) -> std::vector<f64>;
[[nodiscard]] auto PhaseResponse(std::span<const f64> samples) -> std::vector<f64>;

} // namespace hf

#endif /* CORE_HRIR_TRANSFORM_HPP */
