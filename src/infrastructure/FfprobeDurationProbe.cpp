#include "infrastructure/FfprobeDurationProbe.hpp"

namespace audioscribe::infrastructure {

namespace {
constexpr std::chrono::seconds kFfprobeTimeout{15};
}

FfprobeDurationProbe::FfprobeDurationProbe(domain::CommandProbe& probe)
    : m_probe(probe) {}

std::optional<double> FfprobeDurationProbe::DurationSeconds(const std::filesystem::path& mediaFile) {
    if (!m_checked) {
        m_available = m_probe.HasTool("ffprobe");
        m_checked = true;
    }
    if (!m_available) return std::nullopt;

    auto result = m_probe.Run({"ffprobe", "-v", "error", "-show_entries", "format=duration",
                               "-of", "default=noprint_wrappers=1:nokey=1", mediaFile.string()},
                              kFfprobeTimeout);
    if (!result.Ok() || result.output.empty()) return std::nullopt;

    try {
        double seconds = std::stod(result.output);
        if (seconds > 0.0) return seconds;
    } catch (const std::exception&) {
        // "N/A" and similar: duration unknown.
    }
    return std::nullopt;
}

} // namespace audioscribe::infrastructure
