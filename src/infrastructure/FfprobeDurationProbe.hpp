#pragma once

#include "domain/CommandProbe.hpp"
#include "domain/DurationProbe.hpp"

namespace audioscribe::infrastructure {

/**
 * @brief Reads media duration with ffprobe. Returns nullopt when ffprobe is absent or fails.
 */
class FfprobeDurationProbe : public domain::DurationProbe {
public:
    explicit FfprobeDurationProbe(domain::CommandProbe& probe);

    std::optional<double> DurationSeconds(const std::filesystem::path& mediaFile) override;

private:
    domain::CommandProbe& m_probe;
    bool m_checked = false;
    bool m_available = false;
};

} // namespace audioscribe::infrastructure
