/**
 * @file DurationProbe.hpp
 * @brief Interface for measuring the playback length of a media file.
 */

#pragma once

#include <filesystem>
#include <optional>

namespace audioscribe::domain {

class DurationProbe {
public:
    virtual ~DurationProbe() = default;

    /** @brief Duration in seconds, or nullopt when it cannot be determined. */
    virtual std::optional<double> DurationSeconds(const std::filesystem::path& mediaFile) = 0;
};

} // namespace audioscribe::domain
