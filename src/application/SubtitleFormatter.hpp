#pragma once

#include "domain/Transcript.hpp"

#include <string>
#include <vector>

namespace audioscribe::application {

/**
 * @brief SubRip rendering: index, "HH:MM:SS,mmm --> HH:MM:SS,mmm", text, blank line.
 */
class SubtitleFormatter {
public:
    static std::string FormatTimestamp(double seconds);
    static std::string RenderSrt(const std::vector<domain::TranscriptSegment>& segments);
};

} // namespace audioscribe::application
