/**
 * @file Transcript.hpp
 * @brief Transcript content as read back from a worker's result files.
 */

#pragma once

#include <string>
#include <vector>

namespace audioscribe::domain {

struct TranscriptSegment {
    double start = 0.0;
    double end = 0.0;
    std::string text;
    std::string speaker; ///< Empty when diarization did not run.
};

/**
 * @struct TranscriptRecord
 * @brief One entry of the consolidated batch report.
 */
struct TranscriptRecord {
    std::string file; ///< Input media path as it was handed to the worker.
    std::string text;
    std::vector<TranscriptSegment> segments;
    std::string language;
};

} // namespace audioscribe::domain
