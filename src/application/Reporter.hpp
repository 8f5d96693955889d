/**
 * @file Reporter.hpp
 * @brief Human-readable rendering of progress, job outcomes and batch statistics.
 *
 * Every function is a pure function of its arguments; printing is left to the caller.
 */

#pragma once

#include "domain/BatchResult.hpp"
#include "domain/Job.hpp"
#include "domain/Phase.hpp"
#include "domain/ReadinessReport.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace audioscribe::application {

class Reporter {
public:
    /** @brief "1h 2m 3s", "2m 3s" or "4.5s". */
    static std::string FormatDuration(double seconds);

    static std::string SpinnerFrame(std::size_t tick);

    /** @brief Step label shown next to the spinner, e.g. "2/4 Transcribing text...". */
    static std::string PhaseLabel(domain::Phase phase);

    static std::string ProgressLine(domain::Phase phase, std::size_t tick);

    static std::vector<std::string> JobHeader(std::size_t index, std::size_t total,
                                              const domain::Job& job,
                                              std::optional<std::uintmax_t> sizeBytes,
                                              std::optional<double> durationSeconds);

    static std::vector<std::string> JobSummary(const domain::JobResult& result);

    /** @brief Totals plus one line per job; failed jobs carry their diagnostic excerpt. */
    static std::vector<std::string> BatchSummary(const domain::BatchResult& batch);

    static std::vector<std::string> ReadinessSummary(const domain::ReadinessReport& report);

    /** @brief "runtime failure (exit code 1)", "timeout", "could not launch: ...". */
    static std::string FailureDescription(const domain::JobResult& result);
};

} // namespace audioscribe::application
