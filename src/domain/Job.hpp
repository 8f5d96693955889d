/**
 * @file Job.hpp
 * @brief One file's unit of work and its terminal outcome.
 */

#pragma once

#include "domain/Errors.hpp"
#include "domain/Phase.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace audioscribe::domain {

enum class JobState {
    Pending,
    Running,
    Succeeded,
    Failed
};

inline std::string JobStateName(JobState state) {
    switch (state) {
        case JobState::Pending: return "pending";
        case JobState::Running: return "running";
        case JobState::Succeeded: return "succeeded";
        case JobState::Failed: return "failed";
    }
    return "unknown";
}

/**
 * @struct Job
 * @brief Identity of a job, fixed at submission time.
 */
struct Job {
    std::string id;
    std::filesystem::path inputFile;
    std::filesystem::path outputDir;
};

/**
 * @struct JobResult
 * @brief Terminal outcome of a job, as returned by the JobRunner.
 */
struct JobResult {
    Job job;
    JobState state = JobState::Pending;
    ErrorKind error = ErrorKind::None;
    Phase phase = Phase::Initializing;                 ///< Highest phase observed.
    std::optional<int> exitCode;
    std::string errorMessage;
    std::vector<std::string> diagnosticExcerpt;        ///< Last lines seen, only on failure.
    std::vector<std::filesystem::path> outputFiles;    ///< Files in the output dir, only on success.
    std::chrono::system_clock::time_point startedAt;
    std::chrono::system_clock::time_point finishedAt;
    double elapsedSeconds = 0.0;
    std::optional<double> audioDurationSeconds;

    bool Succeeded() const { return state == JobState::Succeeded; }

    /** @brief Audio duration divided by processing time, when both are known. */
    std::optional<double> SpeedFactor() const {
        if (!audioDurationSeconds || elapsedSeconds <= 0.0) return std::nullopt;
        return *audioDurationSeconds / elapsedSeconds;
    }
};

} // namespace audioscribe::domain
