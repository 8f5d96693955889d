/**
 * @file JobRegistry.hpp
 * @brief Thread-safe record of every job submitted to a long-running service.
 */

#pragma once

#include "domain/Job.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace audioscribe::application {

/**
 * @struct JobStatus
 * @brief Point-in-time view of one job. Copies are handed out; the registry owns the record.
 */
struct JobStatus {
    domain::Job job;
    domain::JobState state = domain::JobState::Pending;
    domain::Phase phase = domain::Phase::Initializing;
    domain::ErrorKind error = domain::ErrorKind::None;
    std::optional<int> exitCode;
    std::string errorMessage;
    std::vector<std::string> diagnosticExcerpt;
    std::vector<std::filesystem::path> outputFiles;
    std::chrono::system_clock::time_point submittedAt;
    double elapsedSeconds = 0.0;
    std::size_t sequence = 0; ///< Submission order.
};

/**
 * @class JobRegistry
 * @brief Keyed by job id, so concurrent requests never observe one another's state.
 *
 * Pending and running jobs are always kept. Once more than `maxFinishedJobs` jobs have
 * finished, the oldest finished ones are forgotten and their ids answer as unknown.
 */
class JobRegistry {
public:
    static constexpr std::size_t kDefaultMaxFinishedJobs = 200;

    explicit JobRegistry(std::size_t maxFinishedJobs = kDefaultMaxFinishedJobs);

    /** @return false if a job with the same id is already registered. */
    bool Register(const domain::Job& job);

    void MarkRunning(const std::string& id);

    /** @brief Phases only move forward; a lower phase is ignored. */
    void UpdatePhase(const std::string& id, domain::Phase phase);

    void Complete(const domain::JobResult& result);

    /** @brief Terminal failure for a job that never reached the runner. */
    void Fail(const std::string& id, domain::ErrorKind error, const std::string& message);

    std::optional<JobStatus> Get(const std::string& id) const;

    /** @brief All jobs in submission order. */
    std::vector<JobStatus> List() const;

private:
    void EvictFinishedLocked();

    mutable std::mutex m_mutex;
    std::size_t m_maxFinishedJobs;
    std::map<std::string, JobStatus> m_jobs;
    std::size_t m_nextSequence = 0;
};

} // namespace audioscribe::application
