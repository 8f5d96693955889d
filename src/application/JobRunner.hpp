/**
 * @file JobRunner.hpp
 * @brief Runs one transcription job as a supervised external process.
 */

#pragma once

#include "domain/Configuration.hpp"
#include "domain/Job.hpp"
#include "domain/WorkerCommandBuilder.hpp"
#include "domain/Workspace.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace audioscribe::application {

struct JobRunnerOptions {
    std::chrono::milliseconds pollInterval{100};
    std::size_t excerptLines = 10;
    bool echoWorkerOutput = false;
    /** @brief When set and raised, the running worker is killed and the job ends Interrupted. */
    const std::atomic<bool>* cancelRequested = nullptr;
};

/**
 * @class JobRunner
 * @brief Launches the worker, classifies its output into phases and reports the outcome.
 *
 * Exactly one child process exists per Run() call. Partial output left by a killed worker is
 * not removed.
 */
class JobRunner {
public:
    /** @brief Invoked on every poll tick, including ticks with no new output. */
    using ProgressCallback = std::function<void(const domain::Job& job, domain::Phase phase, std::size_t tick)>;

    explicit JobRunner(const domain::WorkerCommandBuilder& builder, JobRunnerOptions options = {});

    void SetProgressCallback(ProgressCallback callback) { m_onProgress = std::move(callback); }

    /**
     * @brief Runs the job to a terminal state.
     * @param timeout Wall-clock budget; nullopt waits for the worker indefinitely.
     */
    domain::JobResult Run(const domain::Job& job,
                          const domain::Configuration& config,
                          const domain::Workspace& workspace,
                          std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /** @brief Job for `inputFile` with its output directory resolved in `workspace`. */
    static domain::Job MakeJob(const std::string& id,
                               const std::filesystem::path& inputFile,
                               const domain::Workspace& workspace);

    /** @brief JOB_TIMEOUT as a duration; nullopt when zero or unset. */
    static std::optional<std::chrono::milliseconds> TimeoutFrom(const domain::Configuration& config);

    /** @brief POLL_INTERVAL_MS, falling back to 100ms. */
    static std::chrono::milliseconds PollIntervalFrom(const domain::Configuration& config);

private:
    static std::vector<std::filesystem::path> ListOutputFiles(const std::filesystem::path& dir);
    void RunCancelCommand(const std::vector<std::string>& command) const;

    const domain::WorkerCommandBuilder& m_builder;
    JobRunnerOptions m_options;
    ProgressCallback m_onProgress;
};

} // namespace audioscribe::application
