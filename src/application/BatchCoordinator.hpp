/**
 * @file BatchCoordinator.hpp
 * @brief Runs a fixed list of files through the JobRunner, one at a time.
 */

#pragma once

#include "application/JobRunner.hpp"
#include "domain/BatchResult.hpp"
#include "domain/DurationProbe.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace audioscribe::application {

/**
 * @class BatchCoordinator
 * @brief Sequential batch with per-file failure isolation.
 *
 * A failed file never stops the batch; only an operator interruption does. Writes no files.
 * Every file gets its own output directory even when several share a base name.
 */
class BatchCoordinator {
public:
    using JobStarted = std::function<void(std::size_t index, std::size_t total,
                                          const domain::Job& job, std::optional<double> durationSeconds)>;
    using JobFinished = std::function<void(std::size_t index, std::size_t total, const domain::JobResult& result)>;
    using IdFactory = std::function<std::string(const std::filesystem::path& inputFile)>;

    /**
     * @param durationProbe Optional; without it speed factors are not reported.
     */
    BatchCoordinator(JobRunner& runner, domain::DurationProbe* durationProbe = nullptr);

    void OnJobStarted(JobStarted callback) { m_onStarted = std::move(callback); }
    void OnJobFinished(JobFinished callback) { m_onFinished = std::move(callback); }
    void SetIdFactory(IdFactory factory) { m_makeId = std::move(factory); }

    /**
     * @brief Processes `files` in lexicographic path order with JOB_TIMEOUT per file.
     * The list is copied up front; files appearing later are not picked up.
     */
    domain::BatchResult RunBatch(std::vector<std::filesystem::path> files,
                                 const domain::Configuration& config,
                                 const domain::Workspace& workspace);

private:
    JobRunner& m_runner;
    domain::DurationProbe* m_durationProbe;
    JobStarted m_onStarted;
    JobFinished m_onFinished;
    IdFactory m_makeId;
};

} // namespace audioscribe::application
