/**
 * @file JobQueue.hpp
 * @brief Background worker that runs submitted jobs strictly one after another.
 */

#pragma once

#include "application/JobRegistry.hpp"
#include "application/JobRunner.hpp"
#include "domain/Configuration.hpp"
#include "domain/Workspace.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>

namespace audioscribe::application {

/**
 * @struct QueuedJob
 * @brief A job together with the configuration it was submitted with.
 */
struct QueuedJob {
    domain::Job job;
    domain::Configuration config;
};

/**
 * @class JobQueue
 * @brief Serializes worker runs behind a single thread.
 *
 * Status is published to the JobRegistry; callers never touch the runner directly.
 * At most one worker process exists at any time.
 */
class JobQueue {
public:
    using JobFinished = std::function<void(domain::JobResult& result)>;

    JobQueue(JobRunner& runner, JobRegistry& registry, domain::Workspace workspace);
    ~JobQueue();

    JobQueue(const JobQueue&) = delete;
    JobQueue& operator=(const JobQueue&) = delete;

    /**
     * @brief Called on the worker thread when a job reaches a terminal state, before the
     * registry sees it. The hook may append files it produced to `outputFiles`.
     */
    void OnJobFinished(JobFinished callback) { m_onFinished = std::move(callback); }

    /**
     * @brief Registers the job and queues it behind any pending work.
     * @return false if the id is already known or the queue is stopped.
     */
    bool Submit(const domain::Job& job, const domain::Configuration& config);

    std::size_t PendingCount() const;

    /**
     * @brief Stops the worker thread.
     * @param discardPending When true, jobs still waiting are marked Interrupted instead of run.
     */
    void Stop(bool discardPending = false);

private:
    void WorkerLoop();

    JobRunner& m_runner;
    JobRegistry& m_registry;
    domain::Workspace m_workspace;
    JobFinished m_onFinished;

    std::queue<QueuedJob> m_queue;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;

    std::thread m_worker;
    std::atomic<bool> m_running;
};

} // namespace audioscribe::application
