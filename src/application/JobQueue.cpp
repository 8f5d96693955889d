#include "application/JobQueue.hpp"

#include <iostream>

namespace audioscribe::application {

JobQueue::JobQueue(JobRunner& runner, JobRegistry& registry, domain::Workspace workspace)
    : m_runner(runner), m_registry(registry), m_workspace(std::move(workspace)), m_running(true) {
    m_runner.SetProgressCallback([this](const domain::Job& job, domain::Phase phase, std::size_t) {
        m_registry.UpdatePhase(job.id, phase);
    });
    m_worker = std::thread(&JobQueue::WorkerLoop, this);
}

JobQueue::~JobQueue() {
    Stop();
}

bool JobQueue::Submit(const domain::Job& job, const domain::Configuration& config) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return false;
        if (!m_registry.Register(job)) return false;
        m_queue.push(QueuedJob{job, config});
    }
    m_cv.notify_one();
    std::cout << "[JobQueue] Queued " << job.id << " (" << job.inputFile.filename().string() << ")" << std::endl;
    return true;
}

std::size_t JobQueue::PendingCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

void JobQueue::Stop(bool discardPending) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (discardPending) {
            while (!m_queue.empty()) {
                m_registry.Fail(m_queue.front().job.id, domain::ErrorKind::Interrupted,
                                "Service stopped before the job started");
                m_queue.pop();
            }
        }
        if (!m_running) return;
        m_running = false;
    }
    m_cv.notify_all();

    if (m_worker.joinable()) {
        m_worker.join();
    }
}

void JobQueue::WorkerLoop() {
    while (true) {
        QueuedJob next;

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] {
                return !m_queue.empty() || !m_running;
            });

            if (!m_running && m_queue.empty()) {
                return;
            }

            if (m_queue.empty()) {
                continue;
            }

            next = std::move(m_queue.front());
            m_queue.pop();
        }

        m_registry.MarkRunning(next.job.id);
        domain::JobResult result = m_runner.Run(next.job, next.config, m_workspace, JobRunner::TimeoutFrom(next.config));
        if (m_onFinished) {
            m_onFinished(result);
        }
        m_registry.Complete(result);
    }
}

} // namespace audioscribe::application
