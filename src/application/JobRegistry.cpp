#include "application/JobRegistry.hpp"

#include <algorithm>

namespace audioscribe::application {

namespace {

bool IsFinished(domain::JobState state) {
    return state == domain::JobState::Succeeded || state == domain::JobState::Failed;
}

} // namespace

JobRegistry::JobRegistry(std::size_t maxFinishedJobs)
    : m_maxFinishedJobs(maxFinishedJobs) {}

bool JobRegistry::Register(const domain::Job& job) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_jobs.count(job.id) > 0) return false;

    JobStatus status;
    status.job = job;
    status.submittedAt = std::chrono::system_clock::now();
    status.sequence = m_nextSequence++;
    m_jobs.emplace(job.id, std::move(status));
    return true;
}

void JobRegistry::MarkRunning(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_jobs.find(id);
    if (it == m_jobs.end()) return;
    it->second.state = domain::JobState::Running;
}

void JobRegistry::UpdatePhase(const std::string& id, domain::Phase phase) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_jobs.find(id);
    if (it == m_jobs.end()) return;
    it->second.phase = domain::MaxPhase(it->second.phase, phase);
}

void JobRegistry::Complete(const domain::JobResult& result) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_jobs.find(result.job.id);
    if (it == m_jobs.end()) return;

    JobStatus& status = it->second;
    status.state = result.state;
    status.phase = domain::MaxPhase(status.phase, result.phase);
    status.error = result.error;
    status.exitCode = result.exitCode;
    status.errorMessage = result.errorMessage;
    status.diagnosticExcerpt = result.diagnosticExcerpt;
    status.outputFiles = result.outputFiles;
    status.elapsedSeconds = result.elapsedSeconds;
    EvictFinishedLocked();
}

void JobRegistry::Fail(const std::string& id, domain::ErrorKind error, const std::string& message) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_jobs.find(id);
    if (it == m_jobs.end()) return;
    it->second.state = domain::JobState::Failed;
    it->second.error = error;
    it->second.errorMessage = message;
    EvictFinishedLocked();
}

void JobRegistry::EvictFinishedLocked() {
    std::vector<std::map<std::string, JobStatus>::iterator> finished;
    for (auto it = m_jobs.begin(); it != m_jobs.end(); ++it) {
        if (IsFinished(it->second.state)) finished.push_back(it);
    }
    if (finished.size() <= m_maxFinishedJobs) return;

    std::sort(finished.begin(), finished.end(), [](const auto& a, const auto& b) {
        return a->second.sequence < b->second.sequence;
    });
    const std::size_t excess = finished.size() - m_maxFinishedJobs;
    for (std::size_t i = 0; i < excess; ++i) {
        m_jobs.erase(finished[i]);
    }
}

std::optional<JobStatus> JobRegistry::Get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_jobs.find(id);
    if (it == m_jobs.end()) return std::nullopt;
    return it->second;
}

std::vector<JobStatus> JobRegistry::List() const {
    std::vector<JobStatus> out;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        out.reserve(m_jobs.size());
        for (const auto& entry : m_jobs) out.push_back(entry.second);
    }
    std::sort(out.begin(), out.end(), [](const JobStatus& a, const JobStatus& b) {
        return a.sequence < b.sequence;
    });
    return out;
}

} // namespace audioscribe::application
