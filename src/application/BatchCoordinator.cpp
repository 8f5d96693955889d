#include "application/BatchCoordinator.hpp"
#include "infrastructure/JobIdGenerator.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <set>

namespace audioscribe::application {

namespace {

// Files sharing a stem (x/talk.wav, y/talk.wav, talk.mp3) would otherwise write into the same
// results directory; later ones get a numbered suffix.
std::filesystem::path ClaimOutputDir(const std::filesystem::path& preferred,
                                     std::set<std::filesystem::path>& claimed) {
    std::filesystem::path candidate = preferred;
    for (int n = 2; claimed.count(candidate) > 0; ++n) {
        candidate = preferred;
        candidate += "_" + std::to_string(n);
    }
    claimed.insert(candidate);
    return candidate;
}

} // namespace

BatchCoordinator::BatchCoordinator(JobRunner& runner, domain::DurationProbe* durationProbe)
    : m_runner(runner)
    , m_durationProbe(durationProbe)
    , m_makeId([](const std::filesystem::path&) { return infrastructure::JobIdGenerator::Generate(); })
{}

domain::BatchResult BatchCoordinator::RunBatch(std::vector<std::filesystem::path> files,
                                               const domain::Configuration& config,
                                               const domain::Workspace& workspace) {
    std::sort(files.begin(), files.end());

    domain::BatchResult batch;
    const auto timeout = JobRunner::TimeoutFrom(config);
    const std::size_t total = files.size();
    auto batchStart = std::chrono::steady_clock::now();
    std::set<std::filesystem::path> claimedDirs;

    for (std::size_t i = 0; i < total; ++i) {
        domain::Job job = JobRunner::MakeJob(m_makeId(files[i]), files[i], workspace);
        std::filesystem::path preferredDir = job.outputDir;
        job.outputDir = ClaimOutputDir(preferredDir, claimedDirs);
        if (job.outputDir != preferredDir) {
            std::cout << "[BatchCoordinator] " << files[i].string() << " shares its name with an earlier file; "
                      << "writing results to " << job.outputDir.string() << std::endl;
        }

        std::optional<double> duration;
        if (m_durationProbe) {
            duration = m_durationProbe->DurationSeconds(files[i]);
        }
        if (m_onStarted) m_onStarted(i + 1, total, job, duration);

        domain::JobResult result = m_runner.Run(job, config, workspace, timeout);
        result.audioDurationSeconds = duration;

        ++batch.attempted;
        if (result.Succeeded()) {
            ++batch.succeeded;
        } else {
            ++batch.failed;
        }
        if (m_onFinished) m_onFinished(i + 1, total, result);

        bool interrupted = result.error == domain::ErrorKind::Interrupted;
        batch.jobs.push_back(std::move(result));
        if (interrupted) {
            std::cerr << "[BatchCoordinator] Stopping batch after interruption (" << batch.attempted
                      << "/" << total << " attempted)." << std::endl;
            batch.interrupted = true;
            break;
        }
    }

    batch.totalElapsedSeconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - batchStart).count();
    return batch;
}

} // namespace audioscribe::application
