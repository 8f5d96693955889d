/**
 * @file JobRunner.cpp
 * @brief Implementation of the JobRunner supervision loop.
 */

#include "application/JobRunner.hpp"
#include "application/PhaseClassifier.hpp"
#include "infrastructure/ChildProcess.hpp"
#include "infrastructure/SystemCommandProbe.hpp"
#include "infrastructure/WorkspaceManager.hpp"

#include <algorithm>
#include <deque>
#include <iostream>

namespace audioscribe::application {

namespace fs = std::filesystem;
using infrastructure::ChildProcess;
using infrastructure::OutputLine;
using infrastructure::OutputStream;

namespace {

constexpr std::chrono::milliseconds kDrainBudget{500};
constexpr std::chrono::seconds kCancelCommandTimeout{10};

double SecondsSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

JobRunner::JobRunner(const domain::WorkerCommandBuilder& builder, JobRunnerOptions options)
    : m_builder(builder)
    , m_options(options)
{}

domain::Job JobRunner::MakeJob(const std::string& id, const fs::path& inputFile, const domain::Workspace& workspace) {
    domain::Job job;
    job.id = id;
    job.inputFile = inputFile;
    job.outputDir = infrastructure::WorkspaceManager::ResolveJobOutputDir(workspace, inputFile);
    return job;
}

std::optional<std::chrono::milliseconds> JobRunner::TimeoutFrom(const domain::Configuration& config) {
    auto seconds = config.GetInt("JOB_TIMEOUT");
    if (!seconds || *seconds <= 0) return std::nullopt;
    return std::chrono::milliseconds(static_cast<long long>(*seconds) * 1000);
}

std::chrono::milliseconds JobRunner::PollIntervalFrom(const domain::Configuration& config) {
    auto ms = config.GetInt("POLL_INTERVAL_MS");
    if (!ms || *ms <= 0) return std::chrono::milliseconds(100);
    return std::chrono::milliseconds(*ms);
}

domain::JobResult JobRunner::Run(const domain::Job& job,
                                 const domain::Configuration& config,
                                 const domain::Workspace& workspace,
                                 std::optional<std::chrono::milliseconds> timeout) {
    domain::JobResult result;
    result.job = job;
    result.startedAt = std::chrono::system_clock::now();
    auto start = std::chrono::steady_clock::now();

    auto fail = [&](domain::ErrorKind kind, const std::string& message) {
        result.state = domain::JobState::Failed;
        result.error = kind;
        result.errorMessage = message;
        result.finishedAt = std::chrono::system_clock::now();
        result.elapsedSeconds = SecondsSince(start);
        return result;
    };

    if (m_options.cancelRequested && m_options.cancelRequested->load()) {
        return fail(domain::ErrorKind::Interrupted, "Interrupted by user before launch");
    }

    std::error_code ec;
    fs::create_directories(job.outputDir, ec);
    if (ec) {
        std::cerr << "[JobRunner] Cannot create output directory " << job.outputDir.string() << ": " << ec.message() << std::endl;
        return fail(domain::ErrorKind::LaunchFailure, "Cannot create output directory: " + ec.message());
    }

    domain::WorkerInvocation invocation = m_builder.Build(config, job, workspace);
    infrastructure::ProcessSpec spec{invocation.executable, invocation.arguments, invocation.environment};

    std::cout << "[JobRunner] Launching worker for " << job.inputFile.filename().string() << std::endl;
    std::string launchError;
    auto child = ChildProcess::Spawn(spec, launchError);
    if (!child) {
        std::cerr << "[JobRunner] Critical error starting worker: " << launchError << std::endl;
        return fail(domain::ErrorKind::LaunchFailure, launchError);
    }
    result.state = domain::JobState::Running;

    std::deque<std::string> tail;
    auto handle = [&](const OutputLine& line) {
        if (m_options.echoWorkerOutput) {
            std::cout << "[Worker] " << line.text << std::endl;
        }
        result.phase = PhaseClassifier::Classify(result.phase, line.text);
        if (line.stream == OutputStream::Stderr) {
            tail.push_back(line.text);
            while (tail.size() > m_options.excerptLines) tail.pop_front();
        }
    };

    bool timedOut = false;
    bool interrupted = false;
    std::size_t tick = 0;
    while (true) {
        for (const auto& line : child->ReadLines(m_options.pollInterval)) {
            handle(line);
        }
        if (m_onProgress) m_onProgress(job, result.phase, tick++);

        if (child->TryWait()) break;

        if (m_options.cancelRequested && m_options.cancelRequested->load()) {
            interrupted = true;
        } else if (timeout && std::chrono::steady_clock::now() - start >= *timeout) {
            timedOut = true;
        }
        if (interrupted || timedOut) {
            child->Kill();
            RunCancelCommand(invocation.cancelCommand);
            break;
        }
    }
    for (const auto& line : child->Drain(kDrainBudget)) {
        handle(line);
    }

    result.finishedAt = std::chrono::system_clock::now();
    result.elapsedSeconds = SecondsSince(start);
    result.exitCode = child->ExitCode();

    if (timedOut || interrupted) {
        result.state = domain::JobState::Failed;
        result.diagnosticExcerpt.assign(tail.begin(), tail.end());
        if (timedOut) {
            result.error = domain::ErrorKind::TimeoutFailure;
            result.errorMessage = "Worker exceeded the timeout of " + std::to_string(timeout->count()) +
                "ms and was terminated";
        } else {
            result.error = domain::ErrorKind::Interrupted;
            result.errorMessage = "Interrupted by user";
        }
        std::cerr << "[JobRunner] " << result.errorMessage << std::endl;
        return result;
    }

    if (result.exitCode == 0) {
        result.state = domain::JobState::Succeeded;
        result.phase = domain::MaxPhase(result.phase, domain::Phase::Finalizing);
        result.outputFiles = ListOutputFiles(job.outputDir);
        return result;
    }

    result.state = domain::JobState::Failed;
    result.error = domain::ErrorKind::RuntimeFailure;
    result.errorMessage = "Worker exited with code " + std::to_string(*result.exitCode);
    for (const auto& line : tail) {
        if (line.find_first_not_of(" \t") != std::string::npos) {
            result.diagnosticExcerpt.push_back(line);
        }
    }
    return result;
}

std::vector<fs::path> JobRunner::ListOutputFiles(const fs::path& dir) {
    std::vector<fs::path> files;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec)) {
            files.push_back(it->path());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

void JobRunner::RunCancelCommand(const std::vector<std::string>& command) const {
    if (command.empty()) return;
    infrastructure::SystemCommandProbe probe;
    auto outcome = probe.Run(command, kCancelCommandTimeout);
    if (!outcome.Ok()) {
        std::cerr << "[JobRunner] Cleanup command did not succeed: " << command.front() << std::endl;
    }
}

} // namespace audioscribe::application
