/**
 * @file AudioScribeApp.cpp
 * @brief Implementation of the AudioScribeApp class.
 */
#include "app/AudioScribeApp.hpp"

#include "app/ConsoleProgress.hpp"
#include "app/UploadServer.hpp"
#include "application/BatchCoordinator.hpp"
#include "application/JobQueue.hpp"
#include "application/JobRegistry.hpp"
#include "application/JobRunner.hpp"
#include "application/ReadinessChecker.hpp"
#include "application/Reporter.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/FfprobeDurationProbe.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/SystemCommandProbe.hpp"
#include "infrastructure/TranscriptReportWriter.hpp"
#include "infrastructure/WorkerCommandBuilders.hpp"
#include "infrastructure/WorkspaceManager.hpp"

#include <cxxopts.hpp>

#include <chrono>
#include <iostream>
#include <thread>

namespace fs = std::filesystem;

namespace audioscribe::app {

namespace {

void PrintLines(const std::vector<std::string>& lines, std::ostream& out = std::cout) {
    for (const auto& line : lines) {
        out << line << "\n";
    }
    out << std::flush;
}

std::optional<std::uintmax_t> FileSize(const fs::path& file) {
    std::error_code ec;
    auto size = fs::file_size(file, ec);
    if (ec) return std::nullopt;
    return size;
}

} // namespace

AudioScribeApp::AudioScribeApp(const std::atomic<bool>& cancelRequested)
    : m_cancelRequested(cancelRequested) {}

std::optional<AppOptions> AudioScribeApp::ParseArguments(int argc, char** argv, int& exitCode) {
    cxxopts::Options options("audioscribe", "Batch transcription and diarization orchestrator for whisperx");
    options.add_options()
        ("check", "Run the readiness check and exit")
        ("f,file", "Transcribe a single file", cxxopts::value<std::string>())
        ("d,directory", "Transcribe every media file in a directory", cxxopts::value<std::string>())
        ("config", "Configuration file", cxxopts::value<std::string>()->default_value("config.env"))
        ("root", "Workspace root holding audio/ and results/", cxxopts::value<std::string>()->default_value("."))
        ("timeout", "Per-file timeout in seconds (overrides JOB_TIMEOUT)", cxxopts::value<int>())
        ("serve", "Run the upload service")
        ("host", "Address the upload service binds to", cxxopts::value<std::string>()->default_value("0.0.0.0"))
        ("port", "Port of the upload service", cxxopts::value<int>()->default_value("5000"))
        ("debug", "Echo every worker output line")
        ("h,help", "Print usage");

    AppOptions parsed;
    try {
        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            exitCode = kExitSuccess;
            return std::nullopt;
        }

        parsed.checkOnly = result.count("check") > 0;
        parsed.serve = result.count("serve") > 0;
        parsed.debug = result.count("debug") > 0;
        if (result.count("file")) parsed.file = infrastructure::PathUtils::ExpandUser(result["file"].as<std::string>());
        if (result.count("directory")) parsed.directory = infrastructure::PathUtils::ExpandUser(result["directory"].as<std::string>());
        parsed.configPath = infrastructure::PathUtils::ExpandUser(result["config"].as<std::string>());
        parsed.root = infrastructure::PathUtils::ExpandUser(result["root"].as<std::string>());
        if (result.count("timeout")) parsed.timeoutSeconds = result["timeout"].as<int>();
        parsed.host = result["host"].as<std::string>();
        parsed.port = result["port"].as<int>();
    } catch (const std::exception& e) {
        std::cerr << "Error parsing arguments: " << e.what() << "\n" << options.help() << std::endl;
        exitCode = kExitFailure;
        return std::nullopt;
    }

    int modes = (parsed.checkOnly ? 1 : 0) + (parsed.serve ? 1 : 0) + (parsed.file ? 1 : 0) + (parsed.directory ? 1 : 0);
    if (modes > 1) {
        std::cerr << "Choose only one of --check, --file, --directory and --serve." << std::endl;
        exitCode = kExitFailure;
        return std::nullopt;
    }
    if (parsed.timeoutSeconds && *parsed.timeoutSeconds < 0) {
        std::cerr << "--timeout must not be negative." << std::endl;
        exitCode = kExitFailure;
        return std::nullopt;
    }
    if (parsed.port <= 0 || parsed.port > 65535) {
        std::cerr << "--port must be between 1 and 65535." << std::endl;
        exitCode = kExitFailure;
        return std::nullopt;
    }
    return parsed;
}

int AudioScribeApp::Run(int argc, char** argv) {
    int exitCode = kExitSuccess;
    auto options = ParseArguments(argc, argv, exitCode);
    if (!options) return exitCode;

    try {
        if (!Init(*options)) return kExitFailure;

        if (options->checkOnly) return RunCheck();
        if (options->serve) return RunServer(*options);
        return RunJobs(*options);
    } catch (const std::exception& e) {
        std::cerr << "[AudioScribe] Unexpected error: " << e.what() << std::endl;
        return kExitFailure;
    }
}

bool AudioScribeApp::Init(const AppOptions& options) {
    domain::ErrorKind status = domain::ErrorKind::None;
    m_config = infrastructure::ConfigLoader::Load(options.configPath, &status);
    if (status == domain::ErrorKind::ConfigurationDefaulted) {
        std::cerr << "[AudioScribe] Using default configuration; review " << options.configPath.string() << std::endl;
    }
    if (options.timeoutSeconds) {
        m_config = m_config.With("JOB_TIMEOUT", std::to_string(*options.timeoutSeconds));
    }

    m_workspace = infrastructure::WorkspaceManager::FromRoot(options.root);
    std::string error;
    if (!infrastructure::WorkspaceManager::Ensure(m_workspace, error)) {
        std::cerr << "[AudioScribe] Cannot prepare workspace: " << error << std::endl;
        return false;
    }
    return true;
}

int AudioScribeApp::RunCheck() {
    infrastructure::SystemCommandProbe probe;
    application::ReadinessChecker checker(probe);
    domain::ReadinessReport report = checker.Check(m_config, m_workspace);
    PrintLines(application::Reporter::ReadinessSummary(report));
    return report.Ready() ? kExitSuccess : kExitFailure;
}

int AudioScribeApp::RunJobs(const AppOptions& options) {
    std::vector<fs::path> files;
    bool batchMode = !options.file;
    std::error_code ec;

    if (options.file) {
        if (!fs::is_regular_file(*options.file, ec)) {
            std::cerr << "File not found: " << options.file->string() << std::endl;
            return kExitFailure;
        }
        files.push_back(fs::absolute(*options.file, ec));
    } else {
        fs::path directory = options.directory ? *options.directory : m_workspace.input;
        if (!fs::is_directory(directory, ec)) {
            std::cerr << "Directory not found: " << directory.string() << std::endl;
            return kExitFailure;
        }
        files = infrastructure::WorkspaceManager::DiscoverMediaFiles(directory);
        if (files.empty()) {
            std::cerr << "No media files found in " << directory.string() << std::endl;
            return kExitFailure;
        }
    }

    infrastructure::SystemCommandProbe probe;
    application::ReadinessChecker checker(probe);
    domain::ReadinessReport report = checker.Check(m_config, m_workspace);
    if (!report.Ready()) {
        PrintLines(application::Reporter::ReadinessSummary(report), std::cerr);
        return kExitFailure;
    }
    const domain::Configuration& config = report.effective;

    auto builder = infrastructure::MakeWorkerCommandBuilder(config);
    application::JobRunnerOptions runnerOptions;
    runnerOptions.pollInterval = application::JobRunner::PollIntervalFrom(config);
    runnerOptions.echoWorkerOutput = options.debug;
    runnerOptions.cancelRequested = &m_cancelRequested;
    application::JobRunner runner(*builder, runnerOptions);

    ConsoleProgress progress(std::cout);
    if (!options.debug) {
        runner.SetProgressCallback([&progress](const domain::Job& job, domain::Phase phase, std::size_t tick) {
            progress.Update(job, phase, tick);
        });
    }

    infrastructure::FfprobeDurationProbe durationProbe(probe);
    application::BatchCoordinator coordinator(runner, &durationProbe);
    coordinator.OnJobStarted([](std::size_t index, std::size_t total, const domain::Job& job,
                                std::optional<double> duration) {
        PrintLines(application::Reporter::JobHeader(index, total, job, FileSize(job.inputFile), duration));
    });
    coordinator.OnJobFinished([&progress](std::size_t, std::size_t, const domain::JobResult& result) {
        progress.Clear();
        PrintLines(application::Reporter::JobSummary(result), result.Succeeded() ? std::cout : std::cerr);
        std::cout << std::endl;
    });

    std::cout << "Starting processing of " << files.size() << " file(s) on " << config.Device() << "..." << std::endl;
    domain::BatchResult batch = coordinator.RunBatch(files, config, m_workspace);

    if (batch.succeeded > 0) {
        infrastructure::TranscriptReportWriter writer(m_workspace.output);
        std::string error;
        if (!writer.WriteBatchReport(batch, error)) {
            std::cerr << "[AudioScribe] Could not write transcript report: " << error << std::endl;
        }
    }

    PrintLines(application::Reporter::BatchSummary(batch));

    switch (batch.Outcome()) {
        case domain::ErrorKind::None:
            return kExitSuccess;
        case domain::ErrorKind::Interrupted:
            return kExitInterrupted;
        default:
            return batchMode ? kExitPartialFailure : kExitFailure;
    }
}

int AudioScribeApp::RunServer(const AppOptions& options) {
    infrastructure::SystemCommandProbe probe;
    application::ReadinessChecker checker(probe);
    domain::ReadinessReport report = checker.Check(m_config, m_workspace);
    PrintLines(application::Reporter::ReadinessSummary(report));
    if (!report.Ready()) return kExitFailure;
    const domain::Configuration config = report.effective;

    auto builder = infrastructure::MakeWorkerCommandBuilder(config);
    application::JobRunnerOptions runnerOptions;
    runnerOptions.pollInterval = application::JobRunner::PollIntervalFrom(config);
    runnerOptions.echoWorkerOutput = options.debug;
    runnerOptions.cancelRequested = &m_cancelRequested;
    application::JobRunner runner(*builder, runnerOptions);

    application::JobRegistry registry;
    application::JobQueue queue(runner, registry, m_workspace);
    queue.OnJobFinished([](domain::JobResult& result) {
        if (!result.Succeeded()) return;
        std::string error;
        auto record = infrastructure::TranscriptReportWriter::ReadTranscript(result.job.inputFile, result.job.outputDir, error);
        if (!record) {
            std::cerr << "[AudioScribe] " << error << std::endl;
            return;
        }
        fs::path srt = result.job.outputDir / (result.job.inputFile.stem().string() + ".srt");
        std::error_code ec;
        bool existed = fs::exists(srt, ec);
        if (!infrastructure::TranscriptReportWriter::EnsureSubtitles(*record, result.job.inputFile, result.job.outputDir, error)) {
            std::cerr << "[AudioScribe] Could not write subtitles: " << error << std::endl;
        } else if (!existed && fs::exists(srt, ec)) {
            result.outputFiles.push_back(srt);
        }
    });

    UploadServer server(queue, registry, m_workspace, config, [this]() {
        infrastructure::SystemCommandProbe requestProbe;
        application::ReadinessChecker requestChecker(requestProbe);
        return requestChecker.Check(m_config, m_workspace);
    });

    if (!server.Bind(options.host, options.port)) {
        queue.Stop(true);
        return kExitFailure;
    }

    std::atomic<bool> serveOk{true};
    std::atomic<bool> serving{true};
    std::thread listener([&]() {
        serveOk = server.Serve();
        serving = false;
    });

    // Stop() is ignored until the accept loop is up, so a signal arriving earlier waits for it.
    bool running = false;
    while (serving.load() && !running) {
        running = server.WaitUntilRunning(std::chrono::milliseconds(200));
    }
    while (serving.load() && !m_cancelRequested.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "[AudioScribe] Shutting down upload service..." << std::endl;
    server.Stop();
    if (listener.joinable()) listener.join();
    queue.Stop(true);
    if (!serveOk) return kExitFailure;
    return m_cancelRequested.load() ? kExitInterrupted : kExitSuccess;
}

} // namespace audioscribe::app
