/**
 * @file AudioScribeApp.hpp
 * @brief Command-line entry point: readiness check, single file, directory batch or upload service.
 */

#pragma once

#include "domain/Configuration.hpp"
#include "domain/Workspace.hpp"

#include <atomic>
#include <filesystem>
#include <optional>
#include <string>

namespace audioscribe::app {

/** @brief Process exit codes. */
enum ExitCode {
    kExitSuccess = 0,
    kExitFailure = 1,
    kExitPartialFailure = 2,
    kExitInterrupted = 130
};

/**
 * @struct AppOptions
 * @brief Parsed command line.
 */
struct AppOptions {
    bool checkOnly = false;
    bool serve = false;
    bool debug = false;
    std::optional<std::filesystem::path> file;
    std::optional<std::filesystem::path> directory;
    std::filesystem::path configPath = "config.env";
    std::filesystem::path root = ".";
    std::optional<int> timeoutSeconds;
    std::string host = "0.0.0.0";
    int port = 5000;
};

/**
 * @class AudioScribeApp
 * @brief Wires configuration, workspace, readiness and the job pipeline together.
 */
class AudioScribeApp {
public:
    /**
     * @param cancelRequested Raised by the signal handler; polled by running jobs.
     */
    explicit AudioScribeApp(const std::atomic<bool>& cancelRequested);

    /** @return Process exit code. */
    int Run(int argc, char** argv);

    /**
     * @brief Parses argv.
     * @return nullopt when the process should exit right away with `exitCode` (help or bad usage).
     */
    static std::optional<AppOptions> ParseArguments(int argc, char** argv, int& exitCode);

private:
    /** @brief Loads configuration and prepares the workspace. */
    bool Init(const AppOptions& options);

    int RunCheck();
    int RunJobs(const AppOptions& options);
    int RunServer(const AppOptions& options);

    const std::atomic<bool>& m_cancelRequested;
    domain::Configuration m_config;
    domain::Workspace m_workspace;
};

} // namespace audioscribe::app
