/**
 * @file ReadinessChecker.cpp
 * @brief Implementation of ReadinessChecker.
 */

#include "application/ReadinessChecker.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace audioscribe::application {

namespace fs = std::filesystem;
using domain::CheckSeverity;
using domain::ReadinessCheck;

namespace {

constexpr std::chrono::seconds kVersionTimeout{5};
constexpr std::chrono::seconds kImageTimeout{10};
constexpr std::chrono::seconds kGpuTimeout{15};

bool NativeMode(const domain::Configuration& config) {
    return config.WorkerMode() == "native";
}

ReadinessCheck Make(const char* name, CheckSeverity severity, std::string message) {
    ReadinessCheck check;
    check.name = name;
    check.severity = severity;
    check.message = std::move(message);
    return check;
}

void Log(const ReadinessCheck& check) {
    switch (check.severity) {
        case CheckSeverity::Passed:
            std::cout << "[ReadinessChecker] OK " << check.name << ": " << check.message << std::endl;
            break;
        case CheckSeverity::Warning:
            std::cerr << "[ReadinessChecker] WARNING " << check.name << ": " << check.message << std::endl;
            break;
        case CheckSeverity::HardFailure:
            std::cerr << "[ReadinessChecker] FAILED " << check.name << ": " << check.message << std::endl;
            break;
    }
}

} // namespace

ReadinessChecker::ReadinessChecker(domain::CommandProbe& probe)
    : m_probe(probe) {}

std::vector<std::string> ReadinessChecker::RuntimeCommand(const domain::Configuration& config,
                                                          std::vector<std::string> args) const {
    std::vector<std::string> cmd;
    if (config.UseSudo()) cmd.push_back("sudo");
    cmd.push_back("docker");
    cmd.insert(cmd.end(), args.begin(), args.end());
    return cmd;
}

domain::ReadinessReport ReadinessChecker::Check(const domain::Configuration& config, const domain::Workspace& workspace) {
    std::cout << "[ReadinessChecker] Checking system..." << std::endl;

    domain::ReadinessReport report;
    report.effective = config;

    auto add = [&report](ReadinessCheck check) {
        Log(check);
        report.checks.push_back(std::move(check));
    };

    add(CheckRuntime(config));
    bool runtimeAvailable = report.checks.back().severity == CheckSeverity::Passed;

    bool downgrade = false;
    add(CheckGpu(config, runtimeAvailable, downgrade));
    if (downgrade) {
        report.effective = report.effective.With("DEVICE", "cpu");
    }

    add(CheckWorkerArtifact(config, runtimeAvailable));
    add(CheckCredential(config));
    add(CheckDurationProbe());
    add(CheckCacheWritable(workspace));

    if (report.Ready()) {
        std::cout << "[ReadinessChecker] System is ready." << std::endl;
    }
    return report;
}

ReadinessCheck ReadinessChecker::CheckRuntime(const domain::Configuration& config) {
    if (NativeMode(config)) {
        if (m_probe.HasTool(config.WorkerBinary())) {
            return Make(kRuntime, CheckSeverity::Passed, "Worker binary found: " + config.WorkerBinary());
        }
        return Make(kRuntime, CheckSeverity::HardFailure,
                    "Worker binary '" + config.WorkerBinary() + "' not found on PATH.");
    }

    auto result = m_probe.Run({"docker", "--version"}, kVersionTimeout);
    if (result.Ok()) {
        return Make(kRuntime, CheckSeverity::Passed, result.output.empty() ? "Docker found" : result.output);
    }
    return Make(kRuntime, CheckSeverity::HardFailure, "Docker not found. Install Docker.");
}

ReadinessCheck ReadinessChecker::CheckGpu(const domain::Configuration& config, bool runtimeAvailable, bool& downgrade) {
    downgrade = false;
    if (!config.UseGpu()) {
        return Make(kGpu, CheckSeverity::Passed, "CPU mode (as configured)");
    }

    domain::ProbeResult result;
    if (NativeMode(config)) {
        result = m_probe.Run({"nvidia-smi", "--query-gpu=name", "--format=csv,noheader"}, kGpuTimeout);
    } else if (runtimeAvailable) {
        result = m_probe.Run(RuntimeCommand(config, {"run", "--rm", "--gpus", "all", config.Get("GPU_PROBE_IMAGE"),
                                                     "nvidia-smi", "--query-gpu=name", "--format=csv,noheader"}),
                             kGpuTimeout);
    }

    if (result.Ok() && !result.output.empty()) {
        return Make(kGpu, CheckSeverity::Passed, "GPU detected: " + result.output);
    }
    downgrade = true;
    return Make(kGpu, CheckSeverity::Warning, "GPU is not available to the worker, switching to CPU.");
}

ReadinessCheck ReadinessChecker::CheckWorkerArtifact(const domain::Configuration& config, bool runtimeAvailable) {
    if (NativeMode(config)) {
        if (!runtimeAvailable) {
            return Make(kWorkerArtifact, CheckSeverity::HardFailure, "Worker binary unavailable.");
        }
        auto result = m_probe.Run({config.WorkerBinary(), "--help"}, kGpuTimeout);
        if (result.Ok()) {
            return Make(kWorkerArtifact, CheckSeverity::Passed, "Worker binary runs");
        }
        return Make(kWorkerArtifact, CheckSeverity::HardFailure,
                    "Worker binary '" + config.WorkerBinary() + "' does not start.");
    }

    if (!runtimeAvailable) {
        return Make(kWorkerArtifact, CheckSeverity::HardFailure,
                    "Cannot inspect image " + config.WorkerImage() + " without Docker.");
    }
    auto result = m_probe.Run(RuntimeCommand(config, {"image", "inspect", config.WorkerImage()}), kImageTimeout);
    if (result.Ok()) {
        return Make(kWorkerArtifact, CheckSeverity::Passed, "Worker image found: " + config.WorkerImage());
    }
    return Make(kWorkerArtifact, CheckSeverity::HardFailure,
                "Worker image not found. Run: docker pull " + config.WorkerImage());
}

ReadinessCheck ReadinessChecker::CheckCredential(const domain::Configuration& config) {
    if (!config.DiarizationEnabled()) {
        return Make(kCredential, CheckSeverity::Passed, "Diarization disabled; no token needed");
    }
    if (config.CredentialToken()) {
        return Make(kCredential, CheckSeverity::Passed, "HF_TOKEN configured");
    }
    return Make(kCredential, CheckSeverity::HardFailure,
                "HF_TOKEN is not configured but diarization is enabled. Get a token at "
                "https://huggingface.co/settings/tokens and accept the model licenses.");
}

ReadinessCheck ReadinessChecker::CheckDurationProbe() {
    if (m_probe.HasTool("ffprobe")) {
        return Make(kDurationProbe, CheckSeverity::Passed, "ffprobe found");
    }
    return Make(kDurationProbe, CheckSeverity::Warning,
                "ffprobe not found; audio durations and speed will not be shown (install ffmpeg).");
}

ReadinessCheck ReadinessChecker::CheckCacheWritable(const domain::Workspace& workspace) {
    fs::path marker = workspace.cache / "test_write.tmp";
    {
        std::ofstream f(marker);
        if (!f.is_open()) {
            return Make(kCacheWritable, CheckSeverity::HardFailure,
                        "No write permission in cache directory " + workspace.cache.string());
        }
    }
    std::error_code ec;
    fs::remove(marker, ec);
    if (ec) {
        return Make(kCacheWritable, CheckSeverity::HardFailure,
                    "Cannot remove marker file in " + workspace.cache.string() + ": " + ec.message());
    }
    return Make(kCacheWritable, CheckSeverity::Passed, "Cache directory writable: " + workspace.cache.string());
}

} // namespace audioscribe::application
