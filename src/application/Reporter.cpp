#include "application/Reporter.hpp"

#include <array>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace audioscribe::application {

namespace {

constexpr std::array<const char*, 8> kSpinner = {"⠇", "⠏", "⠋", "⠙", "⠸", "⠴", "⠦", "⠇"};
constexpr const char* kRule = "═══════════════════════════════════";

std::string Fixed(double value, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

} // namespace

std::string Reporter::FormatDuration(double seconds) {
    if (seconds < 0) return "0.0s";
    long long whole = static_cast<long long>(seconds);
    long long hours = whole / 3600;
    long long mins = (whole % 3600) / 60;
    long long secs = whole % 60;

    std::ostringstream ss;
    if (hours > 0) {
        ss << hours << "h " << mins << "m " << secs << "s";
    } else if (mins > 0) {
        ss << mins << "m " << secs << "s";
    } else {
        ss << Fixed(seconds, 1) << "s";
    }
    return ss.str();
}

std::string Reporter::SpinnerFrame(std::size_t tick) {
    return kSpinner[tick % kSpinner.size()];
}

std::string Reporter::PhaseLabel(domain::Phase phase) {
    switch (phase) {
        case domain::Phase::Initializing: return "Initializing...";
        case domain::Phase::DetectingSpeech: return "1/4 Detecting speech (VAD)...";
        case domain::Phase::Transcribing: return "2/4 Transcribing text...";
        case domain::Phase::Aligning: return "3/4 Aligning timestamps...";
        case domain::Phase::Diarizing: return "4/4 Diarization (may take a long time)...";
        case domain::Phase::Finalizing: return "Finalizing...";
    }
    return "";
}

std::string Reporter::ProgressLine(domain::Phase phase, std::size_t tick) {
    return "   [PROGRESS] " + SpinnerFrame(tick) + " " + PhaseLabel(phase);
}

std::vector<std::string> Reporter::JobHeader(std::size_t index, std::size_t total,
                                             const domain::Job& job,
                                             std::optional<std::uintmax_t> sizeBytes,
                                             std::optional<double> durationSeconds) {
    std::vector<std::string> lines;
    lines.push_back("═══ File " + std::to_string(index) + "/" + std::to_string(total) + " ═══");
    lines.push_back("Processing: " + job.inputFile.filename().string());
    if (sizeBytes) {
        lines.push_back("   Size: " + Fixed(static_cast<double>(*sizeBytes) / (1024.0 * 1024.0), 1) + " MB");
    }
    if (durationSeconds) {
        lines.push_back("   Duration: " + FormatDuration(*durationSeconds));
    }
    lines.push_back("   Results: " + job.outputDir.string());
    return lines;
}

std::string Reporter::FailureDescription(const domain::JobResult& result) {
    switch (result.error) {
        case domain::ErrorKind::LaunchFailure:
            return "could not launch worker: " + result.errorMessage;
        case domain::ErrorKind::TimeoutFailure:
            return "timed out and was terminated";
        case domain::ErrorKind::Interrupted:
            return "interrupted by user";
        case domain::ErrorKind::RuntimeFailure:
            return "worker failed (exit code " + (result.exitCode ? std::to_string(*result.exitCode) : std::string("?")) + ")";
        default:
            return result.errorMessage.empty() ? "failed" : result.errorMessage;
    }
}

std::vector<std::string> Reporter::JobSummary(const domain::JobResult& result) {
    std::vector<std::string> lines;
    if (result.Succeeded()) {
        lines.push_back("Done: " + result.job.inputFile.filename().string());
        lines.push_back("   Processing time: " + FormatDuration(result.elapsedSeconds));
        if (auto speed = result.SpeedFactor()) {
            lines.push_back("   Speed: " + Fixed(*speed, 1) + "x real time");
        }
        if (!result.outputFiles.empty()) {
            lines.push_back("   Files created: " + std::to_string(result.outputFiles.size()));
            for (const auto& file : result.outputFiles) {
                lines.push_back("      • " + file.filename().string());
            }
        }
        return lines;
    }

    lines.push_back("Error processing " + result.job.inputFile.filename().string() + ": " + FailureDescription(result));
    if (!result.diagnosticExcerpt.empty()) {
        lines.push_back("   Last worker messages:");
        for (const auto& line : result.diagnosticExcerpt) {
            lines.push_back("   [worker] " + line);
        }
    }
    return lines;
}

std::vector<std::string> Reporter::BatchSummary(const domain::BatchResult& batch) {
    std::vector<std::string> lines;
    lines.push_back(kRule);
    lines.push_back("PROCESSING SUMMARY");
    lines.push_back(kRule);
    lines.push_back("Total files: " + std::to_string(batch.attempted));
    lines.push_back("Succeeded: " + std::to_string(batch.succeeded));
    lines.push_back("Failed: " + std::to_string(batch.failed));
    lines.push_back("Total time: " + FormatDuration(batch.totalElapsedSeconds));
    if (batch.attempted > 0) {
        lines.push_back("Mean time per file: " + FormatDuration(batch.MeanElapsedSeconds()));
    }
    if (batch.interrupted) {
        lines.push_back("Batch interrupted by user.");
    }

    for (const auto& job : batch.jobs) {
        std::string name = job.job.inputFile.filename().string();
        if (job.Succeeded()) {
            std::string line = "  [ok] " + name + " in " + FormatDuration(job.elapsedSeconds);
            if (auto speed = job.SpeedFactor()) {
                line += " (" + Fixed(*speed, 1) + "x real time)";
            }
            lines.push_back(line);
        } else {
            lines.push_back("  [failed] " + name + ": " + FailureDescription(job));
            for (const auto& excerpt : job.diagnosticExcerpt) {
                lines.push_back("      " + excerpt);
            }
        }
    }
    return lines;
}

std::vector<std::string> Reporter::ReadinessSummary(const domain::ReadinessReport& report) {
    std::vector<std::string> lines;
    for (const auto& check : report.checks) {
        const char* mark = "[ok]";
        if (check.severity == domain::CheckSeverity::Warning) mark = "[warn]";
        if (check.severity == domain::CheckSeverity::HardFailure) mark = "[FAIL]";
        lines.push_back(std::string(mark) + " " + check.name + ": " + check.message);
    }
    lines.push_back(report.Ready() ? "System is ready." : "System is NOT ready. Fix the errors above and retry.");
    return lines;
}

} // namespace audioscribe::application
