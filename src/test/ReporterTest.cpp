#include <cassert>
#include <iostream>

#include "application/Reporter.hpp"
#include "application/SubtitleFormatter.hpp"

using namespace audioscribe;
using application::Reporter;

namespace {

bool AnyLineContains(const std::vector<std::string>& lines, const std::string& needle) {
    for (const auto& line : lines) {
        if (line.find(needle) != std::string::npos) return true;
    }
    return false;
}

domain::JobResult MakeResult(const std::string& name, bool ok) {
    domain::JobResult result;
    result.job.id = name;
    result.job.inputFile = "/audio/" + name;
    result.job.outputDir = "/results/stem";
    result.state = ok ? domain::JobState::Succeeded : domain::JobState::Failed;
    result.elapsedSeconds = 30.0;
    if (ok) {
        result.exitCode = 0;
        result.outputFiles = {"/results/stem/stem.txt", "/results/stem/stem.json"};
    }
    return result;
}

void TestDurations() {
    std::cout << "[Test] Duration formatting..." << std::endl;
    assert(Reporter::FormatDuration(4.5) == "4.5s");
    assert(Reporter::FormatDuration(0) == "0.0s");
    assert(Reporter::FormatDuration(-3) == "0.0s");
    assert(Reporter::FormatDuration(125) == "2m 5s");
    assert(Reporter::FormatDuration(3723) == "1h 2m 3s");
    std::cout << "[PASS] Durations" << std::endl;
}

void TestProgress() {
    std::cout << "[Test] Progress line..." << std::endl;
    assert(Reporter::SpinnerFrame(0) == Reporter::SpinnerFrame(8));
    assert(Reporter::SpinnerFrame(1) != Reporter::SpinnerFrame(2));
    assert(Reporter::PhaseLabel(domain::Phase::Transcribing).rfind("2/4", 0) == 0);
    auto line = Reporter::ProgressLine(domain::Phase::Diarizing, 3);
    assert(line.find("[PROGRESS]") != std::string::npos);
    assert(line.find("4/4") != std::string::npos);
    std::cout << "[PASS] " << line << std::endl;
}

void TestJobSummaries() {
    std::cout << "[Test] Job summaries..." << std::endl;
    auto ok = MakeResult("talk.mp3", true);
    ok.audioDurationSeconds = 120.0;
    auto okLines = Reporter::JobSummary(ok);
    assert(AnyLineContains(okLines, "4.0x real time"));
    assert(AnyLineContains(okLines, "stem.json"));

    auto timeout = MakeResult("hang.mp3", false);
    timeout.error = domain::ErrorKind::TimeoutFailure;
    auto launch = MakeResult("none.mp3", false);
    launch.error = domain::ErrorKind::LaunchFailure;
    launch.errorMessage = "No such file or directory";
    auto runtime = MakeResult("bad.mp3", false);
    runtime.error = domain::ErrorKind::RuntimeFailure;
    runtime.exitCode = 1;
    runtime.diagnosticExcerpt = {"Traceback (most recent call last):", "RuntimeError: CUDA out of memory"};

    assert(AnyLineContains(Reporter::JobSummary(timeout), "timed out"));
    assert(AnyLineContains(Reporter::JobSummary(launch), "could not launch"));
    auto runtimeLines = Reporter::JobSummary(runtime);
    assert(AnyLineContains(runtimeLines, "exit code 1"));
    assert(AnyLineContains(runtimeLines, "CUDA out of memory"));
    std::cout << "[PASS] Failure kinds are distinguishable" << std::endl;
}

void TestBatchSummary() {
    std::cout << "[Test] Batch summary..." << std::endl;
    domain::BatchResult batch;
    auto a = MakeResult("a.mp3", true);
    a.audioDurationSeconds = 60.0;
    auto b = MakeResult("b.mp3", false);
    b.error = domain::ErrorKind::RuntimeFailure;
    b.exitCode = 2;
    b.diagnosticExcerpt = {"boom"};
    batch.jobs = {a, b};
    batch.attempted = 2;
    batch.succeeded = 1;
    batch.failed = 1;
    batch.totalElapsedSeconds = 60.0;

    auto lines = Reporter::BatchSummary(batch);
    assert(AnyLineContains(lines, "Total files: 2"));
    assert(AnyLineContains(lines, "Succeeded: 1"));
    assert(AnyLineContains(lines, "Failed: 1"));
    assert(AnyLineContains(lines, "Mean time per file: 30.0s"));
    assert(AnyLineContains(lines, "a.mp3 in 30.0s (2.0x real time)"));
    assert(AnyLineContains(lines, "boom"));
    std::cout << "[PASS] Totals, per-file speed and failure excerpt" << std::endl;
}

void TestSubtitles() {
    std::cout << "[Test] SubRip rendering..." << std::endl;
    assert(application::SubtitleFormatter::FormatTimestamp(0) == "00:00:00,000");
    assert(application::SubtitleFormatter::FormatTimestamp(3725.5) == "01:02:05,500");

    std::vector<domain::TranscriptSegment> segments = {
        {0.0, 1.25, " Hello there ", "SPEAKER_00"},
        {1.25, 2.0, "General Kenobi", ""},
    };
    std::string srt = application::SubtitleFormatter::RenderSrt(segments);
    assert(srt ==
           "1\n00:00:00,000 --> 00:00:01,250\n[SPEAKER_00]: Hello there\n\n"
           "2\n00:00:01,250 --> 00:00:02,000\nGeneral Kenobi\n\n");
    std::cout << "[PASS] SRT" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Reporter tests..." << std::endl;
    TestDurations();
    TestProgress();
    TestJobSummaries();
    TestBatchSummary();
    TestSubtitles();
    std::cout << "[PASS] All Reporter tests passed." << std::endl;
    return 0;
}
