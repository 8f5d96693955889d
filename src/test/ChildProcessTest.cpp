#include <cassert>
#include <chrono>
#include <iostream>

#include "infrastructure/ChildProcess.hpp"
#include "infrastructure/FfprobeDurationProbe.hpp"
#include "infrastructure/SystemCommandProbe.hpp"

using namespace audioscribe;
using infrastructure::ChildProcess;
using infrastructure::OutputStream;

namespace {

class ScriptedProbe : public domain::CommandProbe {
public:
    bool hasFfprobe = true;
    std::string output;
    int runs = 0;

    domain::ProbeResult Run(const std::vector<std::string>&, std::chrono::seconds) override {
        ++runs;
        domain::ProbeResult result;
        result.launched = true;
        result.exitCode = 0;
        result.output = output;
        return result;
    }
    bool HasTool(const std::string& name) override { return hasFfprobe && name == "ffprobe"; }
};

void TestLineSplitting() {
    std::cout << "[Test] Lines split on newline and carriage return, per stream..." << std::endl;
    infrastructure::ProcessSpec spec;
    spec.executable = "/bin/sh";
    spec.arguments = {"-c", "printf 'a\\rb\\n\\nc' >&2; echo out; exit 4"};

    std::string error;
    auto child = ChildProcess::Spawn(spec, error);
    assert(child);

    std::vector<infrastructure::OutputLine> lines;
    while (!child->TryWait()) {
        for (auto& line : child->ReadLines(std::chrono::milliseconds(20))) lines.push_back(line);
    }
    for (auto& line : child->Drain(std::chrono::milliseconds(200))) lines.push_back(line);

    std::vector<std::string> errLines;
    std::vector<std::string> outLines;
    for (const auto& line : lines) {
        (line.stream == OutputStream::Stderr ? errLines : outLines).push_back(line.text);
    }
    assert((errLines == std::vector<std::string>{"a", "b", "c"}));
    assert((outLines == std::vector<std::string>{"out"}));
    assert(child->ExitCode() == 4);
    std::cout << "[PASS] Split and exit code" << std::endl;
}

void TestEnvironmentAndLaunchFailure() {
    std::cout << "[Test] Extra environment and exec failure..." << std::endl;
    infrastructure::ProcessSpec spec;
    spec.executable = "/bin/sh";
    spec.arguments = {"-c", "echo \"$AUDIOSCRIBE_TEST_VAR\""};
    spec.environment = {{"AUDIOSCRIBE_TEST_VAR", "bound"}};

    std::string error;
    auto child = ChildProcess::Spawn(spec, error);
    assert(child);
    std::string seen;
    while (!child->TryWait()) {
        for (auto& line : child->ReadLines(std::chrono::milliseconds(20))) seen += line.text;
    }
    for (auto& line : child->Drain(std::chrono::milliseconds(200))) seen += line.text;
    assert(seen == "bound");

    infrastructure::ProcessSpec missing;
    missing.executable = "audioscribe-no-such-binary";
    assert(!ChildProcess::Spawn(missing, error));
    assert(!error.empty());
    std::cout << "[PASS] Environment bound, missing binary reported at spawn" << std::endl;
}

void TestSystemProbe() {
    std::cout << "[Test] SystemCommandProbe..." << std::endl;
    infrastructure::SystemCommandProbe probe;
    auto ok = probe.Run({"sh", "-c", "echo '  version 1.2  '"}, std::chrono::seconds(5));
    assert(ok.Ok());
    assert(ok.output == "version 1.2");

    auto failed = probe.Run({"sh", "-c", "echo nope >&2; exit 2"}, std::chrono::seconds(5));
    assert(failed.launched && !failed.Ok());
    assert(failed.exitCode == 2);
    assert(failed.errorOutput == "nope");

    auto begin = std::chrono::steady_clock::now();
    auto slow = probe.Run({"sleep", "30"}, std::chrono::seconds(1));
    assert(slow.timedOut && !slow.Ok());
    assert(std::chrono::steady_clock::now() - begin < std::chrono::seconds(5));

    auto absent = probe.Run({"audioscribe-no-such-binary"}, std::chrono::seconds(1));
    assert(!absent.launched);

    assert(probe.HasTool("sh"));
    assert(!probe.HasTool("audioscribe-no-such-binary"));
    assert(infrastructure::SystemCommandProbe::FindOnPath("sh").has_value());
    std::cout << "[PASS] Output, failure, timeout and PATH lookup" << std::endl;
}

void TestDurationProbe() {
    std::cout << "[Test] FfprobeDurationProbe..." << std::endl;
    ScriptedProbe probe;
    infrastructure::FfprobeDurationProbe durations(probe);

    probe.output = "123.456";
    auto seconds = durations.DurationSeconds("/audio/a.wav");
    assert(seconds && *seconds > 123.4 && *seconds < 123.5);

    probe.output = "N/A";
    assert(!durations.DurationSeconds("/audio/b.wav"));

    ScriptedProbe without;
    without.hasFfprobe = false;
    infrastructure::FfprobeDurationProbe noTool(without);
    assert(!noTool.DurationSeconds("/audio/a.wav"));
    assert(without.runs == 0);
    std::cout << "[PASS] Durations parsed, unknown when unavailable" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ChildProcess tests..." << std::endl;
    TestLineSplitting();
    TestEnvironmentAndLaunchFailure();
    TestSystemProbe();
    TestDurationProbe();
    std::cout << "[PASS] All ChildProcess tests passed." << std::endl;
    return 0;
}
