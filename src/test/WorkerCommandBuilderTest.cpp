#include <algorithm>
#include <cassert>
#include <iostream>

#include "application/JobRunner.hpp"
#include "infrastructure/WorkerCommandBuilders.hpp"

namespace fs = std::filesystem;
using namespace audioscribe;

namespace {

bool Contains(const std::vector<std::string>& args, const std::string& value) {
    return std::find(args.begin(), args.end(), value) != args.end();
}

/** Value following `flag`, or empty. */
std::string After(const std::vector<std::string>& args, const std::string& flag) {
    auto it = std::find(args.begin(), args.end(), flag);
    if (it == args.end() || it + 1 == args.end()) return "";
    return *(it + 1);
}

const domain::Workspace kWorkspace{"/data/audio", "/data/results", "/home/user/whisperx"};

domain::Job MakeJob() {
    return application::JobRunner::MakeJob("1234", "/data/audio/interview.mp3", kWorkspace);
}

void TestWhisperArguments() {
    std::cout << "[Test] Worker flags from configuration..." << std::endl;
    domain::Configuration config = domain::Configuration()
        .With("HF_TOKEN", "hf_secret")
        .With("MIN_SPEAKERS", "2")
        .With("MAX_SPEAKERS", "");

    auto args = infrastructure::BuildWhisperArguments(config, "/out", "/in/file.wav");
    assert(After(args, "--output_dir") == "/out");
    assert(After(args, "--model") == "large-v3");
    assert(After(args, "--language") == "ru");
    assert(After(args, "--batch_size") == "16");
    assert(After(args, "--device") == "cuda");
    assert(After(args, "--compute_type") == "float16");
    assert(After(args, "--output_format") == "all");
    assert(Contains(args, "--diarize"));
    assert(After(args, "--hf_token") == "hf_secret");
    assert(After(args, "--min_speakers") == "2");
    assert(!Contains(args, "--max_speakers"));
    assert(args.back() == "/in/file.wav");
    std::cout << "[PASS] Full flag set" << std::endl;

    auto noDiarize = infrastructure::BuildWhisperArguments(config.With("ENABLE_DIARIZATION", "false"), "/out", "/in/f.wav");
    assert(!Contains(noDiarize, "--diarize"));
    assert(!Contains(noDiarize, "--hf_token"));
    assert(!Contains(noDiarize, "--min_speakers"));

    auto placeholder = infrastructure::BuildWhisperArguments(domain::Configuration(), "/out", "/in/f.wav");
    assert(!Contains(placeholder, "--diarize"));

    auto autoLanguage = infrastructure::BuildWhisperArguments(config.With("LANGUAGE", "auto"), "/out", "/in/f.wav");
    assert(!Contains(autoLanguage, "--language"));

    auto cpu = infrastructure::BuildWhisperArguments(config.With("DEVICE", "cpu"), "/out", "/in/f.wav");
    assert(After(cpu, "--device") == "cpu");
    std::cout << "[PASS] Optional flags omitted when not applicable" << std::endl;
}

void TestDockerInvocation() {
    std::cout << "[Test] Containerized invocation..." << std::endl;
    infrastructure::DockerCommandBuilder builder(1000, 1000);
    domain::Configuration config = domain::Configuration().With("HF_TOKEN", "hf_secret");
    auto inv = builder.Build(config, MakeJob(), kWorkspace);

    assert(inv.executable == "sudo");
    assert(inv.arguments.front() == "docker");
    assert(After(inv.arguments, "run") == "--rm");
    assert(After(inv.arguments, "--name") == "audioscribe-1234");
    assert(After(inv.arguments, "--user") == "1000:1000");
    assert(After(inv.arguments, "--gpus") == "all");
    assert(Contains(inv.arguments, "/data/audio:/audio:ro"));
    assert(Contains(inv.arguments, "/data/results/interview:/results"));
    assert(Contains(inv.arguments, "/home/user/whisperx:/models"));
    assert(Contains(inv.arguments, "HF_HOME=/models/.cache/huggingface"));
    assert(Contains(inv.arguments, "TORCH_HOME=/models/.cache/torch"));
    assert(Contains(inv.arguments, "HF_TOKEN=hf_secret"));
    assert(Contains(inv.arguments, "ghcr.io/jim60105/whisperx:latest"));
    assert(After(inv.arguments, "--output_dir") == "/results");
    assert(inv.arguments.back() == "/audio/interview.mp3");
    assert((inv.cancelCommand == std::vector<std::string>{"sudo", "docker", "kill", "audioscribe-1234"}));
    std::cout << "[PASS] Mounts, cache bindings and container name" << std::endl;

    auto plain = builder.Build(config.With("USE_SUDO", "false").With("DEVICE", "cpu"), MakeJob(), kWorkspace);
    assert(plain.executable == "docker");
    assert(plain.arguments.front() == "run");
    assert(!Contains(plain.arguments, "--gpus"));
    assert((plain.cancelCommand == std::vector<std::string>{"docker", "kill", "audioscribe-1234"}));
    std::cout << "[PASS] No sudo, no GPU" << std::endl;
}

void TestNativeInvocation() {
    std::cout << "[Test] Native invocation..." << std::endl;
    infrastructure::NativeCommandBuilder builder;
    auto config = domain::Configuration().With("WORKER_BINARY", "/opt/whisperx/bin/whisperx");
    auto inv = builder.Build(config, MakeJob(), kWorkspace);

    assert(inv.executable == "/opt/whisperx/bin/whisperx");
    assert(After(inv.arguments, "--output_dir") == "/data/results/interview");
    assert(inv.arguments.back() == "/data/audio/interview.mp3");
    assert(inv.cancelCommand.empty());
    bool hfHome = false;
    for (const auto& [key, value] : inv.environment) {
        if (key == "HF_HOME") hfHome = value == "/home/user/whisperx/.cache/huggingface";
        assert(key != "HF_TOKEN");
    }
    assert(hfHome);
    std::cout << "[PASS] Cache variables bound to the shared cache" << std::endl;

    auto selected = infrastructure::MakeWorkerCommandBuilder(config.With("WORKER_MODE", "native"));
    assert(dynamic_cast<infrastructure::NativeCommandBuilder*>(selected.get()) != nullptr);
    selected = infrastructure::MakeWorkerCommandBuilder(config);
    assert(dynamic_cast<infrastructure::DockerCommandBuilder*>(selected.get()) != nullptr);
    std::cout << "[PASS] WORKER_MODE selects the builder" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting WorkerCommandBuilder tests..." << std::endl;
    TestWhisperArguments();
    TestDockerInvocation();
    TestNativeInvocation();
    std::cout << "[PASS] All WorkerCommandBuilder tests passed." << std::endl;
    return 0;
}
