#include "infrastructure/WorkerCommandBuilders.hpp"

#include <unistd.h>

#include <filesystem>

namespace audioscribe::infrastructure {

namespace fs = std::filesystem;

namespace {

constexpr const char* kContainerCache = "/models";
constexpr const char* kContainerAudio = "/audio";
constexpr const char* kContainerResults = "/results";

std::vector<std::pair<std::string, std::string>> CacheBindings(const std::string& cacheRoot) {
    return {
        {"HOME", cacheRoot},
        {"HF_HOME", cacheRoot + "/.cache/huggingface"},
        {"XDG_CACHE_HOME", cacheRoot + "/.cache"},
        {"TORCH_HOME", cacheRoot + "/.cache/torch"},
    };
}

std::string Absolute(const fs::path& p) {
    std::error_code ec;
    fs::path abs = fs::absolute(p, ec);
    return (ec ? p : abs).lexically_normal().string();
}

} // namespace

std::vector<std::string> BuildWhisperArguments(const domain::Configuration& config,
                                               const std::string& outputDir,
                                               const std::string& inputRef) {
    std::vector<std::string> args = {
        "--output_dir", outputDir,
        "--model", config.Model(),
    };

    // Leaving the flag out lets the worker detect the language itself.
    if (!config.Language().empty() && config.Language() != "auto") {
        args.insert(args.end(), {"--language", config.Language()});
    }

    args.insert(args.end(), {
        "--batch_size", config.Get("BATCH_SIZE"),
        "--device", config.UseGpu() ? "cuda" : "cpu",
        "--compute_type", config.ComputeType(),
        "--output_format", "all",
        "--verbose", "False",
    });

    auto token = config.CredentialToken();
    if (config.DiarizationEnabled() && token) {
        args.insert(args.end(), {"--diarize", "--hf_token", *token});
        if (auto minSpeakers = config.SpeakerHint("MIN_SPEAKERS")) {
            args.insert(args.end(), {"--min_speakers", std::to_string(*minSpeakers)});
        }
        if (auto maxSpeakers = config.SpeakerHint("MAX_SPEAKERS")) {
            args.insert(args.end(), {"--max_speakers", std::to_string(*maxSpeakers)});
        }
    }

    args.push_back(inputRef);
    return args;
}

DockerCommandBuilder::DockerCommandBuilder(uid_t uid, gid_t gid)
    : m_uid(uid), m_gid(gid) {}

std::string DockerCommandBuilder::ContainerName(const domain::Job& job) {
    return "audioscribe-" + job.id;
}

domain::WorkerInvocation DockerCommandBuilder::Build(const domain::Configuration& config,
                                                     const domain::Job& job,
                                                     const domain::Workspace& workspace) const {
    domain::WorkerInvocation inv;
    std::vector<std::string> docker;
    if (config.UseSudo()) {
        inv.executable = "sudo";
        docker.push_back("docker");
    } else {
        inv.executable = "docker";
    }

    docker.insert(docker.end(), {
        "run", "--rm",
        "--name", ContainerName(job),
        "--user", std::to_string(m_uid) + ":" + std::to_string(m_gid),
    });
    if (config.UseGpu()) {
        docker.insert(docker.end(), {"--gpus", "all"});
    }

    docker.insert(docker.end(), {
        "-v", Absolute(job.inputFile.parent_path()) + ":" + kContainerAudio + ":ro",
        "-v", Absolute(job.outputDir) + ":" + kContainerResults,
        "-v", Absolute(workspace.cache) + ":" + kContainerCache,
        "--workdir", "/app",
    });
    for (const auto& [key, value] : CacheBindings(kContainerCache)) {
        docker.insert(docker.end(), {"-e", key + "=" + value});
    }
    if (auto token = config.CredentialToken()) {
        docker.insert(docker.end(), {"-e", "HF_TOKEN=" + *token});
    }

    docker.insert(docker.end(), {config.WorkerImage(), "whisperx"});
    auto whisperArgs = BuildWhisperArguments(config, kContainerResults,
                                             std::string(kContainerAudio) + "/" + job.inputFile.filename().string());
    docker.insert(docker.end(), whisperArgs.begin(), whisperArgs.end());
    inv.arguments = std::move(docker);

    if (config.UseSudo()) {
        inv.cancelCommand = {"sudo", "docker", "kill", ContainerName(job)};
    } else {
        inv.cancelCommand = {"docker", "kill", ContainerName(job)};
    }
    return inv;
}

domain::WorkerInvocation NativeCommandBuilder::Build(const domain::Configuration& config,
                                                     const domain::Job& job,
                                                     const domain::Workspace& workspace) const {
    domain::WorkerInvocation inv;
    inv.executable = config.WorkerBinary();
    inv.arguments = BuildWhisperArguments(config, Absolute(job.outputDir), Absolute(job.inputFile));
    inv.environment = CacheBindings(Absolute(workspace.cache));
    if (auto token = config.CredentialToken()) {
        inv.environment.emplace_back("HF_TOKEN", *token);
    }
    return inv;
}

std::unique_ptr<domain::WorkerCommandBuilder> MakeWorkerCommandBuilder(const domain::Configuration& config) {
    if (config.WorkerMode() == "native") {
        return std::make_unique<NativeCommandBuilder>();
    }
    return std::make_unique<DockerCommandBuilder>(::getuid(), ::getgid());
}

} // namespace audioscribe::infrastructure
