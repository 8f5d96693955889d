#include "infrastructure/SystemCommandProbe.hpp"
#include "infrastructure/ChildProcess.hpp"

#include <unistd.h>

#include <cstdlib>
#include <iostream>
#include <sstream>

namespace audioscribe::infrastructure {

namespace {

constexpr std::chrono::milliseconds kProbePoll{50};
constexpr std::chrono::milliseconds kDrainBudget{200};

std::string Trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

void Collect(const std::vector<OutputLine>& lines, std::string& out, std::string& err) {
    for (const auto& line : lines) {
        std::string& target = line.stream == OutputStream::Stdout ? out : err;
        target += line.text;
        target += '\n';
    }
}

std::string Join(const std::vector<std::string>& argv) {
    std::ostringstream ss;
    for (std::size_t i = 0; i < argv.size(); ++i) {
        if (i) ss << ' ';
        ss << argv[i];
    }
    return ss.str();
}

} // namespace

domain::ProbeResult SystemCommandProbe::Run(const std::vector<std::string>& argv, std::chrono::seconds timeout) {
    domain::ProbeResult result;
    if (argv.empty()) return result;

    ProcessSpec spec;
    spec.executable = argv.front();
    spec.arguments.assign(argv.begin() + 1, argv.end());

    std::string error;
    auto child = ChildProcess::Spawn(spec, error);
    if (!child) {
        std::cerr << "[CommandProbe] Command '" << argv.front() << "' not found: " << error << std::endl;
        result.errorOutput = error;
        return result;
    }
    result.launched = true;

    std::string out;
    std::string err;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!child->TryWait()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            child->Kill();
            result.timedOut = true;
            std::cerr << "[CommandProbe] Command '" << Join(argv) << "' took too long." << std::endl;
            break;
        }
        Collect(child->ReadLines(kProbePoll), out, err);
    }
    Collect(child->Drain(kDrainBudget), out, err);

    result.exitCode = child->ExitCode();
    result.output = Trim(out);
    result.errorOutput = Trim(err);
    if (!result.timedOut && result.exitCode != 0) {
        std::cerr << "[CommandProbe] Command failed with code " << result.exitCode << ": " << Join(argv) << std::endl;
        if (!result.errorOutput.empty()) {
            std::cerr << "[CommandProbe] Stderr: " << result.errorOutput << std::endl;
        }
    }
    return result;
}

bool SystemCommandProbe::HasTool(const std::string& name) {
    return FindOnPath(name).has_value();
}

std::optional<std::filesystem::path> SystemCommandProbe::FindOnPath(const std::string& name) {
    namespace fs = std::filesystem;
    if (name.empty()) return std::nullopt;

    if (name.find('/') != std::string::npos) {
        if (::access(name.c_str(), X_OK) == 0) return fs::path(name);
        return std::nullopt;
    }

    const char* pathEnv = std::getenv("PATH");
    if (!pathEnv || !*pathEnv) return std::nullopt;

    std::stringstream dirs(pathEnv);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) dir = ".";
        fs::path candidate = fs::path(dir) / name;
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return std::nullopt;
}

} // namespace audioscribe::infrastructure
