/**
 * @file TestSupport.hpp
 * @brief Helpers shared by the test executables: scratch directories and stub workers.
 */

#pragma once

#include "domain/WorkerCommandBuilder.hpp"

#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <functional>
#include <string>

namespace audioscribe::test {

/** @brief Fresh, empty directory under the system temp dir, unique per process. */
inline std::filesystem::path MakeScratchDir(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() /
               ("audioscribe_" + name + "_" + std::to_string(::getpid()));
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

inline void WriteFile(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

inline std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

/**
 * @class StubWorkerBuilder
 * @brief Runs a /bin/sh script in place of the real worker.
 *
 * The script receives the job's output directory as $1 and its input file as $2.
 */
class StubWorkerBuilder : public domain::WorkerCommandBuilder {
public:
    using ScriptFor = std::function<std::string(const domain::Job& job)>;

    explicit StubWorkerBuilder(ScriptFor scriptFor) : m_scriptFor(std::move(scriptFor)) {}

    explicit StubWorkerBuilder(const std::string& script)
        : m_scriptFor([script](const domain::Job&) { return script; }) {}

    domain::WorkerInvocation Build(const domain::Configuration&,
                                   const domain::Job& job,
                                   const domain::Workspace&) const override {
        domain::WorkerInvocation inv;
        inv.executable = "/bin/sh";
        inv.arguments = {"-c", m_scriptFor(job), "stub-worker", job.outputDir.string(), job.inputFile.string()};
        return inv;
    }

private:
    ScriptFor m_scriptFor;
};

/** @brief Builder whose executable does not exist. */
class MissingWorkerBuilder : public domain::WorkerCommandBuilder {
public:
    domain::WorkerInvocation Build(const domain::Configuration&,
                                   const domain::Job&,
                                   const domain::Workspace&) const override {
        domain::WorkerInvocation inv;
        inv.executable = "/nonexistent/audioscribe-worker";
        return inv;
    }
};

} // namespace audioscribe::test
