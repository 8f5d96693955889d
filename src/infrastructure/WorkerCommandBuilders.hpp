/**
 * @file WorkerCommandBuilders.hpp
 * @brief Worker invocations for the containerized and the native whisperx worker.
 */

#pragma once

#include "domain/WorkerCommandBuilder.hpp"

#include <sys/types.h>

#include <memory>

namespace audioscribe::infrastructure {

/**
 * @brief Flags understood by the whisperx CLI, shared by both launch modes.
 * @param outputDir Result directory as the worker sees it.
 * @param inputRef Input file as the worker sees it.
 */
std::vector<std::string> BuildWhisperArguments(const domain::Configuration& config,
                                               const std::string& outputDir,
                                               const std::string& inputRef);

/**
 * @class DockerCommandBuilder
 * @brief `[sudo] docker run --rm ...` with the input, result and cache directories mounted.
 *
 * Cache variables are bound inside the container to the mounted /models volume. The
 * container is named after the job so a supervisor can stop it with `docker kill`.
 */
class DockerCommandBuilder : public domain::WorkerCommandBuilder {
public:
    DockerCommandBuilder(uid_t uid, gid_t gid);

    domain::WorkerInvocation Build(const domain::Configuration& config,
                                   const domain::Job& job,
                                   const domain::Workspace& workspace) const override;

    static std::string ContainerName(const domain::Job& job);

private:
    uid_t m_uid;
    gid_t m_gid;
};

/**
 * @class NativeCommandBuilder
 * @brief Runs the worker binary directly, with cache variables pointing at the shared cache.
 */
class NativeCommandBuilder : public domain::WorkerCommandBuilder {
public:
    domain::WorkerInvocation Build(const domain::Configuration& config,
                                   const domain::Job& job,
                                   const domain::Workspace& workspace) const override;
};

/** @brief Picks the builder named by WORKER_MODE (docker unless "native"). */
std::unique_ptr<domain::WorkerCommandBuilder> MakeWorkerCommandBuilder(const domain::Configuration& config);

} // namespace audioscribe::infrastructure
