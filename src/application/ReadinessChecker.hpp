/**
 * @file ReadinessChecker.hpp
 * @brief Preflight verification of everything a job needs, independent of any job.
 */

#pragma once

#include "domain/CommandProbe.hpp"
#include "domain/Configuration.hpp"
#include "domain/ReadinessReport.hpp"
#include "domain/Workspace.hpp"

namespace audioscribe::application {

/**
 * @class ReadinessChecker
 * @brief Runs the ordered readiness checks, each external command bounded by a timeout.
 *
 * Side effects are limited to creating and removing a marker file in the cache directory.
 * A GPU request that cannot be honoured is downgraded to CPU in the report's effective
 * configuration instead of failing the check.
 */
class ReadinessChecker {
public:
    static constexpr const char* kRuntime = "runtime";
    static constexpr const char* kGpu = "gpu";
    static constexpr const char* kWorkerArtifact = "worker_artifact";
    static constexpr const char* kCredential = "credential";
    static constexpr const char* kDurationProbe = "duration_probe";
    static constexpr const char* kCacheWritable = "cache_writable";

    explicit ReadinessChecker(domain::CommandProbe& probe);

    domain::ReadinessReport Check(const domain::Configuration& config, const domain::Workspace& workspace);

private:
    domain::ReadinessCheck CheckRuntime(const domain::Configuration& config);
    domain::ReadinessCheck CheckGpu(const domain::Configuration& config, bool runtimeAvailable, bool& downgrade);
    domain::ReadinessCheck CheckWorkerArtifact(const domain::Configuration& config, bool runtimeAvailable);
    static domain::ReadinessCheck CheckCredential(const domain::Configuration& config);
    domain::ReadinessCheck CheckDurationProbe();
    static domain::ReadinessCheck CheckCacheWritable(const domain::Workspace& workspace);

    std::vector<std::string> RuntimeCommand(const domain::Configuration& config,
                                            std::vector<std::string> args) const;

    domain::CommandProbe& m_probe;
};

} // namespace audioscribe::application
