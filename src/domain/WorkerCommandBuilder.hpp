/**
 * @file WorkerCommandBuilder.hpp
 * @brief Interface for turning a job into a worker command line.
 */

#pragma once

#include "domain/Configuration.hpp"
#include "domain/Job.hpp"
#include "domain/Workspace.hpp"

#include <string>
#include <utility>
#include <vector>

namespace audioscribe::domain {

/**
 * @struct WorkerInvocation
 * @brief Everything needed to start the external transcription worker for one job.
 */
struct WorkerInvocation {
    std::string executable;
    std::vector<std::string> arguments;
    /** @brief Bindings added to the child's environment, on top of the inherited one. */
    std::vector<std::pair<std::string, std::string>> environment;
    /** @brief Optional command that stops work the child delegated elsewhere (e.g. a container). */
    std::vector<std::string> cancelCommand;
};

/**
 * @class WorkerCommandBuilder
 * @brief Pure function from configuration and job to an invocation. Never spawns anything.
 */
class WorkerCommandBuilder {
public:
    virtual ~WorkerCommandBuilder() = default;

    virtual WorkerInvocation Build(const Configuration& config,
                                   const Job& job,
                                   const Workspace& workspace) const = 0;
};

} // namespace audioscribe::domain
