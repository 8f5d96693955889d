/**
 * @file CommandProbe.hpp
 * @brief Interface for short, bounded external commands used by preflight checks.
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace audioscribe::domain {

struct ProbeResult {
    bool launched = false;
    bool timedOut = false;
    int exitCode = -1;
    std::string output;       ///< Captured standard output, trimmed.
    std::string errorOutput;  ///< Captured diagnostic output, trimmed.

    bool Ok() const { return launched && !timedOut && exitCode == 0; }
};

/**
 * @class CommandProbe
 * @brief Runs a command to completion within a time bound and reports what happened.
 */
class CommandProbe {
public:
    virtual ~CommandProbe() = default;

    virtual ProbeResult Run(const std::vector<std::string>& argv, std::chrono::seconds timeout) = 0;

    /** @brief True when an executable of this name is on PATH. */
    virtual bool HasTool(const std::string& name) = 0;
};

} // namespace audioscribe::domain
