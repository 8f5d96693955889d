/**
 * @file SystemCommandProbe.hpp
 * @brief CommandProbe backed by real child processes.
 */

#pragma once

#include "domain/CommandProbe.hpp"

#include <filesystem>
#include <optional>

namespace audioscribe::infrastructure {

class SystemCommandProbe : public domain::CommandProbe {
public:
    domain::ProbeResult Run(const std::vector<std::string>& argv, std::chrono::seconds timeout) override;
    bool HasTool(const std::string& name) override;

    /** @brief PATH lookup, the same way a shell resolves a bare command name. */
    static std::optional<std::filesystem::path> FindOnPath(const std::string& name);
};

} // namespace audioscribe::infrastructure
