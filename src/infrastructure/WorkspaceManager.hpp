/**
 * @file WorkspaceManager.hpp
 * @brief Creates and resolves the directories a run works in.
 */

#pragma once

#include "domain/Workspace.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace audioscribe::infrastructure {

class WorkspaceManager {
public:
    /** @brief root/audio, root/results and the shared user-scoped cache. */
    static domain::Workspace FromRoot(const std::filesystem::path& root);

    /**
     * @brief Creates input, output and cache directories when absent. Never deletes anything.
     * @param error Populated on failure.
     * @return True if every directory exists afterwards.
     */
    static bool Ensure(const domain::Workspace& workspace, std::string& error);

    /** @brief output/<stem of input>. Deterministic; existing contents are left in place. */
    static std::filesystem::path ResolveJobOutputDir(const domain::Workspace& workspace,
                                                     const std::filesystem::path& inputFile);

    /** @brief Supported media files under `directory`, recursively, sorted by path. */
    static std::vector<std::filesystem::path> DiscoverMediaFiles(const std::filesystem::path& directory);

    static bool IsMediaFile(const std::filesystem::path& file);
};

} // namespace audioscribe::infrastructure
