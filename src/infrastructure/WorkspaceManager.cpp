/**
 * @file WorkspaceManager.cpp
 * @brief Implementation of WorkspaceManager.
 */

#include "infrastructure/WorkspaceManager.hpp"
#include "infrastructure/PathUtils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <iostream>

namespace fs = std::filesystem;

namespace audioscribe::infrastructure {

namespace {

constexpr std::array<const char*, 12> kMediaExtensions = {
    ".wav", ".mp3", ".m4a", ".flac", ".ogg", ".aac", ".wma", ".mp4", ".mkv", ".avi", ".mov", ".webm"
};

bool EnsureDirectory(const fs::path& dir, std::string& error) {
    std::error_code ec;
    if (fs::is_directory(dir, ec)) return true;
    fs::create_directories(dir, ec);
    if (ec || !fs::is_directory(dir)) {
        error = "Cannot create directory " + dir.string() + ": " + (ec ? ec.message() : "not a directory");
        return false;
    }
    return true;
}

} // namespace

domain::Workspace WorkspaceManager::FromRoot(const fs::path& root) {
    domain::Workspace ws;
    ws.input = root / "audio";
    ws.output = root / "results";
    ws.cache = PathUtils::GetWorkerCacheDir();
    return ws;
}

bool WorkspaceManager::Ensure(const domain::Workspace& workspace, std::string& error) {
    for (const auto* dir : {&workspace.input, &workspace.output, &workspace.cache}) {
        if (!EnsureDirectory(*dir, error)) {
            return false;
        }
    }
    std::cout << "[WorkspaceManager] Model cache: " << workspace.cache.string() << std::endl;
    return true;
}

fs::path WorkspaceManager::ResolveJobOutputDir(const domain::Workspace& workspace, const fs::path& inputFile) {
    return workspace.output / inputFile.stem();
}

bool WorkspaceManager::IsMediaFile(const fs::path& file) {
    std::string ext = file.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c){ return std::tolower(c); });
    return std::find(kMediaExtensions.begin(), kMediaExtensions.end(), ext) != kMediaExtensions.end();
}

std::vector<fs::path> WorkspaceManager::DiscoverMediaFiles(const fs::path& directory) {
    std::vector<fs::path> files;
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        return files;
    }

    try {
        for (const auto& entry : fs::recursive_directory_iterator(directory)) {
            if (entry.is_regular_file() && IsMediaFile(entry.path())) {
                files.push_back(entry.path());
            }
        }
    } catch (const fs::filesystem_error& e) {
        std::cerr << "[WorkspaceManager] Error scanning " << directory.string() << ": " << e.what() << std::endl;
    }

    std::sort(files.begin(), files.end());
    return files;
}

} // namespace audioscribe::infrastructure
