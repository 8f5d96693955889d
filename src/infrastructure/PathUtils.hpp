// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace audioscribe::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetHome();
    static std::filesystem::path GetCacheHome();
    /** @brief Shared, run-independent model cache ($HOME/whisperx). Not created here. */
    static std::filesystem::path GetWorkerCacheDir();
    /** @brief Expands a leading "~/" against $HOME. */
    static std::filesystem::path ExpandUser(const std::string& path);
};

} // namespace audioscribe::infrastructure
