#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>

namespace audioscribe::infrastructure {

namespace fs = std::filesystem;

fs::path PathUtils::GetHome() {
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home);
    }
    return {};
}

fs::path PathUtils::GetCacheHome() {
    const char* xdgCacheHome = std::getenv("XDG_CACHE_HOME");
    if (xdgCacheHome && *xdgCacheHome) {
        return fs::path(xdgCacheHome);
    }
    fs::path home = GetHome();
    if (!home.empty()) {
        return home / ".cache";
    }
    return fs::current_path();
}

fs::path PathUtils::GetWorkerCacheDir() {
    fs::path home = GetHome();
    if (!home.empty()) {
        return home / "whisperx";
    }
    return GetCacheHome() / "whisperx"; // Fallback
}

fs::path PathUtils::ExpandUser(const std::string& path) {
    if (path == "~" || path.rfind("~/", 0) == 0) {
        fs::path home = GetHome();
        if (!home.empty()) {
            return path.size() <= 2 ? home : home / path.substr(2);
        }
    }
    return fs::path(path);
}

} // namespace audioscribe::infrastructure
