#include <cassert>
#include <cstdlib>
#include <iostream>

#include "infrastructure/PathUtils.hpp"
#include "infrastructure/WorkspaceManager.hpp"
#include "test/TestSupport.hpp"

namespace fs = std::filesystem;
using namespace audioscribe;
using infrastructure::WorkspaceManager;

int main() {
    std::cout << "[Test] Starting WorkspaceManager tests..." << std::endl;
    auto root = test::MakeScratchDir("workspace");

    // Point the shared cache at the scratch dir so the test never touches the real home.
    ::setenv("HOME", root.c_str(), 1);

    {
        std::cout << "[Test] Workspace layout and creation..." << std::endl;
        auto ws = WorkspaceManager::FromRoot(root / "project");
        assert(ws.input == root / "project" / "audio");
        assert(ws.output == root / "project" / "results");
        assert(ws.cache == root / "whisperx");
        assert(infrastructure::PathUtils::GetWorkerCacheDir() == ws.cache);

        std::string error;
        assert(WorkspaceManager::Ensure(ws, error));
        assert(fs::is_directory(ws.input) && fs::is_directory(ws.output) && fs::is_directory(ws.cache));

        // Idempotent and non-destructive.
        test::WriteFile(ws.cache / "model.bin", "weights");
        assert(WorkspaceManager::Ensure(ws, error));
        assert(fs::exists(ws.cache / "model.bin"));
        std::cout << "[PASS] Directories created, existing content kept" << std::endl;
    }

    {
        std::cout << "[Test] Ensure fails when a path is occupied by a file..." << std::endl;
        domain::Workspace ws{root / "blocked_in", root / "blocked_out", root / "blocked_cache"};
        test::WriteFile(ws.output, "file in the way");
        std::string error;
        assert(!WorkspaceManager::Ensure(ws, error));
        assert(!error.empty());
        std::cout << "[PASS] " << error << std::endl;
    }

    {
        std::cout << "[Test] Output directory resolution..." << std::endl;
        domain::Workspace ws{root / "in", root / "out", root / "cache"};
        assert(WorkspaceManager::ResolveJobOutputDir(ws, root / "in" / "meeting.mp3") == root / "out" / "meeting");
        assert(WorkspaceManager::ResolveJobOutputDir(ws, "/elsewhere/meeting.mp3") == root / "out" / "meeting");
        std::cout << "[PASS] output/<stem>" << std::endl;
    }

    {
        std::cout << "[Test] Media discovery..." << std::endl;
        fs::path dir = root / "media";
        test::WriteFile(dir / "b.MP3", "x");
        test::WriteFile(dir / "a.wav", "x");
        test::WriteFile(dir / "nested" / "c.m4a", "x");
        test::WriteFile(dir / "notes.txt", "x");
        test::WriteFile(dir / "cover.jpg", "x");

        auto files = WorkspaceManager::DiscoverMediaFiles(dir);
        assert(files.size() == 3);
        assert(files[0].filename() == "a.wav");
        assert(files[1].filename() == "b.MP3");
        assert(files[2].filename() == "c.m4a");
        assert(WorkspaceManager::DiscoverMediaFiles(root / "does_not_exist").empty());
        assert(WorkspaceManager::IsMediaFile("clip.WEBM"));
        assert(!WorkspaceManager::IsMediaFile("clip"));
        std::cout << "[PASS] Sorted, recursive, case-insensitive extensions" << std::endl;
    }

    {
        std::cout << "[Test] ExpandUser..." << std::endl;
        assert(infrastructure::PathUtils::ExpandUser("~/audio") == root / "audio");
        assert(infrastructure::PathUtils::ExpandUser("/abs/path") == fs::path("/abs/path"));
        std::cout << "[PASS] ~ expanded" << std::endl;
    }

    fs::remove_all(root);
    std::cout << "[PASS] All WorkspaceManager tests passed." << std::endl;
    return 0;
}
