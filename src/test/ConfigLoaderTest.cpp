#include <cassert>
#include <iostream>

#include "infrastructure/ConfigLoader.hpp"
#include "test/TestSupport.hpp"

namespace fs = std::filesystem;
using namespace audioscribe;
using infrastructure::ConfigLoader;

int main() {
    std::cout << "[Test] Starting ConfigLoader tests..." << std::endl;
    auto root = test::MakeScratchDir("config");

    {
        std::cout << "[Test] Missing file is created with defaults..." << std::endl;
        fs::path path = root / "config.env";
        domain::ErrorKind status = domain::ErrorKind::None;
        auto config = ConfigLoader::Load(path, &status);

        assert(status == domain::ErrorKind::ConfigurationDefaulted);
        assert(fs::exists(path));
        assert(config.Model() == "large-v3");
        assert(config.Language() == "ru");
        assert(config.Get("BATCH_SIZE") == "16");
        assert(config.Device() == "cuda");
        assert(config.DiarizationEnabled());
        assert(!config.CredentialToken());

        // The file written is itself loadable and yields the same values.
        domain::ErrorKind second = domain::ErrorKind::ConfigurationDefaulted;
        auto reloaded = ConfigLoader::Load(path, &second);
        assert(second == domain::ErrorKind::None);
        assert(reloaded.Values() == config.Values());
        std::cout << "[PASS] Default file written and round-trips" << std::endl;
    }

    {
        std::cout << "[Test] Comments, blanks, whitespace and quotes..." << std::endl;
        fs::path path = root / "custom.env";
        test::WriteFile(path,
                        "# comment\n"
                        "\n"
                        "HF_TOKEN = \"hf_abc123\"\n"
                        "  WHISPER_MODEL=medium  \n"
                        "LANGUAGE='en'\n"
                        "MIN_SPEAKERS=2\n"
                        "MAX_SPEAKERS=0\n"
                        "ENABLE_DIARIZATION=False\n");
        domain::ErrorKind status = domain::ErrorKind::ConfigurationDefaulted;
        auto config = ConfigLoader::Load(path, &status);

        assert(status == domain::ErrorKind::None);
        assert(config.CredentialToken() == std::optional<std::string>("hf_abc123"));
        assert(config.Model() == "medium");
        assert(config.Language() == "en");
        assert(config.SpeakerHint("MIN_SPEAKERS") == std::optional<int>(2));
        assert(!config.SpeakerHint("MAX_SPEAKERS"));
        assert(!config.DiarizationEnabled());
        // Keys not in the file keep their defaults.
        assert(config.ComputeType() == "float16");
        std::cout << "[PASS] Parsed overrides over defaults" << std::endl;
    }

    {
        std::cout << "[Test] Malformed file is backed up and replaced..." << std::endl;
        fs::path path = root / "broken.env";
        test::WriteFile(path, "WHISPER_MODEL=small\nthis line has no separator\n");
        domain::ErrorKind status = domain::ErrorKind::None;
        auto config = ConfigLoader::Load(path, &status);

        assert(status == domain::ErrorKind::ConfigurationDefaulted);
        assert(config.Model() == "large-v3");
        fs::path backup = root / "broken.env.bak";
        assert(fs::exists(backup));
        assert(test::ReadFile(backup).find("no separator") != std::string::npos);
        assert(test::ReadFile(path) == ConfigLoader::DefaultFileContent());
        std::cout << "[PASS] Backup kept, defaults in effect" << std::endl;
    }

    {
        std::cout << "[Test] Unreadable path falls back to defaults without writing..." << std::endl;
        fs::path path = root / "a_directory.env";
        fs::create_directories(path);
        domain::ErrorKind status = domain::ErrorKind::None;
        auto config = ConfigLoader::Load(path, &status);
        assert(status == domain::ErrorKind::ConfigurationDefaulted);
        assert(config.Model() == "large-v3");
        assert(fs::is_directory(path));
        std::cout << "[PASS] Defaults used" << std::endl;
    }

    {
        std::cout << "[Test] Configuration derivation..." << std::endl;
        domain::Configuration base;
        auto cpu = base.With("DEVICE", "cpu");
        assert(base.UseGpu());
        assert(!cpu.UseGpu());
        assert(!base.GetInt("MIN_SPEAKERS"));
        assert(!base.With("BATCH_SIZE", "-4").GetInt("BATCH_SIZE"));
        assert(base.With("USE_SUDO", "yes").UseSudo());
        std::cout << "[PASS] With() leaves the original untouched" << std::endl;
    }

    fs::remove_all(root);
    std::cout << "[PASS] All ConfigLoader tests passed." << std::endl;
    return 0;
}
