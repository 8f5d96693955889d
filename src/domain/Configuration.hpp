/**
 * @file Configuration.hpp
 * @brief Immutable snapshot of operator settings consumed by the orchestrator.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace audioscribe::domain {

/** @brief Credential value shipped in the default config file; treated as "no token". */
inline constexpr const char* kPlaceholderToken = "your_token_here";

/**
 * @struct ConfigKey
 * @brief A recognized setting with its built-in default and documentation comment.
 */
struct ConfigKey {
    const char* name;
    const char* defaultValue;
    const char* comment;
};

/** @brief Canonical key set, in the order the default config file lists them. */
const std::vector<ConfigKey>& RecognizedKeys();

/**
 * @class Configuration
 * @brief Immutable key/value settings where every recognized key has a defined value.
 *
 * Unknown keys read from a file are kept verbatim and returned by Get() but never validated.
 */
class Configuration {
public:
    /** @brief Builds a configuration holding only the built-in defaults. */
    Configuration();

    /** @brief Builds a configuration from file values layered over the defaults. */
    explicit Configuration(const std::map<std::string, std::string>& values);

    std::string Get(const std::string& key) const;
    std::optional<int> GetInt(const std::string& key) const;
    bool GetBool(const std::string& key) const;

    /** @brief Returns a copy with one setting replaced. */
    Configuration With(const std::string& key, const std::string& value) const;

    const std::map<std::string, std::string>& Values() const { return m_values; }

    // Typed accessors for the canonical keys.
    std::string Model() const { return Get("WHISPER_MODEL"); }
    std::string Language() const { return Get("LANGUAGE"); }
    std::string Device() const { return Get("DEVICE"); }
    std::string ComputeType() const { return Get("COMPUTE_TYPE"); }
    std::string WorkerMode() const { return Get("WORKER_MODE"); }
    std::string WorkerImage() const { return Get("WORKER_IMAGE"); }
    std::string WorkerBinary() const { return Get("WORKER_BINARY"); }
    bool UseGpu() const { return Device() == "cuda"; }
    bool DiarizationEnabled() const { return GetBool("ENABLE_DIARIZATION"); }
    bool UseSudo() const { return GetBool("USE_SUDO"); }

    /** @brief Token value, or nullopt when empty or still the placeholder. */
    std::optional<std::string> CredentialToken() const;

    /** @brief Speaker hint, only when configured as a positive integer. */
    std::optional<int> SpeakerHint(const std::string& key) const;

private:
    std::map<std::string, std::string> m_values;
};

} // namespace audioscribe::domain
