#include "domain/Configuration.hpp"

#include <algorithm>
#include <cctype>

namespace audioscribe::domain {

namespace {

std::string Trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

bool IsAllDigits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

} // namespace

const std::vector<ConfigKey>& RecognizedKeys() {
    static const std::vector<ConfigKey> keys = {
        {"HF_TOKEN", kPlaceholderToken,
         "HuggingFace token for diarization (https://huggingface.co/settings/tokens)\n"
         "Accept the licenses of pyannote/speaker-diarization-3.1 and pyannote/segmentation-3.0"},
        {"WHISPER_MODEL", "large-v3", "Whisper model (tiny, base, small, medium, large-v1, large-v2, large-v3)"},
        {"LANGUAGE", "ru", "Audio language (ru, en, ... or auto for detection)"},
        {"BATCH_SIZE", "16", "Batch size (larger is faster but needs more GPU memory)"},
        {"DEVICE", "cuda", "Compute device (cuda or cpu)"},
        {"ENABLE_DIARIZATION", "true", "Enable speaker diarization"},
        {"MIN_SPEAKERS", "", "Minimum number of speakers (empty for auto detection)"},
        {"MAX_SPEAKERS", "", "Maximum number of speakers (empty for auto detection)"},
        {"COMPUTE_TYPE", "float16", "Numeric precision (float16, float32, int8)"},
        {"VAD_METHOD", "pyannote", "Voice activity detection method (pyannote, silero)"},
        {"CHUNK_SIZE", "30", "Chunk size in seconds"},
        {"WORKER_MODE", "docker", "How the worker runs: docker (container image) or native (binary on PATH)"},
        {"WORKER_IMAGE", "ghcr.io/jim60105/whisperx:latest", "Worker container image"},
        {"WORKER_BINARY", "whisperx", "Worker executable used in native mode"},
        {"USE_SUDO", "true", "Run container runtime commands through sudo"},
        {"GPU_PROBE_IMAGE", "nvidia/cuda:12.4.1-base-ubuntu22.04", "Image used to check GPU visibility"},
        {"JOB_TIMEOUT", "0", "Per-file timeout in seconds (0 disables it)"},
        {"POLL_INTERVAL_MS", "100", "Worker output poll interval in milliseconds"},
    };
    return keys;
}

Configuration::Configuration() {
    for (const auto& key : RecognizedKeys()) {
        m_values[key.name] = key.defaultValue;
    }
}

Configuration::Configuration(const std::map<std::string, std::string>& values)
    : Configuration() {
    for (const auto& [key, value] : values) {
        m_values[key] = value;
    }
}

std::string Configuration::Get(const std::string& key) const {
    auto it = m_values.find(key);
    return it != m_values.end() ? it->second : std::string();
}

std::optional<int> Configuration::GetInt(const std::string& key) const {
    std::string value = Trim(Get(key));
    if (!IsAllDigits(value)) return std::nullopt;
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

bool Configuration::GetBool(const std::string& key) const {
    std::string value = Trim(Get(key));
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return std::tolower(c); });
    return value == "true" || value == "1" || value == "yes";
}

Configuration Configuration::With(const std::string& key, const std::string& value) const {
    Configuration copy(*this);
    copy.m_values[key] = value;
    return copy;
}

std::optional<std::string> Configuration::CredentialToken() const {
    std::string token = Trim(Get("HF_TOKEN"));
    if (token.empty() || token == kPlaceholderToken) return std::nullopt;
    return token;
}

std::optional<int> Configuration::SpeakerHint(const std::string& key) const {
    auto value = GetInt(key);
    if (value && *value > 0) return value;
    return std::nullopt;
}

} // namespace audioscribe::domain
