/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading the operator configuration (config.env).
 *
 * Loading never fails the caller. A missing file is created from the documented defaults, a
 * malformed one is moved to `<path>.bak` and recreated, and an unreadable one is left alone.
 * In every one of these cases the built-in defaults are used for this call.
 */

#pragma once

#include "domain/Configuration.hpp"
#include "domain/Errors.hpp"

#include <filesystem>
#include <string>

namespace audioscribe::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Reads KEY=value lines from `path`.
     * @param status Optional; set to ConfigurationDefaulted when the defaults were used.
     * @return A configuration where every recognized key has a value.
     */
    static domain::Configuration Load(const std::filesystem::path& path, domain::ErrorKind* status = nullptr);

    /**
     * @brief Writes the documented default configuration to `path`.
     * Note: an existing file at `path` is overwritten.
     */
    static bool WriteDefault(const std::filesystem::path& path, std::string& error);

    /** @brief Text of the documented default file. */
    static std::string DefaultFileContent();
};

} // namespace audioscribe::infrastructure
