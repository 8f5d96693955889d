/**
 * @file Workspace.hpp
 * @brief Directory roles used by a run.
 */

#pragma once

#include <filesystem>

namespace audioscribe::domain {

/**
 * @struct Workspace
 * @brief Input media, per-job result trees and the shared model cache.
 *
 * The cache outlives every run; output subdirectories belong to one input file each.
 */
struct Workspace {
    std::filesystem::path input;
    std::filesystem::path output;
    std::filesystem::path cache;
};

} // namespace audioscribe::domain
