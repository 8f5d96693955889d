/**
 * @file Errors.hpp
 * @brief Failure taxonomy shared by the orchestrator components.
 */

#pragma once

#include <string>

namespace audioscribe::domain {

enum class ErrorKind {
    None,
    ConfigurationDefaulted,  ///< Config file missing or malformed; defaults used.
    ReadinessHardFailure,    ///< Preflight check that blocks every job.
    ReadinessSoftWarning,    ///< Preflight check that only degrades output.
    LaunchFailure,           ///< Worker could not be started at all.
    RuntimeFailure,          ///< Worker ran and exited non-zero.
    TimeoutFailure,          ///< Worker exceeded its wall-clock budget and was killed.
    Interrupted,             ///< Operator interrupted the run while the worker was alive.
    PartialBatchFailure      ///< Batch completed but at least one job failed.
};

inline std::string ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::ConfigurationDefaulted: return "configuration_defaulted";
        case ErrorKind::ReadinessHardFailure: return "readiness_hard_failure";
        case ErrorKind::ReadinessSoftWarning: return "readiness_soft_warning";
        case ErrorKind::LaunchFailure: return "launch_failure";
        case ErrorKind::RuntimeFailure: return "runtime_failure";
        case ErrorKind::TimeoutFailure: return "timeout_failure";
        case ErrorKind::Interrupted: return "interrupted";
        case ErrorKind::PartialBatchFailure: return "partial_batch_failure";
    }
    return "unknown";
}

} // namespace audioscribe::domain
