/**
 * @file ReadinessReport.hpp
 * @brief Snapshot of preflight checks.
 */

#pragma once

#include "domain/Configuration.hpp"
#include "domain/Errors.hpp"

#include <string>
#include <vector>

namespace audioscribe::domain {

enum class CheckSeverity {
    Passed,
    Warning,
    HardFailure
};

struct ReadinessCheck {
    std::string name;
    CheckSeverity severity = CheckSeverity::Passed;
    std::string message;

    ErrorKind Error() const {
        switch (severity) {
            case CheckSeverity::Warning: return ErrorKind::ReadinessSoftWarning;
            case CheckSeverity::HardFailure: return ErrorKind::ReadinessHardFailure;
            default: return ErrorKind::None;
        }
    }
};

/**
 * @struct ReadinessReport
 * @brief Result of one readiness pass. Not persisted.
 *
 * effective is the configuration jobs should run with; it differs from the input only when
 * a GPU was requested but is not visible, in which case DEVICE is downgraded to cpu.
 */
struct ReadinessReport {
    std::vector<ReadinessCheck> checks;
    Configuration effective;

    bool Ready() const {
        for (const auto& check : checks) {
            if (check.severity == CheckSeverity::HardFailure) return false;
        }
        return true;
    }

    const ReadinessCheck* Find(const std::string& name) const {
        for (const auto& check : checks) {
            if (check.name == name) return &check;
        }
        return nullptr;
    }
};

} // namespace audioscribe::domain
