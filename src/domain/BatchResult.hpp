/**
 * @file BatchResult.hpp
 * @brief Aggregate outcome of a sequential batch run.
 */

#pragma once

#include "domain/Job.hpp"

#include <cstddef>
#include <vector>

namespace audioscribe::domain {

struct BatchResult {
    std::vector<JobResult> jobs;   ///< In processing order.
    std::size_t attempted = 0;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    double totalElapsedSeconds = 0.0;
    bool interrupted = false;      ///< Stopped early because the operator cancelled.

    double MeanElapsedSeconds() const {
        return attempted > 0 ? totalElapsedSeconds / static_cast<double>(attempted) : 0.0;
    }

    ErrorKind Outcome() const {
        if (interrupted) return ErrorKind::Interrupted;
        return failed > 0 ? ErrorKind::PartialBatchFailure : ErrorKind::None;
    }
};

} // namespace audioscribe::domain
