/**
 * @file Phase.hpp
 * @brief Coarse processing stage inferred from worker output.
 */

#pragma once

#include <string>

namespace audioscribe::domain {

/**
 * @enum Phase
 * @brief Totally ordered processing stages. The numeric value is the order.
 */
enum class Phase : int {
    Initializing = 0,
    DetectingSpeech = 1,
    Transcribing = 2,
    Aligning = 3,
    Diarizing = 4,
    Finalizing = 5
};

inline int PhaseOrder(Phase phase) { return static_cast<int>(phase); }

inline Phase MaxPhase(Phase a, Phase b) { return PhaseOrder(a) >= PhaseOrder(b) ? a : b; }

/** @brief Short machine-friendly name, used in JSON status payloads. */
inline std::string PhaseName(Phase phase) {
    switch (phase) {
        case Phase::Initializing: return "initializing";
        case Phase::DetectingSpeech: return "detecting_speech";
        case Phase::Transcribing: return "transcribing";
        case Phase::Aligning: return "aligning";
        case Phase::Diarizing: return "diarizing";
        case Phase::Finalizing: return "finalizing";
    }
    return "unknown";
}

} // namespace audioscribe::domain
