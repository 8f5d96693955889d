#include "application/PhaseClassifier.hpp"

namespace audioscribe::application {

const std::vector<PhaseClassifier::Rule>& PhaseClassifier::Rules() {
    static const std::vector<Rule> rules = {
        {"Performing VAD", domain::Phase::DetectingSpeech},
        {"voice activity detection", domain::Phase::DetectingSpeech},
        {"Performing transcription", domain::Phase::Transcribing},
        {"Performing alignment", domain::Phase::Aligning},
        {"Performing diarization", domain::Phase::Diarizing},
    };
    return rules;
}

domain::Phase PhaseClassifier::Classify(domain::Phase current, const std::string& line) {
    for (const auto& rule : Rules()) {
        if (line.find(rule.marker) != std::string::npos) {
            return domain::MaxPhase(current, rule.phase);
        }
    }
    return current;
}

} // namespace audioscribe::application
