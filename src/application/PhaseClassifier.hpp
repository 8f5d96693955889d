/**
 * @file PhaseClassifier.hpp
 * @brief Maps worker output lines onto the ordered processing phases.
 */

#pragma once

#include "domain/Phase.hpp"

#include <string>
#include <vector>

namespace audioscribe::application {

/**
 * @class PhaseClassifier
 * @brief Pure, ordered (marker, phase) rule table. The phase never regresses.
 */
class PhaseClassifier {
public:
    struct Rule {
        const char* marker;
        domain::Phase phase;
    };

    /**
     * @brief Returns max(current, phase of the first matching rule), or current when no rule matches.
     */
    static domain::Phase Classify(domain::Phase current, const std::string& line);

    /** @brief Rules in the priority order they are tried. */
    static const std::vector<Rule>& Rules();
};

} // namespace audioscribe::application
