#pragma once

#include "domain/Job.hpp"

#include <cstddef>
#include <iosfwd>
#include <string>

namespace audioscribe::app {

/**
 * @class ConsoleProgress
 * @brief Keeps a single spinner line up to date with carriage returns.
 */
class ConsoleProgress {
public:
    explicit ConsoleProgress(std::ostream& out);

    void Update(const domain::Job& job, domain::Phase phase, std::size_t tick);

    /** @brief Erases the spinner line so the next output starts on a clean line. */
    void Clear();

private:
    std::ostream& m_out;
    std::size_t m_lastWidth = 0;
};

} // namespace audioscribe::app
