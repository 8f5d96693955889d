#include "app/ConsoleProgress.hpp"

#include "application/Reporter.hpp"

#include <ostream>

namespace audioscribe::app {

ConsoleProgress::ConsoleProgress(std::ostream& out) : m_out(out) {}

void ConsoleProgress::Update(const domain::Job&, domain::Phase phase, std::size_t tick) {
    std::string line = application::Reporter::ProgressLine(phase, tick);
    std::size_t width = line.size();
    if (width < m_lastWidth) {
        line.append(m_lastWidth - width, ' ');
    }
    m_lastWidth = width;
    m_out << '\r' << line << std::flush;
}

void ConsoleProgress::Clear() {
    if (m_lastWidth == 0) return;
    m_out << '\r' << std::string(m_lastWidth, ' ') << '\r' << std::flush;
    m_lastWidth = 0;
}

} // namespace audioscribe::app
