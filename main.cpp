#include "app/AudioScribeApp.hpp"

#include <atomic>
#include <csignal>

namespace {

std::atomic<bool> g_cancelRequested{false};

// Async-signal-safe: only raises the flag; the supervision loop does the rest.
void SignalHandler(int) {
    g_cancelRequested.store(true);
}

} // namespace

int main(int argc, char** argv) {
    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);

    audioscribe::app::AudioScribeApp app(g_cancelRequested);
    return app.Run(argc, argv);
}
