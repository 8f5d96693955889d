/**
 * @file ChildProcess.hpp
 * @brief Supervised child process with line-oriented, non-blocking output capture.
 */

#pragma once

#include <sys/types.h>

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace audioscribe::infrastructure {

struct ProcessSpec {
    std::string executable;
    std::vector<std::string> arguments;
    /** @brief Added to (or overriding) the inherited environment. */
    std::vector<std::pair<std::string, std::string>> environment;
};

enum class OutputStream {
    Stdout,
    Stderr
};

struct OutputLine {
    OutputStream stream;
    std::string text;
};

/**
 * @class ChildProcess
 * @brief Owns one running child: its pid, its process group and its output pipes.
 *
 * The child runs in its own process group so Kill() also reaches anything it spawned.
 * Destroying a ChildProcess that is still running kills and reaps it.
 */
class ChildProcess {
public:
    /**
     * @brief Starts the child.
     * @param error Populated when the executable cannot be started (not found, not executable...).
     * @return The running child, or nullptr on launch failure.
     */
    static std::unique_ptr<ChildProcess> Spawn(const ProcessSpec& spec, std::string& error);

    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    /**
     * @brief Waits at most `wait` for output and returns the complete lines received.
     *
     * Lines are returned in arrival order per stream. '\r' also ends a line so progress bars
     * that redraw in place are observed as they update.
     */
    std::vector<OutputLine> ReadLines(std::chrono::milliseconds wait);

    /** @brief Reads whatever is left after exit, bounded by `budget`, including partial lines. */
    std::vector<OutputLine> Drain(std::chrono::milliseconds budget);

    /** @brief Non-blocking reap. Returns true once the child has exited. */
    bool TryWait();

    /** @brief Forcibly terminates the whole process group and reaps the child. */
    void Kill();

    bool OutputClosed() const { return m_stdoutFd < 0 && m_stderrFd < 0; }

    /** @brief Exit status; 128 + signal number when the child was killed by a signal. */
    int ExitCode() const { return m_exitCode; }

private:
    struct SpawnKey {
        explicit SpawnKey() = default;
    };

public:
    /** @brief Only reachable through Spawn(). */
    ChildProcess(SpawnKey, pid_t pid, int stdoutFd, int stderrFd);

private:
    void ReadAvailable(int& fd, std::string& buffer, OutputStream stream, std::vector<OutputLine>& lines);
    static void SplitLines(std::string& buffer, OutputStream stream, std::vector<OutputLine>& lines);
    void FlushPartial(std::vector<OutputLine>& lines);
    void RecordStatus(int status);

    pid_t m_pid;
    int m_stdoutFd;
    int m_stderrFd;
    std::string m_stdoutBuffer;
    std::string m_stderrBuffer;
    bool m_exited = false;
    int m_exitCode = -1;
};

} // namespace audioscribe::infrastructure
