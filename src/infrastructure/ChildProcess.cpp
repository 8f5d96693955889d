/**
 * @file ChildProcess.cpp
 * @brief POSIX implementation of ChildProcess (fork/exec, poll, process groups).
 */

#include "infrastructure/ChildProcess.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <set>
#include <thread>

extern char** environ;

namespace audioscribe::infrastructure {

namespace {

constexpr std::size_t kReadChunk = 4096;

void CloseFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void ClosePipe(int fds[2]) {
    CloseFd(fds[0]);
    CloseFd(fds[1]);
}

std::vector<std::string> BuildEnvironment(const std::vector<std::pair<std::string, std::string>>& overrides) {
    std::set<std::string> overridden;
    for (const auto& [key, value] : overrides) {
        overridden.insert(key);
    }

    std::vector<std::string> env;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string item(*entry);
        std::string key = item.substr(0, item.find('='));
        if (overridden.count(key) == 0) {
            env.push_back(std::move(item));
        }
    }
    for (const auto& [key, value] : overrides) {
        env.push_back(key + "=" + value);
    }
    return env;
}

std::vector<char*> ToArgv(std::vector<std::string>& items) {
    std::vector<char*> argv;
    argv.reserve(items.size() + 1);
    for (auto& item : items) {
        argv.push_back(item.data());
    }
    argv.push_back(nullptr);
    return argv;
}

} // namespace

std::unique_ptr<ChildProcess> ChildProcess::Spawn(const ProcessSpec& spec, std::string& error) {
    if (spec.executable.empty()) {
        error = "No executable given.";
        return nullptr;
    }

    // Everything the child needs is prepared before fork().
    std::vector<std::string> argStrings;
    argStrings.push_back(spec.executable);
    argStrings.insert(argStrings.end(), spec.arguments.begin(), spec.arguments.end());
    std::vector<std::string> envStrings = BuildEnvironment(spec.environment);
    std::vector<char*> argv = ToArgv(argStrings);
    std::vector<char*> envp = ToArgv(envStrings);

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int statusPipe[2] = {-1, -1};
    if (::pipe2(outPipe, O_CLOEXEC) != 0 || ::pipe2(errPipe, O_CLOEXEC) != 0 ||
        ::pipe2(statusPipe, O_CLOEXEC) != 0) {
        error = std::string("pipe() failed: ") + std::strerror(errno);
        ClosePipe(outPipe);
        ClosePipe(errPipe);
        ClosePipe(statusPipe);
        return nullptr;
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        error = std::string("fork() failed: ") + std::strerror(errno);
        ClosePipe(outPipe);
        ClosePipe(errPipe);
        ClosePipe(statusPipe);
        return nullptr;
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        int devNull = ::open("/dev/null", O_RDONLY);
        if (devNull >= 0) ::dup2(devNull, STDIN_FILENO);
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);
        ::execvpe(argv[0], argv.data(), envp.data());

        // Only reached when exec failed; the parent reads errno from the status pipe.
        int execErrno = errno;
        ssize_t ignored = ::write(statusPipe[1], &execErrno, sizeof(execErrno));
        (void)ignored;
        ::_exit(127);
    }

    ::setpgid(pid, pid);
    CloseFd(outPipe[1]);
    CloseFd(errPipe[1]);
    CloseFd(statusPipe[1]);

    int execErrno = 0;
    ssize_t n;
    do {
        n = ::read(statusPipe[0], &execErrno, sizeof(execErrno));
    } while (n < 0 && errno == EINTR);
    CloseFd(statusPipe[0]);

    if (n > 0) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        CloseFd(outPipe[0]);
        CloseFd(errPipe[0]);
        error = "Cannot execute '" + spec.executable + "': " + std::strerror(execErrno);
        return nullptr;
    }

    ::fcntl(outPipe[0], F_SETFL, ::fcntl(outPipe[0], F_GETFL) | O_NONBLOCK);
    ::fcntl(errPipe[0], F_SETFL, ::fcntl(errPipe[0], F_GETFL) | O_NONBLOCK);

    return std::make_unique<ChildProcess>(SpawnKey{}, pid, outPipe[0], errPipe[0]);
}

ChildProcess::ChildProcess(SpawnKey, pid_t pid, int stdoutFd, int stderrFd)
    : m_pid(pid)
    , m_stdoutFd(stdoutFd)
    , m_stderrFd(stderrFd)
{}

ChildProcess::~ChildProcess() {
    if (!m_exited) {
        Kill();
    }
    CloseFd(m_stdoutFd);
    CloseFd(m_stderrFd);
}

std::vector<OutputLine> ChildProcess::ReadLines(std::chrono::milliseconds wait) {
    std::vector<OutputLine> lines;

    pollfd fds[2];
    nfds_t count = 0;
    if (m_stdoutFd >= 0) fds[count++] = pollfd{m_stdoutFd, POLLIN, 0};
    if (m_stderrFd >= 0) fds[count++] = pollfd{m_stderrFd, POLLIN, 0};

    if (count == 0) {
        // The child closed both streams but may still be running.
        std::this_thread::sleep_for(wait);
        return lines;
    }

    int ready = ::poll(fds, count, static_cast<int>(wait.count()));
    if (ready <= 0) {
        return lines; // Timeout, or EINTR which the caller treats the same way.
    }

    for (nfds_t i = 0; i < count; ++i) {
        if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;
        if (fds[i].fd == m_stdoutFd) {
            ReadAvailable(m_stdoutFd, m_stdoutBuffer, OutputStream::Stdout, lines);
        } else if (fds[i].fd == m_stderrFd) {
            ReadAvailable(m_stderrFd, m_stderrBuffer, OutputStream::Stderr, lines);
        }
    }
    return lines;
}

std::vector<OutputLine> ChildProcess::Drain(std::chrono::milliseconds budget) {
    std::vector<OutputLine> lines;
    auto deadline = std::chrono::steady_clock::now() + budget;
    while (!OutputClosed() && std::chrono::steady_clock::now() < deadline) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        auto chunk = ReadLines(std::max(remaining, std::chrono::milliseconds(1)));
        lines.insert(lines.end(), chunk.begin(), chunk.end());
    }
    FlushPartial(lines);
    return lines;
}

void ChildProcess::ReadAvailable(int& fd, std::string& buffer, OutputStream stream, std::vector<OutputLine>& lines) {
    char chunk[kReadChunk];
    while (fd >= 0) {
        ssize_t n = ::read(fd, chunk, sizeof(chunk));
        if (n > 0) {
            buffer.append(chunk, static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;

        // EOF or a hard read error: the stream is finished.
        CloseFd(fd);
        SplitLines(buffer, stream, lines);
        if (!buffer.empty()) {
            lines.push_back(OutputLine{stream, buffer});
            buffer.clear();
        }
        return;
    }
    SplitLines(buffer, stream, lines);
}

void ChildProcess::SplitLines(std::string& buffer, OutputStream stream, std::vector<OutputLine>& lines) {
    std::size_t start = 0;
    for (std::size_t i = 0; i < buffer.size(); ++i) {
        if (buffer[i] != '\n' && buffer[i] != '\r') continue;
        if (i > start) {
            lines.push_back(OutputLine{stream, buffer.substr(start, i - start)});
        }
        start = i + 1;
    }
    buffer.erase(0, start);
}

void ChildProcess::FlushPartial(std::vector<OutputLine>& lines) {
    if (!m_stdoutBuffer.empty()) {
        lines.push_back(OutputLine{OutputStream::Stdout, m_stdoutBuffer});
        m_stdoutBuffer.clear();
    }
    if (!m_stderrBuffer.empty()) {
        lines.push_back(OutputLine{OutputStream::Stderr, m_stderrBuffer});
        m_stderrBuffer.clear();
    }
}

bool ChildProcess::TryWait() {
    if (m_exited) return true;
    int status = 0;
    pid_t r = ::waitpid(m_pid, &status, WNOHANG);
    if (r == m_pid) {
        RecordStatus(status);
    } else if (r < 0 && errno == ECHILD) {
        // Reaped elsewhere; nothing more can be learned about it.
        m_exited = true;
    }
    return m_exited;
}

void ChildProcess::Kill() {
    if (m_exited) return;
    ::kill(-m_pid, SIGKILL);
    ::kill(m_pid, SIGKILL);
    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(m_pid, &status, 0);
    } while (r < 0 && errno == EINTR);
    if (r == m_pid) {
        RecordStatus(status);
    } else {
        m_exited = true;
    }
}

void ChildProcess::RecordStatus(int status) {
    m_exited = true;
    if (WIFEXITED(status)) {
        m_exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        m_exitCode = 128 + WTERMSIG(status);
    }
}

} // namespace audioscribe::infrastructure
