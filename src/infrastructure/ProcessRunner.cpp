/**
 * @file ProcessRunner.cpp
 * @brief Implementation of ProcessRunner.
 */

#include "infrastructure/ProcessRunner.hpp"
#include "domain/PipelineErrors.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace adaharvest::infrastructure {

namespace {

void KillGroup(pid_t pid) {
    ::kill(-pid, SIGTERM);
    for (int i = 0; i < 20; ++i) {
        int status = 0;
        if (::waitpid(pid, &status, WNOHANG) == pid) return;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    ::kill(-pid, SIGKILL);
    int status = 0;
    ::waitpid(pid, &status, 0);
}

bool Drain(int fd, std::string& sink) {
    char buffer[8192];
    ssize_t n = ::read(fd, buffer, sizeof(buffer));
    if (n > 0) {
        sink.append(buffer, static_cast<size_t>(n));
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) return true;
    return false; // EOF or error
}

} // namespace

ProcessRunner::Result ProcessRunner::Run(const std::vector<std::string>& argv,
                                         const domain::CancellationToken& token,
                                         std::chrono::seconds timeout) {
    if (argv.empty()) {
        throw std::invalid_argument("ProcessRunner: empty command line");
    }
    if (token.isCancelled()) {
        throw domain::CancelledError();
    }

    int outPipe[2];
    int errPipe[2];
    if (::pipe2(outPipe, O_CLOEXEC) != 0) {
        throw std::runtime_error(std::string("pipe failed: ") + std::strerror(errno));
    }
    if (::pipe2(errPipe, O_CLOEXEC) != 0) {
        ::close(outPipe[0]);
        ::close(outPipe[1]);
        throw std::runtime_error(std::string("pipe failed: ") + std::strerror(errno));
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        for (int fd : {outPipe[0], outPipe[1], errPipe[0], errPipe[1]}) ::close(fd);
        throw std::runtime_error(std::string("fork failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);
        int devNull = ::open("/dev/null", O_RDONLY);
        if (devNull >= 0) ::dup2(devNull, STDIN_FILENO);
        ::execvp(args[0], args.data());
        _exit(127);
    }

    ::setpgid(pid, pid);
    ::close(outPipe[1]);
    ::close(errPipe[1]);

    Result result;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    bool outOpen = true;
    bool errOpen = true;
    bool cancelled = false;
    int pollErrno = 0;

    while (outOpen || errOpen) {
        if (token.isCancelled()) {
            cancelled = true;
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            result.timedOut = true;
            break;
        }

        pollfd fds[2];
        nfds_t count = 0;
        if (outOpen) fds[count++] = {outPipe[0], POLLIN, 0};
        if (errOpen) fds[count++] = {errPipe[0], POLLIN, 0};

        int rc = ::poll(fds, count, 200);
        if (rc < 0 && errno != EINTR) {
            pollErrno = errno;
            break;
        }
        if (rc <= 0) continue;

        for (nfds_t i = 0; i < count; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            bool isOut = fds[i].fd == outPipe[0];
            bool open = Drain(fds[i].fd, isOut ? result.out : result.err);
            if (!open) {
                if (isOut) outOpen = false; else errOpen = false;
            }
        }
    }

    ::close(outPipe[0]);
    ::close(errPipe[0]);

    // The child is abandoned on every early exit; never leave it running.
    if (cancelled || result.timedOut || pollErrno != 0) {
        KillGroup(pid);
        if (cancelled) throw domain::CancelledError();
        if (pollErrno != 0) {
            throw std::runtime_error(std::string("poll failed: ") + std::strerror(pollErrno));
        }
        return result;
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::runtime_error(std::string("waitpid failed: ") + std::strerror(errno));
        }
    }
    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else {
        result.exitCode = 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
    }
    return result;
}

bool ProcessRunner::HasTool(const std::string& tool) {
    std::string cmd = "command -v " + tool + " >/dev/null 2>&1";
    int result = std::system(cmd.c_str());
    return result == 0;
}

} // namespace adaharvest::infrastructure
