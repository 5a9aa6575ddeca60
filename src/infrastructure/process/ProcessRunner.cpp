#include "infrastructure/process/ProcessRunner.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace resetwatch::infra {

namespace {

constexpr std::chrono::milliseconds kReapPollInterval{10};

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Reads what is available; closes the descriptor on EOF or error.
void drain(int& fd, std::string& sink) {
    std::array<char, 4096> buf{};
    ssize_t n = ::read(fd, buf.data(), buf.size());
    if (n > 0) {
        sink.append(buf.data(), static_cast<std::size_t>(n));
    } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
        closeFd(fd);
    }
}

} // namespace

ProcessResult ProcessRunner::run(const std::string& binary, const std::vector<std::string>& args,
                                 std::chrono::milliseconds timeout) {
    ProcessResult result;

    if (::access(binary.c_str(), X_OK) != 0) {
        result.errors = binary + ": " + std::strerror(errno);
        spdlog::error("Cannot execute {}: {}", binary, std::strerror(errno));
        return result;
    }

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    if (::pipe2(outPipe, O_CLOEXEC) != 0) {
        result.errors = std::string("pipe: ") + std::strerror(errno);
        return result;
    }
    if (::pipe2(errPipe, O_CLOEXEC) != 0) {
        result.errors = std::string("pipe: ") + std::strerror(errno);
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        return result;
    }

    // argv is built before fork so the child only calls async-signal-safe functions.
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(binary.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        result.errors = std::string("fork: ") + std::strerror(errno);
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        closeFd(errPipe[0]);
        closeFd(errPipe[1]);
        return result;
    }

    if (pid == 0) {
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);
        ::execv(binary.c_str(), argv.data());
        ::_exit(127);
    }

    result.started = true;
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);

    int outFd = outPipe[0];
    int errFd = errPipe[0];
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (outFd >= 0 || errFd >= 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.timedOut = true;
            break;
        }

        std::array<pollfd, 2> fds{};
        fds[0] = {outFd, POLLIN, 0};
        fds[1] = {errFd, POLLIN, 0};

        int ready = ::poll(fds.data(), fds.size(), static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("poll on {} output failed: {}", binary, std::strerror(errno));
            result.timedOut = true;
            break;
        }

        if (outFd >= 0 && (fds[0].revents & (POLLIN | POLLHUP | POLLERR))) {
            drain(outFd, result.output);
        }
        if (errFd >= 0 && (fds[1].revents & (POLLIN | POLLHUP | POLLERR))) {
            drain(errFd, result.errors);
        }
    }

    closeFd(outFd);
    closeFd(errFd);

    // The child may close its pipes and keep running, so reaping is bounded
    // by the same deadline.
    int status = 0;
    bool reaped = false;
    while (!result.timedOut) {
        pid_t waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            reaped = true;
            break;
        }
        if (waited < 0 && errno != EINTR) {
            spdlog::error("waitpid for {} failed: {}", binary, std::strerror(errno));
            return result;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            result.timedOut = true;
            break;
        }
        std::this_thread::sleep_for(kReapPollInterval);
    }

    if (!reaped) {
        ::kill(pid, SIGKILL);
        while (::waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) {
                spdlog::error("waitpid for {} failed: {}", binary, std::strerror(errno));
                return result;
            }
        }
    }

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    }
    return result;
}

} // namespace resetwatch::infra
