#include "process/ProcessRunner.h"
#include "core/Errors.h"
#include "utils/Logger.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <limits>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace {

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

int decodeStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// Reads what is available; returns false on EOF or error
bool drain(int fd, std::string& into) {
    char buffer[4096];
    while (true) {
        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            into.append(buffer, static_cast<size_t>(n));
            if (static_cast<size_t>(n) < sizeof(buffer)) return true;
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return true;
        return false;
    }
}

std::string describeCommand(const std::string& command, const std::vector<std::string>& args) {
    std::string out = command;
    for (const auto& a : args) out += " " + a;
    return out;
}

}

ProcessRunner::ProcessRunner(std::chrono::milliseconds killGrace) : killGrace(killGrace) {}

int ProcessRunner::terminate(int pid) {
    ::kill(-pid, SIGTERM);

    auto deadline = std::chrono::steady_clock::now() + killGrace;
    int status = 0;
    while (std::chrono::steady_clock::now() < deadline) {
        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) return decodeStatus(status);
        if (r < 0 && errno != EINTR) return -1;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    ::kill(-pid, SIGKILL);
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    return decodeStatus(status);
}

ProcessResult ProcessRunner::run(const std::string& command,
                                 const std::vector<std::string>& args,
                                 const fs::path& workingDirectory,
                                 std::chrono::milliseconds timeout) {
    if (command.empty()) {
        throw ExecutionFailure("Failed to execute command: empty command");
    }
    if (timeout > kMaxTimeout) timeout = kMaxTimeout;

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int execPipe[2] = {-1, -1};  // exec 失败时子进程写入 errno
    // 全部 O_CLOEXEC: 其他线程并发 fork 出的子进程不能继承这里的写端; dup2 到 1/2 时标志被清除
    if (::pipe2(outPipe, O_CLOEXEC) != 0 || ::pipe2(errPipe, O_CLOEXEC) != 0 ||
        ::pipe2(execPipe, O_CLOEXEC) != 0) {
        std::string reason = std::strerror(errno);
        closeFd(outPipe[0]); closeFd(outPipe[1]);
        closeFd(errPipe[0]); closeFd(errPipe[1]);
        closeFd(execPipe[0]); closeFd(execPipe[1]);
        throw ExecutionFailure("Failed to execute command: pipe failed: " + reason);
    }

    std::vector<char*> cargs;
    cargs.reserve(args.size() + 2);
    cargs.push_back(const_cast<char*>(command.c_str()));
    for (const auto& arg : args) {
        cargs.push_back(const_cast<char*>(arg.c_str()));
    }
    cargs.push_back(nullptr);

    Logger::getInstance().debug("exec: " + describeCommand(command, args) + " (cwd " + workingDirectory.string() + ")");

    pid_t pid = ::fork();
    if (pid == 0) {
        ::setpgid(0, 0);
        int devNull = ::open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            ::dup2(devNull, STDIN_FILENO);
            ::close(devNull);
        }
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);
        ::close(outPipe[0]); ::close(outPipe[1]);
        ::close(errPipe[0]); ::close(errPipe[1]);
        ::close(execPipe[0]);

        if (!workingDirectory.empty() && ::chdir(workingDirectory.c_str()) != 0) {
            int err = errno;
            ssize_t ignored = ::write(execPipe[1], &err, sizeof(err));
            (void)ignored;
            _exit(127);
        }
        ::execvp(cargs[0], cargs.data());
        int err = errno;
        ssize_t ignored = ::write(execPipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    closeFd(execPipe[1]);

    if (pid < 0) {
        std::string reason = std::strerror(errno);
        closeFd(outPipe[0]);
        closeFd(errPipe[0]);
        closeFd(execPipe[0]);
        throw ExecutionFailure("Failed to execute command: fork failed: " + reason);
    }
    // Parent side too, so kill(-pid) works even if the child has not run setpgid yet
    ::setpgid(pid, pid);

    int childErrno = 0;
    ssize_t n;
    do {
        n = ::read(execPipe[0], &childErrno, sizeof(childErrno));
    } while (n < 0 && errno == EINTR);
    closeFd(execPipe[0]);
    if (n == static_cast<ssize_t>(sizeof(childErrno))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        closeFd(outPipe[0]);
        closeFd(errPipe[0]);
        throw ExecutionFailure("Failed to execute command: " + describeCommand(command, args) + ": " +
                               std::strerror(childErrno));
    }

    ::fcntl(outPipe[0], F_SETFL, ::fcntl(outPipe[0], F_GETFL) | O_NONBLOCK);
    ::fcntl(errPipe[0], F_SETFL, ::fcntl(errPipe[0], F_GETFL) | O_NONBLOCK);

    ProcessResult result;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    bool timedOut = false;

    while (outPipe[0] >= 0 || errPipe[0] >= 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            timedOut = true;
            break;
        }

        struct pollfd fds[2];
        nfds_t count = 0;
        if (outPipe[0] >= 0) fds[count++] = {outPipe[0], POLLIN, 0};
        if (errPipe[0] >= 0) fds[count++] = {errPipe[0], POLLIN, 0};

        const auto waitMs = std::min<long long>(remaining.count(), std::numeric_limits<int>::max());
        int ready = ::poll(fds, count, static_cast<int>(waitMs));
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ready == 0) continue;

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) continue;
            bool isOut = fds[i].fd == outPipe[0];
            bool open = drain(fds[i].fd, isOut ? result.stdoutText : result.stderrText);
            if (!open) closeFd(isOut ? outPipe[0] : errPipe[0]);
        }
    }

    closeFd(outPipe[0]);
    closeFd(errPipe[0]);

    if (timedOut) {
        terminate(pid);
        Logger::getInstance().warn("Command timed out after " + std::to_string(timeout.count()) + "ms: " +
                                   describeCommand(command, args));
        throw TimeoutError("Command timed out after " + std::to_string(timeout.count()) + "ms",
                           result.stdoutText, result.stderrText);
    }

    // Output closed; the child may still be running (e.g. it closed its stdio), so keep honouring the deadline
    int status = 0;
    while (true) {
        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) break;
        if (r < 0 && errno != EINTR) {
            status = -1;
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            terminate(pid);
            throw TimeoutError("Command timed out after " + std::to_string(timeout.count()) + "ms",
                               result.stdoutText, result.stderrText);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    result.exitCode = status == -1 ? -1 : decodeStatus(status);
    return result;
}

void requireSuccess(const ProcessResult& result, const std::string& what) {
    if (result.exitCode == 0) return;
    const std::string& detail = result.stderrText.empty() ? result.stdoutText : result.stderrText;
    throw ExecutionFailure(what + " failed with exit code " + std::to_string(result.exitCode) + ": " + detail,
                           result.stdoutText, result.stderrText, result.exitCode);
}
