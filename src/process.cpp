#include "process.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <sstream>
#include <thread>

namespace pfpred {

std::string describe(const ProcessRequest& request) {
    std::ostringstream ss;
    for (size_t i = 0; i < request.argv.size(); ++i) {
        if (i > 0) ss << ' ';
        ss << request.argv[i];
    }
    if (!request.workingDirectory.empty()) {
        ss << " (in " << request.workingDirectory << ")";
    }
    return ss.str();
}

std::string describe(const ProcessResult& result) {
    if (!result.launched) return "not started";
    if (result.timedOut) return "timed out";
    return "exit code " + std::to_string(result.exitCode);
}

PosixProcessRunner::PosixProcessRunner(std::chrono::milliseconds pollInterval)
    : pollInterval(pollInterval) {}

// Only async-signal-safe calls between fork and exec.
[[noreturn]] static void runChild(const std::string& workingDirectory, const std::string& logPath,
                                  char* const* argv) {
    setpgid(0, 0); // own group so a timeout can kill the whole tree

    if (!workingDirectory.empty() && chdir(workingDirectory.c_str()) != 0) {
        _exit(126);
    }

    if (!logPath.empty()) {
        int fd = open(logPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
        if (fd >= 0) {
            dup2(fd, 1);
            dup2(fd, 2);
            close(fd);
        }
    }

    execvp(argv[0], argv);
    _exit(127);
}

ProcessResult PosixProcessRunner::run(const ProcessRequest& request) {
    ProcessResult result;

    if (request.argv.empty()) {
        throw PredictionException("PosixProcessRunner: empty command line", ErrorCode::UNKNOWN_ERROR);
    }
    if (request.cancelled && request.cancelled->load()) {
        throw PredictionException("Cancelled before starting " + request.argv[0], ErrorCode::CANCELLED);
    }

    std::vector<char*> args;
    args.reserve(request.argv.size() + 1);
    for (const auto& arg : request.argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    globalLogger.debug("Starting " + describe(request));

    pid_t child = fork();
    if (child < 0) {
        globalLogger.error("Cannot fork sub process for " + request.argv[0] + ": " + std::strerror(errno));
        return result;
    }

    if (child == 0) {
        runChild(request.workingDirectory, request.logPath, args.data());
    }
    // Also set from the parent so the group exists before any timeout kill.
    // EACCES means the child already exec'd, having set it itself.
    if (setpgid(child, child) < 0 && errno != EACCES) {
        globalLogger.debug("setpgid failed for " + request.argv[0] + ": " + std::strerror(errno));
    }

    result.launched = true;
    const bool bounded = request.timeout.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + request.timeout;
    int status = 0;

    while (true) {
        pid_t w = waitpid(child, &status, bounded ? WNOHANG : 0);
        if (w == child) {
            break;
        }
        if (w < 0) {
            if (errno == EINTR) continue;
            globalLogger.error("waitpid failed for " + request.argv[0] + ": " + std::strerror(errno));
            return result;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            globalLogger.warning(request.argv[0] + " exceeded " +
                                 std::to_string(request.timeout.count()) + " ms, killing");
            kill(-child, SIGKILL);
            kill(child, SIGKILL);
            while (waitpid(child, &status, 0) < 0 && errno == EINTR) {
            }
            result.timedOut = true;
            return result;
        }
        std::this_thread::sleep_for(pollInterval);
    }

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exitCode = 128 + WTERMSIG(status);
    }

    globalLogger.debug(request.argv[0] + " finished with " + describe(result));
    return result;
}

} // namespace pfpred
