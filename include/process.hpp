#pragma once

#include "utils.hpp"
#include <atomic>
#include <chrono>
#include <string>
#include <vector>

namespace pfpred {

struct ProcessRequest {
    std::vector<std::string> argv;
    std::string workingDirectory;          // empty: inherit
    std::string logPath;                   // child stdout/stderr; empty: inherit
    std::chrono::milliseconds timeout{0};  // zero: wait forever
    const std::atomic<bool>* cancelled = nullptr;
};

struct ProcessResult {
    int exitCode = -1;
    bool launched = false;
    bool timedOut = false;

    bool success() const { return launched && !timedOut && exitCode == 0; }
};

std::string describe(const ProcessRequest& request);
std::string describe(const ProcessResult& result);

class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    // Blocks until the child exits or the timeout expires. Throws CANCELLED
    // when the request was cancelled before launch; once launched the child
    // is only stopped by its timeout.
    virtual ProcessResult run(const ProcessRequest& request) = 0;
};

class PosixProcessRunner : public ProcessRunner {
private:
    std::chrono::milliseconds pollInterval;

public:
    explicit PosixProcessRunner(std::chrono::milliseconds pollInterval = std::chrono::milliseconds(20));

    ProcessResult run(const ProcessRequest& request) override;
};

} // namespace pfpred
