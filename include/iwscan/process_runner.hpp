#ifndef IWSCAN_PROCESS_RUNNER_HPP
#define IWSCAN_PROCESS_RUNNER_HPP

#include <string>
#include <vector>

namespace iwscan {

struct ProcessOutput {
    // errno from a failed exec (ENOENT, EACCES, ...), 0 when the child ran.
    int spawnError = 0;
    // Exit status, or 128 + signal number when the child was killed.
    int exitCode = 0;
    std::string standardOutput;
    std::string standardError;
};

/**
 * Runs one external command to completion and captures what it printed.
 * Implementations must not throw for a non-zero exit; that is reported
 * through ProcessOutput.
 */
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;
    virtual ProcessOutput run(const std::vector<std::string>& argv) = 0;
};

// fork/execvp with stdout and stderr captured through pipes.
class PosixProcessRunner : public ProcessRunner {
public:
    ProcessOutput run(const std::vector<std::string>& argv) override;
};

} // namespace iwscan

#endif // IWSCAN_PROCESS_RUNNER_HPP
