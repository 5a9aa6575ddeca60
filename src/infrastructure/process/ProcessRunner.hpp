#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace resetwatch::infra {

/**
 * @brief Outcome of running an external program.
 */
struct ProcessResult {
    bool started{false};   ///< fork/exec succeeded
    bool timedOut{false};  ///< Killed at the deadline
    int exitCode{-1};      ///< Exit status, or -1 if killed by a signal
    std::string output;    ///< Captured standard output
    std::string errors;    ///< Captured standard error

    [[nodiscard]] bool succeeded() const { return started && !timedOut && exitCode == 0; }
};

/**
 * @brief Runs a program without a shell and captures its output.
 *
 * The binary and its arguments are passed to execv() as separate strings.
 * A program still running at the deadline is killed with SIGKILL.
 */
class ProcessRunner {
public:
    /**
     * @brief Runs @p binary and waits for it to exit.
     * @param binary Path to the executable.
     * @param args Arguments, not including argv[0].
     * @param timeout Wall-clock limit for the whole run.
     * @return Captured output and exit status; never throws for a failing
     *         or missing program.
     */
    static ProcessResult run(const std::string& binary, const std::vector<std::string>& args,
                             std::chrono::milliseconds timeout);
};

} // namespace resetwatch::infra
