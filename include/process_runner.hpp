/**
 * @file process_runner.hpp
 * @brief Subprocess execution with captured output for the dump-tool backends.
 *
 * The dump-tool backends never spawn processes directly; they build a ProcessRequest
 * and hand it to a ProcessRunner, which lets tests replace real tools with scripted results.
 */

#ifndef PROCESS_RUNNER_HPP
#define PROCESS_RUNNER_HPP

#include <string>
#include <vector>
#include <utility>
#include <optional>
#include <chrono>
#include <filesystem>
#include "backup_error.hpp"

/**
 * @brief Description of one external tool invocation.
 */
struct ProcessRequest {
    std::string program;                                      ///< Executable name (looked up in PATH) or path.
    std::vector<std::string> args;                            ///< Arguments, without argv[0].
    std::vector<std::pair<std::string, std::string>> env;     ///< Variables set only in the child.
    std::optional<std::filesystem::path> stdoutFile;          ///< Stream stdout into this file instead of capturing it.
    std::chrono::milliseconds timeout{std::chrono::hours(1)}; ///< Deadline after which the child is killed.
};

/**
 * @brief Outcome of a finished invocation.
 */
struct ProcessResult {
    int exitCode = -1;      ///< Exit status, or 128 + signal number if the child was killed.
    std::string stdoutText; ///< Captured standard output (empty when streamed to a file).
    std::string stderrText; ///< Captured standard error.

    bool success() const { return exitCode == 0; }
};

/**
 * @brief Interface for running external tools.
 */
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    /**
     * @brief Runs a process to completion.
     *
     * A non-zero exit status is not an error at this level; it is reported in ProcessResult.
     *
     * @param request Invocation to perform.
     * @return Result<ProcessResult> The outcome, or a Database-kind error if the process could
     *         not be started or missed its deadline, or an Io-kind error if output could not be written.
     */
    virtual Result<ProcessResult> run(const ProcessRequest& request) = 0;
};

/**
 * @brief ProcessRunner based on fork/execvp and pipes.
 */
class PosixProcessRunner : public ProcessRunner {
public:
    Result<ProcessResult> run(const ProcessRequest& request) override;
};

/**
 * @brief Renders a request as a shell-like command line with credentials masked, for logging.
 */
std::string describeCommand(const ProcessRequest& request);

#endif // PROCESS_RUNNER_HPP
