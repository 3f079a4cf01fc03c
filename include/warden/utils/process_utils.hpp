/**
 * @file process_utils.hpp
 * @brief Child process execution with deadlines and process-group cleanup
 *
 * Runs a program with captured stdout/stderr, optional stdin, an extended
 * environment and a hard deadline. The child is placed in its own process
 * group; at the deadline the whole group receives SIGTERM, then SIGKILL
 * after a grace period, and the group is killed again once the leader has
 * been reaped so that no background children outlive the call.
 *
 * **Best-effort confinement** (applied in the child before exec):
 * - memory_limit_bytes → RLIMIT_AS
 * - isolate_network → new network namespace (plain unshare as root,
 *   unprivileged user namespace with identity uid/gid maps otherwise)
 *
 * Failures to apply confinement are reported back to the parent through a
 * close-on-exec pipe and surfaced in ProcessResult, never silently ignored.
 *
 * @date 2025
 */

#pragma once

#include "warden/core/result.hpp"
#include "warden/core/types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace warden {
namespace utils {

/**
 * @struct ProcessOptions
 * @brief How to launch and bound a child process
 */
struct ProcessOptions {
    std::vector<std::string> argv;                     ///< Program and arguments (PATH lookup)
    std::map<std::string, std::string> env;            ///< Added to / overriding the environment
    bool inherit_env{true};                            ///< Start from the parent environment
    std::optional<std::filesystem::path> working_dir;  ///< chdir before exec
    std::optional<std::string> stdin_data;             ///< Written to stdin, else /dev/null
    std::chrono::milliseconds timeout{0};              ///< 0 = no deadline
    std::chrono::milliseconds kill_grace{200};         ///< SIGTERM → SIGKILL delay
    std::size_t max_output_bytes{0};                   ///< Per stream, 0 = unlimited
    std::optional<std::uint64_t> memory_limit_bytes;   ///< RLIMIT_AS
    bool isolate_network{false};                       ///< Private network namespace
    CancellationToken cancel;                          ///< Kill early when cancelled
};

/**
 * @struct ProcessResult
 * @brief Outcome of a child process
 */
struct ProcessResult {
    int exit_code{0};                       ///< Exit status, 128+N for signal N, 124 on timeout
    std::string stdout_output;              ///< Captured stdout (possibly truncated)
    std::string stderr_output;              ///< Captured stderr (possibly truncated)
    bool timed_out{false};                  ///< Killed at the deadline
    bool cancelled{false};                  ///< Killed because the token was cancelled
    bool output_truncated{false};           ///< A stream exceeded max_output_bytes
    bool network_isolated{false};           ///< Network namespace was applied
    bool memory_limited{false};             ///< RLIMIT_AS was applied
    std::chrono::milliseconds duration{0};  ///< Wall time from fork to reap
};

/**
 * @class ProcessUtils
 * @brief Static process launching helpers
 */
class ProcessUtils {
public:
    /**
     * @brief Run a child process to completion or deadline
     *
     * The call returns only after the child has been reaped and its process
     * group killed, so a timed-out command never keeps running.
     *
     * @param options Launch options
     * @return ProcessResult, or:
     *         INVALID_REQUEST if argv is empty or the working directory
     *         cannot be entered; EXECUTION_FAILED if pipes/fork/exec fail
     */
    static Result<ProcessResult> Run(const ProcessOptions& options);

    /**
     * @brief Whether the current process runs with root privileges
     */
    static bool IsPrivileged();
};

} // namespace utils
} // namespace warden
