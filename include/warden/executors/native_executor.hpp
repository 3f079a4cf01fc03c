/**
 * @file native_executor.hpp
 * @brief Host process backend
 *
 * Runs the command as `/bin/sh -c "<joined command>"` in a child process of
 * the host. This is the weakest isolation level and the last link of every
 * fallback chain: a hard deadline with process-group cleanup, RLIMIT_AS for
 * memory, and a best-effort private network namespace for network "none".
 * CPU quota and pids limit have no native counterpart and are only logged.
 *
 * @date 2025
 */

#pragma once

#include "warden/executors/executor.hpp"

#include <atomic>
#include <chrono>
#include <string>

namespace warden {
namespace executors {

/**
 * @struct NativeExecutorConfig
 * @brief Native backend settings
 */
struct NativeExecutorConfig {
    std::string shell{"/bin/sh"};                ///< Interpreter for the joined command
    bool isolate_network{true};                  ///< Private netns for network "none"
    std::chrono::milliseconds kill_grace{200};   ///< SIGTERM → SIGKILL delay
    std::size_t max_output_bytes{50000};         ///< Per stream cap
};

/**
 * @class NativeExecutor
 * @brief Executes commands as host child processes
 */
class NativeExecutor : public Executor {
public:
    explicit NativeExecutor(const NativeExecutorConfig& config = NativeExecutorConfig{});
    ~NativeExecutor() override;

    SandboxType GetType() const override { return SandboxType::NATIVE; }

    /// Verifies the shell is executable
    Result<void> Connect() override;
    Result<void> Disconnect() override;

    /// True while the shell is executable
    bool IsAvailable() override;

    Result<ExecutionResult> Execute(const ExecutionRequest& request,
                                    const IsolationPolicy& policy,
                                    const CancellationToken& cancel) override;

private:
    NativeExecutorConfig config_;
    std::atomic<bool> warned_network_{false};
};

} // namespace executors
} // namespace warden
