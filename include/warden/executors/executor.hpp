/**
 * @file executor.hpp
 * @brief Common contract of the isolation backends
 *
 * An executor turns an (already merged and validated) IsolationPolicy plus
 * an ExecutionRequest into an ExecutionResult using one isolation mechanism.
 *
 * **Contract**:
 * - Connect() prepares the backend; failure is non-fatal and leaves
 *   IsAvailable() false
 * - IsAvailable() never throws and never blocks for long
 * - Execute() reports a command that ran (any exit code, timeout) as a
 *   successful Result; infrastructure failures as Result errors.
 *   BACKEND_UNAVAILABLE is the only kind that triggers fallback
 * - Disconnect() releases everything the backend holds; idempotent
 *
 * @date 2025
 */

#pragma once

#include "warden/core/result.hpp"
#include "warden/core/types.hpp"

namespace warden {
namespace executors {

/**
 * @class Executor
 * @brief Abstract isolation backend
 */
class Executor {
public:
    virtual ~Executor() = default;

    virtual SandboxType GetType() const = 0;

    virtual Result<void> Connect() = 0;

    virtual Result<void> Disconnect() = 0;

    virtual bool IsAvailable() = 0;

    /**
     * @brief Run one command
     * @param request Command, env and timeout overrides
     * @param policy Merged policy
     * @param cancel Caller cancellation
     */
    virtual Result<ExecutionResult> Execute(const ExecutionRequest& request,
                                            const IsolationPolicy& policy,
                                            const CancellationToken& cancel) = 0;
};

} // namespace executors
} // namespace warden
