/**
 * @file sandbox_manager.hpp
 * @brief Single entry point for sandboxed command execution
 *
 * Owns the configured defaults and the three backends, merges every call's
 * policy over the defaults, picks the requested backend and walks its
 * fallback chain while backends are unavailable.
 *
 * **Backend Selection**:
 * ```
 * merged.type (unset → container if an image is set, else native)
 *     │  unavailable
 *     ▼
 * fallback chain: container → native
 *                 wasm → container → native
 *     │  all unavailable
 *     ▼
 * BACKEND_UNAVAILABLE
 * ```
 *
 * A fallback keeps resources, network, env, mounts and timeout of the merged
 * policy; only the mechanism changes. Failures of the command itself (exit
 * codes, timeouts) and every error other than BACKEND_UNAVAILABLE are
 * returned as-is, never retried on another backend.
 *
 * **Thread Safety**: Execute() may be called concurrently. Initialize() and
 * Shutdown() wait for running executions.
 *
 * @date 2025
 */

#pragma once

#include "warden/core/config.hpp"
#include "warden/core/result.hpp"
#include "warden/core/types.hpp"
#include "warden/executors/executor.hpp"
#include "warden/runtime/container_runtime.hpp"
#include "warden/runtime/wasm_runtime.hpp"

#include <map>
#include <memory>
#include <shared_mutex>

namespace warden {
namespace core {

/**
 * @struct Backends
 * @brief Engine clients the manager drives
 *
 * A null member selects the built-in default: the docker CLI for containers
 * and the Extism runtime for WASM (when compiled in).
 */
struct Backends {
    std::shared_ptr<runtime::ContainerRuntime> container_runtime;
    std::shared_ptr<runtime::WasmRuntime> wasm_runtime;
};

/**
 * @class SandboxManager
 * @brief Policy-driven façade over the native, container and WASM backends
 *
 * **Usage Example**:
 * @code
 * SandboxManager manager(LoadConfigFromFile("warden.json"));
 * manager.Initialize();
 *
 * ExecutionRequest request;
 * request.command = {"echo", "hello"};
 *
 * IsolationPolicy policy;
 * policy.type = SandboxType::CONTAINER;
 * policy.image = "alpine:3.19";
 * policy.resources.memory_limit_bytes = 256ull * 1024 * 1024;
 *
 * auto result = manager.Execute(request, policy);
 * if (result) {
 *     std::cout << result.Value().stdout_output;
 * }
 *
 * manager.Shutdown();
 * @endcode
 */
class SandboxManager {
public:
    explicit SandboxManager(const ManagerConfig& config = ManagerConfig{},
                            Backends backends = Backends{});

    /// Shuts down if still initialized
    ~SandboxManager();

    SandboxManager(const SandboxManager&) = delete;
    SandboxManager& operator=(const SandboxManager&) = delete;

    /**
     * @brief Validate configuration and connect every backend
     *
     * Idempotent. A backend that fails to connect is logged and stays
     * unavailable; that is never fatal.
     *
     * @throws std::invalid_argument if the configuration is invalid
     */
    void Initialize();

    /**
     * @brief Run one command
     *
     * Initializes lazily. Merges @p policy over the configured defaults,
     * validates the result and dispatches through the fallback chain.
     *
     * @param request Command to run
     * @param policy Caller overrides (unset fields inherit the defaults)
     * @param cancel Abandon the execution early
     * @return ExecutionResult for any command that ran; errors:
     *         INVALID_REQUEST, INVALID_POLICY, BACKEND_UNAVAILABLE (chain
     *         exhausted), POOL_EXHAUSTED, EXECUTION_FAILED, CANCELLED
     */
    Result<ExecutionResult> Execute(const ExecutionRequest& request,
                                    const IsolationPolicy& policy = IsolationPolicy{},
                                    const CancellationToken& cancel = CancellationToken{});

    /// Whether the container runtime currently answers. Never throws.
    bool IsDockerAvailable();

    /// Whether a WASM runtime is loaded. Never throws.
    bool IsWasmAvailable();

    /**
     * @brief Disconnect every backend and destroy pooled containers
     *
     * Safe without Initialize() and safe to call twice. The manager can be
     * initialized again afterwards.
     */
    void Shutdown();

    bool IsInitialized() const;

    const ManagerConfig& GetConfig() const { return config_; }

private:
    void InitializeLocked();
    void ShutdownLocked();
    bool EnsureInitialized();
    bool IsBackendAvailable(SandboxType type);
    Result<ExecutionResult> Dispatch(const ExecutionRequest& request,
                                     const IsolationPolicy& merged,
                                     const CancellationToken& cancel);

    ManagerConfig config_;
    Backends backends_;

    mutable std::shared_mutex mutex_;
    bool initialized_{false};
    std::map<SandboxType, std::unique_ptr<executors::Executor>> executors_;
};

} // namespace core
} // namespace warden
