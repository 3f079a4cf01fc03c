/**
 * @file wasm_executor.hpp
 * @brief WASM plugin backend
 *
 * Runs a precompiled plugin module instead of a shell command. The module
 * is taken from policy.wasm.module and its exported function (default
 * "run") is called with a single string input:
 * - request.stdin_data when present
 * - otherwise JSON `{"command": [...], "cwd": "...", "env": {...}}`
 *
 * The plugin output is unpacked when it is a JSON object of the form
 * `{"stdout": "...", "stderr": "...", "exitCode": N}`; any other output is
 * taken as stdout with exit code 0. A trap yields exit code 1 with the trap
 * message on stderr.
 *
 * A watchdog thread cancels the call at the deadline; the module is then
 * dropped from the cache since its instance state is unknown.
 *
 * @date 2025
 */

#pragma once

#include "warden/executors/executor.hpp"
#include "warden/runtime/wasm_runtime.hpp"

#include <atomic>
#include <filesystem>
#include <list>
#include <memory>
#include <mutex>
#include <string>

namespace warden {
namespace executors {

/**
 * @struct WasmExecutorConfig
 * @brief WASM backend settings
 */
struct WasmExecutorConfig {
    std::size_t cache_size{10};              ///< Loaded modules kept (LRU)
    std::size_t max_output_bytes{50000};     ///< Per stream cap
    std::string default_function{"run"};     ///< Export called when the policy names none
    std::string default_working_dir{"/workspace"};  ///< "cwd" sent to the plugin
};

/**
 * @class WasmExecutor
 * @brief Executes plugin modules through a WasmRuntime
 */
class WasmExecutor : public Executor {
public:
    /**
     * @param runtime WASM engine, nullptr when none is built in
     * @param config Backend settings
     */
    explicit WasmExecutor(std::shared_ptr<runtime::WasmRuntime> runtime,
                          const WasmExecutorConfig& config = WasmExecutorConfig{});
    ~WasmExecutor() override;

    SandboxType GetType() const override { return SandboxType::WASM; }

    /**
     * @brief Probe the runtime
     * @return BACKEND_UNAVAILABLE without a runtime or if the probe fails
     */
    Result<void> Connect() override;

    /// Drops every cached module
    Result<void> Disconnect() override;

    bool IsAvailable() override;

    Result<ExecutionResult> Execute(const ExecutionRequest& request,
                                    const IsolationPolicy& policy,
                                    const CancellationToken& cancel) override;

    std::size_t GetCachedModuleCount() const;

    /// Plugin input for a request (stdin, or the JSON envelope)
    std::string BuildInput(const ExecutionRequest& request, const IsolationPolicy& policy) const;

private:
    struct CachedModule {
        std::string key;                                 ///< sha256(bytes):wasi
        std::shared_ptr<runtime::WasmModule> module;
        std::shared_ptr<std::mutex> call_mutex;          ///< One call at a time
    };

    Result<CachedModule> GetOrLoadModule(const std::filesystem::path& path, bool wasi);
    void EvictModule(const std::string& key);

    std::shared_ptr<runtime::WasmRuntime> runtime_;
    WasmExecutorConfig config_;
    std::atomic<bool> connected_{false};

    mutable std::mutex cache_mutex_;
    std::list<CachedModule> cache_;  ///< Most recently used first
};

} // namespace executors
} // namespace warden
