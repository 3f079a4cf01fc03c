/**
 * @file native_executor.cpp
 * @brief Implementation of the host process backend
 *
 * @date 2025
 */

#include "warden/executors/native_executor.hpp"
#include "warden/core/policy.hpp"
#include "warden/utils/process_utils.hpp"
#include "warden/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <unistd.h>

namespace warden {
namespace executors {

NativeExecutor::NativeExecutor(const NativeExecutorConfig& config)
    : config_(config) {
}

NativeExecutor::~NativeExecutor() = default;

// ============================================================================
// LIFECYCLE
// ============================================================================

Result<void> NativeExecutor::Connect() {
    if (!IsAvailable()) {
        return Result<void>::Failure(ErrorKind::BACKEND_UNAVAILABLE,
                                     "Shell not executable: " + config_.shell);
    }
    spdlog::info("Native executor ready (shell: {}, network isolation: {})",
                 config_.shell, config_.isolate_network ? "on" : "off");
    return Result<void>::Success();
}

Result<void> NativeExecutor::Disconnect() {
    spdlog::debug("Native executor disconnected");
    return Result<void>::Success();
}

bool NativeExecutor::IsAvailable() {
    return ::access(config_.shell.c_str(), X_OK) == 0;
}

// ============================================================================
// EXECUTION
// ============================================================================

Result<ExecutionResult> NativeExecutor::Execute(const ExecutionRequest& request,
                                                const IsolationPolicy& policy,
                                                const CancellationToken& cancel) {
    if (request.command.empty()) {
        return Result<ExecutionResult>::Failure(ErrorKind::INVALID_REQUEST,
                                                "Command array is empty");
    }

    const auto& resources = policy.resources;
    if (resources.cpu_quota) {
        spdlog::debug("cpu quota {} is advisory for native execution", *resources.cpu_quota);
    }
    if (resources.pids_limit) {
        spdlog::debug("pids limit {} is advisory for native execution", *resources.pids_limit);
    }

    utils::ProcessOptions options;
    options.argv = {config_.shell, "-c", BuildShellCommand(request.command)};
    options.env = ResolveEnvironment(request, policy);
    options.working_dir = ResolveWorkingDir(request, policy);
    options.stdin_data = request.stdin_data;
    options.timeout = ResolveTimeout(request, policy);
    options.kill_grace = config_.kill_grace;
    options.max_output_bytes = config_.max_output_bytes;
    options.memory_limit_bytes = resources.memory_limit_bytes;
    options.isolate_network = config_.isolate_network &&
                              ResolveNetworkMode(policy) == NetworkMode::NONE;
    options.cancel = cancel;

    spdlog::debug("Native exec: {} (timeout: {}ms)", options.argv.back(),
                  options.timeout.count());

    auto run = utils::ProcessUtils::Run(options);
    if (!run) {
        return Result<ExecutionResult>::Failure(run.GetError());
    }

    const auto& process = run.Value();

    if (options.isolate_network && !process.network_isolated &&
        !warned_network_.exchange(true)) {
        spdlog::warn("Kernel refused a private network namespace; native commands "
                     "run with host network access");
    }
    if (options.memory_limit_bytes && !process.memory_limited) {
        spdlog::warn("Memory limit of {} could not be applied",
                     utils::StringUtils::FormatSize(*options.memory_limit_bytes));
    }

    if (process.cancelled) {
        return Result<ExecutionResult>::Failure(ErrorKind::CANCELLED, "Execution cancelled");
    }

    if (process.timed_out) {
        spdlog::warn("Native command timed out after {}ms", options.timeout.count());
    }

    ExecutionResult result;
    result.stdout_output = process.stdout_output;
    result.stderr_output = process.stderr_output;
    result.exit_code = process.exit_code;
    result.timed_out = process.timed_out;
    result.duration = process.duration;
    result.backend = SandboxType::NATIVE;

    return Result<ExecutionResult>::Success(std::move(result));
}

} // namespace executors
} // namespace warden
