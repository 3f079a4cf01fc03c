/**
 * @file container_executor.cpp
 * @brief Implementation of the pooled container backend
 *
 * **Execution Flow**:
 * ```
 * validate → Acquire (bounded by timeout) → exec /bin/sh -c → Release
 *                                              │
 *                       timeout / cancel / infra error / 137 → destroy
 * ```
 *
 * @date 2025
 */

#include "warden/executors/container_executor.hpp"
#include "warden/core/policy.hpp"
#include "warden/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace warden {
namespace executors {

namespace {

/// Exit code of a process killed by SIGKILL (OOM killer, docker kill)
constexpr int kKilledExitCode = 137;

std::string CapOutput(const std::string& output, std::size_t max_bytes) {
    return max_bytes == 0 ? output : utils::StringUtils::Truncate(output, max_bytes);
}

} // anonymous namespace

ContainerExecutor::ContainerExecutor(std::shared_ptr<runtime::ContainerRuntime> runtime,
                                     const ContainerExecutorConfig& config)
    : runtime_(std::move(runtime))
    , config_(config) {

    if (!runtime_) {
        throw std::invalid_argument("ContainerExecutor requires a container runtime");
    }
}

ContainerExecutor::~ContainerExecutor() {
    Disconnect();
}

// ============================================================================
// LIFECYCLE
// ============================================================================

Result<void> ContainerExecutor::Connect() {
    auto ping = runtime_->Ping();

    {
        std::lock_guard<std::mutex> lock(availability_mutex_);
        available_ = ping.IsSuccess();
        availability_known_ = true;
        availability_checked_at_ = std::chrono::steady_clock::now();
    }

    if (!ping) {
        spdlog::warn("Container runtime '{}' unavailable: {}", runtime_->GetName(),
                     ping.GetError().message);
        return Result<void>::Failure(ErrorKind::BACKEND_UNAVAILABLE, ping.GetError().message);
    }

    spdlog::info("Container executor connected (runtime: {})", runtime_->GetName());
    return Result<void>::Success();
}

Result<void> ContainerExecutor::Disconnect() {
    std::shared_ptr<pool::ContainerPool> pool;
    {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        pool = std::move(pool_);
        pool_.reset();
    }

    if (pool) {
        pool->DestroyAll();
        spdlog::info("Container executor disconnected");
    }

    InvalidateAvailability();
    return Result<void>::Success();
}

bool ContainerExecutor::IsAvailable() {
    std::lock_guard<std::mutex> lock(availability_mutex_);

    auto now = std::chrono::steady_clock::now();
    if (availability_known_ && now - availability_checked_at_ < config_.availability_ttl) {
        return available_;
    }

    auto ping = runtime_->Ping();
    available_ = ping.IsSuccess();
    availability_known_ = true;
    availability_checked_at_ = std::chrono::steady_clock::now();

    if (!available_) {
        spdlog::debug("Container runtime ping failed: {}", ping.GetError().message);
    }
    return available_;
}

// ============================================================================
// EXECUTION
// ============================================================================

Result<ExecutionResult> ContainerExecutor::Execute(const ExecutionRequest& request,
                                                   const IsolationPolicy& policy,
                                                   const CancellationToken& cancel) {
    if (request.command.empty()) {
        return Result<ExecutionResult>::Failure(ErrorKind::INVALID_REQUEST,
                                                "Command array is empty");
    }
    if (!policy.image || utils::StringUtils::Trim(*policy.image).empty()) {
        return Result<ExecutionResult>::Failure(ErrorKind::INVALID_POLICY,
                                                "container policy requires an image");
    }

    const auto timeout = ResolveTimeout(request, policy);
    const auto start_time = std::chrono::steady_clock::now();
    const auto deadline = start_time + timeout;

    auto pool = GetPool();
    auto acquired = pool->Acquire(*policy.image, BuildCreateOptions(policy), deadline, cancel);
    if (!acquired) {
        if (acquired.GetError().kind == ErrorKind::BACKEND_UNAVAILABLE) {
            InvalidateAvailability();
        }
        return Result<ExecutionResult>::Failure(acquired.GetError());
    }

    const pool::PooledContainer& container = acquired.Value();

    // Waiting for the pool spends the same budget as the command itself
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
        pool->Release(container);
        spdlog::warn("Container command timed out waiting for a pool slot ({}ms)",
                     timeout.count());

        ExecutionResult result;
        result.exit_code = kTimeoutExitCode;
        result.timed_out = true;
        result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        result.backend = SandboxType::CONTAINER;
        return Result<ExecutionResult>::Success(std::move(result));
    }

    runtime::ContainerExecOptions exec;
    exec.command = {config_.shell, "-c", BuildShellCommand(request.command)};
    exec.env = ResolveEnvironment(request, policy);
    exec.working_dir = ResolveWorkingDir(request, policy);
    exec.stdin_data = request.stdin_data;
    exec.timeout = remaining;
    exec.max_output_bytes = config_.max_output_bytes;
    exec.cancel = cancel;

    spdlog::debug("Container exec in {}: {} (timeout: {}ms)", container.id,
                  exec.command.back(), remaining.count());

    Result<runtime::ContainerExecResult> run = Result<runtime::ContainerExecResult>::Failure(
        ErrorKind::EXECUTION_FAILED, "exec did not run");
    try {
        run = runtime_->Exec(container.id, exec);
    } catch (const std::exception& e) {
        spdlog::error("Container exec threw: {}", e.what());
        run = Result<runtime::ContainerExecResult>::Failure(ErrorKind::EXECUTION_FAILED, e.what());
    }

    bool corrupted = !run || run.Value().timed_out || run.Value().cancelled ||
                     run.Value().exit_code == kKilledExitCode;
    pool->Release(container, corrupted);

    if (!run) {
        if (run.GetError().kind == ErrorKind::BACKEND_UNAVAILABLE) {
            InvalidateAvailability();
        }
        return Result<ExecutionResult>::Failure(run.GetError());
    }

    const auto& output = run.Value();
    if (output.cancelled) {
        return Result<ExecutionResult>::Failure(ErrorKind::CANCELLED, "Execution cancelled");
    }

    if (output.timed_out) {
        spdlog::warn("Container command timed out after {}ms (container {} destroyed)",
                     timeout.count(), container.id);
    }

    ExecutionResult result;
    result.stdout_output = CapOutput(output.stdout_output, config_.max_output_bytes);
    result.stderr_output = CapOutput(output.stderr_output, config_.max_output_bytes);
    result.exit_code = output.timed_out ? kTimeoutExitCode : output.exit_code;
    result.timed_out = output.timed_out;
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    result.backend = SandboxType::CONTAINER;

    return Result<ExecutionResult>::Success(std::move(result));
}

runtime::ContainerCreateOptions ContainerExecutor::BuildCreateOptions(
    const IsolationPolicy& policy) const {

    runtime::ContainerCreateOptions options;
    options.image = policy.image.value_or("");
    options.memory_limit_bytes = policy.resources.memory_limit_bytes;
    options.cpus = policy.resources.cpu_quota;
    options.pids_limit = policy.resources.pids_limit.value_or(config_.default_pids_limit);
    options.network_mode = ResolveNetworkMode(policy);
    options.mounts = policy.mounts.value_or(std::vector<Mount>{});
    options.user = policy.user;
    options.working_dir = config_.container_workdir;
    return options;
}

pool::PoolStats ContainerExecutor::GetPoolStats() const {
    std::lock_guard<std::mutex> lock(pool_mutex_);
    return pool_ ? pool_->GetStats() : pool::PoolStats{};
}

// ============================================================================
// PRIVATE HELPER METHODS
// ============================================================================

std::shared_ptr<pool::ContainerPool> ContainerExecutor::GetPool() {
    std::lock_guard<std::mutex> lock(pool_mutex_);
    if (!pool_) {
        pool_ = std::make_shared<pool::ContainerPool>(runtime_, config_.pool);
    }
    return pool_;
}

void ContainerExecutor::InvalidateAvailability() {
    std::lock_guard<std::mutex> lock(availability_mutex_);
    availability_known_ = false;
}

} // namespace executors
} // namespace warden
