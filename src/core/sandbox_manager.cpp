/**
 * @file sandbox_manager.cpp
 * @brief Implementation of backend selection, fallback and lifecycle
 *
 * @date 2025
 */

#include "warden/core/sandbox_manager.hpp"
#include "warden/core/policy.hpp"
#include "warden/executors/container_executor.hpp"
#include "warden/executors/native_executor.hpp"
#include "warden/executors/wasm_executor.hpp"
#include "warden/utils/container_utils.hpp"
#include "warden/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <mutex>
#include <stdexcept>

namespace warden {
namespace core {

// ============================================================================
// CONSTRUCTOR / DESTRUCTOR
// ============================================================================

SandboxManager::SandboxManager(const ManagerConfig& config, Backends backends)
    : config_(config)
    , backends_(std::move(backends)) {
}

SandboxManager::~SandboxManager() {
    Shutdown();
}

// ============================================================================
// LIFECYCLE
// ============================================================================

void SandboxManager::Initialize() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    InitializeLocked();
}

void SandboxManager::InitializeLocked() {
    if (initialized_) {
        return;
    }

    ValidateConfig(config_);

    spdlog::info("Initializing sandbox manager...");

    executors::NativeExecutorConfig native_config;
    native_config.isolate_network = config_.native.isolate_network;
    native_config.kill_grace = config_.native.kill_grace;
    native_config.max_output_bytes = config_.max_output_bytes;
    executors_[SandboxType::NATIVE] = std::make_unique<executors::NativeExecutor>(native_config);

    auto container_runtime = backends_.container_runtime;
    if (!container_runtime) {
        utils::DockerCliConfig docker_config;
        docker_config.binary = config_.docker.binary;
        docker_config.host = config_.docker.host;
        docker_config.command_timeout = config_.docker.command_timeout;
        container_runtime = std::make_shared<utils::DockerCliRuntime>(docker_config);
    }

    executors::ContainerExecutorConfig container_config;
    container_config.pool.max_size = config_.pool.max_size;
    container_config.pool.idle_timeout = config_.pool.idle_timeout;
    container_config.availability_ttl = config_.docker.availability_ttl;
    container_config.max_output_bytes = config_.max_output_bytes;
    executors_[SandboxType::CONTAINER] =
        std::make_unique<executors::ContainerExecutor>(container_runtime, container_config);

    auto wasm_runtime = backends_.wasm_runtime;
    if (!wasm_runtime) {
        wasm_runtime = runtime::CreateDefaultWasmRuntime();
    }

    executors::WasmExecutorConfig wasm_config;
    wasm_config.cache_size = config_.wasm.cache_size;
    wasm_config.max_output_bytes = config_.max_output_bytes;
    executors_[SandboxType::WASM] =
        std::make_unique<executors::WasmExecutor>(wasm_runtime, wasm_config);

    for (auto& [type, executor] : executors_) {
        auto connected = executor->Connect();
        if (connected) {
            spdlog::info("[{}] backend available", SandboxTypeToString(type));
        } else {
            spdlog::warn("[{}] backend unavailable: {}", SandboxTypeToString(type),
                         connected.GetError().message);
        }
    }

    initialized_ = true;
    spdlog::info("Sandbox manager initialized");
}

void SandboxManager::Shutdown() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    ShutdownLocked();
}

void SandboxManager::ShutdownLocked() {
    if (!initialized_ && executors_.empty()) {
        return;
    }

    spdlog::info("Shutting down sandbox manager...");

    for (auto& [type, executor] : executors_) {
        auto disconnected = executor->Disconnect();
        if (!disconnected) {
            spdlog::warn("[{}] disconnect failed: {}", SandboxTypeToString(type),
                         disconnected.GetError().message);
        }
    }
    executors_.clear();
    initialized_ = false;
}

bool SandboxManager::IsInitialized() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return initialized_;
}

bool SandboxManager::EnsureInitialized() {
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        if (initialized_) {
            return true;
        }
    }

    try {
        Initialize();
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Sandbox manager initialization failed: {}", e.what());
        return false;
    }
}

// ============================================================================
// AVAILABILITY PROBES
// ============================================================================

bool SandboxManager::IsDockerAvailable() {
    return IsBackendAvailable(SandboxType::CONTAINER);
}

bool SandboxManager::IsWasmAvailable() {
    return IsBackendAvailable(SandboxType::WASM);
}

bool SandboxManager::IsBackendAvailable(SandboxType type) {
    if (!EnsureInitialized()) {
        return false;
    }

    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = executors_.find(type);
    if (it == executors_.end()) {
        return false;
    }

    try {
        return it->second->IsAvailable();
    } catch (const std::exception& e) {
        spdlog::warn("[{}] availability probe failed: {}", SandboxTypeToString(type), e.what());
        return false;
    }
}

// ============================================================================
// EXECUTION
// ============================================================================

Result<ExecutionResult> SandboxManager::Execute(const ExecutionRequest& request,
                                                const IsolationPolicy& policy,
                                                const CancellationToken& cancel) {
    auto request_valid = ValidateRequest(request);
    if (!request_valid) {
        return Result<ExecutionResult>::Failure(request_valid.GetError());
    }

    IsolationPolicy merged = MergePolicy(config_.defaults, policy);
    if (!merged.type) {
        bool has_image = merged.image && !utils::StringUtils::Trim(*merged.image).empty();
        merged.type = has_image ? SandboxType::CONTAINER : SandboxType::NATIVE;
    }

    auto valid = ValidatePolicy(merged);
    if (!valid) {
        return Result<ExecutionResult>::Failure(valid.GetError());
    }

    // Shutdown() may run between the two locks; initialize again in that case
    while (true) {
        if (!EnsureInitialized()) {
            return Result<ExecutionResult>::Failure(ErrorKind::INVALID_POLICY,
                                                    "Sandbox manager configuration is invalid");
        }

        std::shared_lock<std::shared_mutex> lock(mutex_);
        if (initialized_) {
            return Dispatch(request, merged, cancel);
        }
    }
}

Result<ExecutionResult> SandboxManager::Dispatch(const ExecutionRequest& request,
                                                 const IsolationPolicy& merged,
                                                 const CancellationToken& cancel) {
    const SandboxType requested = *merged.type;

    std::vector<SandboxType> chain = {requested};
    auto fallback = config_.fallback.find(requested);
    if (fallback != config_.fallback.end()) {
        chain.insert(chain.end(), fallback->second.begin(), fallback->second.end());
    }

    std::vector<std::string> tried;

    for (SandboxType type : chain) {
        const char* name = SandboxTypeToString(type);

        if (type == SandboxType::CONTAINER &&
            (!merged.image || utils::StringUtils::Trim(*merged.image).empty())) {
            spdlog::debug("Skipping [container] fallback: no image configured");
            continue;
        }

        auto it = executors_.find(type);
        if (it == executors_.end() || !it->second->IsAvailable()) {
            spdlog::warn("[{}] backend unavailable, trying next in chain", name);
            tried.push_back(name);
            continue;
        }

        IsolationPolicy effective = merged;
        effective.type = type;

        Result<ExecutionResult> result = Result<ExecutionResult>::Failure(
            ErrorKind::EXECUTION_FAILED, "execution did not run");
        try {
            result = it->second->Execute(request, effective, cancel);
        } catch (const std::exception& e) {
            spdlog::error("[{}] executor threw: {}", name, e.what());
            return Result<ExecutionResult>::Failure(ErrorKind::EXECUTION_FAILED,
                std::string(name) + " executor failed: " + e.what());
        }

        if (!result && result.GetError().kind == ErrorKind::BACKEND_UNAVAILABLE) {
            spdlog::warn("[{}] backend became unavailable: {}", name, result.GetError().message);
            tried.push_back(name);
            continue;
        }

        if (result && type != requested) {
            spdlog::info("Executed on [{}] backend in place of [{}]", name,
                         SandboxTypeToString(requested));
        }
        return result;
    }

    return Result<ExecutionResult>::Failure(ErrorKind::BACKEND_UNAVAILABLE,
        std::string("Sandbox type '") + SandboxTypeToString(requested) +
        "' not available (tried: " + utils::StringUtils::Join(tried, ", ") + ")");
}

} // namespace core
} // namespace warden
