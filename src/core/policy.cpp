/**
 * @file policy.cpp
 * @brief Implementation of policy merging and validation
 *
 * @date 2025
 */

#include "warden/core/policy.hpp"
#include "warden/utils/string_utils.hpp"

namespace warden {

namespace {

template <typename T>
std::optional<T> Pick(const std::optional<T>& override_value,
                      const std::optional<T>& default_value) {
    return override_value.has_value() ? override_value : default_value;
}

bool IsValidEnvName(const std::string& key) {
    return !key.empty() && key.find('=') == std::string::npos;
}

} // anonymous namespace

IsolationPolicy MergePolicy(const IsolationPolicy& defaults,
                            const IsolationPolicy& overrides) {
    IsolationPolicy merged;

    merged.type = Pick(overrides.type, defaults.type);
    merged.image = Pick(overrides.image, defaults.image);

    merged.resources.memory_limit_bytes = Pick(overrides.resources.memory_limit_bytes,
                                               defaults.resources.memory_limit_bytes);
    merged.resources.cpu_quota = Pick(overrides.resources.cpu_quota,
                                      defaults.resources.cpu_quota);
    merged.resources.pids_limit = Pick(overrides.resources.pids_limit,
                                       defaults.resources.pids_limit);

    merged.network.mode = Pick(overrides.network.mode, defaults.network.mode);

    merged.mounts = Pick(overrides.mounts, defaults.mounts);

    merged.env = defaults.env;
    for (const auto& [key, value] : overrides.env) {
        merged.env[key] = value;
    }

    merged.timeout = Pick(overrides.timeout, defaults.timeout);
    merged.working_dir = Pick(overrides.working_dir, defaults.working_dir);
    merged.user = Pick(overrides.user, defaults.user);

    merged.wasm.module = Pick(overrides.wasm.module, defaults.wasm.module);
    merged.wasm.function = Pick(overrides.wasm.function, defaults.wasm.function);
    merged.wasm.wasi = Pick(overrides.wasm.wasi, defaults.wasm.wasi);

    return merged;
}

Result<void> ValidatePolicy(const IsolationPolicy& policy) {
    const auto& res = policy.resources;

    if (res.memory_limit_bytes && *res.memory_limit_bytes == 0) {
        return Result<void>::Failure(ErrorKind::INVALID_POLICY,
                                     "memory limit must be greater than zero");
    }
    if (res.cpu_quota && !(*res.cpu_quota > 0.0)) {
        return Result<void>::Failure(ErrorKind::INVALID_POLICY,
                                     "cpu quota must be greater than zero");
    }
    if (res.pids_limit && *res.pids_limit < 1) {
        return Result<void>::Failure(ErrorKind::INVALID_POLICY,
                                     "pids limit must be at least 1");
    }
    if (policy.timeout && policy.timeout->count() <= 0) {
        return Result<void>::Failure(ErrorKind::INVALID_POLICY,
                                     "timeout must be positive");
    }
    if (policy.type == SandboxType::CONTAINER &&
        (!policy.image || utils::StringUtils::Trim(*policy.image).empty())) {
        return Result<void>::Failure(ErrorKind::INVALID_POLICY,
                                     "container policy requires an image");
    }
    if (policy.mounts) {
        for (const auto& mount : *policy.mounts) {
            if (mount.host_path.empty() || mount.container_path.empty()) {
                return Result<void>::Failure(ErrorKind::INVALID_POLICY,
                                             "mount requires host and container paths");
            }
            if (!mount.container_path.is_absolute()) {
                return Result<void>::Failure(ErrorKind::INVALID_POLICY,
                                             "mount target must be absolute: " +
                                             mount.container_path.string());
            }
        }
    }
    for (const auto& [key, value] : policy.env) {
        if (!IsValidEnvName(key)) {
            return Result<void>::Failure(ErrorKind::INVALID_POLICY,
                                         "invalid environment variable name: '" + key + "'");
        }
    }

    return Result<void>::Success();
}

Result<void> ValidateRequest(const ExecutionRequest& request) {
    if (request.command.empty()) {
        return Result<void>::Failure(ErrorKind::INVALID_REQUEST, "Command array is empty");
    }
    if (request.timeout && request.timeout->count() <= 0) {
        return Result<void>::Failure(ErrorKind::INVALID_REQUEST,
                                     "timeout must be positive, got " +
                                     std::to_string(request.timeout->count()) + "ms");
    }
    for (const auto& [key, value] : request.env) {
        if (!IsValidEnvName(key)) {
            return Result<void>::Failure(ErrorKind::INVALID_REQUEST,
                                         "invalid environment variable name: '" + key + "'");
        }
    }

    return Result<void>::Success();
}

std::chrono::milliseconds ResolveTimeout(const ExecutionRequest& request,
                                         const IsolationPolicy& policy) {
    if (request.timeout) return *request.timeout;
    if (policy.timeout) return *policy.timeout;
    return kDefaultTimeout;
}

std::map<std::string, std::string> ResolveEnvironment(const ExecutionRequest& request,
                                                      const IsolationPolicy& policy) {
    auto env = policy.env;
    for (const auto& [key, value] : request.env) {
        env[key] = value;
    }
    return env;
}

std::optional<std::filesystem::path> ResolveWorkingDir(const ExecutionRequest& request,
                                                       const IsolationPolicy& policy) {
    if (request.working_dir) return request.working_dir;
    return policy.working_dir;
}

std::string BuildShellCommand(const std::vector<std::string>& command) {
    return utils::StringUtils::Join(command, " ");
}

} // namespace warden
