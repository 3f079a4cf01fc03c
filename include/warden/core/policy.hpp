/**
 * @file policy.hpp
 * @brief Policy merging, validation and effective-value resolution
 *
 * @date 2025
 */

#pragma once

#include "warden/core/result.hpp"
#include "warden/core/types.hpp"

namespace warden {

/**
 * @brief Merge caller overrides over defaults
 *
 * Set override fields win; unset ones inherit. resources, network and wasm
 * merge field by field, env merges key by key, mounts replace wholesale.
 */
IsolationPolicy MergePolicy(const IsolationPolicy& defaults,
                            const IsolationPolicy& overrides);

/**
 * @brief Check a (merged) policy for values no backend can honor
 * @return INVALID_POLICY describing the first problem found
 */
Result<void> ValidatePolicy(const IsolationPolicy& policy);

/**
 * @brief Reject requests that cannot run as given
 * @return INVALID_REQUEST for an empty command, a non-positive timeout or a
 *         malformed environment name
 */
Result<void> ValidateRequest(const ExecutionRequest& request);

/// request.timeout, else policy.timeout, else kDefaultTimeout
std::chrono::milliseconds ResolveTimeout(const ExecutionRequest& request,
                                         const IsolationPolicy& policy);

/// policy.env overlaid by request.env
std::map<std::string, std::string> ResolveEnvironment(const ExecutionRequest& request,
                                                      const IsolationPolicy& policy);

/// request.working_dir, else policy.working_dir
std::optional<std::filesystem::path> ResolveWorkingDir(const ExecutionRequest& request,
                                                       const IsolationPolicy& policy);

/// Network mode with the NONE default applied
inline NetworkMode ResolveNetworkMode(const IsolationPolicy& policy) {
    return policy.network.mode.value_or(NetworkMode::NONE);
}

/// Command tokens joined for /bin/sh -c
std::string BuildShellCommand(const std::vector<std::string>& command);

} // namespace warden
