/**
 * @file types.hpp
 * @brief Shared value types for execution requests, policies and results
 *
 * Everything in this header is plain data. Policies use std::optional for
 * every field so that a caller policy can be merged over manager defaults:
 * an unset field inherits, a set field overrides (see MergePolicy).
 *
 * @date 2025
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace warden {

/**
 * @enum SandboxType
 * @brief Isolation mechanism that runs a command
 */
enum class SandboxType {
    NATIVE,     ///< Host process (trusted/internal execution)
    CONTAINER,  ///< Pooled container driven through a container runtime
    WASM        ///< Precompiled module in an embedded WASM runtime
};

/**
 * @enum NetworkMode
 * @brief Network access granted to the command
 */
enum class NetworkMode {
    NONE,    ///< No network access (default)
    BRIDGE   ///< Bridged network (container backend only)
};

const char* SandboxTypeToString(SandboxType type);
std::optional<SandboxType> ParseSandboxType(const std::string& name);
const char* NetworkModeToString(NetworkMode mode);
std::optional<NetworkMode> ParseNetworkMode(const std::string& name);

/**
 * @struct Mount
 * @brief Host path bound into a container
 */
struct Mount {
    std::filesystem::path host_path;       ///< Source on the host
    std::filesystem::path container_path;  ///< Target inside the container
    bool read_only{false};                 ///< Bind read-only

    bool operator==(const Mount& other) const {
        return host_path == other.host_path &&
               container_path == other.container_path &&
               read_only == other.read_only;
    }
};

/**
 * @struct ResourceSpec
 * @brief Resource limits applied by the backend
 */
struct ResourceSpec {
    std::optional<std::uint64_t> memory_limit_bytes;  ///< Memory ceiling
    std::optional<double> cpu_quota;                  ///< Fractional CPU count
    std::optional<int> pids_limit;                    ///< Max processes (container)
};

/**
 * @struct NetworkPolicy
 * @brief Network isolation settings
 */
struct NetworkPolicy {
    std::optional<NetworkMode> mode;  ///< Unset resolves to NONE
};

/**
 * @struct WasmOptions
 * @brief Module selection for the WASM backend
 */
struct WasmOptions {
    std::optional<std::filesystem::path> module;  ///< Path to the .wasm file
    std::optional<std::string> function;          ///< Exported entry point ("run")
    std::optional<bool> wasi;                     ///< Enable WASI imports
};

/**
 * @struct IsolationPolicy
 * @brief Declarative backend, resource and network contract for one call
 */
struct IsolationPolicy {
    std::optional<SandboxType> type;                   ///< Requested backend
    std::optional<std::string> image;                  ///< Container image
    ResourceSpec resources;                            ///< Resource limits
    NetworkPolicy network;                             ///< Network settings
    std::optional<std::vector<Mount>> mounts;          ///< Bind mounts (replace on merge)
    std::map<std::string, std::string> env;            ///< Base environment
    std::optional<std::chrono::milliseconds> timeout;  ///< Default timeout
    std::optional<std::filesystem::path> working_dir;  ///< Default working dir
    std::optional<std::string> user;                   ///< Container user
    WasmOptions wasm;                                  ///< WASM module options
};

/**
 * @struct ExecutionRequest
 * @brief Command to run; one request produces exactly one result
 */
struct ExecutionRequest {
    std::vector<std::string> command;                  ///< Joined and run by /bin/sh -c
    std::map<std::string, std::string> env;            ///< Overrides policy env
    std::optional<std::chrono::milliseconds> timeout;  ///< Overrides policy timeout
    std::optional<std::filesystem::path> working_dir;  ///< Overrides policy working dir
    std::optional<std::string> stdin_data;             ///< Fed to the command's stdin
};

/**
 * @struct ExecutionResult
 * @brief Normalized outcome of a command that ran
 *
 * Non-zero exit codes and timeouts are reported here, not as errors.
 */
struct ExecutionResult {
    std::string stdout_output;                 ///< Captured standard output
    std::string stderr_output;                 ///< Captured standard error
    int exit_code{0};                          ///< 124 on timeout, 128+N on signal N
    bool timed_out{false};                     ///< Command was killed at the deadline
    std::chrono::milliseconds duration{0};     ///< Wall time of the run
    SandboxType backend{SandboxType::NATIVE};  ///< Backend that actually ran it
};

/// Exit code reported for a command killed at its deadline
constexpr int kTimeoutExitCode = 124;

/**
 * @brief Map an exit code onto the 0..255 range a process can return
 *
 * Codes outside that range (WASM plugins may report any int) become 1, so a
 * failing command never turns into a successful process status.
 */
int ToProcessExitStatus(int exit_code);

/// Timeout used when neither the request nor the policy sets one
constexpr std::chrono::milliseconds kDefaultTimeout{30000};

/**
 * @class CancellationToken
 * @brief Shared flag that lets a caller abandon a running execution
 *
 * Copies share state. A default-constructed token is never cancelled and
 * costs nothing to check.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    /// Token that can actually be cancelled
    static CancellationToken Create() {
        CancellationToken token;
        token.flag_ = std::make_shared<std::atomic<bool>>(false);
        return token;
    }

    void Cancel() const {
        if (flag_) flag_->store(true);
    }

    bool IsCancelled() const {
        return flag_ && flag_->load();
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace warden
