/**
 * @file config.hpp
 * @brief Sandbox manager configuration and its JSON loader
 *
 * **JSON Layout** (every key optional):
 * @code{.json}
 * {
 *   "defaults": {
 *     "type": "container",
 *     "image": "alpine:3.19",
 *     "resources": { "memory": "512m", "cpus": 0.5, "pids": 100 },
 *     "network": { "mode": "none" },
 *     "mounts": [ { "host": "/data", "container": "/data", "readonly": true } ],
 *     "env": { "LANG": "C" },
 *     "timeout_ms": 30000,
 *     "working_dir": "/workspace",
 *     "user": "1000:1000",
 *     "wasm": { "module": "plugins/tool.wasm", "function": "run", "wasi": true }
 *   },
 *   "pool":   { "max_size": 5, "idle_timeout_ms": 60000 },
 *   "docker": { "binary": "docker", "host": "", "availability_ttl_ms": 5000,
 *               "command_timeout_ms": 30000 },
 *   "native": { "isolate_network": true, "kill_grace_ms": 200 },
 *   "wasm":   { "cache_size": 10 },
 *   "max_output_bytes": 50000,
 *   "fallback": { "container": ["native"], "wasm": ["container", "native"] }
 * }
 * @endcode
 *
 * Byte quantities accept a number of bytes or a string such as "512m".
 *
 * @date 2025
 */

#pragma once

#include "warden/core/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace warden {

/// Image used by container policies that do not name one
constexpr const char* kDefaultImage = "alpine:3.19";

struct PoolSettings {
    std::size_t max_size{5};                        ///< Max live containers
    std::chrono::milliseconds idle_timeout{60000};  ///< Idle eviction threshold
};

struct DockerSettings {
    std::string binary{"docker"};                       ///< CLI executable
    std::string host;                                   ///< DOCKER_HOST override
    std::chrono::milliseconds availability_ttl{5000};   ///< Ping cache lifetime
    std::chrono::milliseconds command_timeout{30000};   ///< Control command deadline
};

struct NativeSettings {
    bool isolate_network{true};                 ///< Private netns for network "none"
    std::chrono::milliseconds kill_grace{200};  ///< SIGTERM → SIGKILL delay
};

struct WasmSettings {
    std::size_t cache_size{10};  ///< Loaded modules kept
};

/// Fallback chain per requested backend (the head itself excluded)
using FallbackChains = std::map<SandboxType, std::vector<SandboxType>>;

/// container → native, wasm → container → native
FallbackChains DefaultFallbackChains();

/// Defaults applied when the caller sets nothing: the default image only
IsolationPolicy DefaultPolicy();

/**
 * @struct ManagerConfig
 * @brief Everything a SandboxManager is configured with
 */
struct ManagerConfig {
    IsolationPolicy defaults = DefaultPolicy();   ///< Merged under every call
    PoolSettings pool;
    DockerSettings docker;
    NativeSettings native;
    WasmSettings wasm;
    std::size_t max_output_bytes{50000};          ///< Per stream cap, all backends
    FallbackChains fallback = DefaultFallbackChains();
};

/**
 * @brief Check a configuration for values the manager cannot run with
 * @throws std::invalid_argument describing the first problem
 */
void ValidateConfig(const ManagerConfig& config);

/**
 * @brief Parse an IsolationPolicy object
 * @throws std::invalid_argument on unknown enum values or wrong types
 */
IsolationPolicy ParsePolicyJson(const nlohmann::json& j);

/**
 * @brief Build a ManagerConfig from JSON, starting from the defaults
 * @throws std::invalid_argument on malformed values
 */
ManagerConfig LoadConfigFromJson(const nlohmann::json& j);

/**
 * @brief Read and parse a JSON configuration file
 * @throws std::runtime_error if the file cannot be read
 * @throws std::invalid_argument if it is not valid configuration
 */
ManagerConfig LoadConfigFromFile(const std::filesystem::path& path);

} // namespace warden
