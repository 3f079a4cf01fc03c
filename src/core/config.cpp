/**
 * @file config.cpp
 * @brief Implementation of configuration defaults, validation and loading
 *
 * @date 2025
 */

#include "warden/core/config.hpp"
#include "warden/core/policy.hpp"
#include "warden/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace warden {

namespace {

std::uint64_t ParseBytes(const json& value, const std::string& field) {
    if (value.is_number_unsigned()) {
        return value.get<std::uint64_t>();
    }
    if (value.is_number_integer() && value.get<std::int64_t>() >= 0) {
        return static_cast<std::uint64_t>(value.get<std::int64_t>());
    }
    if (value.is_string()) {
        auto parsed = utils::StringUtils::ParseByteSize(value.get<std::string>());
        if (parsed) {
            return *parsed;
        }
    }
    throw std::invalid_argument("'" + field + "' is not a byte quantity: " + value.dump());
}

// Counts are read signed first so that -1 is rejected instead of wrapping
std::size_t ParseCount(const json& value, const std::string& field) {
    if (!value.is_number_integer()) {
        throw std::invalid_argument("'" + field + "' must be an integer");
    }
    if (value.is_number_unsigned()) {
        return value.get<std::size_t>();
    }
    const auto count = value.get<std::int64_t>();
    if (count < 0) {
        throw std::invalid_argument("'" + field + "' must not be negative, got " +
                                    std::to_string(count));
    }
    return static_cast<std::size_t>(count);
}

std::chrono::milliseconds ParseMillis(const json& value, const std::string& field) {
    if (!value.is_number_integer()) {
        throw std::invalid_argument("'" + field + "' must be an integer number of milliseconds");
    }
    return std::chrono::milliseconds(value.get<std::int64_t>());
}

SandboxType ParseType(const json& value, const std::string& field) {
    auto type = value.is_string() ? ParseSandboxType(value.get<std::string>()) : std::nullopt;
    if (!type) {
        throw std::invalid_argument("'" + field + "' is not a sandbox type: " + value.dump());
    }
    return *type;
}

template <typename T>
T Get(const json& object, const char* key, const std::string& context) {
    try {
        return object.at(key).get<T>();
    } catch (const json::exception& e) {
        throw std::invalid_argument("'" + context + "." + key + "': " + e.what());
    }
}

} // anonymous namespace

// ============================================================================
// DEFAULTS
// ============================================================================

FallbackChains DefaultFallbackChains() {
    return {
        {SandboxType::CONTAINER, {SandboxType::NATIVE}},
        {SandboxType::WASM, {SandboxType::CONTAINER, SandboxType::NATIVE}},
    };
}

IsolationPolicy DefaultPolicy() {
    IsolationPolicy policy;
    policy.image = kDefaultImage;
    return policy;
}

// ============================================================================
// VALIDATION
// ============================================================================

void ValidateConfig(const ManagerConfig& config) {
    if (config.pool.max_size < 1) {
        throw std::invalid_argument("pool.max_size must be at least 1");
    }
    if (config.pool.idle_timeout.count() < 1) {
        throw std::invalid_argument("pool.idle_timeout_ms must be at least 1");
    }
    if (config.native.kill_grace.count() < 0) {
        throw std::invalid_argument("native.kill_grace_ms must not be negative");
    }
    if (config.docker.binary.empty()) {
        throw std::invalid_argument("docker.binary must not be empty");
    }
    if (config.wasm.cache_size < 1) {
        throw std::invalid_argument("wasm.cache_size must be at least 1");
    }

    // The defaults may leave the image to the caller
    IsolationPolicy defaults = config.defaults;
    defaults.type.reset();
    auto valid = ValidatePolicy(defaults);
    if (!valid) {
        throw std::invalid_argument("invalid default policy: " + valid.GetError().message);
    }

    for (const auto& [head, chain] : config.fallback) {
        for (auto type : chain) {
            if (type == head) {
                throw std::invalid_argument(std::string("fallback chain of '") +
                    SandboxTypeToString(head) + "' contains itself");
            }
        }
    }
}

// ============================================================================
// JSON LOADING
// ============================================================================

IsolationPolicy ParsePolicyJson(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("policy must be a JSON object");
    }

    IsolationPolicy policy;

    if (j.contains("type")) {
        policy.type = ParseType(j["type"], "type");
    }
    if (j.contains("image")) {
        policy.image = Get<std::string>(j, "image", "policy");
    }

    if (j.contains("resources")) {
        const auto& res = j["resources"];
        if (res.contains("memory")) {
            policy.resources.memory_limit_bytes = ParseBytes(res["memory"], "resources.memory");
        }
        if (res.contains("cpus")) {
            policy.resources.cpu_quota = Get<double>(res, "cpus", "resources");
        }
        if (res.contains("pids")) {
            policy.resources.pids_limit = Get<int>(res, "pids", "resources");
        }
    }

    if (j.contains("network") && j["network"].contains("mode")) {
        auto mode = ParseNetworkMode(Get<std::string>(j["network"], "mode", "network"));
        if (!mode) {
            throw std::invalid_argument("'network.mode' must be \"none\" or \"bridge\"");
        }
        policy.network.mode = *mode;
    }

    if (j.contains("mounts")) {
        if (!j["mounts"].is_array()) {
            throw std::invalid_argument("'mounts' must be an array");
        }
        std::vector<Mount> mounts;
        for (const auto& item : j["mounts"]) {
            Mount mount;
            mount.host_path = Get<std::string>(item, "host", "mounts[]");
            mount.container_path = Get<std::string>(item, "container", "mounts[]");
            if (item.contains("readonly")) {
                mount.read_only = Get<bool>(item, "readonly", "mounts[]");
            }
            mounts.push_back(std::move(mount));
        }
        policy.mounts = std::move(mounts);
    }

    if (j.contains("env")) {
        policy.env = Get<std::map<std::string, std::string>>(j, "env", "policy");
    }
    if (j.contains("timeout_ms")) {
        policy.timeout = ParseMillis(j["timeout_ms"], "timeout_ms");
    }
    if (j.contains("working_dir")) {
        policy.working_dir = Get<std::string>(j, "working_dir", "policy");
    }
    if (j.contains("user")) {
        policy.user = Get<std::string>(j, "user", "policy");
    }

    if (j.contains("wasm")) {
        const auto& wasm = j["wasm"];
        if (wasm.contains("module")) {
            policy.wasm.module = Get<std::string>(wasm, "module", "wasm");
        }
        if (wasm.contains("function")) {
            policy.wasm.function = Get<std::string>(wasm, "function", "wasm");
        }
        if (wasm.contains("wasi")) {
            policy.wasm.wasi = Get<bool>(wasm, "wasi", "wasm");
        }
    }

    return policy;
}

ManagerConfig LoadConfigFromJson(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("configuration must be a JSON object");
    }

    ManagerConfig config;

    if (j.contains("defaults")) {
        config.defaults = MergePolicy(DefaultPolicy(), ParsePolicyJson(j["defaults"]));
    }

    if (j.contains("pool")) {
        const auto& pool = j["pool"];
        if (pool.contains("max_size")) {
            config.pool.max_size = ParseCount(pool["max_size"], "pool.max_size");
        }
        if (pool.contains("idle_timeout_ms")) {
            config.pool.idle_timeout = ParseMillis(pool["idle_timeout_ms"], "pool.idle_timeout_ms");
        }
    }

    if (j.contains("docker")) {
        const auto& docker = j["docker"];
        if (docker.contains("binary")) {
            config.docker.binary = Get<std::string>(docker, "binary", "docker");
        }
        if (docker.contains("host")) {
            config.docker.host = Get<std::string>(docker, "host", "docker");
        }
        if (docker.contains("availability_ttl_ms")) {
            config.docker.availability_ttl =
                ParseMillis(docker["availability_ttl_ms"], "docker.availability_ttl_ms");
        }
        if (docker.contains("command_timeout_ms")) {
            config.docker.command_timeout =
                ParseMillis(docker["command_timeout_ms"], "docker.command_timeout_ms");
        }
    }

    if (j.contains("native")) {
        const auto& native = j["native"];
        if (native.contains("isolate_network")) {
            config.native.isolate_network = Get<bool>(native, "isolate_network", "native");
        }
        if (native.contains("kill_grace_ms")) {
            config.native.kill_grace = ParseMillis(native["kill_grace_ms"], "native.kill_grace_ms");
        }
    }

    if (j.contains("wasm") && j["wasm"].contains("cache_size")) {
        config.wasm.cache_size = ParseCount(j["wasm"]["cache_size"], "wasm.cache_size");
    }

    if (j.contains("max_output_bytes")) {
        config.max_output_bytes = static_cast<std::size_t>(
            ParseBytes(j["max_output_bytes"], "max_output_bytes"));
    }

    if (j.contains("fallback")) {
        if (!j["fallback"].is_object()) {
            throw std::invalid_argument("'fallback' must be an object");
        }
        FallbackChains chains;
        for (const auto& item : j["fallback"].items()) {
            const std::string& name = item.key();
            const json& chain = item.value();
            SandboxType head = ParseType(json(name), "fallback");
            if (!chain.is_array()) {
                throw std::invalid_argument("'fallback." + name + "' must be an array");
            }
            for (const auto& next : chain) {
                chains[head].push_back(ParseType(next, "fallback." + name));
            }
        }
        config.fallback = std::move(chains);
    }

    ValidateConfig(config);
    return config;
}

ManagerConfig LoadConfigFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open configuration file: " + path.string());
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw std::invalid_argument("Invalid JSON in " + path.string() + ": " + e.what());
    }

    spdlog::debug("Loaded configuration from {}", path.string());
    return LoadConfigFromJson(j);
}

} // namespace warden
