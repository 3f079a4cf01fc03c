/**
 * @file types.cpp
 * @brief Name conversions for the shared enums
 *
 * @date 2025
 */

#include "warden/core/result.hpp"
#include "warden/core/types.hpp"
#include "warden/utils/string_utils.hpp"

namespace warden {

const char* ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::BACKEND_UNAVAILABLE: return "BACKEND_UNAVAILABLE";
        case ErrorKind::INVALID_POLICY:      return "INVALID_POLICY";
        case ErrorKind::INVALID_REQUEST:     return "INVALID_REQUEST";
        case ErrorKind::POOL_EXHAUSTED:      return "POOL_EXHAUSTED";
        case ErrorKind::EXECUTION_FAILED:    return "EXECUTION_FAILED";
        case ErrorKind::CANCELLED:           return "CANCELLED";
    }
    return "UNKNOWN";
}

const char* SandboxTypeToString(SandboxType type) {
    switch (type) {
        case SandboxType::NATIVE:    return "native";
        case SandboxType::CONTAINER: return "container";
        case SandboxType::WASM:      return "wasm";
    }
    return "unknown";
}

std::optional<SandboxType> ParseSandboxType(const std::string& name) {
    std::string lowered = utils::StringUtils::ToLower(utils::StringUtils::Trim(name));

    if (lowered == "native") return SandboxType::NATIVE;
    // "docker" is accepted for configs written against the docker-only naming
    if (lowered == "container" || lowered == "docker") return SandboxType::CONTAINER;
    if (lowered == "wasm") return SandboxType::WASM;
    return std::nullopt;
}

const char* NetworkModeToString(NetworkMode mode) {
    switch (mode) {
        case NetworkMode::NONE:   return "none";
        case NetworkMode::BRIDGE: return "bridge";
    }
    return "none";
}

std::optional<NetworkMode> ParseNetworkMode(const std::string& name) {
    std::string lowered = utils::StringUtils::ToLower(utils::StringUtils::Trim(name));

    if (lowered == "none") return NetworkMode::NONE;
    if (lowered == "bridge") return NetworkMode::BRIDGE;
    return std::nullopt;
}

int ToProcessExitStatus(int exit_code) {
    if (exit_code < 0 || exit_code > 255) {
        return 1;
    }
    return exit_code;
}

} // namespace warden
