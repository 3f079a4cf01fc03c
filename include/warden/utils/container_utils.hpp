/**
 * @file container_utils.hpp
 * @brief Docker CLI implementation of the container runtime
 *
 * Drives the `docker` command-line client rather than the Engine API, so the
 * only requirement on the host is a working CLI and whatever daemon it is
 * configured for (DOCKER_HOST, contexts). Podman's docker-compatible CLI
 * works as a drop-in by pointing `binary` at it.
 *
 * **Security Hardening** applied to every container:
 * - --cap-drop ALL
 * - --security-opt no-new-privileges
 * - --pids-limit (default 100)
 * - --network none unless the policy asks for bridge
 *
 * @date 2025
 */

#pragma once

#include "warden/runtime/container_runtime.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace warden {
namespace utils {

/**
 * @struct DockerCliConfig
 * @brief Docker client settings
 */
struct DockerCliConfig {
    std::string binary{"docker"};                        ///< CLI executable (PATH lookup)
    std::string host;                                    ///< DOCKER_HOST override (empty = inherit)
    std::chrono::milliseconds command_timeout{30000};    ///< Ping/start/stop/rm deadline
    std::chrono::milliseconds create_timeout{300000};    ///< Create deadline (includes pull)
    std::string name_prefix{"warden"};                   ///< Container name prefix
};

/**
 * @class DockerCliRuntime
 * @brief ContainerRuntime backed by the docker CLI
 *
 * **Usage Example**:
 * @code
 * DockerCliRuntime docker;
 * if (!docker.Ping()) return;
 *
 * runtime::ContainerCreateOptions options;
 * options.image = "alpine:3.19";
 * auto id = docker.CreateContainer(options);
 * docker.StartContainer(id.Value());
 *
 * runtime::ContainerExecOptions exec;
 * exec.command = {"/bin/sh", "-c", "echo hello"};
 * auto result = docker.Exec(id.Value(), exec);
 *
 * docker.RemoveContainer(id.Value(), true);
 * @endcode
 */
class DockerCliRuntime : public runtime::ContainerRuntime {
public:
    explicit DockerCliRuntime(const DockerCliConfig& config = DockerCliConfig{});
    ~DockerCliRuntime() override;

    std::string GetName() const override { return "docker"; }

    Result<void> Ping() override;
    Result<std::string> CreateContainer(const runtime::ContainerCreateOptions& options) override;
    Result<void> StartContainer(const std::string& container_id) override;
    Result<runtime::ContainerExecResult> Exec(const std::string& container_id,
                                              const runtime::ContainerExecOptions& options) override;
    Result<void> StopContainer(const std::string& container_id,
                               std::chrono::seconds grace) override;
    Result<void> RemoveContainer(const std::string& container_id, bool force) override;

    /**
     * @brief Daemon version reported by `docker version`
     * @return Version string, or "unknown"
     */
    std::string GetServerVersion();

    /**
     * @brief Build `docker create` arguments (without the binary)
     *
     * Exposed for tests and for logging the effective command.
     */
    std::vector<std::string> BuildCreateArgs(const runtime::ContainerCreateOptions& options,
                                             const std::string& container_name) const;

    /// Build `docker exec` arguments (without the binary)
    std::vector<std::string> BuildExecArgs(const std::string& container_id,
                                           const runtime::ContainerExecOptions& options) const;

    /**
     * @brief Whether CLI stderr means the daemon is unreachable
     */
    static bool IsConnectivityError(const std::string& stderr_output);

    const DockerCliConfig& GetConfig() const { return config_; }

private:
    struct CommandOutput {
        int exit_code{0};
        std::string stdout_output;
        std::string stderr_output;
        bool timed_out{false};
    };

    Result<CommandOutput> RunDocker(const std::vector<std::string>& args,
                                    std::chrono::milliseconds timeout) const;
    Result<void> RunSimple(const std::vector<std::string>& args, const std::string& action) const;
    std::string GenerateContainerName() const;

    DockerCliConfig config_;
};

} // namespace utils
} // namespace warden
