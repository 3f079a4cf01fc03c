/**
 * @file container_runtime.hpp
 * @brief Pluggable container engine client
 *
 * The container backend only needs a handful of engine operations: ping the
 * daemon, create/start/stop/remove a container and exec a command in it.
 * Any engine client offering that shape can drive the pool; the default is
 * DockerCliRuntime (utils/container_utils.hpp).
 *
 * Implementations must be safe to call from several threads at once.
 *
 * @date 2025
 */

#pragma once

#include "warden/core/result.hpp"
#include "warden/core/types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace warden {
namespace runtime {

/**
 * @struct ContainerCreateOptions
 * @brief Creation-time settings of a pooled container
 *
 * Two containers are interchangeable only if they were created with equal
 * options; the pool fingerprints this struct to group them into families.
 */
struct ContainerCreateOptions {
    std::string image;                                ///< Image reference
    std::optional<std::uint64_t> memory_limit_bytes;  ///< --memory
    std::optional<double> cpus;                       ///< --cpus
    int pids_limit{100};                              ///< --pids-limit
    NetworkMode network_mode{NetworkMode::NONE};      ///< --network
    std::vector<Mount> mounts;                        ///< -v host:ctr[:ro]
    std::optional<std::string> user;                  ///< --user
    std::filesystem::path working_dir{"/workspace"};  ///< --workdir
};

/**
 * @struct ContainerExecOptions
 * @brief One command executed inside a running container
 */
struct ContainerExecOptions {
    std::vector<std::string> command;                  ///< argv inside the container
    std::map<std::string, std::string> env;            ///< -e KEY=VALUE
    std::optional<std::filesystem::path> working_dir;  ///< -w
    std::optional<std::string> stdin_data;             ///< Piped with -i
    std::chrono::milliseconds timeout{0};              ///< 0 = no deadline
    std::size_t max_output_bytes{0};                   ///< Per stream, 0 = unlimited
    CancellationToken cancel;                          ///< Abort early
};

/**
 * @struct ContainerExecResult
 * @brief Result of command execution in container
 */
struct ContainerExecResult {
    int exit_code{0};                       ///< Exit code of the command
    std::string stdout_output;              ///< Standard output
    std::string stderr_output;              ///< Standard error
    bool timed_out{false};                  ///< Deadline hit, exec client killed
    bool cancelled{false};                  ///< Cancellation token fired
    std::chrono::milliseconds duration{0};  ///< Execution duration
};

/**
 * @class ContainerRuntime
 * @brief Abstract container engine
 */
class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;

    /// Engine name for logs ("docker")
    virtual std::string GetName() const = 0;

    /**
     * @brief Check that the engine daemon answers
     * @return BACKEND_UNAVAILABLE if it does not
     */
    virtual Result<void> Ping() = 0;

    /**
     * @brief Create (not start) a container that idles until exec'd into
     * @return Container ID
     */
    virtual Result<std::string> CreateContainer(const ContainerCreateOptions& options) = 0;

    virtual Result<void> StartContainer(const std::string& container_id) = 0;

    /**
     * @brief Run a command in a started container
     *
     * A non-zero exit code of the command is a successful result. A timeout
     * kills the exec client only; the caller must dispose of the container.
     */
    virtual Result<ContainerExecResult> Exec(const std::string& container_id,
                                             const ContainerExecOptions& options) = 0;

    virtual Result<void> StopContainer(const std::string& container_id,
                                       std::chrono::seconds grace) = 0;

    virtual Result<void> RemoveContainer(const std::string& container_id, bool force) = 0;
};

} // namespace runtime
} // namespace warden
