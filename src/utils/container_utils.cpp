/**
 * @file container_utils.cpp
 * @brief Implementation of the docker CLI container runtime
 *
 * Every operation shells out to the docker client through ProcessUtils with
 * a deadline, so a wedged daemon can never hang the caller.
 *
 * **Container Lifecycle**:
 * ```
 * create (sleep infinity) → start → exec* → stop → rm --force
 * ```
 *
 * **Error Classification**:
 * - CLI cannot be spawned, control command timed out, or stderr says the
 *   daemon is unreachable → BACKEND_UNAVAILABLE
 * - `Error response from daemon: ...` on exec → EXECUTION_FAILED
 * - Any other non-zero exit of a control command → EXECUTION_FAILED
 * - Non-zero exit of an exec'd command → successful result
 *
 * @date 2025
 */

#include "warden/utils/container_utils.hpp"
#include "warden/utils/hash_utils.hpp"
#include "warden/utils/process_utils.hpp"
#include "warden/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <iomanip>
#include <sstream>

namespace warden {
namespace utils {

namespace {

std::string FormatCpus(double cpus) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << cpus;
    return oss.str();
}

std::string FirstLine(const std::string& text) {
    std::string trimmed = StringUtils::Trim(text);
    auto newline = trimmed.find('\n');
    return newline == std::string::npos ? trimmed : trimmed.substr(0, newline);
}

} // anonymous namespace

// ============================================================================
// CONSTRUCTOR / DESTRUCTOR
// ============================================================================

DockerCliRuntime::DockerCliRuntime(const DockerCliConfig& config)
    : config_(config) {
    spdlog::debug("Docker CLI runtime created (binary: {})", config_.binary);
}

DockerCliRuntime::~DockerCliRuntime() = default;

// ============================================================================
// DAEMON PROBING
// ============================================================================
// `docker --version` only proves the client exists; `docker version` with a
// server template round-trips to the daemon

Result<void> DockerCliRuntime::Ping() {
    auto result = RunDocker({"version", "--format", "{{.Server.Version}}"},
                            config_.command_timeout);
    if (!result) {
        return Result<void>::Failure(result.GetError());
    }

    const auto& output = result.Value();
    if (output.exit_code != 0 || StringUtils::Trim(output.stdout_output).empty()) {
        return Result<void>::Failure(ErrorKind::BACKEND_UNAVAILABLE,
            "Docker daemon not reachable: " + FirstLine(output.stderr_output));
    }

    return Result<void>::Success();
}

std::string DockerCliRuntime::GetServerVersion() {
    auto result = RunDocker({"version", "--format", "{{.Server.Version}}"},
                            config_.command_timeout);
    if (result && result.Value().exit_code == 0) {
        std::string version = StringUtils::Trim(result.Value().stdout_output);
        if (!version.empty()) {
            return version;
        }
    }
    return "unknown";
}

// ============================================================================
// CONTAINER CREATION
// ============================================================================

Result<std::string> DockerCliRuntime::CreateContainer(
    const runtime::ContainerCreateOptions& options) {

    if (StringUtils::Trim(options.image).empty()) {
        return Result<std::string>::Failure(ErrorKind::INVALID_POLICY,
                                            "container image is empty");
    }

    std::string name = GenerateContainerName();
    spdlog::info("Creating container {} from {}", name, options.image);

    if (options.network_mode != NetworkMode::NONE) {
        spdlog::warn("Container {} gets network mode '{}'", name,
                     NetworkModeToString(options.network_mode));
    }

    auto result = RunDocker(BuildCreateArgs(options, name), config_.create_timeout);
    if (!result) {
        return Result<std::string>::Failure(result.GetError());
    }

    const auto& output = result.Value();
    if (output.exit_code != 0) {
        ErrorKind kind = IsConnectivityError(output.stderr_output)
            ? ErrorKind::BACKEND_UNAVAILABLE
            : ErrorKind::EXECUTION_FAILED;
        spdlog::error("Failed to create container: {}", FirstLine(output.stderr_output));
        return Result<std::string>::Failure(kind,
            "Failed to create container: " + FirstLine(output.stderr_output));
    }

    // docker create may print pull progress before the ID; the ID is the last line
    std::string container_id;
    std::istringstream stream(output.stdout_output);
    std::string line;
    while (std::getline(stream, line)) {
        line = StringUtils::Trim(line);
        if (!line.empty()) {
            container_id = line;
        }
    }

    if (container_id.empty()) {
        return Result<std::string>::Failure(ErrorKind::EXECUTION_FAILED,
                                            "docker create returned no container id");
    }

    spdlog::debug("Container created: {}", container_id);
    return Result<std::string>::Success(container_id);
}

// ============================================================================
// CONTAINER LIFECYCLE MANAGEMENT
// ============================================================================

Result<void> DockerCliRuntime::StartContainer(const std::string& container_id) {
    spdlog::debug("Starting container: {}", container_id);
    return RunSimple({"start", container_id}, "start");
}

Result<void> DockerCliRuntime::StopContainer(const std::string& container_id,
                                             std::chrono::seconds grace) {
    spdlog::debug("Stopping container: {} (grace: {}s)", container_id, grace.count());
    return RunSimple({"stop", "--time", std::to_string(grace.count()), container_id}, "stop");
}

Result<void> DockerCliRuntime::RemoveContainer(const std::string& container_id, bool force) {
    spdlog::debug("Removing container: {} (force: {})", container_id, force);

    std::vector<std::string> args = {"rm"};
    if (force) {
        args.push_back("--force");
    }
    args.push_back(container_id);

    return RunSimple(args, "remove");
}

// ============================================================================
// CONTAINER COMMAND EXECUTION
// ============================================================================

Result<runtime::ContainerExecResult> DockerCliRuntime::Exec(
    const std::string& container_id,
    const runtime::ContainerExecOptions& options) {

    if (options.command.empty()) {
        return Result<runtime::ContainerExecResult>::Failure(ErrorKind::INVALID_REQUEST,
                                                            "Command array is empty");
    }

    ProcessOptions process;
    process.argv.push_back(config_.binary);
    for (auto& arg : BuildExecArgs(container_id, options)) {
        process.argv.push_back(std::move(arg));
    }
    if (!config_.host.empty()) {
        process.env["DOCKER_HOST"] = config_.host;
    }
    process.stdin_data = options.stdin_data;
    process.timeout = options.timeout;
    process.max_output_bytes = options.max_output_bytes;
    process.cancel = options.cancel;

    auto run = ProcessUtils::Run(process);
    if (!run) {
        return Result<runtime::ContainerExecResult>::Failure(ErrorKind::BACKEND_UNAVAILABLE,
            "Failed to run docker client: " + run.GetError().message);
    }

    const auto& output = run.Value();

    if (!output.timed_out && !output.cancelled && output.exit_code != 0) {
        if (IsConnectivityError(output.stderr_output)) {
            return Result<runtime::ContainerExecResult>::Failure(ErrorKind::BACKEND_UNAVAILABLE,
                "Docker daemon not reachable: " + FirstLine(output.stderr_output));
        }
        if (StringUtils::StartsWith(output.stderr_output, "Error response from daemon")) {
            return Result<runtime::ContainerExecResult>::Failure(ErrorKind::EXECUTION_FAILED,
                FirstLine(output.stderr_output));
        }
    }

    runtime::ContainerExecResult result;
    result.exit_code = output.exit_code;
    result.stdout_output = output.stdout_output;
    result.stderr_output = output.stderr_output;
    result.timed_out = output.timed_out;
    result.cancelled = output.cancelled;
    result.duration = output.duration;

    return Result<runtime::ContainerExecResult>::Success(std::move(result));
}

// ============================================================================
// ARGUMENT BUILDERS
// ============================================================================

std::vector<std::string> DockerCliRuntime::BuildCreateArgs(
    const runtime::ContainerCreateOptions& options,
    const std::string& container_name) const {

    std::vector<std::string> args;

    args.push_back("create");

    // Container name
    args.push_back("--name");
    args.push_back(container_name);
    args.push_back("--label");
    args.push_back("warden.pool=true");

    // Memory limit
    if (options.memory_limit_bytes) {
        args.push_back("--memory");
        args.push_back(std::to_string(*options.memory_limit_bytes));
    }

    // CPU limit
    if (options.cpus) {
        args.push_back("--cpus");
        args.push_back(FormatCpus(*options.cpus));
    }

    args.push_back("--pids-limit");
    args.push_back(std::to_string(options.pids_limit));

    // Network mode
    args.push_back("--network");
    args.push_back(NetworkModeToString(options.network_mode));

    // Security: no capabilities, no privilege escalation
    args.push_back("--cap-drop");
    args.push_back("ALL");
    args.push_back("--security-opt");
    args.push_back("no-new-privileges");

    // Volume mounts
    for (const auto& mount : options.mounts) {
        args.push_back("-v");
        args.push_back(mount.host_path.string() + ":" + mount.container_path.string() +
                       (mount.read_only ? ":ro" : ""));
    }

    if (options.user) {
        args.push_back("--user");
        args.push_back(*options.user);
    }

    if (!options.working_dir.empty()) {
        args.push_back("--workdir");
        args.push_back(options.working_dir.string());
    }

    // Image and idle entrypoint; work arrives through exec
    args.push_back(options.image);
    args.push_back("sleep");
    args.push_back("infinity");

    return args;
}

std::vector<std::string> DockerCliRuntime::BuildExecArgs(
    const std::string& container_id,
    const runtime::ContainerExecOptions& options) const {

    std::vector<std::string> args = {"exec"};

    if (options.stdin_data) {
        args.push_back("-i");  // Interactive mode
    }

    for (const auto& [key, value] : options.env) {
        args.push_back("-e");
        args.push_back(key + "=" + value);
    }

    if (options.working_dir) {
        args.push_back("-w");
        args.push_back(options.working_dir->string());
    }

    args.push_back(container_id);
    args.insert(args.end(), options.command.begin(), options.command.end());

    return args;
}

// ============================================================================
// PRIVATE HELPER METHODS
// ============================================================================

bool DockerCliRuntime::IsConnectivityError(const std::string& stderr_output) {
    static const char* kMarkers[] = {
        "Cannot connect to the Docker daemon",
        "Is the docker daemon running",
        "error during connect",
        "permission denied while trying to connect to the Docker daemon",
        "connection refused",
    };

    for (const char* marker : kMarkers) {
        if (StringUtils::Contains(stderr_output, marker)) {
            return true;
        }
    }
    return false;
}

Result<DockerCliRuntime::CommandOutput> DockerCliRuntime::RunDocker(
    const std::vector<std::string>& args,
    std::chrono::milliseconds timeout) const {

    ProcessOptions process;
    process.argv.push_back(config_.binary);
    process.argv.insert(process.argv.end(), args.begin(), args.end());
    process.timeout = timeout;
    if (!config_.host.empty()) {
        process.env["DOCKER_HOST"] = config_.host;
    }

    spdlog::debug("Executing: {}", StringUtils::Join(process.argv, " "));

    auto run = ProcessUtils::Run(process);
    if (!run) {
        return Result<CommandOutput>::Failure(ErrorKind::BACKEND_UNAVAILABLE,
            "Failed to run docker client: " + run.GetError().message);
    }

    const auto& output = run.Value();
    if (output.timed_out) {
        return Result<CommandOutput>::Failure(ErrorKind::BACKEND_UNAVAILABLE,
            "docker " + (args.empty() ? std::string() : args.front()) +
            " timed out after " + std::to_string(timeout.count()) + "ms");
    }

    CommandOutput command_output;
    command_output.exit_code = output.exit_code;
    command_output.stdout_output = output.stdout_output;
    command_output.stderr_output = output.stderr_output;
    command_output.timed_out = output.timed_out;

    return Result<CommandOutput>::Success(std::move(command_output));
}

Result<void> DockerCliRuntime::RunSimple(const std::vector<std::string>& args,
                                         const std::string& action) const {
    auto result = RunDocker(args, config_.command_timeout);
    if (!result) {
        return Result<void>::Failure(result.GetError());
    }

    const auto& output = result.Value();
    if (output.exit_code != 0) {
        ErrorKind kind = IsConnectivityError(output.stderr_output)
            ? ErrorKind::BACKEND_UNAVAILABLE
            : ErrorKind::EXECUTION_FAILED;
        return Result<void>::Failure(kind,
            "Failed to " + action + " container: " + FirstLine(output.stderr_output));
    }

    return Result<void>::Success();
}

std::string DockerCliRuntime::GenerateContainerName() const {
    return config_.name_prefix + "-" + HashUtils::GenerateRandomHex(6);
}

} // namespace utils
} // namespace warden
