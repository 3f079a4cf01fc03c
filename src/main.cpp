/**
 * @file main.cpp
 * @brief warden-run - run one command through the sandbox manager
 *
 * Builds an IsolationPolicy from the command line (over an optional JSON
 * configuration file), executes the trailing command and mirrors its exit
 * status. Infrastructure errors exit with status 2.
 *
 * **Examples**:
 * ```
 * warden-run -- echo hello
 * warden-run --type container --image python:3.12-alpine --memory 256m -- python -c 'print(1)'
 * warden-run --type native --timeout 500 --env FOO=bar -- 'echo $FOO'
 * warden-run --config warden.json --json -- ls /workspace
 * ```
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include "warden/core/config.hpp"
#include "warden/core/sandbox_manager.hpp"
#include "warden/utils/string_utils.hpp"

#include <csignal>
#include <fstream>
#include <iostream>
#include <iterator>

using json = nlohmann::json;

namespace {

constexpr int kInfrastructureErrorStatus = 2;

warden::CancellationToken g_cancel = warden::CancellationToken::Create();

void HandleSignal(int) {
    g_cancel.Cancel();
}

/*******************************************************************************
 * Option Parsing Helpers
 ******************************************************************************/

warden::Mount ParseMount(const std::string& spec) {
    auto parts = warden::utils::StringUtils::Split(spec, ':');
    bool valid_mode = parts.size() == 2 || (parts.size() == 3 && (parts[2] == "ro" || parts[2] == "rw"));
    if (!valid_mode) {
        throw CLI::ValidationError("--mount", "expected host:container[:ro], got '" + spec + "'");
    }

    warden::Mount mount;
    mount.host_path = parts[0];
    mount.container_path = parts[1];
    mount.read_only = parts.size() == 3 && parts[2] == "ro";
    return mount;
}

std::pair<std::string, std::string> ParseEnv(const std::string& assignment) {
    auto eq = assignment.find('=');
    if (eq == std::string::npos || eq == 0) {
        throw CLI::ValidationError("--env", "expected KEY=VALUE, got '" + assignment + "'");
    }
    return {assignment.substr(0, eq), assignment.substr(eq + 1)};
}

/*******************************************************************************
 * Output
 ******************************************************************************/

void PrintJson(const warden::ExecutionResult& result) {
    json j;
    j["stdout"] = result.stdout_output;
    j["stderr"] = result.stderr_output;
    j["exit_code"] = result.exit_code;
    j["timed_out"] = result.timed_out;
    j["duration_ms"] = result.duration.count();
    j["backend"] = warden::SandboxTypeToString(result.backend);
    std::cout << j.dump(2) << std::endl;
}

void PrintJsonError(const warden::Error& error) {
    json j;
    j["error"] = warden::ErrorKindToString(error.kind);
    j["message"] = error.message;
    std::cout << j.dump(2) << std::endl;
}

} // anonymous namespace

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"Warden - run a command in a sandbox"};

    std::string type_name;
    std::string image;
    long timeout_ms = 0;
    std::string memory;
    double cpus = 0.0;
    std::string network;
    std::vector<std::string> mounts;
    std::vector<std::string> env;
    std::string workdir;
    std::string config_path;
    std::string stdin_file;
    bool json_output = false;
    bool verbose = false;
    std::vector<std::string> command;

    app.add_option("-t,--type", type_name, "Backend: native, container or wasm");
    app.add_option("-i,--image", image, "Container image");
    app.add_option("--timeout", timeout_ms, "Timeout in milliseconds")
        ->check(CLI::PositiveNumber);
    app.add_option("-m,--memory", memory, "Memory limit (e.g. 512m, 1g)");
    app.add_option("--cpus", cpus, "CPU quota (fractional CPUs)")
        ->check(CLI::PositiveNumber);
    app.add_option("-n,--network", network, "Network mode: none or bridge");
    app.add_option("--mount", mounts, "Bind mount host:container[:ro] (repeatable)");
    app.add_option("-e,--env", env, "Environment variable KEY=VALUE (repeatable)");
    app.add_option("-w,--workdir", workdir, "Working directory");
    app.add_option("-c,--config", config_path, "JSON configuration file")
        ->check(CLI::ExistingFile);
    app.add_option("--stdin", stdin_file, "File fed to the command's stdin")
        ->check(CLI::ExistingFile);
    app.add_flag("--json", json_output, "Print the result as JSON");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_option("command", command, "Command to execute")
        ->required();

    CLI11_PARSE(app, argc, argv);

    // Configure logging level and format; logs go to stderr, output to stdout
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    try {
        warden::ManagerConfig config;
        if (!config_path.empty()) {
            config = warden::LoadConfigFromFile(config_path);
        }

        warden::IsolationPolicy policy;
        if (!type_name.empty()) {
            policy.type = warden::ParseSandboxType(type_name);
            if (!policy.type) {
                spdlog::error("Unknown sandbox type: {}", type_name);
                return kInfrastructureErrorStatus;
            }
        }
        if (!image.empty()) {
            policy.image = image;
        }
        if (!memory.empty()) {
            policy.resources.memory_limit_bytes = warden::utils::StringUtils::ParseByteSize(memory);
            if (!policy.resources.memory_limit_bytes) {
                spdlog::error("Invalid memory limit: {}", memory);
                return kInfrastructureErrorStatus;
            }
        }
        if (cpus > 0.0) {
            policy.resources.cpu_quota = cpus;
        }
        if (!network.empty()) {
            policy.network.mode = warden::ParseNetworkMode(network);
            if (!policy.network.mode) {
                spdlog::error("Unknown network mode: {}", network);
                return kInfrastructureErrorStatus;
            }
        }
        if (!mounts.empty()) {
            std::vector<warden::Mount> parsed;
            for (const auto& spec : mounts) {
                parsed.push_back(ParseMount(spec));
            }
            policy.mounts = parsed;
        }

        warden::ExecutionRequest request;
        request.command = command;
        for (const auto& assignment : env) {
            request.env.insert(ParseEnv(assignment));
        }
        if (timeout_ms > 0) {
            request.timeout = std::chrono::milliseconds(timeout_ms);
        }
        if (!workdir.empty()) {
            request.working_dir = workdir;
        }
        if (!stdin_file.empty()) {
            std::ifstream in(stdin_file, std::ios::binary);
            request.stdin_data = std::string((std::istreambuf_iterator<char>(in)),
                                             std::istreambuf_iterator<char>());
        }

        warden::core::SandboxManager manager(config);
        manager.Initialize();

        spdlog::debug("Docker available: {}, WASM available: {}",
                      manager.IsDockerAvailable(), manager.IsWasmAvailable());

        auto result = manager.Execute(request, policy, g_cancel);
        manager.Shutdown();

        if (!result) {
            const auto& error = result.GetError();
            if (json_output) {
                PrintJsonError(error);
            } else {
                spdlog::error("{}: {}", warden::ErrorKindToString(error.kind), error.message);
            }
            return kInfrastructureErrorStatus;
        }

        const auto& execution = result.Value();
        if (json_output) {
            PrintJson(execution);
        } else {
            std::cout << execution.stdout_output << std::flush;
            std::cerr << execution.stderr_output << std::flush;
            if (execution.timed_out) {
                spdlog::warn("Command timed out after {} ms", execution.duration.count());
            }
        }

        spdlog::debug("Exit code {} on [{}] in {} ms", execution.exit_code,
                      warden::SandboxTypeToString(execution.backend), execution.duration.count());
        return warden::ToProcessExitStatus(execution.exit_code);

    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    } catch (const std::invalid_argument& e) {
        spdlog::error("Invalid configuration: {}", e.what());
        return kInfrastructureErrorStatus;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return kInfrastructureErrorStatus;
    }
}
