#include "warden/utils/container_utils.hpp"

#include "fakes.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>

using namespace warden;
using warden::utils::DockerCliConfig;
using warden::utils::DockerCliRuntime;

namespace {

bool HasPair(const std::vector<std::string>& args, const std::string& flag,
             const std::string& value) {
    for (std::size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] == flag && args[i + 1] == value) {
            return true;
        }
    }
    return false;
}

bool Has(const std::vector<std::string>& args, const std::string& value) {
    return std::find(args.begin(), args.end(), value) != args.end();
}

// Stand-in docker client: a shell script made executable
class FakeDockerBinary {
public:
    explicit FakeDockerBinary(const std::string& body)
        : script_("#!/bin/sh\n" + body + "\n", ".sh") {
        std::filesystem::permissions(script_.Path(), std::filesystem::perms::owner_all,
                                     std::filesystem::perm_options::add);
    }

    std::string Path() const { return script_.Path().string(); }

private:
    test::TempFile script_;
};

} // namespace

TEST(DockerCliRuntimeTest, CreateArgsCarryHardeningAndLimits) {
    DockerCliRuntime docker;
    runtime::ContainerCreateOptions options;
    options.image = "alpine:3.19";
    options.memory_limit_bytes = 512ull * 1024 * 1024;
    options.cpus = 0.5;
    options.pids_limit = 64;
    options.mounts = {{"/srv/data", "/data", true}, {"/tmp/out", "/out", false}};
    options.user = "1000:1000";

    auto args = docker.BuildCreateArgs(options, "warden-abc");

    ASSERT_FALSE(args.empty());
    EXPECT_EQ(args.front(), "create");
    EXPECT_TRUE(HasPair(args, "--name", "warden-abc"));
    EXPECT_TRUE(HasPair(args, "--label", "warden.pool=true"));
    EXPECT_TRUE(HasPair(args, "--memory", std::to_string(512ull * 1024 * 1024)));
    EXPECT_TRUE(HasPair(args, "--cpus", "0.500"));
    EXPECT_TRUE(HasPair(args, "--pids-limit", "64"));
    EXPECT_TRUE(HasPair(args, "--network", "none"));
    EXPECT_TRUE(HasPair(args, "--cap-drop", "ALL"));
    EXPECT_TRUE(HasPair(args, "--security-opt", "no-new-privileges"));
    EXPECT_TRUE(HasPair(args, "-v", "/srv/data:/data:ro"));
    EXPECT_TRUE(HasPair(args, "-v", "/tmp/out:/out"));
    EXPECT_TRUE(HasPair(args, "--user", "1000:1000"));
    EXPECT_TRUE(HasPair(args, "--workdir", "/workspace"));

    // Image followed by the idle entrypoint
    ASSERT_GE(args.size(), 3u);
    EXPECT_EQ(args[args.size() - 3], "alpine:3.19");
    EXPECT_EQ(args[args.size() - 2], "sleep");
    EXPECT_EQ(args[args.size() - 1], "infinity");
}

TEST(DockerCliRuntimeTest, CreateArgsOmitUnsetLimits) {
    DockerCliRuntime docker;
    runtime::ContainerCreateOptions options;
    options.image = "busybox";
    options.network_mode = NetworkMode::BRIDGE;

    auto args = docker.BuildCreateArgs(options, "warden-x");

    EXPECT_FALSE(Has(args, "--memory"));
    EXPECT_FALSE(Has(args, "--cpus"));
    EXPECT_FALSE(Has(args, "--user"));
    EXPECT_TRUE(HasPair(args, "--pids-limit", "100"));
    EXPECT_TRUE(HasPair(args, "--network", "bridge"));
}

TEST(DockerCliRuntimeTest, ExecArgsPlaceOptionsBeforeContainer) {
    DockerCliRuntime docker;
    runtime::ContainerExecOptions options;
    options.command = {"/bin/sh", "-c", "echo $A"};
    options.env = {{"A", "1"}};
    options.working_dir = std::filesystem::path("/workspace/src");
    options.stdin_data = std::string("input");

    auto args = docker.BuildExecArgs("abc123", options);

    std::vector<std::string> expected = {
        "exec", "-i", "-e", "A=1", "-w", "/workspace/src", "abc123",
        "/bin/sh", "-c", "echo $A",
    };
    EXPECT_EQ(args, expected);
}

TEST(DockerCliRuntimeTest, ExecArgsWithoutStdinAreNotInteractive) {
    DockerCliRuntime docker;
    runtime::ContainerExecOptions options;
    options.command = {"true"};

    auto args = docker.BuildExecArgs("abc123", options);

    EXPECT_FALSE(Has(args, "-i"));
    EXPECT_EQ(args, (std::vector<std::string>{"exec", "abc123", "true"}));
}

TEST(DockerCliRuntimeTest, RecognizesConnectivityErrors) {
    EXPECT_TRUE(DockerCliRuntime::IsConnectivityError(
        "Cannot connect to the Docker daemon at unix:///var/run/docker.sock. "
        "Is the docker daemon running?"));
    EXPECT_TRUE(DockerCliRuntime::IsConnectivityError(
        "error during connect: Get \"http://host/v1.24/version\": dial tcp: connection refused"));
    EXPECT_FALSE(DockerCliRuntime::IsConnectivityError(
        "Error response from daemon: No such container: abc"));
    EXPECT_FALSE(DockerCliRuntime::IsConnectivityError(""));
}

TEST(DockerCliRuntimeTest, MissingBinaryMeansUnavailable) {
    DockerCliConfig config;
    config.binary = "/nonexistent/docker";
    DockerCliRuntime docker(config);

    auto ping = docker.Ping();
    ASSERT_FALSE(ping);
    EXPECT_EQ(ping.GetError().kind, ErrorKind::BACKEND_UNAVAILABLE);
    EXPECT_EQ(docker.GetServerVersion(), "unknown");
}

TEST(DockerCliRuntimeTest, DaemonDownMeansUnavailable) {
    FakeDockerBinary binary(
        "echo 'Cannot connect to the Docker daemon at unix:///var/run/docker.sock.' >&2\n"
        "exit 1");
    DockerCliConfig config;
    config.binary = binary.Path();
    DockerCliRuntime docker(config);

    auto ping = docker.Ping();
    ASSERT_FALSE(ping);
    EXPECT_EQ(ping.GetError().kind, ErrorKind::BACKEND_UNAVAILABLE);

    runtime::ContainerCreateOptions options;
    options.image = "alpine:3.19";
    auto created = docker.CreateContainer(options);
    ASSERT_FALSE(created);
    EXPECT_EQ(created.GetError().kind, ErrorKind::BACKEND_UNAVAILABLE);
}

TEST(DockerCliRuntimeTest, StopPassesGracePeriod) {
    test::TempFile log("", ".log");
    FakeDockerBinary binary("echo \"$@\" >> " + log.Path().string());
    DockerCliConfig config;
    config.binary = binary.Path();
    DockerCliRuntime docker(config);

    ASSERT_TRUE(docker.StopContainer("warden-abc", std::chrono::seconds(3)));

    std::ifstream in(log.Path());
    std::string line;
    std::getline(in, line);
    EXPECT_EQ(line, "stop --time 3 warden-abc");
}

TEST(DockerCliRuntimeTest, ReachableDaemonReportsVersion) {
    FakeDockerBinary binary("echo 24.0.7");
    DockerCliConfig config;
    config.binary = binary.Path();
    DockerCliRuntime docker(config);

    EXPECT_TRUE(docker.Ping());
    EXPECT_EQ(docker.GetServerVersion(), "24.0.7");
}

TEST(DockerCliRuntimeTest, CreateReturnsLastOutputLine) {
    FakeDockerBinary binary(
        "echo 'Unable to find image locally'\n"
        "echo 'f00dfeed1234'");
    DockerCliConfig config;
    config.binary = binary.Path();
    DockerCliRuntime docker(config);

    runtime::ContainerCreateOptions options;
    options.image = "alpine:3.19";
    auto created = docker.CreateContainer(options);

    ASSERT_TRUE(created) << created.GetError().message;
    EXPECT_EQ(created.Value(), "f00dfeed1234");
}

TEST(DockerCliRuntimeTest, ExecClassifiesDaemonErrorsAndCommandExits) {
    FakeDockerBinary binary(
        "for last; do :; done\n"
        "case \"$last\" in\n"
        "  missing) echo 'Error response from daemon: No such container: x' >&2; exit 1 ;;\n"
        "  *) echo \"ran $last\"; exit 5 ;;\n"
        "esac");
    DockerCliConfig config;
    config.binary = binary.Path();
    DockerCliRuntime docker(config);

    runtime::ContainerExecOptions options;
    options.command = {"missing"};
    auto daemon_error = docker.Exec("abc", options);
    ASSERT_FALSE(daemon_error);
    EXPECT_EQ(daemon_error.GetError().kind, ErrorKind::EXECUTION_FAILED);

    options.command = {"work"};
    auto command_exit = docker.Exec("abc", options);
    ASSERT_TRUE(command_exit);
    EXPECT_EQ(command_exit.Value().exit_code, 5);
    EXPECT_EQ(command_exit.Value().stdout_output, "ran work\n");
}

TEST(DockerCliRuntimeTest, ExecRejectsEmptyCommand) {
    DockerCliRuntime docker;
    auto result = docker.Exec("abc", runtime::ContainerExecOptions{});

    ASSERT_FALSE(result);
    EXPECT_EQ(result.GetError().kind, ErrorKind::INVALID_REQUEST);
}
