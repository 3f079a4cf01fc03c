#include "warden/executors/wasm_executor.hpp"

#include "fakes.hpp"

#include <nlohmann/json.hpp>
#include <gtest/gtest.h>

#include <thread>

using namespace warden;
using warden::executors::WasmExecutor;
using warden::executors::WasmExecutorConfig;
using json = nlohmann::json;

namespace {

ExecutionRequest Command(std::vector<std::string> command) {
    ExecutionRequest request;
    request.command = std::move(command);
    return request;
}

IsolationPolicy ModulePolicy(const test::TempFile& module) {
    IsolationPolicy policy;
    policy.type = SandboxType::WASM;
    policy.wasm.module = module.Path();
    return policy;
}

test::WasmHandler Returning(std::string output) {
    return [output](const std::string&, const std::string&,
                    const std::atomic<bool>&) -> Result<std::string> {
        return Result<std::string>::Success(output);
    };
}

} // namespace

TEST(WasmExecutorTest, WithoutRuntimeConnectFails) {
    WasmExecutor executor(nullptr);

    auto connected = executor.Connect();
    ASSERT_FALSE(connected);
    EXPECT_EQ(connected.GetError().kind, ErrorKind::BACKEND_UNAVAILABLE);
    EXPECT_FALSE(executor.IsAvailable());
}

TEST(WasmExecutorTest, FailedProbeMeansUnavailable) {
    auto runtime = std::make_shared<test::FakeWasmRuntime>();
    runtime->probe_ok = false;
    WasmExecutor executor(runtime);

    EXPECT_FALSE(executor.Connect());
    EXPECT_FALSE(executor.IsAvailable());

    test::TempFile module("module-a");
    auto result = executor.Execute(Command({"x"}), ModulePolicy(module), CancellationToken{});
    ASSERT_FALSE(result);
    EXPECT_EQ(result.GetError().kind, ErrorKind::BACKEND_UNAVAILABLE);
}

TEST(WasmExecutorTest, StructuredOutputIsUnpacked) {
    auto runtime = std::make_shared<test::FakeWasmRuntime>(
        Returning(R"({"stdout": "hi\n", "stderr": "warn\n", "exitCode": 3})"));
    WasmExecutor executor(runtime);
    ASSERT_TRUE(executor.Connect());
    test::TempFile module("module-a");

    auto result = executor.Execute(Command({"greet"}), ModulePolicy(module), CancellationToken{});

    ASSERT_TRUE(result) << result.GetError().message;
    EXPECT_EQ(result.Value().stdout_output, "hi\n");
    EXPECT_EQ(result.Value().stderr_output, "warn\n");
    EXPECT_EQ(result.Value().exit_code, 3);
    EXPECT_EQ(result.Value().backend, SandboxType::WASM);
}

TEST(WasmExecutorTest, RawOutputBecomesStdout) {
    auto runtime = std::make_shared<test::FakeWasmRuntime>(Returning("plain text"));
    WasmExecutor executor(runtime);
    ASSERT_TRUE(executor.Connect());
    test::TempFile module("module-a");

    auto result = executor.Execute(Command({"x"}), ModulePolicy(module), CancellationToken{});

    ASSERT_TRUE(result);
    EXPECT_EQ(result.Value().stdout_output, "plain text");
    EXPECT_EQ(result.Value().stderr_output, "");
    EXPECT_EQ(result.Value().exit_code, 0);
}

TEST(WasmExecutorTest, JsonWithoutOutputFieldsIsKeptVerbatim) {
    auto runtime = std::make_shared<test::FakeWasmRuntime>(Returning("[1,2,3]"));
    WasmExecutor executor(runtime);
    ASSERT_TRUE(executor.Connect());
    test::TempFile module("module-a");

    auto result = executor.Execute(Command({"x"}), ModulePolicy(module), CancellationToken{});

    ASSERT_TRUE(result);
    EXPECT_EQ(result.Value().stdout_output, "[1,2,3]");
}

TEST(WasmExecutorTest, TrapBecomesExitCodeOne) {
    auto runtime = std::make_shared<test::FakeWasmRuntime>(
        [](const std::string&, const std::string&, const std::atomic<bool>&) {
            return Result<std::string>::Failure(ErrorKind::EXECUTION_FAILED,
                                                "wasm trap: unreachable");
        });
    WasmExecutor executor(runtime);
    ASSERT_TRUE(executor.Connect());
    test::TempFile module("module-a");

    auto result = executor.Execute(Command({"x"}), ModulePolicy(module), CancellationToken{});

    ASSERT_TRUE(result);
    EXPECT_EQ(result.Value().exit_code, 1);
    EXPECT_EQ(result.Value().stderr_output, "wasm trap: unreachable");
}

TEST(WasmExecutorTest, EnvelopeCarriesCommandCwdAndEnv) {
    std::string received;
    auto runtime = std::make_shared<test::FakeWasmRuntime>(
        [&received](const std::string&, const std::string& input, const std::atomic<bool>&) {
            received = input;
            return Result<std::string>::Success("ok");
        });
    WasmExecutor executor(runtime);
    ASSERT_TRUE(executor.Connect());
    test::TempFile module("module-a");

    auto policy = ModulePolicy(module);
    policy.env = {{"A", "1"}};
    auto request = Command({"ls", "-l"});
    request.env = {{"B", "2"}};

    ASSERT_TRUE(executor.Execute(request, policy, CancellationToken{}));

    auto envelope = json::parse(received);
    EXPECT_EQ(envelope["command"], json::array({"ls", "-l"}));
    EXPECT_EQ(envelope["cwd"], "/workspace");
    EXPECT_EQ(envelope["env"]["A"], "1");
    EXPECT_EQ(envelope["env"]["B"], "2");
}

TEST(WasmExecutorTest, StdinIsPassedAsRawInput) {
    WasmExecutor executor(std::make_shared<test::FakeWasmRuntime>());
    ASSERT_TRUE(executor.Connect());
    test::TempFile module("module-a");

    auto request = Command({"ignored"});
    request.stdin_data = std::string("raw bytes");

    auto result = executor.Execute(request, ModulePolicy(module), CancellationToken{});

    ASSERT_TRUE(result);
    EXPECT_EQ(result.Value().stdout_output, "raw bytes");
}

TEST(WasmExecutorTest, EmptyStdinFallsBackToEnvelope) {
    WasmExecutor executor(std::make_shared<test::FakeWasmRuntime>());

    auto request = Command({"run"});
    request.stdin_data = std::string();
    request.working_dir = std::filesystem::path("/data");

    auto envelope = json::parse(executor.BuildInput(request, IsolationPolicy{}));
    EXPECT_EQ(envelope["cwd"], "/data");
    EXPECT_EQ(envelope["command"], json::array({"run"}));
}

TEST(WasmExecutorTest, TimeoutCancelsCallAndEvictsModule) {
    auto runtime = std::make_shared<test::FakeWasmRuntime>(test::BlockingHandler());
    WasmExecutor executor(runtime);
    ASSERT_TRUE(executor.Connect());
    test::TempFile module("module-a");

    auto request = Command({"spin"});
    request.timeout = std::chrono::milliseconds(200);

    auto result = executor.Execute(request, ModulePolicy(module), CancellationToken{});

    ASSERT_TRUE(result);
    EXPECT_TRUE(result.Value().timed_out);
    EXPECT_EQ(result.Value().exit_code, kTimeoutExitCode);
    EXPECT_EQ(result.Value().stderr_output, "Execution timed out");
    EXPECT_LT(result.Value().duration, std::chrono::milliseconds(5000));
    EXPECT_EQ(executor.GetCachedModuleCount(), 0u);
}

TEST(WasmExecutorTest, CancellationInterruptsCall) {
    auto runtime = std::make_shared<test::FakeWasmRuntime>(test::BlockingHandler());
    WasmExecutor executor(runtime);
    ASSERT_TRUE(executor.Connect());
    test::TempFile module("module-a");

    auto cancel = CancellationToken::Create();
    std::thread canceller([cancel] {
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        cancel.Cancel();
    });

    auto result = executor.Execute(Command({"spin"}), ModulePolicy(module), cancel);
    canceller.join();

    ASSERT_FALSE(result);
    EXPECT_EQ(result.GetError().kind, ErrorKind::CANCELLED);
}

TEST(WasmExecutorTest, MissingModuleIsInvalidPolicy) {
    WasmExecutor executor(std::make_shared<test::FakeWasmRuntime>());
    ASSERT_TRUE(executor.Connect());

    IsolationPolicy no_module;
    auto unset = executor.Execute(Command({"x"}), no_module, CancellationToken{});
    ASSERT_FALSE(unset);
    EXPECT_EQ(unset.GetError().kind, ErrorKind::INVALID_POLICY);

    IsolationPolicy missing_file;
    missing_file.wasm.module = std::filesystem::path("/nonexistent/plugin.wasm");
    auto missing = executor.Execute(Command({"x"}), missing_file, CancellationToken{});
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.GetError().kind, ErrorKind::INVALID_POLICY);
    EXPECT_EQ(missing.GetError().message, "WASM module not found: /nonexistent/plugin.wasm");
}

TEST(WasmExecutorTest, MissingExportIsInvalidPolicy) {
    WasmExecutor executor(std::make_shared<test::FakeWasmRuntime>(nullptr,
                                                                  std::set<std::string>{"main"}));
    ASSERT_TRUE(executor.Connect());
    test::TempFile module("module-a");

    auto default_export = executor.Execute(Command({"x"}), ModulePolicy(module),
                                           CancellationToken{});
    ASSERT_FALSE(default_export);
    EXPECT_EQ(default_export.GetError().kind, ErrorKind::INVALID_POLICY);

    auto policy = ModulePolicy(module);
    policy.wasm.function = "main";
    EXPECT_TRUE(executor.Execute(Command({"x"}), policy, CancellationToken{}));
}

TEST(WasmExecutorTest, RejectedModuleBytesAreExecutionFailure) {
    WasmExecutor executor(std::make_shared<test::FakeWasmRuntime>());
    ASSERT_TRUE(executor.Connect());
    test::TempFile empty("");

    auto result = executor.Execute(Command({"x"}), ModulePolicy(empty), CancellationToken{});

    ASSERT_FALSE(result);
    EXPECT_EQ(result.GetError().kind, ErrorKind::EXECUTION_FAILED);
}

TEST(WasmExecutorTest, ModulesAreCachedByContentAndWasiFlag) {
    auto runtime = std::make_shared<test::FakeWasmRuntime>();
    WasmExecutor executor(runtime);
    ASSERT_TRUE(executor.Connect());
    test::TempFile first("same-bytes");
    test::TempFile copy("same-bytes");

    ASSERT_TRUE(executor.Execute(Command({"x"}), ModulePolicy(first), CancellationToken{}));
    ASSERT_TRUE(executor.Execute(Command({"x"}), ModulePolicy(copy), CancellationToken{}));
    EXPECT_EQ(runtime->load_count.load(), 1);
    EXPECT_FALSE(runtime->last_wasi.load());

    auto wasi = ModulePolicy(first);
    wasi.wasm.wasi = true;
    ASSERT_TRUE(executor.Execute(Command({"x"}), wasi, CancellationToken{}));
    EXPECT_EQ(runtime->load_count.load(), 2);
    EXPECT_TRUE(runtime->last_wasi.load());
    EXPECT_EQ(executor.GetCachedModuleCount(), 2u);
}

TEST(WasmExecutorTest, CacheEvictsLeastRecentlyUsed) {
    auto runtime = std::make_shared<test::FakeWasmRuntime>();
    WasmExecutorConfig config;
    config.cache_size = 2;
    WasmExecutor executor(runtime, config);
    ASSERT_TRUE(executor.Connect());
    test::TempFile a("module-a");
    test::TempFile b("module-b");
    test::TempFile c("module-c");

    ASSERT_TRUE(executor.Execute(Command({"x"}), ModulePolicy(a), CancellationToken{}));
    ASSERT_TRUE(executor.Execute(Command({"x"}), ModulePolicy(b), CancellationToken{}));
    ASSERT_TRUE(executor.Execute(Command({"x"}), ModulePolicy(a), CancellationToken{}));
    ASSERT_TRUE(executor.Execute(Command({"x"}), ModulePolicy(c), CancellationToken{}));
    EXPECT_EQ(runtime->load_count.load(), 3);
    EXPECT_EQ(executor.GetCachedModuleCount(), 2u);

    // a stayed warm, b was evicted
    ASSERT_TRUE(executor.Execute(Command({"x"}), ModulePolicy(a), CancellationToken{}));
    EXPECT_EQ(runtime->load_count.load(), 3);
    ASSERT_TRUE(executor.Execute(Command({"x"}), ModulePolicy(b), CancellationToken{}));
    EXPECT_EQ(runtime->load_count.load(), 4);
}

TEST(WasmExecutorTest, DisconnectDropsCache) {
    WasmExecutor executor(std::make_shared<test::FakeWasmRuntime>());
    ASSERT_TRUE(executor.Connect());
    test::TempFile module("module-a");
    ASSERT_TRUE(executor.Execute(Command({"x"}), ModulePolicy(module), CancellationToken{}));

    EXPECT_TRUE(executor.Disconnect());
    EXPECT_EQ(executor.GetCachedModuleCount(), 0u);
    EXPECT_FALSE(executor.IsAvailable());
}
