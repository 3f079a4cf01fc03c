/**
 * @file wasm_executor.cpp
 * @brief Implementation of the WASM plugin backend
 *
 * @date 2025
 */

#include "warden/executors/wasm_executor.hpp"
#include "warden/core/policy.hpp"
#include "warden/utils/hash_utils.hpp"
#include "warden/utils/string_utils.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <condition_variable>
#include <fstream>
#include <iterator>
#include <thread>

using json = nlohmann::json;

namespace warden {
namespace executors {

namespace {

constexpr std::chrono::milliseconds kWatchdogTick{50};

struct PluginOutput {
    std::string stdout_output;
    std::string stderr_output;
    int exit_code{0};
};

PluginOutput ParsePluginOutput(const std::string& output) {
    PluginOutput parsed;
    parsed.stdout_output = output;

    json document = json::parse(output, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return parsed;
    }

    auto out = document.find("stdout");
    if (out != document.end() && out->is_string()) {
        parsed.stdout_output = out->get<std::string>();
    }
    auto err = document.find("stderr");
    if (err != document.end() && err->is_string()) {
        parsed.stderr_output = err->get<std::string>();
    }
    auto code = document.find("exitCode");
    if (code != document.end() && code->is_number()) {
        parsed.exit_code = code->get<int>();
    }
    return parsed;
}

std::string CapOutput(const std::string& output, std::size_t max_bytes) {
    return max_bytes == 0 ? output : utils::StringUtils::Truncate(output, max_bytes);
}

} // anonymous namespace

WasmExecutor::WasmExecutor(std::shared_ptr<runtime::WasmRuntime> runtime,
                           const WasmExecutorConfig& config)
    : runtime_(std::move(runtime))
    , config_(config) {
}

WasmExecutor::~WasmExecutor() {
    Disconnect();
}

// ============================================================================
// LIFECYCLE
// ============================================================================

Result<void> WasmExecutor::Connect() {
    if (!runtime_) {
        connected_ = false;
        return Result<void>::Failure(ErrorKind::BACKEND_UNAVAILABLE,
                                     "WASM support not compiled in");
    }

    auto probe = runtime_->Probe();
    connected_ = probe.IsSuccess();
    if (!probe) {
        spdlog::warn("WASM runtime '{}' unavailable: {}", runtime_->GetName(),
                     probe.GetError().message);
        return Result<void>::Failure(ErrorKind::BACKEND_UNAVAILABLE, probe.GetError().message);
    }

    spdlog::info("WASM executor connected (runtime: {}, cache: {})",
                 runtime_->GetName(), config_.cache_size);
    return Result<void>::Success();
}

Result<void> WasmExecutor::Disconnect() {
    std::list<CachedModule> dropped;
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        dropped.swap(cache_);
    }
    if (!dropped.empty()) {
        spdlog::debug("Dropping {} cached WASM module(s)", dropped.size());
    }
    connected_ = false;
    return Result<void>::Success();
}

bool WasmExecutor::IsAvailable() {
    return connected_;
}

std::size_t WasmExecutor::GetCachedModuleCount() const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return cache_.size();
}

// ============================================================================
// EXECUTION
// ============================================================================

Result<ExecutionResult> WasmExecutor::Execute(const ExecutionRequest& request,
                                              const IsolationPolicy& policy,
                                              const CancellationToken& cancel) {
    if (!connected_) {
        return Result<ExecutionResult>::Failure(ErrorKind::BACKEND_UNAVAILABLE,
                                                "WASM executor not connected");
    }
    if (!policy.wasm.module) {
        return Result<ExecutionResult>::Failure(ErrorKind::INVALID_POLICY,
                                                "No WASM module specified in policy");
    }

    const auto start_time = std::chrono::steady_clock::now();
    const auto timeout = ResolveTimeout(request, policy);
    const auto deadline = start_time + timeout;
    const std::string function = policy.wasm.function.value_or(config_.default_function);

    auto loaded = GetOrLoadModule(*policy.wasm.module, policy.wasm.wasi.value_or(false));
    if (!loaded) {
        return Result<ExecutionResult>::Failure(loaded.GetError());
    }
    const CachedModule& cached = loaded.Value();

    if (!cached.module->HasFunction(function)) {
        return Result<ExecutionResult>::Failure(ErrorKind::INVALID_POLICY,
            "WASM module " + policy.wasm.module->string() + " does not export '" +
            function + "'");
    }

    const std::string input = BuildInput(request, policy);

    std::lock_guard<std::mutex> call_lock(*cached.call_mutex);

    ExecutionResult result;
    result.backend = SandboxType::WASM;

    // Time spent waiting for a previous call counts against the deadline
    if (std::chrono::steady_clock::now() >= deadline) {
        result.stderr_output = "Execution timed out";
        result.exit_code = kTimeoutExitCode;
        result.timed_out = true;
        result.duration = timeout;
        return Result<ExecutionResult>::Success(std::move(result));
    }

    std::mutex watch_mutex;
    std::condition_variable watch_cv;
    bool finished = false;
    bool fired_timeout = false;
    bool fired_cancel = false;

    std::thread watchdog([&]() {
        std::unique_lock<std::mutex> lock(watch_mutex);
        while (!finished) {
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                fired_timeout = true;
                cached.module->Cancel();
                return;
            }
            if (cancel.IsCancelled()) {
                fired_cancel = true;
                cached.module->Cancel();
                return;
            }
            watch_cv.wait_until(lock, std::min(deadline, now + kWatchdogTick));
        }
    });

    spdlog::debug("WASM call {}:{} (timeout: {}ms)", policy.wasm.module->string(),
                  function, timeout.count());

    Result<std::string> call = Result<std::string>::Failure(ErrorKind::EXECUTION_FAILED,
                                                            "call did not run");
    try {
        call = cached.module->Call(function, input);
    } catch (const std::exception& e) {
        call = Result<std::string>::Failure(ErrorKind::EXECUTION_FAILED, e.what());
    }

    {
        std::lock_guard<std::mutex> lock(watch_mutex);
        finished = true;
    }
    watch_cv.notify_all();
    watchdog.join();

    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    if (fired_timeout || fired_cancel) {
        EvictModule(cached.key);
    }

    if (fired_cancel) {
        return Result<ExecutionResult>::Failure(ErrorKind::CANCELLED, "Execution cancelled");
    }

    if (fired_timeout) {
        spdlog::warn("WASM call {} timed out after {}ms", function, timeout.count());
        result.stderr_output = "Execution timed out";
        result.exit_code = kTimeoutExitCode;
        result.timed_out = true;
        return Result<ExecutionResult>::Success(std::move(result));
    }

    if (!call) {
        result.stderr_output = CapOutput(call.GetError().message, config_.max_output_bytes);
        result.exit_code = 1;
        return Result<ExecutionResult>::Success(std::move(result));
    }

    PluginOutput output = ParsePluginOutput(call.Value());
    result.stdout_output = CapOutput(output.stdout_output, config_.max_output_bytes);
    result.stderr_output = CapOutput(output.stderr_output, config_.max_output_bytes);
    result.exit_code = output.exit_code;

    return Result<ExecutionResult>::Success(std::move(result));
}

std::string WasmExecutor::BuildInput(const ExecutionRequest& request,
                                     const IsolationPolicy& policy) const {
    if (request.stdin_data && !request.stdin_data->empty()) {
        return *request.stdin_data;
    }

    auto working_dir = ResolveWorkingDir(request, policy);

    json envelope;
    envelope["command"] = request.command;
    envelope["cwd"] = working_dir ? working_dir->string() : config_.default_working_dir;
    envelope["env"] = ResolveEnvironment(request, policy);
    return envelope.dump();
}

// ============================================================================
// MODULE CACHE
// ============================================================================

Result<WasmExecutor::CachedModule> WasmExecutor::GetOrLoadModule(
    const std::filesystem::path& path, bool wasi) {

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return Result<CachedModule>::Failure(ErrorKind::INVALID_POLICY,
                                             "WASM module not found: " + path.string());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Result<CachedModule>::Failure(ErrorKind::EXECUTION_FAILED,
                                             "Cannot read WASM module: " + path.string());
    }
    std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                                    std::istreambuf_iterator<char>());

    const std::string key = utils::HashUtils::ComputeSHA256(bytes) + (wasi ? ":wasi" : ":bare");

    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = std::find_if(cache_.begin(), cache_.end(),
                               [&key](const CachedModule& entry) { return entry.key == key; });
        if (it != cache_.end()) {
            cache_.splice(cache_.begin(), cache_, it);
            return Result<CachedModule>::Success(cache_.front());
        }
    }

    spdlog::info("Loading WASM module {} ({})", path.string(),
                 utils::StringUtils::FormatSize(bytes.size()));

    auto loaded = runtime_->LoadModule(bytes, wasi);
    if (!loaded) {
        return Result<CachedModule>::Failure(loaded.GetError());
    }

    CachedModule entry;
    entry.key = key;
    entry.module = loaded.Value();
    entry.call_mutex = std::make_shared<std::mutex>();

    std::lock_guard<std::mutex> lock(cache_mutex_);

    // Another thread may have loaded the same module meanwhile
    auto it = std::find_if(cache_.begin(), cache_.end(),
                           [&key](const CachedModule& cached) { return cached.key == key; });
    if (it != cache_.end()) {
        cache_.splice(cache_.begin(), cache_, it);
        return Result<CachedModule>::Success(cache_.front());
    }

    cache_.push_front(entry);
    while (cache_.size() > std::max<std::size_t>(config_.cache_size, 1)) {
        spdlog::debug("Evicting cached WASM module {}", cache_.back().key);
        cache_.pop_back();
    }

    return Result<CachedModule>::Success(entry);
}

void WasmExecutor::EvictModule(const std::string& key) {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    cache_.remove_if([&key](const CachedModule& entry) { return entry.key == key; });
}

} // namespace executors
} // namespace warden
