/**
 * @file extism_runtime.cpp
 * @brief Implementation of the Extism-backed WASM runtime
 *
 * @date 2025
 */

#include "warden/runtime/extism_runtime.hpp"

#include <extism.h>
#include <spdlog/spdlog.h>

namespace warden {
namespace runtime {

// ============================================================================
// MODULE
// ============================================================================

ExtismModule::ExtismModule(ExtismPlugin* plugin)
    : plugin_(plugin)
    , cancel_handle_(extism_plugin_cancel_handle(plugin)) {
}

ExtismModule::~ExtismModule() {
    std::lock_guard<std::mutex> lock(call_mutex_);
    extism_plugin_free(plugin_);
}

bool ExtismModule::HasFunction(const std::string& function) const {
    std::lock_guard<std::mutex> lock(call_mutex_);
    return extism_plugin_function_exists(plugin_, function.c_str());
}

Result<std::string> ExtismModule::Call(const std::string& function, const std::string& input) {
    std::lock_guard<std::mutex> lock(call_mutex_);

    int32_t rc = extism_plugin_call(plugin_, function.c_str(),
                                    reinterpret_cast<const uint8_t*>(input.data()),
                                    static_cast<ExtismSize>(input.size()));
    if (rc != 0) {
        const char* error = extism_plugin_error(plugin_);
        std::string message = error ? error : "plugin call failed with code " + std::to_string(rc);
        spdlog::debug("Extism call '{}' failed: {}", function, message);
        return Result<std::string>::Failure(ErrorKind::EXECUTION_FAILED, message);
    }

    ExtismSize length = extism_plugin_output_length(plugin_);
    const uint8_t* data = extism_plugin_output_data(plugin_);
    if (!data || length == 0) {
        return Result<std::string>::Success(std::string());
    }

    return Result<std::string>::Success(
        std::string(reinterpret_cast<const char*>(data), static_cast<std::size_t>(length)));
}

void ExtismModule::Cancel() {
    // Runs without call_mutex_, which the running call holds
    if (cancel_handle_ && !extism_plugin_cancel(cancel_handle_)) {
        spdlog::warn("Extism refused to cancel the running plugin call");
    }
}

// ============================================================================
// RUNTIME
// ============================================================================

Result<void> ExtismRuntime::Probe() {
    const char* version = extism_version();
    if (!version) {
        return Result<void>::Failure(ErrorKind::BACKEND_UNAVAILABLE,
                                     "Extism runtime did not report a version");
    }
    spdlog::debug("Extism runtime version {}", version);
    return Result<void>::Success();
}

Result<std::shared_ptr<WasmModule>> ExtismRuntime::LoadModule(
    const std::vector<std::uint8_t>& wasm, bool wasi) {

    char* errmsg = nullptr;
    ExtismPlugin* plugin = extism_plugin_new(wasm.data(), static_cast<ExtismSize>(wasm.size()),
                                             nullptr, 0, wasi, &errmsg);
    if (!plugin) {
        std::string message = errmsg ? errmsg : "unknown error";
        if (errmsg) {
            extism_plugin_new_error_free(errmsg);
        }
        return Result<std::shared_ptr<WasmModule>>::Failure(ErrorKind::EXECUTION_FAILED,
            "Failed to load WASM module: " + message);
    }

    return Result<std::shared_ptr<WasmModule>>::Success(std::make_shared<ExtismModule>(plugin));
}

} // namespace runtime
} // namespace warden
