/**
 * @file wasm_runtime.hpp
 * @brief Pluggable WASM engine
 *
 * The WASM backend runs precompiled plugin modules that export a function
 * taking a byte string and returning a byte string. A runtime loads modules
 * from their bytes; a loaded module can be called repeatedly and cancelled
 * from another thread while a call is running.
 *
 * @date 2025
 */

#pragma once

#include "warden/core/result.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace warden {
namespace runtime {

/**
 * @class WasmModule
 * @brief One instantiated plugin
 *
 * Calls on the same module are not required to be thread-safe; the caller
 * serializes them. Cancel() must be callable concurrently with Call().
 */
class WasmModule {
public:
    virtual ~WasmModule() = default;

    /// Whether the module exports @p function
    virtual bool HasFunction(const std::string& function) const = 0;

    /**
     * @brief Invoke an exported function
     * @param function Export name
     * @param input Bytes passed as the plugin input
     * @return Plugin output, or EXECUTION_FAILED with the trap message
     */
    virtual Result<std::string> Call(const std::string& function,
                                     const std::string& input) = 0;

    /// Interrupt the call currently running on this module, if any
    virtual void Cancel() = 0;
};

/**
 * @class WasmRuntime
 * @brief Factory for WasmModule instances
 */
class WasmRuntime {
public:
    virtual ~WasmRuntime() = default;

    /// Engine name for logs ("extism")
    virtual std::string GetName() const = 0;

    /**
     * @brief Check that the engine is usable on this host
     * @return BACKEND_UNAVAILABLE if it is not
     */
    virtual Result<void> Probe() = 0;

    /**
     * @brief Compile and instantiate a module
     * @param wasm Module bytes
     * @param wasi Link WASI imports
     * @return Loaded module, or EXECUTION_FAILED if the bytes are rejected
     */
    virtual Result<std::shared_ptr<WasmModule>> LoadModule(const std::vector<std::uint8_t>& wasm,
                                                           bool wasi) = 0;
};

/**
 * @brief Runtime built into this binary
 * @return Extism runtime, or nullptr when built without WASM support
 */
std::shared_ptr<WasmRuntime> CreateDefaultWasmRuntime();

} // namespace runtime
} // namespace warden
