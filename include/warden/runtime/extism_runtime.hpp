/**
 * @file extism_runtime.hpp
 * @brief WasmRuntime on the Extism C SDK
 *
 * Only compiled when libextism is found at configure time
 * (WARDEN_HAVE_EXTISM).
 *
 * @date 2025
 */

#pragma once

#include "warden/runtime/wasm_runtime.hpp"

#include <mutex>

struct ExtismPlugin;
struct ExtismCancelHandle;

namespace warden {
namespace runtime {

/**
 * @class ExtismModule
 * @brief Owns one ExtismPlugin
 */
class ExtismModule : public WasmModule {
public:
    explicit ExtismModule(ExtismPlugin* plugin);
    ~ExtismModule() override;

    ExtismModule(const ExtismModule&) = delete;
    ExtismModule& operator=(const ExtismModule&) = delete;

    bool HasFunction(const std::string& function) const override;
    Result<std::string> Call(const std::string& function, const std::string& input) override;
    void Cancel() override;

private:
    ExtismPlugin* plugin_;
    const ExtismCancelHandle* cancel_handle_;
    mutable std::mutex call_mutex_;  ///< Extism plugins are not reentrant
};

/**
 * @class ExtismRuntime
 * @brief Loads modules through extism_plugin_new
 */
class ExtismRuntime : public WasmRuntime {
public:
    std::string GetName() const override { return "extism"; }
    Result<void> Probe() override;
    Result<std::shared_ptr<WasmModule>> LoadModule(const std::vector<std::uint8_t>& wasm,
                                                   bool wasi) override;
};

} // namespace runtime
} // namespace warden
