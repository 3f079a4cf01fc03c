/**
 * @file wasm_runtime.cpp
 * @brief Selection of the built-in WASM runtime
 *
 * @date 2025
 */

#include "warden/runtime/wasm_runtime.hpp"

#ifdef WARDEN_HAVE_EXTISM
#include "warden/runtime/extism_runtime.hpp"
#endif

#include <spdlog/spdlog.h>

namespace warden {
namespace runtime {

std::shared_ptr<WasmRuntime> CreateDefaultWasmRuntime() {
#ifdef WARDEN_HAVE_EXTISM
    return std::make_shared<ExtismRuntime>();
#else
    spdlog::debug("WASM support not compiled in (libextism not found at build time)");
    return nullptr;
#endif
}

} // namespace runtime
} // namespace warden
