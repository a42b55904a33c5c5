#pragma once

#include <memory>
#include <string>

#include "wasm_signer.hpp"

namespace devproxy {

// Loads, validates and instantiates the module at `path` with WasmEdge and
// resolves the exports named in `names`. Throws SignError(Initialization).
std::unique_ptr<ModuleInstance> loadWasmEdgeModule(const std::string &path, const WasmExportNames &names = {});

} // namespace devproxy
