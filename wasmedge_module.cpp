#include "wasmedge_module.hpp"

#include <wasmedge/wasmedge.h>

#include <trantor/utils/Logger.h>

namespace devproxy {

namespace {

class WasmEdgeName {
public:
	explicit WasmEdgeName(const std::string &s) : value_(WasmEdge_StringCreateByCString(s.c_str())), text_(s) {}
	~WasmEdgeName() { WasmEdge_StringDelete(value_); }

	WasmEdgeName(const WasmEdgeName &) = delete;
	WasmEdgeName &operator=(const WasmEdgeName &) = delete;

	const WasmEdge_String &get() const { return value_; }
	const std::string &text() const { return text_; }

private:
	WasmEdge_String value_;
	std::string text_;
};

struct ConfigureDeleter {
	void operator()(WasmEdge_ConfigureContext *p) const { WasmEdge_ConfigureDelete(p); }
};

struct VMDeleter {
	void operator()(WasmEdge_VMContext *p) const { WasmEdge_VMDelete(p); }
};

static std::string resultMessage(const WasmEdge_Result &res) {
	const char *msg = WasmEdge_ResultGetMessage(res);
	return msg ? msg : "unknown error";
}

[[noreturn]] static void initFailure(const std::string &message) {
	throw SignError(SignError::Kind::Initialization, message);
}

class WasmEdgeModule : public ModuleInstance {
public:
	WasmEdgeModule(const std::string &path, const WasmExportNames &names)
		: mallocName_(names.malloc), freeName_(names.free), signName_(names.sign) {
		conf_.reset(WasmEdge_ConfigureCreate());
		if (!conf_) initFailure("failed to create WasmEdge configure context");
		vm_.reset(WasmEdge_VMCreate(conf_.get(), nullptr));
		if (!vm_) initFailure("failed to create WasmEdge VM");

		LOG_DEBUG << "loading wasm module " << path;
		check(WasmEdge_VMLoadWasmFromFile(vm_.get(), path.c_str()), "failed to load " + path);
		check(WasmEdge_VMValidate(vm_.get()), "module validation failed");
		check(WasmEdge_VMInstantiate(vm_.get()), "module instantiation failed");

		const WasmEdge_ModuleInstanceContext *mod = WasmEdge_VMGetActiveModule(vm_.get());
		if (!mod) initFailure("no active module after instantiation");

		WasmEdgeName memoryName(names.memory);
		memory_ = WasmEdge_ModuleInstanceFindMemory(mod, memoryName.get());
		if (!memory_) initFailure("wasm export '" + names.memory + "' not found");

		requireFunction(mod, mallocName_, 2, 1);
		requireFunction(mod, freeName_, 3, 0);
		requireFunction(mod, signName_, 9, 0);
		LOG_INFO << "wasm module " << path << " instantiated";
	}

	int32_t allocate(int32_t size, int32_t align) override {
		WasmEdge_Value params[2] = {WasmEdge_ValueGenI32(size), WasmEdge_ValueGenI32(align)};
		WasmEdge_Value returns[1];
		execute(mallocName_, params, 2, returns, 1);
		return WasmEdge_ValueGetI32(returns[0]);
	}

	void deallocate(int32_t ptr, int32_t size, int32_t align) override {
		WasmEdge_Value params[3] = {WasmEdge_ValueGenI32(ptr), WasmEdge_ValueGenI32(size), WasmEdge_ValueGenI32(align)};
		execute(freeName_, params, 3, nullptr, 0);
	}

	void callSign(const SignArgs &args) override {
		WasmEdge_Value params[9];
		for (size_t i = 0; i < args.size(); i++) params[i] = WasmEdge_ValueGenI32(args[i]);
		execute(signName_, params, 9, nullptr, 0);
	}

	void writeMemory(int32_t offset, const std::string &bytes) override {
		if (bytes.empty()) return;
		WasmEdge_Result res = WasmEdge_MemoryInstanceSetData(memory_,
															 reinterpret_cast<const uint8_t *>(bytes.data()),
															 static_cast<uint32_t>(offset),
															 static_cast<uint32_t>(bytes.size()));
		if (!WasmEdge_ResultOK(res)) {
			throw SignError(SignError::Kind::Execution,
							"failed to write " + std::to_string(bytes.size()) + " bytes at " + std::to_string(offset) + ": " + resultMessage(res));
		}
	}

	std::string readMemory(int32_t offset, int32_t length) override {
		if (length <= 0) return {};
		std::string out(static_cast<size_t>(length), '\0');
		WasmEdge_Result res = WasmEdge_MemoryInstanceGetData(memory_,
															 reinterpret_cast<uint8_t *>(&out[0]),
															 static_cast<uint32_t>(offset),
															 static_cast<uint32_t>(length));
		if (!WasmEdge_ResultOK(res)) {
			throw SignError(SignError::Kind::Execution,
							"failed to read " + std::to_string(length) + " bytes at " + std::to_string(offset) + ": " + resultMessage(res));
		}
		return out;
	}

private:
	static void check(const WasmEdge_Result &res, const std::string &what) {
		if (!WasmEdge_ResultOK(res)) initFailure(what + ": " + resultMessage(res));
	}

	static void requireFunction(const WasmEdge_ModuleInstanceContext *mod, const WasmEdgeName &name,
								uint32_t params, uint32_t returns) {
		const WasmEdge_FunctionInstanceContext *fn = WasmEdge_ModuleInstanceFindFunction(mod, name.get());
		if (!fn) initFailure("wasm export '" + name.text() + "' not found");
		const WasmEdge_FunctionTypeContext *type = WasmEdge_FunctionInstanceGetFunctionType(fn);
		if (!type || WasmEdge_FunctionTypeGetParametersLength(type) != params ||
			WasmEdge_FunctionTypeGetReturnsLength(type) != returns) {
			initFailure("wasm export '" + name.text() + "' has an unexpected signature");
		}
	}

	void execute(const WasmEdgeName &name, const WasmEdge_Value *params, uint32_t paramLen,
				 WasmEdge_Value *returns, uint32_t returnLen) {
		WasmEdge_Result res = WasmEdge_VMExecute(vm_.get(), name.get(), params, paramLen, returns, returnLen);
		if (!WasmEdge_ResultOK(res)) {
			throw SignError(SignError::Kind::Execution, "wasm call '" + name.text() + "' failed: " + resultMessage(res));
		}
	}

	WasmEdgeName mallocName_;
	WasmEdgeName freeName_;
	WasmEdgeName signName_;
	std::unique_ptr<WasmEdge_ConfigureContext, ConfigureDeleter> conf_;
	std::unique_ptr<WasmEdge_VMContext, VMDeleter> vm_;
	WasmEdge_MemoryInstanceContext *memory_{nullptr};
};

} // namespace

std::unique_ptr<ModuleInstance> loadWasmEdgeModule(const std::string &path, const WasmExportNames &names) {
	return std::make_unique<WasmEdgeModule>(path, names);
}

} // namespace devproxy
