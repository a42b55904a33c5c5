#include "wasm_signer.hpp"

#include <limits>

#include <trantor/utils/Logger.h>

#include "utf8.hpp"

namespace devproxy {

namespace {

constexpr int32_t kDescriptorSize = 8;
constexpr int32_t kDescriptorAlign = 4;

static int32_t readLe32(const std::string &bytes, size_t offset) {
	uint32_t v = static_cast<uint32_t>(static_cast<uint8_t>(bytes[offset]))
		| (static_cast<uint32_t>(static_cast<uint8_t>(bytes[offset + 1])) << 8)
		| (static_cast<uint32_t>(static_cast<uint8_t>(bytes[offset + 2])) << 16)
		| (static_cast<uint32_t>(static_cast<uint8_t>(bytes[offset + 3])) << 24);
	return static_cast<int32_t>(v);
}

static void requireUtf8(const std::string &value, const char *what) {
	std::string error;
	if (!isValidUtf8(value, &error)) {
		throw SignError(SignError::Kind::Encoding, std::string(what) + " is not valid utf-8: " + error);
	}
}

} // namespace

const char *SignError::kindName(Kind kind) {
	switch (kind) {
	case Kind::Initialization: return "initialization";
	case Kind::Allocation: return "allocation";
	case Kind::Encoding: return "encoding";
	case Kind::Execution: return "execution";
	}
	return "unknown";
}

ModuleTransaction::~ModuleTransaction() {
	for (auto it = allocations_.rbegin(); it != allocations_.rend(); ++it) {
		try {
			module_.deallocate(it->ptr, it->size, it->align);
			LOG_DEBUG << "freed module buffer ptr=" << it->ptr << " size=" << it->size << " align=" << it->align;
		} catch (const std::exception &e) {
			LOG_ERROR << "failed to free module buffer ptr=" << it->ptr << " size=" << it->size << ": " << e.what();
		}
	}
}

int32_t ModuleTransaction::allocate(int32_t size, int32_t align, const char *what) {
	int32_t ptr = module_.allocate(size, align);
	if (ptr == 0) {
		throw SignError(SignError::Kind::Allocation,
						std::string("module allocator returned null for ") + what + " (" + std::to_string(size) + " bytes)");
	}
	LOG_DEBUG << "allocated " << what << " at " << ptr << " size=" << size << " align=" << align;
	allocations_.push_back({ptr, size, align});
	return ptr;
}

void ModuleTransaction::adopt(int32_t ptr, int32_t size, int32_t align) {
	allocations_.push_back({ptr, size, align});
}

std::pair<int32_t, int32_t> ModuleTransaction::writeString(const std::string &value, const char *what) {
	if (value.size() > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
		throw SignError(SignError::Kind::Allocation, std::string(what) + " does not fit in module memory");
	}
	int32_t len = static_cast<int32_t>(value.size());
	int32_t ptr = allocate(len, 1, what);
	module_.writeMemory(ptr, value);
	return {ptr, len};
}

WasmSigner::WasmSigner(ModuleLoader loader) : loader_(std::move(loader)) {}

bool WasmSigner::ready() const {
	std::lock_guard<std::mutex> lock(mu_);
	return module_ != nullptr;
}

ModuleInstance &WasmSigner::ensureModule() {
	if (module_) return *module_;
	if (initAttempted_) throw SignError(SignError::Kind::Initialization, initError_);
	initAttempted_ = true;
	LOG_INFO << "initializing signing module";
	try {
		module_ = loader_ ? loader_() : nullptr;
		if (!module_) throw std::runtime_error("module loader produced no instance");
	} catch (const std::exception &e) {
		module_.reset();
		initError_ = std::string("signing module initialization failed: ") + e.what();
		LOG_ERROR << initError_;
		throw SignError(SignError::Kind::Initialization, initError_);
	}
	LOG_INFO << "signing module ready";
	return *module_;
}

std::string WasmSigner::sign(const std::string &nonce,
							 const std::string &timestamp,
							 const std::string &deviceId,
							 const std::string &query) {
	requireUtf8(nonce, "nonce");
	requireUtf8(timestamp, "timestamp");
	requireUtf8(deviceId, "device id");
	requireUtf8(query, "query");

	std::lock_guard<std::mutex> lock(mu_);
	ModuleInstance &module = ensureModule();
	ModuleTransaction txn(module);

	int32_t descriptor = txn.allocate(kDescriptorSize, kDescriptorAlign, "descriptor");
	auto n = txn.writeString(nonce, "nonce");
	auto t = txn.writeString(timestamp, "timestamp");
	auto d = txn.writeString(deviceId, "device id");
	auto q = txn.writeString(query, "query");

	module.callSign({descriptor, n.first, n.second, t.first, t.second, d.first, d.second, q.first, q.second});

	std::string slot = module.readMemory(descriptor, kDescriptorSize);
	if (slot.size() != static_cast<size_t>(kDescriptorSize)) {
		throw SignError(SignError::Kind::Execution, "short read of result descriptor");
	}
	int32_t resultPtr = readLe32(slot, 0);
	int32_t resultLen = readLe32(slot, 4);
	LOG_DEBUG << "sign returned ptr=" << resultPtr << " len=" << resultLen;
	if (resultLen < 0) {
		throw SignError(SignError::Kind::Execution, "module reported negative result length " + std::to_string(resultLen));
	}
	if (resultPtr != 0) txn.adopt(resultPtr, resultLen, 1);

	std::string signature = resultLen == 0 ? std::string() : module.readMemory(resultPtr, resultLen);
	std::string error;
	if (!isValidUtf8(signature, &error)) {
		throw SignError(SignError::Kind::Encoding, "signature is not valid utf-8: " + error);
	}
	return signature;
}

} // namespace devproxy
