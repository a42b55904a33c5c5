#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace devproxy {

class SignError : public std::runtime_error {
public:
	enum class Kind { Initialization, Allocation, Encoding, Execution };

	SignError(Kind kind, const std::string &message) : std::runtime_error(message), kind_(kind) {}

	Kind kind() const { return kind_; }
	static const char *kindName(Kind kind);

private:
	Kind kind_;
};

// The one thing callers need from the signing backend.
class Signer {
public:
	virtual ~Signer() = default;
	virtual std::string sign(const std::string &nonce,
							 const std::string &timestamp,
							 const std::string &deviceId,
							 const std::string &query) = 0;
	// False while the backend still has to be loaded.
	virtual bool ready() const { return true; }
};

struct WasmExportNames {
	std::string memory{"memory"};
	std::string malloc{"__wbindgen_malloc"};
	std::string free{"__wbindgen_free"};
	std::string sign{"sign"};
};

// A loaded bytecode module: its allocator exports, the signing export and
// its linear memory. Offsets are module addresses. Implementations throw
// SignError(Execution) on traps and out-of-bounds access. Not reentrant.
class ModuleInstance {
public:
	using SignArgs = std::array<int32_t, 9>;

	virtual ~ModuleInstance() = default;
	virtual int32_t allocate(int32_t size, int32_t align) = 0;
	virtual void deallocate(int32_t ptr, int32_t size, int32_t align) = 0;
	virtual void callSign(const SignArgs &args) = 0;
	virtual void writeMemory(int32_t offset, const std::string &bytes) = 0;
	virtual std::string readMemory(int32_t offset, int32_t length) = 0;
};

// Every buffer allocated through the transaction is handed back to the
// module when it goes out of scope, whichever way the call ends.
class ModuleTransaction {
public:
	explicit ModuleTransaction(ModuleInstance &module) : module_(module) {}
	~ModuleTransaction();

	ModuleTransaction(const ModuleTransaction &) = delete;
	ModuleTransaction &operator=(const ModuleTransaction &) = delete;

	int32_t allocate(int32_t size, int32_t align, const char *what);
	// Takes ownership of a buffer the module allocated on its own.
	void adopt(int32_t ptr, int32_t size, int32_t align);
	std::pair<int32_t, int32_t> writeString(const std::string &value, const char *what);
	size_t outstanding() const { return allocations_.size(); }

private:
	struct Allocation {
		int32_t ptr;
		int32_t size;
		int32_t align;
	};

	ModuleInstance &module_;
	std::vector<Allocation> allocations_;
};

// Signs through a compiled module. The module is loaded on first use and
// every call holds one lock: the module's execution context is shared and
// must never be entered twice. A failed load is remembered and reported to
// every later caller.
class WasmSigner : public Signer {
public:
	using ModuleLoader = std::function<std::unique_ptr<ModuleInstance>()>;

	explicit WasmSigner(ModuleLoader loader);

	std::string sign(const std::string &nonce,
					 const std::string &timestamp,
					 const std::string &deviceId,
					 const std::string &query) override;

	bool ready() const override;

private:
	ModuleInstance &ensureModule();

	mutable std::mutex mu_;
	ModuleLoader loader_;
	std::unique_ptr<ModuleInstance> module_;
	bool initAttempted_{false};
	std::string initError_;
};

} // namespace devproxy
